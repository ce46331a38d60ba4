#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "web/router.hpp"

namespace camrelay {

// Thread-per-connection HTTP/1.1 server. Owns no camera resources: every
// request is handed to the Router it was built with.
class HttpServer {
public:
    HttpServer(const ServerConfig& cfg, std::shared_ptr<const Router> router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and listens synchronously, then accepts on a background thread.
    bool start(std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    uint16_t port() const { return bound_port_; }

    std::size_t openConnections() const;

private:
    struct Client {
        int fd{-1};
        std::string address;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void serveLoop();
    void handleClient(Client* client);
    void reapFinishedClients();

    ServerConfig cfg_;
    std::shared_ptr<const Router> router_;

    std::atomic<bool> running_{false};
    uint16_t bound_port_{0};
    int listen_fd_{-1};
    std::thread server_thread_;

    mutable std::mutex clients_mutex_;
    std::list<std::unique_ptr<Client>> clients_;
};

}  // namespace camrelay
