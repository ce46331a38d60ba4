#include "web/http_server.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include "core/logging.hpp"
#include "web/http.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace camrelay {

namespace {

constexpr std::size_t kMaxRequestHeadBytes = 8192;
constexpr int kAcceptPollMs = 200;
constexpr int kRequestReadTimeoutS = 5;

class SocketResponseWriter : public ResponseWriter {
public:
    SocketResponseWriter(int fd, const std::atomic<bool>& server_running)
        : fd_(fd), server_running_(server_running) {}

    bool write(const void* data, std::size_t size) override {
        const char* p = static_cast<const char*>(data);
        while (size > 0) {
            const ssize_t n = ::send(fd_, p, size, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return false;
            }
            p += n;
            size -= static_cast<std::size_t>(n);
        }
        return true;
    }

    bool cancelled() const override { return !server_running_.load(); }

private:
    int fd_;
    const std::atomic<bool>& server_running_;
};

bool readRequestHead(int fd, std::string& out) {
    char buf[1024];
    while (out.size() < kMaxRequestHeadBytes) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        out.append(buf, static_cast<std::size_t>(n));
        if (out.find("\r\n\r\n") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string peerAddress(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

HttpServer::HttpServer(const ServerConfig& cfg, std::shared_ptr<const Router> router)
    : cfg_(cfg), router_(std::move(router)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    if (running_.load()) {
        error = "server already running";
        return false;
    }
    if (!router_) {
        error = "no router";
        return false;
    }
    if (cfg_.port < 0 || cfg_.port > 65535) {
        error = "invalid port " + std::to_string(cfg_.port);
        return false;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        error = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    int yes = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));
    if (cfg_.bind_address.empty() || cfg_.bind_address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, cfg_.bind_address.c_str(), &addr.sin_addr) != 1) {
        error = "invalid bind address " + cfg_.bind_address;
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind to port " + std::to_string(cfg_.port) + " failed: " + std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    if (::listen(listen_fd_, cfg_.listen_backlog) < 0) {
        error = std::string("listen() failed: ") + std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = static_cast<uint16_t>(cfg_.port);
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServer::serveLoop, this);
    logInfo("http", "server listening on " + cfg_.bind_address + ":" + std::to_string(bound_port_));
    error.clear();
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::list<std::unique_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        // Unblocks handlers stuck in send()/recv(); fds stay valid until joined.
        for (auto& c : clients_) {
            ::shutdown(c->fd, SHUT_RDWR);
        }
        clients.swap(clients_);
    }
    for (auto& c : clients) {
        if (c->thread.joinable()) {
            c->thread.join();
        }
        ::close(c->fd);
    }
    logInfo("http", "server stopped");
}

std::size_t HttpServer::openConnections() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    std::size_t open = 0;
    for (const auto& c : clients_) {
        if (!c->done.load()) {
            open++;
        }
    }
    return open;
}

void HttpServer::reapFinishedClients() {
    std::list<std::unique_ptr<Client>> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c->thread.joinable()) {
            c->thread.join();
        }
        ::close(c->fd);
    }
}

void HttpServer::serveLoop() {
    while (running_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, kAcceptPollMs);
        reapFinishedClients();
        if (rc <= 0) {
            continue;
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        const int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (running_.load() && errno != EINTR && errno != EAGAIN) {
                logWarning("http", std::string("accept() failed: ") + std::strerror(errno));
            }
            continue;
        }

        int one = 1;
        ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        timeval tv{};
        tv.tv_sec = kRequestReadTimeoutS;
        ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        auto client = std::make_unique<Client>();
        client->fd = client_fd;
        client->address = peerAddress(client_addr);
        Client* raw = client.get();

        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.push_back(std::move(client));
        raw->thread = std::thread(&HttpServer::handleClient, this, raw);
    }
}

void HttpServer::handleClient(Client* client) {
    SocketResponseWriter writer(client->fd, running_);

    std::string head;
    if (!readRequestHead(client->fd, head)) {
        if (!head.empty() && !writeString(writer, makeHttpErrorResponse(400, "Incomplete request"))) {
            logDebug("http", client->address + " closed before the 400 was written");
        }
        client->done.store(true);
        return;
    }

    HttpRequest request;
    std::string error;
    if (!parseHttpRequest(head, request, error)) {
        logDebug("http", client->address + " sent a bad request: " + error);
        if (!writeString(writer, makeHttpErrorResponse(400, error))) {
            logDebug("http", client->address + " closed before the 400 was written");
        }
        client->done.store(true);
        return;
    }
    request.client_address = client->address;

    router_->dispatch(request, writer);
    client->done.store(true);
}

}  // namespace camrelay
