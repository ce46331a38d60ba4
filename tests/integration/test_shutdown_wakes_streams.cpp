#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "camera/camera_registry.hpp"
#include "core/logging.hpp"
#include "stream/frame_broadcaster.hpp"
#include "web/http_server.hpp"
#include "web/stream_endpoint.hpp"
#include "support/synthetic_frame_source.hpp"

namespace {

int openStream(uint16_t port, const std::string& path) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    const std::string req = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::send(fd, req.data(), req.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(req.size())) {
        ::close(fd);
        return -1;
    }
    return fd;
}

// Reads until EOF. Returns false if the read timed out instead.
bool drainUntilClosed(int fd, std::string& out) {
    char buf[8192];
    for (;;) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            return false;
        }
        out.append(buf, static_cast<std::size_t>(n));
    }
}

}  // namespace

// Stopping a camera ends every stream attached to it: clients see the
// connection close promptly instead of hanging on a dead camera.
int main() {
    camrelay::Logger::instance().setLevel(camrelay::LogLevel::Error);

    camrelay::CameraConfig cam = camrelay::CameraRegistry::defaultCamera(0);
    cam.width = 64;
    cam.height = 48;
    auto bc = std::make_shared<camrelay::FrameBroadcaster>(
        cam, camrelay::testing::testCaptureConfig(),
        std::make_unique<camrelay::testing::SyntheticFrameSource>(64, 48, 30.0));
    std::string error;
    if (!bc->start(error)) {
        std::cerr << "start failed: " << error << "\n";
        return 1;
    }

    auto connections = std::make_shared<camrelay::ConnectionCounter>();
    auto router = std::make_shared<camrelay::Router>();
    camrelay::StreamConfig stream_cfg;
    stream_cfg.wait_poll_ms = 100;
    if (!router->add("/stream0.mjpg", std::make_shared<camrelay::StreamEndpoint>(0, bc, connections, stream_cfg))) {
        std::cerr << "route registration failed\n";
        return 1;
    }

    camrelay::ServerConfig server_cfg;
    server_cfg.port = 0;
    server_cfg.bind_address = "127.0.0.1";
    camrelay::HttpServer server(server_cfg, router);
    if (!server.start(error)) {
        std::cerr << "server start failed: " << error << "\n";
        return 1;
    }

    constexpr int kClients = 3;
    std::vector<int> fds;
    for (int i = 0; i < kClients; ++i) {
        const int fd = openStream(server.port(), "/stream0.mjpg");
        if (fd < 0) {
            std::cerr << "client " << i << " could not connect\n";
            return 1;
        }
        fds.push_back(fd);
    }

    const auto wait_until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (connections->active() < kClients && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    int rc = 0;
    if (connections->active() != kClients) {
        std::cerr << "expected " << kClients << " active streams, got " << connections->active() << "\n";
        rc = 1;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    const auto t0 = std::chrono::steady_clock::now();
    bc->stop();
    for (const int fd : fds) {
        std::string received;
        if (!drainUntilClosed(fd, received)) {
            std::cerr << "stream did not close after the camera stopped\n";
            rc = 1;
        } else if (received.find("--FRAME\r\n") == std::string::npos) {
            std::cerr << "stream should have delivered frames before closing\n";
            rc = 1;
        }
        ::close(fd);
    }
    if (std::chrono::steady_clock::now() - t0 > std::chrono::seconds(2)) {
        std::cerr << "streams took too long to close\n";
        rc = 1;
    }
    if (connections->active() != 0) {
        std::cerr << "active stream count should drain to 0\n";
        rc = 1;
    }

    server.stop();
    return rc;
}
