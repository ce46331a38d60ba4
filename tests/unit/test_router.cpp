#include "web/router.hpp"

#include <iostream>
#include <memory>

#include "camera/camera_registry.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "web/index_page.hpp"
#include "web/stream_endpoint.hpp"
#include "support/capture_writer.hpp"

namespace {

camrelay::HttpRequest get(const std::string& path, const std::string& method = "GET") {
    camrelay::HttpRequest req;
    req.method = method;
    req.path = path;
    req.target = path;
    req.version = "HTTP/1.1";
    req.client_address = "127.0.0.1:50000";
    return req;
}

}  // namespace

int main() {
    camrelay::Logger::instance().setLevel(camrelay::LogLevel::Error);

    const auto cameras = camrelay::CameraRegistry::builtinCameras();
    camrelay::Router router;
    auto index = std::make_shared<camrelay::IndexPageHandler>("Monitor", cameras);
    if (!router.add("/", index) || !router.add("/index.html", index)) {
        std::cerr << "index routes should register\n";
        return 1;
    }
    // Camera 2 has no broadcaster: its stream route must answer 503.
    auto endpoint = std::make_shared<camrelay::StreamEndpoint>(2, nullptr, nullptr, camrelay::StreamConfig{});
    if (!router.add(camrelay::CameraRegistry::streamPath(2), endpoint)) {
        std::cerr << "stream route should register\n";
        return 1;
    }
    if (router.add("/", index) || router.add("no-slash", index) || router.add("/null", nullptr)) {
        std::cerr << "duplicate, relative and null routes should be rejected\n";
        return 1;
    }
    if (router.paths().size() != 3 || router.find("/stream2.mjpg") == nullptr) {
        std::cerr << "route table contents mismatch\n";
        return 1;
    }

    {
        camrelay::testing::CaptureWriter w;
        router.dispatch(get("/"), w);
        const std::string out = w.data();
        if (out.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 || out.find("text/html") == std::string::npos ||
            out.find("<img src=\"/stream0.mjpg\"") == std::string::npos) {
            std::cerr << "index page should be served as HTML with a stream per camera\n";
            return 1;
        }
    }
    {
        camrelay::testing::CaptureWriter w;
        router.dispatch(get("/stream9.mjpg"), w);
        if (w.data().rfind("HTTP/1.1 404 Not Found\r\n", 0) != 0) {
            std::cerr << "unknown path should answer 404\n";
            return 1;
        }
    }
    {
        camrelay::testing::CaptureWriter w;
        router.dispatch(get("/stream2.mjpg"), w);
        if (w.data().rfind("HTTP/1.1 503 Service Unavailable\r\n", 0) != 0 ||
            w.data().find("Camera 2 not available") == std::string::npos) {
            std::cerr << "unavailable camera should answer 503\n";
            return 1;
        }
        if (endpoint->activeConnections() != 0) {
            std::cerr << "503 should not count as an active stream\n";
            return 1;
        }
    }
    {
        camrelay::testing::CaptureWriter w;
        router.dispatch(get("/", "POST"), w);
        if (w.data().rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) != 0) {
            std::cerr << "POST should answer 405\n";
            return 1;
        }
    }
    return 0;
}
