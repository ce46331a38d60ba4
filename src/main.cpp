#include "camera/camera_registry.hpp"
#include "camera/frame_source.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/telemetry.hpp"
#include "stream/frame_broadcaster.hpp"
#include "web/http_server.hpp"
#include "web/index_page.hpp"
#include "web/router.hpp"
#include "web/stream_endpoint.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

struct CameraSlot {
    camrelay::CameraConfig config;
    std::shared_ptr<camrelay::FrameBroadcaster> broadcaster;
};

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string config_path = (argc > 1) ? argv[1] : "config/camrelay.yaml";

    camrelay::AppConfig config = camrelay::defaultAppConfig();
    std::string error;
    if (std::ifstream(config_path).good()) {
        if (!camrelay::loadConfig(config_path, config, error)) {
            std::cerr << "Config load failed: " << error << '\n';
            return 1;
        }
    } else if (argc > 1) {
        std::cerr << "Config file not found: " << config_path << '\n';
        return 1;
    }

    if (!camrelay::Logger::instance().configure(config.logging, error)) {
        std::cerr << "Logging setup failed, continuing on console only: " << error << '\n';
    }
    camrelay::logInfo("main", "=== camrelay multi-camera streaming server ===");

    const camrelay::CameraRegistry registry(config.cameras);
    std::vector<CameraSlot> slots;
    int started = 0;
    for (const auto& cam : registry.cameras()) {
        CameraSlot slot;
        slot.config = cam;
        slot.broadcaster = std::make_shared<camrelay::FrameBroadcaster>(
            cam, config.capture, camrelay::makeFrameSource(cam, config.capture));
        if (slot.broadcaster->start(error)) {
            started++;
            camrelay::logInfo("main", "camera " + std::to_string(cam.index) + " initialized successfully");
        } else {
            camrelay::logError("main", "camera " + std::to_string(cam.index) + " failed to initialize: " + error);
        }
        slots.push_back(slot);
    }

    if (started == 0) {
        camrelay::logError("main", "no cameras could be initialized, exiting");
        for (auto& slot : slots) {
            slot.broadcaster->stop();
        }
        return 1;
    }

    auto router = std::make_shared<camrelay::Router>();
    auto index = std::make_shared<camrelay::IndexPageHandler>(config.server.page_title, registry.cameras());
    bool routes_ok = router->add("/", index) && router->add("/index.html", index);
    auto stream_connections = std::make_shared<camrelay::ConnectionCounter>();
    for (const auto& slot : slots) {
        routes_ok = routes_ok && router->add(
            camrelay::CameraRegistry::streamPath(slot.config.index),
            std::make_shared<camrelay::StreamEndpoint>(
                slot.config.index, slot.broadcaster, stream_connections, config.stream));
    }
    if (!routes_ok) {
        camrelay::logError("main", "route table could not be built");
        for (auto& slot : slots) {
            slot.broadcaster->stop();
        }
        return 1;
    }

    camrelay::HttpServer server(config.server, router);
    if (!server.start(error)) {
        camrelay::logError("main", "HTTP server failed to start: " + error);
        for (auto& slot : slots) {
            slot.broadcaster->stop();
        }
        return 1;
    }

    const std::string base = "http://" + config.server.bind_address + ":" + std::to_string(server.port());
    camrelay::logInfo("main", "available endpoints:");
    for (const auto& slot : slots) {
        const std::string state = slot.broadcaster->isRunning() ? "" : " (unavailable)";
        camrelay::logInfo("main", "  camera " + std::to_string(slot.config.index) + ": " + base +
                                      camrelay::CameraRegistry::streamPath(slot.config.index) + state);
    }
    camrelay::logInfo("main", "  monitor page: " + base + "/");

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    camrelay::logInfo("main", "shutting down");
    // Broadcasters first: stopping them wakes every endpoint blocked on a frame.
    for (auto& slot : slots) {
        slot.broadcaster->stop();
    }
    server.stop();
    return 0;
}
