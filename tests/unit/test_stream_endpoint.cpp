#include "web/stream_endpoint.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "camera/camera_registry.hpp"
#include "core/logging.hpp"
#include "support/capture_writer.hpp"
#include "support/synthetic_frame_source.hpp"

namespace {

using camrelay::testing::CaptureWriter;
using camrelay::testing::SyntheticFrameSource;

std::shared_ptr<camrelay::FrameBroadcaster> startBroadcaster(int index, std::unique_ptr<SyntheticFrameSource> source) {
    camrelay::CameraConfig cam = camrelay::CameraRegistry::defaultCamera(index);
    cam.width = 64;
    cam.height = 48;
    cam.max_stream_fps = 30.0;
    auto bc = std::make_shared<camrelay::FrameBroadcaster>(cam, camrelay::testing::testCaptureConfig(), std::move(source));
    std::string error;
    if (!bc->start(error)) {
        std::cerr << "broadcaster start failed: " << error << "\n";
        return nullptr;
    }
    return bc;
}

camrelay::HttpRequest streamRequest(int index) {
    camrelay::HttpRequest req;
    req.method = "GET";
    req.path = camrelay::CameraRegistry::streamPath(index);
    req.client_address = "127.0.0.1:40000";
    return req;
}

}  // namespace

int main() {
    camrelay::Logger::instance().setLevel(camrelay::LogLevel::Error);

    if (camrelay::StreamEndpoint::partHeader(1234) !=
        "--FRAME\r\nContent-Type: image/jpeg\r\nContent-Length: 1234\r\n\r\n") {
        std::cerr << "part header format mismatch\n";
        return 1;
    }
    const std::string head = camrelay::StreamEndpoint::responseHead();
    if (head.rfind("HTTP/1.1 200 OK\r\n", 0) != 0 ||
        head.find("Content-Type: multipart/x-mixed-replace; boundary=FRAME\r\n") == std::string::npos ||
        head.find("Cache-Control: no-cache, private\r\n") == std::string::npos ||
        head.find("Pragma: no-cache\r\n") == std::string::npos || head.find("Age: 0\r\n") == std::string::npos) {
        std::cerr << "stream response head mismatch:\n" << head;
        return 1;
    }

    {
        CaptureWriter w;
        const camrelay::JpegBytes bytes{0xFF, 0xD8, 0x01, 0xFF, 0xD9};
        if (!camrelay::StreamEndpoint::writePart(w, bytes)) {
            std::cerr << "writePart should succeed on a healthy writer\n";
            return 1;
        }
        const std::string expected = camrelay::StreamEndpoint::partHeader(5) + std::string("\xFF\xD8\x01\xFF\xD9", 5) + "\r\n";
        if (w.data() != expected) {
            std::cerr << "part should be header, JPEG bytes, CRLF\n";
            return 1;
        }
    }

    auto bc = startBroadcaster(0, std::make_unique<SyntheticFrameSource>(64, 48, 60.0));
    if (!bc) {
        return 1;
    }
    auto connections = std::make_shared<camrelay::ConnectionCounter>();
    camrelay::StreamConfig stream_cfg;
    stream_cfg.wait_poll_ms = 50;
    camrelay::StreamEndpoint endpoint(0, bc, connections, stream_cfg);

    // Client goes away after the head and three full parts.
    {
        CaptureWriter w(1 + 3 * 3);
        endpoint.handle(streamRequest(0), w);
        const std::string out = w.data();
        if (out.rfind(head, 0) != 0) {
            std::cerr << "stream should start with the multipart head\n";
            return 1;
        }
        if (camrelay::testing::countOccurrences(out, "--FRAME\r\n") != 3) {
            std::cerr << "expected three complete parts before the write failure\n";
            return 1;
        }
        if (connections->active() != 0) {
            std::cerr << "connection count should return to 0 after disconnect\n";
            return 1;
        }
    }

    // Several concurrent clients each get their own stream; the shared counter
    // sees all of them and drains to 0.
    {
        constexpr int kClients = 4;
        std::vector<std::unique_ptr<CaptureWriter>> writers;
        std::vector<std::thread> clients;
        for (int i = 0; i < kClients; ++i) {
            writers.push_back(std::make_unique<CaptureWriter>());
        }
        for (int i = 0; i < kClients; ++i) {
            CaptureWriter* w = writers[static_cast<std::size_t>(i)].get();
            clients.emplace_back([&endpoint, w]() { endpoint.handle(streamRequest(0), *w); });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        const int active_during = connections->active();
        for (auto& w : writers) {
            w->cancel();
        }
        for (auto& t : clients) {
            t.join();
        }
        if (active_during != kClients) {
            std::cerr << "expected " << kClients << " active streams, got " << active_during << "\n";
            return 1;
        }
        if (connections->active() != 0) {
            std::cerr << "cancelled streams should release their connections\n";
            return 1;
        }
        for (const auto& w : writers) {
            if (camrelay::testing::countOccurrences(w->data(), "--FRAME\r\n") < 2) {
                std::cerr << "every client should have received frames\n";
                return 1;
            }
        }
    }

    // Stopping the camera ends the stream.
    {
        CaptureWriter w;
        std::thread client([&]() { endpoint.handle(streamRequest(0), w); });
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        bc->stop();
        client.join();
        if (connections->active() != 0) {
            std::cerr << "stream should end when the camera stops\n";
            return 1;
        }
    }
    {
        CaptureWriter w;
        endpoint.handle(streamRequest(0), w);
        if (w.data().rfind("HTTP/1.1 503", 0) != 0) {
            std::cerr << "stopped camera should answer 503\n";
            return 1;
        }
    }

    // A camera that stops delivering closes the stream once the stall timeout passes.
    {
        auto source = std::make_unique<SyntheticFrameSource>(64, 48, 0.0);
        source->failReads(1, 1 << 30);
        auto stalled = startBroadcaster(1, std::move(source));
        if (!stalled) {
            return 1;
        }
        camrelay::StreamConfig stall_cfg;
        stall_cfg.wait_poll_ms = 20;
        stall_cfg.stall_timeout_ms = 200;
        camrelay::StreamEndpoint stalled_endpoint(1, stalled, connections, stall_cfg);
        CaptureWriter w;
        const auto t0 = std::chrono::steady_clock::now();
        stalled_endpoint.handle(streamRequest(1), w);
        const auto waited = std::chrono::steady_clock::now() - t0;
        stalled->stop();
        if (waited < std::chrono::milliseconds(150) || waited > std::chrono::seconds(3)) {
            std::cerr << "stall timeout should close the stream after about 200 ms\n";
            return 1;
        }
        if (w.data().find("--FRAME") != std::string::npos) {
            std::cerr << "stalled camera should not have produced parts\n";
            return 1;
        }
    }
    return 0;
}
