#include "web/stream_endpoint.hpp"

#include <utility>

#include "core/logging.hpp"
#include "core/time_utils.hpp"

namespace camrelay {

namespace {

// Keeps the active-connection count exact on every exit path.
class ConnectionGuard {
public:
    explicit ConnectionGuard(ConnectionCounter& counter) : counter_(counter), active_(counter.increment()) {}
    ~ConnectionGuard() {
        if (!released_) {
            counter_.decrement();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    int activeAtEntry() const { return active_; }

    // Returns the count after this connection left.
    int release() {
        released_ = true;
        return counter_.decrement();
    }

private:
    ConnectionCounter& counter_;
    int active_{0};
    bool released_{false};
};

}  // namespace

StreamEndpoint::StreamEndpoint(
    int camera_index,
    std::shared_ptr<FrameBroadcaster> broadcaster,
    std::shared_ptr<ConnectionCounter> connections,
    const StreamConfig& cfg)
    : camera_index_(camera_index),
      broadcaster_(std::move(broadcaster)),
      connections_(connections ? std::move(connections) : std::make_shared<ConnectionCounter>()),
      cfg_(cfg),
      log_tag_("stream" + std::to_string(camera_index)) {}

std::string StreamEndpoint::multipartContentType() {
    return std::string("multipart/x-mixed-replace; boundary=") + boundary();
}

std::string StreamEndpoint::responseHead() {
    return "HTTP/1.1 200 OK\r\n"
           "Age: 0\r\n"
           "Cache-Control: no-cache, private\r\n"
           "Pragma: no-cache\r\n"
           "Connection: close\r\n"
           "Content-Type: " + multipartContentType() + "\r\n\r\n";
}

std::string StreamEndpoint::partHeader(std::size_t content_length) {
    std::string out;
    out.reserve(96U);
    out += "--";
    out += boundary();
    out += "\r\n";
    out += "Content-Type: image/jpeg\r\n";
    out += "Content-Length: " + std::to_string(content_length) + "\r\n\r\n";
    return out;
}

bool StreamEndpoint::writePart(ResponseWriter& writer, const JpegBytes& jpeg) {
    if (!writeString(writer, partHeader(jpeg.size()))) {
        return false;
    }
    if (!writer.write(jpeg.data(), jpeg.size())) {
        return false;
    }
    return writer.write("\r\n", 2);
}

bool StreamEndpoint::available() const {
    return broadcaster_ && broadcaster_->isRunning();
}

void StreamEndpoint::handle(const HttpRequest& request, ResponseWriter& writer) {
    if (!available()) {
        logWarning(log_tag_, "camera " + std::to_string(camera_index_) + " not available for " + request.client_address);
        if (!writeString(writer, makeHttpErrorResponse(503, "Camera " + std::to_string(camera_index_) + " not available"))) {
            logDebug(log_tag_, "client went away before the 503 was written");
        }
        return;
    }

    ConnectionGuard guard(*connections_);
    logInfo(log_tag_, "new client for camera " + std::to_string(camera_index_) + " from " + request.client_address +
                          ". Active: " + std::to_string(guard.activeAtEntry()));

    std::string reason = "server shutting down";
    uint64_t parts_sent = 0;
    if (!writeString(writer, responseHead())) {
        reason = "write failed";
    } else {
        int64_t last_frame_ns = nowSteadyNs();
        const int64_t stall_ns = static_cast<int64_t>(cfg_.stall_timeout_ms) * 1000000LL;
        while (!writer.cancelled()) {
            EncodedFrame frame;
            const FrameWait w = broadcaster_->getFrame(frame, cfg_.wait_poll_ms);
            if (w == FrameWait::Stopped) {
                reason = "camera stopped";
                break;
            }
            if (w == FrameWait::Timeout) {
                if (stall_ns > 0 && nowSteadyNs() - last_frame_ns >= stall_ns) {
                    reason = "no frame for " + std::to_string(cfg_.stall_timeout_ms) + " ms";
                    break;
                }
                continue;
            }
            if (!frame.jpeg || frame.jpeg->empty()) {
                continue;
            }
            if (!writePart(writer, *frame.jpeg)) {
                reason = "write failed";
                break;
            }
            parts_sent++;
            last_frame_ns = nowSteadyNs();
        }
    }

    const int remaining = guard.release();
    logInfo(log_tag_, "camera " + std::to_string(camera_index_) + " client " + request.client_address +
                          " disconnected (" + reason + ", " + std::to_string(parts_sent) + " frames sent). Active: " +
                          std::to_string(remaining));
}

}  // namespace camrelay
