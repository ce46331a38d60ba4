#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"
#include "stream/frame_broadcaster.hpp"
#include "web/http.hpp"

namespace camrelay {

// GET /stream<N>.mjpg: one multipart/x-mixed-replace response per connection,
// one JPEG part per frame pulled from the camera's broadcaster.
class StreamEndpoint : public RouteHandler {
public:
    // `broadcaster` may be null when the camera could not be created; such a
    // route answers 503 like a broadcaster that failed to start.
    StreamEndpoint(
        int camera_index,
        std::shared_ptr<FrameBroadcaster> broadcaster,
        std::shared_ptr<ConnectionCounter> connections,
        const StreamConfig& cfg);

    void handle(const HttpRequest& request, ResponseWriter& writer) override;

    static const char* boundary() { return "FRAME"; }
    static std::string multipartContentType();
    static std::string responseHead();
    static std::string partHeader(std::size_t content_length);
    static bool writePart(ResponseWriter& writer, const JpegBytes& jpeg);

    int activeConnections() const { return connections_->active(); }

private:
    bool available() const;

    int camera_index_{0};
    std::shared_ptr<FrameBroadcaster> broadcaster_;
    std::shared_ptr<ConnectionCounter> connections_;
    StreamConfig cfg_;
    std::string log_tag_;
};

}  // namespace camrelay
