#include "camera/frame_source.hpp"

#include <chrono>
#include <thread>

#include "camera/video_capture_source.hpp"
#include "core/logging.hpp"

namespace camrelay {

int warmUpSource(FrameSource& source, int frames, int delay_ms, const std::string& log_tag) {
    if (frames <= 0) {
        return 0;
    }
    logInfo(log_tag, "warming up camera (" + std::to_string(frames) + " frames)");
    int failed = 0;
    cv::Mat discard;
    std::string error;
    for (int i = 0; i < frames; ++i) {
        if (!source.read(discard, error)) {
            failed++;
            logWarning(log_tag, "warm-up frame " + std::to_string(i + 1) + " failed: " + error);
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
    logInfo(log_tag, "camera warm-up complete");
    return failed;
}

std::unique_ptr<FrameSource> makeFrameSource(const CameraConfig& camera, const CaptureConfig& capture) {
    return std::make_unique<VideoCaptureSource>(camera, capture);
}

}  // namespace camrelay
