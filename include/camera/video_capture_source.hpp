#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "camera/frame_source.hpp"
#include "core/config.hpp"

namespace camrelay {

struct CaptureBackend {
    int api{cv::CAP_ANY};
    std::string name;
};

// cv::VideoCapture over a local device index or a GStreamer pipeline.
class VideoCaptureSource : public FrameSource {
public:
    VideoCaptureSource(const CameraConfig& camera, const CaptureConfig& capture);
    ~VideoCaptureSource() override;

    bool open(std::string& error) override;
    bool read(cv::Mat& frame, std::string& error) override;
    void close() override;
    bool isOpen() const override;
    std::string description() const override { return active_source_desc_; }

    // Platform-preferred capture API first, generic fallback last.
    static std::vector<CaptureBackend> backendCandidates(const std::string& source_mode);

private:
    bool openBackend(const CaptureBackend& backend, std::string& error);
    bool openGStreamer(std::string& error);
    bool probe();
    void applyRequestedMode();

    cv::VideoCapture cap_;
    CameraConfig camera_;
    CaptureConfig capture_;
    std::string log_tag_;
    std::string active_source_desc_;
};

}  // namespace camrelay
