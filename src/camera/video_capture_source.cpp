#include "camera/video_capture_source.hpp"

#include <cmath>

#include "core/logging.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace camrelay {

VideoCaptureSource::VideoCaptureSource(const CameraConfig& camera, const CaptureConfig& capture)
    : camera_(camera), capture_(capture), log_tag_("camera" + std::to_string(camera.index)) {}

VideoCaptureSource::~VideoCaptureSource() {
    close();
}

std::vector<CaptureBackend> VideoCaptureSource::backendCandidates(const std::string& source_mode) {
    if (source_mode == "v4l2") {
        return {{cv::CAP_V4L2, "V4L2"}};
    }
    std::vector<CaptureBackend> out;
#if defined(_WIN32)
    out.push_back({cv::CAP_DSHOW, "DirectShow"});
#elif defined(__APPLE__)
    out.push_back({cv::CAP_AVFOUNDATION, "AVFoundation"});
#else
    out.push_back({cv::CAP_V4L2, "V4L2"});
#endif
    out.push_back({cv::CAP_ANY, "default"});
    return out;
}

bool VideoCaptureSource::openBackend(const CaptureBackend& backend, std::string& error) {
#ifdef __linux__
    if (backend.api == cv::CAP_V4L2) {
        const std::string dev = "/dev/video" + std::to_string(camera_.index);
        if (::access(dev.c_str(), F_OK) != 0) {
            error = "V4L2 device not found: " + dev;
            return false;
        }
    }
#endif
    try {
        if (!cap_.open(camera_.index, backend.api)) {
            error = "backend " + backend.name + " could not open device index " + std::to_string(camera_.index);
            return false;
        }
    } catch (const cv::Exception& e) {
        error = "backend " + backend.name + " failed: " + e.what();
        cap_.release();
        return false;
    }
    active_source_desc_ = backend.name + ":" + std::to_string(camera_.index);
    error.clear();
    return true;
}

bool VideoCaptureSource::openGStreamer(std::string& error) {
    try {
        if (!cap_.open(camera_.gstreamer_pipeline, cv::CAP_GSTREAMER)) {
            error = "failed to open GStreamer pipeline";
            return false;
        }
    } catch (const cv::Exception& e) {
        error = std::string("GStreamer pipeline failed: ") + e.what();
        cap_.release();
        return false;
    }
    active_source_desc_ = "gstreamer:" + camera_.gstreamer_pipeline;
    error.clear();
    return true;
}

void VideoCaptureSource::applyRequestedMode() {
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(camera_.width));
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(camera_.height));
    cap_.set(cv::CAP_PROP_FPS, camera_.frame_rate);

    // Hardware may clamp to its nearest supported mode without reporting it.
    const int actual_w = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    const int actual_h = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    const double actual_fps = cap_.get(cv::CAP_PROP_FPS);

    logInfo(log_tag_, "requested " + std::to_string(camera_.width) + "x" + std::to_string(camera_.height) +
                          " @ " + std::to_string(camera_.frame_rate) + " FPS");
    logInfo(log_tag_, camera_.description + " - actual " + std::to_string(actual_w) + "x" +
                          std::to_string(actual_h) + " @ " + std::to_string(actual_fps) + " FPS");
    if (actual_w != camera_.width || actual_h != camera_.height) {
        logWarning(log_tag_, "camera is using " + std::to_string(actual_w) + "x" + std::to_string(actual_h) +
                                 " instead of the requested resolution");
    }
    if (std::abs(actual_fps - camera_.frame_rate) > 0.01) {
        logWarning(log_tag_, "camera is using " + std::to_string(actual_fps) + " FPS instead of requested " +
                                 std::to_string(camera_.frame_rate) + " FPS");
    }
}

bool VideoCaptureSource::probe() {
    cv::Mat frame;
    for (int i = 0; i < capture_.probe_attempts; ++i) {
        try {
            if (cap_.read(frame) && !frame.empty()) {
                return true;
            }
        } catch (const cv::Exception& e) {
            logWarning(log_tag_, std::string("probe read threw: ") + e.what());
        }
    }
    return false;
}

bool VideoCaptureSource::open(std::string& error) {
    close();

    std::vector<std::string> failures;
    if (camera_.source_mode == "gstreamer") {
        std::string gst_error;
        if (openGStreamer(gst_error)) {
            if (probe()) {
                logInfo(log_tag_, "opened " + active_source_desc_);
                applyRequestedMode();
                error.clear();
                return true;
            }
            gst_error = "GStreamer pipeline opened but produced no frames";
            close();
        }
        // Requested GStreamer path failed; fall back to the device backends.
        logWarning(log_tag_, gst_error);
        failures.push_back(gst_error);
    }

    for (const auto& backend : backendCandidates(camera_.source_mode)) {
        std::string backend_error;
        if (!openBackend(backend, backend_error)) {
            logWarning(log_tag_, backend_error);
            failures.push_back(backend_error);
            continue;
        }
        applyRequestedMode();
        if (!probe()) {
            backend_error = "backend " + backend.name + " opened but produced no frames after " +
                std::to_string(capture_.probe_attempts) + " attempts";
            logWarning(log_tag_, backend_error);
            failures.push_back(backend_error);
            close();
            continue;
        }
        logInfo(log_tag_, "opened with backend " + backend.name);
        error.clear();
        return true;
    }

    error = "could not open camera " + std::to_string(camera_.index);
    if (!failures.empty()) {
        error += " (" + failures.back() + ")";
    }
    return false;
}

bool VideoCaptureSource::read(cv::Mat& frame, std::string& error) {
    if (!cap_.isOpened()) {
        error = "camera is not open";
        return false;
    }
    try {
        if (!cap_.read(frame) || frame.empty()) {
            error = "failed to read frame";
            return false;
        }
    } catch (const cv::Exception& e) {
        error = std::string("read threw: ") + e.what();
        return false;
    }
    error.clear();
    return true;
}

void VideoCaptureSource::close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
    active_source_desc_.clear();
}

bool VideoCaptureSource::isOpen() const {
    return cap_.isOpened();
}

}  // namespace camrelay
