#include "stream/frame_broadcaster.hpp"

#include <chrono>
#include <cmath>
#include <utility>

#include "core/logging.hpp"
#include "core/time_utils.hpp"
#include "overlay/frame_rotation.hpp"

namespace camrelay {

namespace {

constexpr int64_t kStatsPeriodNs = 60LL * 1000000000LL;
constexpr uint64_t kReadFailureLogEvery = 100;

}  // namespace

const char* broadcasterStateName(FrameBroadcaster::State state) {
    switch (state) {
    case FrameBroadcaster::State::Idle:
        return "idle";
    case FrameBroadcaster::State::Running:
        return "running";
    case FrameBroadcaster::State::Failed:
        return "failed";
    case FrameBroadcaster::State::Stopped:
        return "stopped";
    }
    return "unknown";
}

FrameBroadcaster::FrameBroadcaster(
    const CameraConfig& camera,
    const CaptureConfig& capture,
    std::unique_ptr<FrameSource> source)
    : camera_(camera),
      capture_(capture),
      log_tag_("camera" + std::to_string(camera.index)),
      source_(std::move(source)),
      encoder_(camera.jpeg_quality) {}

FrameBroadcaster::~FrameBroadcaster() {
    stop();
}

bool FrameBroadcaster::start(std::string& error) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Idle) {
            error = "broadcaster already " + std::string(broadcasterStateName(state_));
            return false;
        }
    }

    logInfo(log_tag_, "starting capture (" + camera_.description + ")");
    std::string open_error;
    if (!source_ || !source_->open(open_error)) {
        if (!source_) {
            open_error = "no frame source";
        }
        error = "hardware unavailable: " + open_error;
        logError(log_tag_, error);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Failed;
        return false;
    }
    source_opened_ = true;
    logInfo(log_tag_, "source " + source_->description());

    warmUpSource(*source_, capture_.warmup_frames, capture_.warmup_delay_ms, log_tag_);

    compositor_ = std::make_unique<OverlayCompositor>(camera_.overlay, camera_.index, nowSteadyNs());
    running_.store(true);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Running;
    }
    capture_thread_ = std::thread(&FrameBroadcaster::captureLoop, this);
    error.clear();
    return true;
}

void FrameBroadcaster::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Stopped) {
            return;
        }
        state_ = State::Stopped;
    }
    running_.store(false);
    frame_cv_.notify_all();

    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
    if (source_opened_) {
        source_->close();
        source_opened_ = false;
        const auto t = telemetry_.snapshot();
        logInfo(log_tag_, "stopped after publishing " + std::to_string(t.frames_published) + " frames");
    }
}

FrameWait FrameBroadcaster::getFrame(EncodedFrame& out, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != State::Running) {
        return FrameWait::Stopped;
    }

    const uint64_t seen = sequence_;
    const auto ready = [this, seen]() {
        return sequence_ != seen || state_ != State::Running;
    };
    if (timeout_ms < 0) {
        frame_cv_.wait(lock, ready);
    } else if (!frame_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) {
        return FrameWait::Timeout;
    }
    if (sequence_ == seen) {
        return FrameWait::Stopped;
    }

    out.jpeg = latest_;
    out.sequence = sequence_;
    out.timestamp_ns = latest_timestamp_ns_;
    return FrameWait::Frame;
}

FrameBroadcaster::State FrameBroadcaster::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool FrameBroadcaster::overlayShown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overlay_shown_;
}

uint64_t FrameBroadcaster::publishedSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

int64_t FrameBroadcaster::lastPublishNs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_timestamp_ns_;
}

void FrameBroadcaster::publish(JpegBuffer jpeg, int64_t timestamp_ns, bool overlay_shown) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(jpeg);
        latest_timestamp_ns_ = timestamp_ns;
        overlay_shown_ = overlay_shown;
        ++sequence_;
    }
    frame_cv_.notify_all();
    telemetry_.addPublished();
}

void FrameBroadcaster::captureLoop() {
    const int64_t interval_ns = static_cast<int64_t>(std::llround(1e9 / camera_.max_stream_fps));
    int64_t next_due_ns = 0;
    int64_t stats_window_start_ns = nowSteadyNs();
    uint64_t consecutive_failures = 0;

    cv::Mat raw;
    cv::Mat frame;
    std::string error;

    while (running_.load()) {
        if (!source_->read(raw, error)) {
            telemetry_.addReadFailure();
            if (consecutive_failures % kReadFailureLogEvery == 0) {
                logWarning(log_tag_, "failed to read frame: " + error +
                                         " (consecutive failures: " + std::to_string(consecutive_failures + 1) + ")");
            }
            consecutive_failures++;
            std::this_thread::sleep_for(std::chrono::milliseconds(capture_.read_retry_delay_ms));
            continue;
        }
        // An empty frame on a successful read counts as a read failure.
        if (raw.empty()) {
            telemetry_.addReadFailure();
            logWarning(log_tag_, "source returned an empty frame");
            continue;
        }
        if (consecutive_failures > 0) {
            logInfo(log_tag_, "frame reads recovered after " + std::to_string(consecutive_failures) + " failures");
            consecutive_failures = 0;
        }
        telemetry_.addCaptured();

        // Delivery cap: frames arriving ahead of schedule are dropped, never held.
        const int64_t now_ns = nowSteadyNs();
        if (now_ns < next_due_ns) {
            telemetry_.addRateDropped();
            continue;
        }
        next_due_ns += interval_ns;
        if (next_due_ns < now_ns - interval_ns) {
            next_due_ns = now_ns + interval_ns;
        }

        try {
            if (!rotateFrame(raw, frame, camera_.rotation_deg)) {
                telemetry_.addProcessFailure();
                logWarning(log_tag_, "unsupported rotation " + std::to_string(camera_.rotation_deg));
                continue;
            }
            compositor_->apply(frame, now_ns);
        } catch (const cv::Exception& e) {
            telemetry_.addProcessFailure();
            logWarning(log_tag_, std::string("dropping frame, rotate/overlay failed: ") + e.what());
            continue;
        }

        JpegBytes encoded;
        if (!encoder_.encode(frame, encoded, error)) {
            telemetry_.addEncodeFailure();
            logWarning(log_tag_, "dropping frame, encode failed: " + error);
            continue;
        }
        publish(std::make_shared<const JpegBytes>(std::move(encoded)), now_ns, compositor_->shown());

        if (now_ns - stats_window_start_ns >= kStatsPeriodNs) {
            const auto t = telemetry_.snapshot();
            logDebug(log_tag_, "captured=" + std::to_string(t.frames_captured) +
                                   " published=" + std::to_string(t.frames_published) +
                                   " rate_dropped=" + std::to_string(t.frames_rate_dropped) +
                                   " read_failures=" + std::to_string(t.read_failures) +
                                   " encode_failures=" + std::to_string(t.encode_failures) +
                                   " process_failures=" + std::to_string(t.process_failures));
            stats_window_start_ns = now_ns;
        }
    }
}

}  // namespace camrelay
