#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <opencv2/core.hpp>

#include "camera/frame_source.hpp"
#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"
#include "overlay/overlay_compositor.hpp"
#include "stream/frame_encoder.hpp"

namespace camrelay {

// Single-producer, multi-consumer latest-frame relay for one camera.
//
// One capture thread reads the FrameSource, rotates, composites the overlay,
// encodes and replaces a single shared slot. Readers block in getFrame() until
// the next publish. Nothing is queued: a slow reader skips whatever it missed.
//
// Lifecycle is Idle -> Running -> Stopped, or Idle -> Failed -> Stopped. A
// broadcaster is never restarted; build a new one instead.
class FrameBroadcaster {
public:
    enum class State {
        Idle,
        Running,
        Failed,
        Stopped,
    };

    FrameBroadcaster(const CameraConfig& camera, const CaptureConfig& capture, std::unique_ptr<FrameSource> source);
    ~FrameBroadcaster();

    FrameBroadcaster(const FrameBroadcaster&) = delete;
    FrameBroadcaster& operator=(const FrameBroadcaster&) = delete;

    // Opens the source, warms it up and spawns the capture thread. Only the
    // first call can succeed; a failed open leaves the broadcaster Failed.
    bool start(std::string& error);

    // Wakes all readers, joins the capture thread and releases the source.
    // Safe to call in any state and more than once, including from another
    // thread while start() is still warming up; it then waits for start() to
    // finish and the source is never read after it returns.
    void stop();

    // Blocks until a frame newer than the one current at entry is published.
    // timeout_ms < 0 waits indefinitely.
    FrameWait getFrame(EncodedFrame& out, int timeout_ms = -1);

    State state() const;
    bool isRunning() const { return state() == State::Running; }
    bool overlayShown() const;
    uint64_t publishedSequence() const;
    int64_t lastPublishNs() const;

    const CameraConfig& camera() const { return camera_; }
    const std::string& logTag() const { return log_tag_; }
    TelemetrySnapshot telemetry() const { return telemetry_.snapshot(); }

private:
    void captureLoop();
    void publish(JpegBuffer jpeg, int64_t timestamp_ns, bool overlay_shown);

    const CameraConfig camera_;
    const CaptureConfig capture_;
    const std::string log_tag_;

    // Serialises start() and stop(). Guards source_opened_ and capture_thread_.
    std::mutex lifecycle_mutex_;

    // Touched only by start()/stop() and the capture thread.
    std::unique_ptr<FrameSource> source_;
    bool source_opened_{false};
    std::unique_ptr<OverlayCompositor> compositor_;
    FrameEncoder encoder_;
    std::thread capture_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::condition_variable frame_cv_;
    State state_{State::Idle};
    JpegBuffer latest_;
    uint64_t sequence_{0};
    int64_t latest_timestamp_ns_{0};
    bool overlay_shown_{false};

    Telemetry telemetry_;
};

const char* broadcasterStateName(FrameBroadcaster::State state);

}  // namespace camrelay
