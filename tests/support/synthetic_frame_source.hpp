#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include <opencv2/core.hpp>

#include "camera/frame_source.hpp"

namespace camrelay::testing {

// Deterministic FrameSource for tests. Every frame has four solid quadrants
// (top-left blue, top-right green, bottom-left red, bottom-right white), and
// the frame counter is stamped into the top-left pixel's green channel.
class SyntheticFrameSource : public FrameSource {
public:
    struct Counters {
        std::atomic<int> opens{0};
        std::atomic<int> reads{0};
        std::atomic<int> closes{0};
    };

    SyntheticFrameSource(int width, int height, double fps, std::shared_ptr<Counters> counters = nullptr)
        : width_(width),
          height_(height),
          frame_period_(std::chrono::microseconds(fps > 0.0 ? static_cast<long long>(1e6 / fps) : 0)),
          counters_(counters ? std::move(counters) : std::make_shared<Counters>()) {}

    void failOpen(const std::string& reason) { open_error_ = reason; }
    // Reads numbered [from, from + count) fail.
    void failReads(int from, int count) {
        fail_from_ = from;
        fail_count_ = count;
    }
    // Reads numbered [from, from + count) succeed but return a 5-channel
    // frame that neither the JPEG encoder nor the overlay drawing accepts.
    // Reads numbered [from, from + count) succeed with an empty frame.
    void emptyFrames(int from, int count) {
        empty_from_ = from;
        empty_count_ = count;
    }
    void corruptFrames(int from, int count) {
        corrupt_from_ = from;
        corrupt_count_ = count;
    }

    bool open(std::string& error) override {
        counters_->opens.fetch_add(1);
        if (!open_error_.empty()) {
            error = open_error_;
            return false;
        }
        open_ = true;
        return true;
    }

    bool read(cv::Mat& frame, std::string& error) override {
        if (!open_) {
            error = "not open";
            return false;
        }
        const int n = counters_->reads.fetch_add(1);
        if (frame_period_.count() > 0) {
            std::this_thread::sleep_for(frame_period_);
        }
        if (n >= fail_from_ && n < fail_from_ + fail_count_) {
            error = "synthetic read failure";
            return false;
        }
        if (n >= empty_from_ && n < empty_from_ + empty_count_) {
            frame = cv::Mat();
            return true;
        }
        if (n >= corrupt_from_ && n < corrupt_from_ + corrupt_count_) {
            frame = cv::Mat(height_, width_ * 5, CV_8UC1, cv::Scalar(0)).reshape(5);
            return true;
        }
        frame = makePattern(width_, height_);
        frame.at<cv::Vec3b>(0, 0)[1] = static_cast<unsigned char>(n & 0xFF);
        return true;
    }

    void close() override {
        counters_->closes.fetch_add(1);
        open_ = false;
    }

    bool isOpen() const override { return open_; }
    std::string description() const override { return "synthetic " + std::to_string(width_) + "x" + std::to_string(height_); }

    static cv::Mat makePattern(int width, int height) {
        cv::Mat m(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        const int hw = width / 2;
        const int hh = height / 2;
        m(cv::Rect(0, 0, hw, hh)).setTo(cv::Scalar(255, 0, 0));
        m(cv::Rect(hw, 0, width - hw, hh)).setTo(cv::Scalar(0, 255, 0));
        m(cv::Rect(0, hh, hw, height - hh)).setTo(cv::Scalar(0, 0, 255));
        m(cv::Rect(hw, hh, width - hw, height - hh)).setTo(cv::Scalar(255, 255, 255));
        return m;
    }

    const std::shared_ptr<Counters>& counters() const { return counters_; }

private:
    int width_;
    int height_;
    std::chrono::microseconds frame_period_;
    std::shared_ptr<Counters> counters_;
    std::string open_error_;
    int fail_from_{-1};
    int fail_count_{0};
    int empty_from_{-1};
    int empty_count_{0};
    int corrupt_from_{-1};
    int corrupt_count_{0};
    bool open_{false};
};

// Fast capture settings so tests do not spend a second warming up.
inline CaptureConfig testCaptureConfig() {
    CaptureConfig c;
    c.warmup_frames = 1;
    c.warmup_delay_ms = 0;
    c.read_retry_delay_ms = 1;
    return c;
}

}  // namespace camrelay::testing
