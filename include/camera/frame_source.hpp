#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"

namespace camrelay {

// Producer-side handle to one capture device. Only the thread that owns the
// broadcaster's capture loop touches it after open().
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open(std::string& error) = 0;
    virtual bool read(cv::Mat& frame, std::string& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string description() const = 0;
};

// Reads and discards `frames` frames, sleeping `delay_ms` between reads, so
// auto-exposure settles before the first published frame. Returns the number
// of reads that failed.
int warmUpSource(FrameSource& source, int frames, int delay_ms, const std::string& log_tag);

std::unique_ptr<FrameSource> makeFrameSource(const CameraConfig& camera, const CaptureConfig& capture);

}  // namespace camrelay
