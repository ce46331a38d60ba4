#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace camrelay {

class FrameEncoder {
public:
    explicit FrameEncoder(int jpeg_quality = 85);

    int quality() const { return jpeg_quality_; }
    bool encode(const cv::Mat& bgr_frame, JpegBytes& out, std::string& error) const;

private:
    int jpeg_quality_{85};
};

}  // namespace camrelay
