#include "stream/frame_encoder.hpp"

#include <algorithm>
#include <vector>

#include <opencv2/imgcodecs.hpp>

namespace camrelay {

FrameEncoder::FrameEncoder(int jpeg_quality) : jpeg_quality_(std::clamp(jpeg_quality, 1, 100)) {}

bool FrameEncoder::encode(const cv::Mat& bgr_frame, JpegBytes& out, std::string& error) const {
    if (bgr_frame.empty()) {
        error = "cannot encode an empty frame";
        return false;
    }

    const std::vector<int> params{
        cv::IMWRITE_JPEG_QUALITY, jpeg_quality_
    };
    try {
        if (!cv::imencode(".jpg", bgr_frame, out, params)) {
            error = "cv::imencode rejected the frame";
            return false;
        }
    } catch (const cv::Exception& e) {
        error = std::string("cv::imencode threw: ") + e.what();
        return false;
    }
    if (out.empty()) {
        error = "encoder produced no bytes";
        return false;
    }
    error.clear();
    return true;
}

}  // namespace camrelay
