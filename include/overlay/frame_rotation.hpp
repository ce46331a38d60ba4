#pragma once

#include <opencv2/core.hpp>

namespace camrelay {

bool isSupportedRotation(int rotation_deg);

// Clockwise rotation by 0/90/180/270 degrees. 0 shares `in`'s data.
bool rotateFrame(const cv::Mat& in, cv::Mat& out, int rotation_deg);

}  // namespace camrelay
