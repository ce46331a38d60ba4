#include "overlay/frame_rotation.hpp"

namespace camrelay {

bool isSupportedRotation(int rotation_deg) {
    return rotation_deg == 0 || rotation_deg == 90 || rotation_deg == 180 || rotation_deg == 270;
}

bool rotateFrame(const cv::Mat& in, cv::Mat& out, int rotation_deg) {
    if (in.empty()) {
        return false;
    }
    switch (rotation_deg) {
    case 0:
        out = in;
        return true;
    case 90:
        cv::rotate(in, out, cv::ROTATE_90_CLOCKWISE);
        return true;
    case 180:
        cv::rotate(in, out, cv::ROTATE_180);
        return true;
    case 270:
        cv::rotate(in, out, cv::ROTATE_90_COUNTERCLOCKWISE);
        return true;
    default:
        return false;
    }
}

}  // namespace camrelay
