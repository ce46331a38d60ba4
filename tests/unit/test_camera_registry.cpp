#include "camera/camera_registry.hpp"

#include <iostream>

int main() {
    const camrelay::CameraRegistry registry(camrelay::CameraRegistry::builtinCameras());

    if (registry.size() != 2 || !registry.contains(0) || !registry.contains(2) || registry.contains(1)) {
        std::cerr << "built-in registry should hold cameras 0 and 2\n";
        return 1;
    }

    const camrelay::CameraConfig* main_cam = registry.find(0);
    if (main_cam == nullptr || main_cam->frame_rate != 15.0 || !main_cam->overlay.enabled) {
        std::cerr << "camera 0 should run at 15 fps with its overlay enabled\n";
        return 1;
    }
    if (main_cam->overlay.cycle_minutes != 10.0 || main_cam->overlay.duration_seconds != 30.0) {
        std::cerr << "camera 0 overlay should show 30 s every 10 min\n";
        return 1;
    }
    if (main_cam->overlay.text_color_b != 0 || main_cam->overlay.text_color_g != 85 || main_cam->overlay.text_color_r != 204) {
        std::cerr << "camera 0 text colour mismatch\n";
        return 1;
    }

    const camrelay::CameraConfig plant = registry.configFor(2);
    if (plant.frame_rate != 7.5 || plant.overlay.enabled) {
        std::cerr << "camera 2 should run at 7.5 fps without an overlay\n";
        return 1;
    }

    const camrelay::CameraConfig other = registry.configFor(5);
    if (other.index != 5 || other.description != "Additional Camera" || other.frame_rate != 10.0 || other.overlay.enabled) {
        std::cerr << "unknown index should get the default camera config\n";
        return 1;
    }

    camrelay::CameraRegistry custom;
    if (!custom.add(other) || custom.add(other)) {
        std::cerr << "second add of the same index should be rejected\n";
        return 1;
    }

    if (camrelay::CameraRegistry::streamPath(0) != "/stream0.mjpg" ||
        camrelay::CameraRegistry::streamPath(12) != "/stream12.mjpg") {
        std::cerr << "stream path format mismatch\n";
        return 1;
    }

    const auto cams = registry.cameras();
    if (cams.size() != 2 || cams[0].index != 0 || cams[1].index != 2) {
        std::cerr << "cameras() should list in index order\n";
        return 1;
    }
    return 0;
}
