#include "camera/camera_registry.hpp"

namespace camrelay {

CameraRegistry::CameraRegistry(const std::vector<CameraConfig>& cameras) {
    for (const auto& cam : cameras) {
        add(cam);
    }
}

std::vector<CameraConfig> CameraRegistry::builtinCameras() {
    CameraConfig main_cam;
    main_cam.index = 0;
    main_cam.description = "Main Camera (Fish Tank)";
    main_cam.frame_rate = 15.0;
    main_cam.width = 1280;
    main_cam.height = 720;
    main_cam.overlay.enabled = true;
    main_cam.overlay.text = "WNCC STEM Club Meeting Thursday at 4 in C1";
    main_cam.overlay.cycle_minutes = 10.0;
    main_cam.overlay.duration_seconds = 30.0;
    main_cam.overlay.font_scale = 0.8;
    main_cam.overlay.background_opacity = 0.7;
    main_cam.overlay.text_opacity = 0.9;
    // burnt orange
    main_cam.overlay.text_color_b = 0;
    main_cam.overlay.text_color_g = 85;
    main_cam.overlay.text_color_r = 204;

    CameraConfig plant_cam;
    plant_cam.index = 2;
    plant_cam.description = "Secondary Camera (Plant Beds)";
    plant_cam.frame_rate = 7.5;
    plant_cam.width = 1280;
    plant_cam.height = 720;
    plant_cam.overlay.enabled = false;
    plant_cam.overlay.text.clear();
    plant_cam.overlay.font_scale = 0.7;
    plant_cam.overlay.background_opacity = 0.5;
    plant_cam.overlay.text_opacity = 1.0;
    plant_cam.overlay.text_color_b = 255;
    plant_cam.overlay.text_color_g = 255;
    plant_cam.overlay.text_color_r = 255;

    return {main_cam, plant_cam};
}

CameraConfig CameraRegistry::defaultCamera(int index) {
    CameraConfig cam;
    cam.index = index;
    return cam;
}

std::string CameraRegistry::streamPath(int index) {
    return "/stream" + std::to_string(index) + ".mjpg";
}

bool CameraRegistry::add(const CameraConfig& cam) {
    return cameras_.emplace(cam.index, cam).second;
}

bool CameraRegistry::contains(int index) const {
    return cameras_.find(index) != cameras_.end();
}

const CameraConfig* CameraRegistry::find(int index) const {
    const auto it = cameras_.find(index);
    if (it == cameras_.end()) {
        return nullptr;
    }
    return &it->second;
}

CameraConfig CameraRegistry::configFor(int index) const {
    const CameraConfig* cam = find(index);
    if (cam != nullptr) {
        return *cam;
    }
    return defaultCamera(index);
}

std::vector<CameraConfig> CameraRegistry::cameras() const {
    std::vector<CameraConfig> out;
    out.reserve(cameras_.size());
    for (const auto& kv : cameras_) {
        out.push_back(kv.second);
    }
    return out;
}

}  // namespace camrelay
