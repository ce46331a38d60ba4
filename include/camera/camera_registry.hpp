#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/config.hpp"

namespace camrelay {

// Static map of camera index -> capture/overlay configuration. Built once at
// startup; entries are never mutated afterwards.
class CameraRegistry {
public:
    CameraRegistry() = default;
    explicit CameraRegistry(const std::vector<CameraConfig>& cameras);

    static std::vector<CameraConfig> builtinCameras();
    static CameraConfig defaultCamera(int index);
    static std::string streamPath(int index);

    bool add(const CameraConfig& cam);
    bool contains(int index) const;
    const CameraConfig* find(int index) const;
    CameraConfig configFor(int index) const;

    std::vector<CameraConfig> cameras() const;
    std::size_t size() const { return cameras_.size(); }

private:
    std::map<int, CameraConfig> cameras_;
};

}  // namespace camrelay
