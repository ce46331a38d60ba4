#include "core/config.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <opencv2/core.hpp>

#include "camera/camera_registry.hpp"

namespace camrelay {

namespace {

const char* const kCameraSectionPrefix = "camera_";

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "yes" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "no" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

// "[0, 85, 204]" or "0,85,204" -> b, g, r
bool toBgr(const std::string& v, OverlayConfig& overlay) {
    std::string t = trim(v);
    if (!t.empty() && t.front() == '[') {
        t = t.substr(1);
    }
    if (!t.empty() && t.back() == ']') {
        t.pop_back();
    }
    std::stringstream ss(t);
    std::string item;
    int channels[3] = {0, 0, 0};
    int count = 0;
    while (std::getline(ss, item, ',')) {
        if (count >= 3) {
            return false;
        }
        channels[count++] = std::stoi(trim(item));
    }
    if (count != 3) {
        return false;
    }
    overlay.text_color_b = channels[0];
    overlay.text_color_g = channels[1];
    overlay.text_color_r = channels[2];
    return true;
}

bool parseCameraSection(const std::string& section, int& index) {
    const std::string prefix(kCameraSectionPrefix);
    if (section.compare(0, prefix.size(), prefix) != 0 || section.size() == prefix.size()) {
        return false;
    }
    const std::string digits = section.substr(prefix.size());
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    index = std::stoi(digits);
    return true;
}

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isString()) {
        bool b = out;
        if (toBool(static_cast<std::string>(child), b)) {
            out = b;
        }
        return;
    }
    int v = out ? 1 : 0;
    child >> v;
    out = v != 0;
}

void readColorOrDefault(const cv::FileNode& node, const char* key, OverlayConfig& overlay) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isSeq() && child.size() == 3) {
        overlay.text_color_b = static_cast<int>(child[0]);
        overlay.text_color_g = static_cast<int>(child[1]);
        overlay.text_color_r = static_cast<int>(child[2]);
    } else if (child.isString()) {
        toBgr(static_cast<std::string>(child), overlay);
    }
}

void readCameraNode(const cv::FileNode& node, CameraConfig& cam) {
    readOrDefault(node, "description", cam.description);
    readOrDefault(node, "source_mode", cam.source_mode);
    readOrDefault(node, "gstreamer_pipeline", cam.gstreamer_pipeline);
    readOrDefault(node, "width", cam.width);
    readOrDefault(node, "height", cam.height);
    readOrDefault(node, "frame_rate", cam.frame_rate);
    readOrDefault(node, "max_stream_fps", cam.max_stream_fps);
    readOrDefault(node, "rotation_deg", cam.rotation_deg);
    readOrDefault(node, "jpeg_quality", cam.jpeg_quality);

    readBoolOrDefault(node, "overlay_enabled", cam.overlay.enabled);
    readOrDefault(node, "overlay_text", cam.overlay.text);
    readOrDefault(node, "overlay_cycle_minutes", cam.overlay.cycle_minutes);
    readOrDefault(node, "overlay_duration_seconds", cam.overlay.duration_seconds);
    readOrDefault(node, "overlay_font_scale", cam.overlay.font_scale);
    readOrDefault(node, "overlay_transparency", cam.overlay.background_opacity);
    readOrDefault(node, "text_transparency", cam.overlay.text_opacity);
    readOrDefault(node, "overlay_thickness", cam.overlay.thickness);
    readColorOrDefault(node, "text_color", cam.overlay);
}

void applyCameraKey(CameraConfig& cam, const std::string& key, const std::string& value) {
    if (key == "description") cam.description = value;
    else if (key == "source_mode") cam.source_mode = value;
    else if (key == "gstreamer_pipeline") cam.gstreamer_pipeline = value;
    else if (key == "width") cam.width = std::stoi(value);
    else if (key == "height") cam.height = std::stoi(value);
    else if (key == "frame_rate") cam.frame_rate = std::stod(value);
    else if (key == "max_stream_fps") cam.max_stream_fps = std::stod(value);
    else if (key == "rotation_deg") cam.rotation_deg = std::stoi(value);
    else if (key == "jpeg_quality") cam.jpeg_quality = std::stoi(value);
    else if (key == "overlay_enabled") {
        bool b = cam.overlay.enabled;
        if (toBool(value, b)) cam.overlay.enabled = b;
    } else if (key == "overlay_text") cam.overlay.text = value;
    else if (key == "overlay_cycle_minutes") cam.overlay.cycle_minutes = std::stod(value);
    else if (key == "overlay_duration_seconds") cam.overlay.duration_seconds = std::stod(value);
    else if (key == "overlay_font_scale") cam.overlay.font_scale = std::stod(value);
    else if (key == "overlay_transparency") cam.overlay.background_opacity = std::stod(value);
    else if (key == "text_transparency") cam.overlay.text_opacity = std::stod(value);
    else if (key == "overlay_thickness") cam.overlay.thickness = std::stoi(value);
    else if (key == "text_color") toBgr(value, cam.overlay);
}

bool loadConfigFileStorage(const std::string& path, AppConfig& out, std::string& error) {
    const cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
        error = "cv::FileStorage could not open " + path;
        return false;
    }

    const cv::FileNode server = fs["server"];
    const cv::FileNode capture = fs["capture"];
    const cv::FileNode stream = fs["stream"];
    const cv::FileNode logging = fs["logging"];

    readOrDefault(server, "port", out.server.port);
    readOrDefault(server, "bind_address", out.server.bind_address);
    readOrDefault(server, "listen_backlog", out.server.listen_backlog);
    readOrDefault(server, "page_title", out.server.page_title);

    readOrDefault(capture, "probe_attempts", out.capture.probe_attempts);
    readOrDefault(capture, "warmup_frames", out.capture.warmup_frames);
    readOrDefault(capture, "warmup_delay_ms", out.capture.warmup_delay_ms);
    readOrDefault(capture, "read_retry_delay_ms", out.capture.read_retry_delay_ms);

    readOrDefault(stream, "wait_poll_ms", out.stream.wait_poll_ms);
    readOrDefault(stream, "stall_timeout_ms", out.stream.stall_timeout_ms);

    readOrDefault(logging, "level", out.logging.level);
    readBoolOrDefault(logging, "console", out.logging.console);
    readBoolOrDefault(logging, "file_enabled", out.logging.file_enabled);
    readOrDefault(logging, "directory", out.logging.directory);
    readOrDefault(logging, "file_name", out.logging.file_name);
    readOrDefault(logging, "backup_count", out.logging.backup_count);

    std::vector<CameraConfig> cameras;
    const cv::FileNode root = fs.root();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const cv::FileNode node = *it;
        int index = 0;
        if (!parseCameraSection(node.name(), index)) {
            continue;
        }
        CameraConfig cam = CameraRegistry::defaultCamera(index);
        readCameraNode(node, cam);
        cameras.push_back(cam);
    }
    if (!cameras.empty()) {
        out.cameras = cameras;
    }

    return validateConfig(out, error);
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& result, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    AppConfig out = result;
    std::vector<CameraConfig> cameras;
    CameraConfig* current_camera = nullptr;
    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == '%') {
            continue;
        }

        // section header, e.g. "server:" or "camera_2:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            current_camera = nullptr;
            int index = 0;
            if (parseCameraSection(section, index)) {
                cameras.push_back(CameraRegistry::defaultCamera(index));
                current_camera = &cameras.back();
            }
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        // strip inline comment
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (current_camera != nullptr) {
                applyCameraKey(*current_camera, key, value);
            } else if (section == "server") {
                if (key == "port") out.server.port = std::stoi(value);
                else if (key == "bind_address") out.server.bind_address = value;
                else if (key == "listen_backlog") out.server.listen_backlog = std::stoi(value);
                else if (key == "page_title") out.server.page_title = value;
            } else if (section == "capture") {
                if (key == "probe_attempts") out.capture.probe_attempts = std::stoi(value);
                else if (key == "warmup_frames") out.capture.warmup_frames = std::stoi(value);
                else if (key == "warmup_delay_ms") out.capture.warmup_delay_ms = std::stoi(value);
                else if (key == "read_retry_delay_ms") out.capture.read_retry_delay_ms = std::stoi(value);
            } else if (section == "stream") {
                if (key == "wait_poll_ms") out.stream.wait_poll_ms = std::stoi(value);
                else if (key == "stall_timeout_ms") out.stream.stall_timeout_ms = std::stoi(value);
            } else if (section == "logging") {
                if (key == "level") out.logging.level = value;
                else if (key == "console") {
                    bool b = out.logging.console;
                    if (toBool(value, b)) out.logging.console = b;
                } else if (key == "file_enabled") {
                    bool b = out.logging.file_enabled;
                    if (toBool(value, b)) out.logging.file_enabled = b;
                } else if (key == "directory") out.logging.directory = value;
                else if (key == "file_name") out.logging.file_name = value;
                else if (key == "backup_count") out.logging.backup_count = std::stoi(value);
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    if (!cameras.empty()) {
        out.cameras = cameras;
    }
    if (!validateConfig(out, error)) {
        return false;
    }
    result = out;
    return true;
}

bool isUnitInterval(double v) {
    return v >= 0.0 && v <= 1.0;
}

}  // namespace

AppConfig defaultAppConfig() {
    AppConfig cfg;
    cfg.cameras = CameraRegistry::builtinCameras();
    return cfg;
}

bool validateCameraConfig(const CameraConfig& cam, std::string& error) {
    const std::string who = "camera_" + std::to_string(cam.index);
    if (cam.index < 0) {
        error = who + ": index must be >= 0";
        return false;
    }
    if (cam.width <= 0 || cam.height <= 0) {
        error = who + ": width/height must be > 0";
        return false;
    }
    if (cam.frame_rate <= 0.0 || cam.max_stream_fps <= 0.0) {
        error = who + ": frame_rate and max_stream_fps must be > 0";
        return false;
    }
    if (cam.source_mode != "auto" && cam.source_mode != "v4l2" && cam.source_mode != "gstreamer") {
        error = who + ": source_mode must be 'auto', 'v4l2' or 'gstreamer'";
        return false;
    }
    if (cam.source_mode == "gstreamer" && cam.gstreamer_pipeline.empty()) {
        error = who + ": gstreamer_pipeline must not be empty when source_mode=gstreamer";
        return false;
    }
    if (cam.rotation_deg != 0 && cam.rotation_deg != 90 && cam.rotation_deg != 180 && cam.rotation_deg != 270) {
        error = who + ": rotation_deg must be one of 0, 90, 180, 270";
        return false;
    }
    if (cam.jpeg_quality < 1 || cam.jpeg_quality > 100) {
        error = who + ": jpeg_quality must be in [1,100]";
        return false;
    }
    const OverlayConfig& ov = cam.overlay;
    if (!isUnitInterval(ov.background_opacity) || !isUnitInterval(ov.text_opacity)) {
        error = who + ": overlay_transparency and text_transparency must be in [0,1]";
        return false;
    }
    if (ov.text_color_b < 0 || ov.text_color_b > 255 ||
        ov.text_color_g < 0 || ov.text_color_g > 255 ||
        ov.text_color_r < 0 || ov.text_color_r > 255) {
        error = who + ": text_color channels must be in [0,255]";
        return false;
    }
    if (ov.enabled) {
        if (ov.cycle_minutes <= 0.0) {
            error = who + ": overlay_cycle_minutes must be > 0 when overlay is enabled";
            return false;
        }
        if (ov.duration_seconds < 0.0 || ov.duration_seconds > ov.cycle_minutes * 60.0) {
            error = who + ": overlay_duration_seconds must be in [0, cycle]";
            return false;
        }
        if (ov.font_scale <= 0.0 || ov.thickness <= 0) {
            error = who + ": overlay font scale and thickness must be > 0";
            return false;
        }
    }
    error.clear();
    return true;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.server.port <= 0 || cfg.server.port > 65535) {
        error = "server.port must be in [1,65535]";
        return false;
    }
    if (cfg.server.listen_backlog <= 0) {
        error = "server.listen_backlog must be > 0";
        return false;
    }
    if (cfg.capture.probe_attempts <= 0) {
        error = "capture.probe_attempts must be > 0";
        return false;
    }
    if (cfg.capture.warmup_frames < 0 || cfg.capture.warmup_delay_ms < 0 || cfg.capture.read_retry_delay_ms < 0) {
        error = "capture warm-up and retry values must be >= 0";
        return false;
    }
    if (cfg.stream.wait_poll_ms <= 0 || cfg.stream.stall_timeout_ms < 0) {
        error = "stream.wait_poll_ms must be > 0 and stream.stall_timeout_ms >= 0";
        return false;
    }
    const std::string& lvl = cfg.logging.level;
    if (lvl != "debug" && lvl != "info" && lvl != "warning" && lvl != "error") {
        error = "logging.level must be debug, info, warning or error";
        return false;
    }
    if (cfg.logging.backup_count < 0) {
        error = "logging.backup_count must be >= 0";
        return false;
    }
    if (cfg.logging.file_enabled && cfg.logging.file_name.empty()) {
        error = "logging.file_name must not be empty when file logging is enabled";
        return false;
    }
    if (cfg.cameras.empty()) {
        error = "at least one camera must be configured";
        return false;
    }
    std::set<int> seen;
    for (const auto& cam : cfg.cameras) {
        if (!seen.insert(cam.index).second) {
            error = "duplicate camera index " + std::to_string(cam.index);
            return false;
        }
        if (!validateCameraConfig(cam, error)) {
            return false;
        }
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    {
        std::ifstream probe(path);
        if (!probe.is_open()) {
            error = "failed to open config file: " + path;
            return false;
        }
    }

    try {
        AppConfig parsed = out;
        std::string fs_error;
        if (loadConfigFileStorage(path, parsed, fs_error)) {
            out = parsed;
            error.clear();
            return true;
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace camrelay
