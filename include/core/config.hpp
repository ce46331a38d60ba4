#pragma once

#include <string>
#include <vector>

namespace camrelay {

struct OverlayConfig {
    bool enabled{false};
    std::string text{"Camera Feed"};
    double cycle_minutes{15.0};
    double duration_seconds{60.0};
    double font_scale{0.7};
    double background_opacity{0.6}; // [0,1], black box behind the label
    double text_opacity{0.9};       // [0,1], independent of background
    int text_color_b{255};
    int text_color_g{255};
    int text_color_r{0};
    int thickness{2};
};

struct CameraConfig {
    int index{0};
    std::string description{"Additional Camera"};
    std::string source_mode{"auto"};  // auto | v4l2 | gstreamer
    std::string gstreamer_pipeline;
    int width{1280};
    int height{720};
    double frame_rate{10.0};
    double max_stream_fps{15.0};
    int rotation_deg{0};              // 0 | 90 | 180 | 270
    int jpeg_quality{85};
    OverlayConfig overlay;
};

struct ServerConfig {
    int port{8000};
    std::string bind_address{"0.0.0.0"};
    int listen_backlog{16};
    std::string page_title{"WNCC Aquaponics - Multi-Camera Monitor"};
};

struct CaptureConfig {
    int probe_attempts{3};
    int warmup_frames{5};
    int warmup_delay_ms{100};
    int read_retry_delay_ms{10};
};

struct StreamConfig {
    int wait_poll_ms{500};
    int stall_timeout_ms{0}; // 0 = wait for the camera indefinitely
};

struct LoggingConfig {
    std::string level{"info"};  // debug | info | warning | error
    bool console{true};
    bool file_enabled{true};
    std::string directory{"logs"};
    std::string file_name{"camrelay.log"};
    int backup_count{7};
};

struct AppConfig {
    ServerConfig server;
    CaptureConfig capture;
    StreamConfig stream;
    LoggingConfig logging;
    std::vector<CameraConfig> cameras;
};

// Fills `out` with the built-in defaults, including the built-in cameras.
AppConfig defaultAppConfig();

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);
bool validateCameraConfig(const CameraConfig& cam, std::string& error);

}  // namespace camrelay
