#include "overlay/overlay_compositor.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

#include "core/logging.hpp"

namespace camrelay {

namespace {

constexpr int kMarginPx = 20;
constexpr int kPaddingPx = 5;

std::string formatSeconds(double s) {
    if (std::floor(s) == s) {
        return std::to_string(static_cast<long long>(s));
    }
    return std::to_string(s);
}

}  // namespace

OverlayCompositor::OverlayCompositor(const OverlayConfig& cfg, int camera_index, int64_t cycle_start_ns)
    : cfg_(cfg),
      label_("Camera " + std::to_string(camera_index) + ": " + cfg.text),
      log_tag_("camera" + std::to_string(camera_index)) {
    state_.cycle_start_ns = cycle_start_ns;
    state_.currently_shown = false;
}

bool OverlayCompositor::isVisible(double elapsed_in_cycle_s, const OverlayConfig& cfg) {
    return cfg.enabled && elapsed_in_cycle_s < cfg.duration_seconds;
}

int64_t OverlayCompositor::cycleNs() const {
    return static_cast<int64_t>(std::llround(cfg_.cycle_minutes * 60.0 * 1e9));
}

double OverlayCompositor::elapsedInCycleSeconds(int64_t now_ns) {
    const int64_t cycle_ns = cycleNs();
    if (cycle_ns <= 0 || now_ns <= state_.cycle_start_ns) {
        return 0.0;
    }
    int64_t elapsed = now_ns - state_.cycle_start_ns;
    if (elapsed >= cycle_ns) {
        // Reset the cycle timer to the start of the window `now` falls in.
        state_.cycle_start_ns += (elapsed / cycle_ns) * cycle_ns;
        elapsed = now_ns - state_.cycle_start_ns;
    }
    return static_cast<double>(elapsed) / 1e9;
}

OverlayEdge OverlayCompositor::apply(cv::Mat& bgr, int64_t now_ns) {
    if (!cfg_.enabled) {
        return OverlayEdge::None;
    }

    const double elapsed_s = elapsedInCycleSeconds(now_ns);
    const bool show = isVisible(elapsed_s, cfg_);

    OverlayEdge edge = OverlayEdge::None;
    if (show && !state_.currently_shown) {
        edge = OverlayEdge::Shown;
        logInfo(log_tag_, "label '" + cfg_.text + "' displayed for " + formatSeconds(cfg_.duration_seconds) + "s");
    } else if (!show && state_.currently_shown) {
        edge = OverlayEdge::Hidden;
        logInfo(log_tag_, "label '" + cfg_.text + "' hidden - next display in " +
                              formatSeconds(cfg_.cycle_minutes * 60.0 - elapsed_s) + "s");
    }
    state_.currently_shown = show;

    if (show && !bgr.empty()) {
        renderLabel(bgr, label_, cfg_);
    }
    return edge;
}

void OverlayCompositor::renderLabel(cv::Mat& bgr, const std::string& label, const OverlayConfig& cfg) {
    if (bgr.empty() || label.empty()) {
        return;
    }

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    int baseline = 0;
    const cv::Size text_size = cv::getTextSize(label, font, cfg.font_scale, cfg.thickness, &baseline);

    const cv::Point origin(kMarginPx, bgr.rows - kMarginPx);
    const cv::Rect box(
        origin.x - kPaddingPx,
        origin.y - text_size.height - kPaddingPx,
        text_size.width + 2 * kPaddingPx,
        text_size.height + baseline + 2 * kPaddingPx);
    const cv::Rect roi = box & cv::Rect(0, 0, bgr.cols, bgr.rows);
    if (roi.area() <= 0) {
        return;
    }

    cv::Mat target = bgr(roi);
    const cv::Point local_origin(origin.x - roi.x, origin.y - roi.y);

    cv::Mat layer(target.size(), target.type(), cv::Scalar::all(0));
    cv::addWeighted(layer, cfg.background_opacity, target, 1.0 - cfg.background_opacity, 0.0, target);

    const cv::Scalar color(cfg.text_color_b, cfg.text_color_g, cfg.text_color_r);
    if (cfg.text_opacity >= 1.0) {
        cv::putText(target, label, local_origin, font, cfg.font_scale, color, cfg.thickness, cv::LINE_AA);
        return;
    }
    target.copyTo(layer);
    cv::putText(layer, label, local_origin, font, cfg.font_scale, color, cfg.thickness, cv::LINE_AA);
    cv::addWeighted(layer, cfg.text_opacity, target, 1.0 - cfg.text_opacity, 0.0, target);
}

}  // namespace camrelay
