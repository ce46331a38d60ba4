#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"

namespace camrelay {

enum class OverlayEdge {
    None,
    Shown,
    Hidden,
};

struct OverlayState {
    int64_t cycle_start_ns{0};
    bool currently_shown{false};
};

// Time-gated label renderer for one camera. The label is visible for the first
// duration_seconds of every cycle_minutes window. Owned and driven by the
// capture thread only.
class OverlayCompositor {
public:
    OverlayCompositor(const OverlayConfig& cfg, int camera_index, int64_t cycle_start_ns);

    // The visibility rule apply() uses for every frame.
    static bool isVisible(double elapsed_in_cycle_s, const OverlayConfig& cfg);

    // Composites the label onto `bgr` when the current cycle position calls for
    // it. Returns the visibility edge crossed by this frame, if any; each edge
    // is logged once.
    OverlayEdge apply(cv::Mat& bgr, int64_t now_ns);

    bool enabled() const { return cfg_.enabled; }
    bool shown() const { return state_.currently_shown; }
    const std::string& label() const { return label_; }
    double elapsedInCycleSeconds(int64_t now_ns);

    // Background box alpha-blended at background_opacity, then the text at
    // text_opacity, anchored bottom-left.
    static void renderLabel(cv::Mat& bgr, const std::string& label, const OverlayConfig& cfg);

private:
    int64_t cycleNs() const;

    OverlayConfig cfg_;
    std::string label_;
    std::string log_tag_;
    OverlayState state_;
};

}  // namespace camrelay
