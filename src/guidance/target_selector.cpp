#include "pursuit/guidance/target_selector.hpp"
#include "pursuit/core/config.hpp"
#include "pursuit/core/logger.hpp"

#include <limits>

namespace pursuit {

namespace {

constexpr const char* kModule = "selector";

}  // namespace

TargetSelector::TargetSelector()
    : TargetSelector(SelectorConfig{}) {}

TargetSelector::TargetSelector(const SelectorConfig& config)
    : self_anchor_(config.resolved_anchor()) {
    PURSUIT_LOG_DEBUG(kModule, "Target selector created: self anchor=({}, {})",
                      self_anchor_.x, self_anchor_.y);
}

std::optional<BoundingBox> TargetSelector::select(const Detections& detections,
                                                  const Point2D& cursor) {
    candidates_.clear();
    current_target_.reset();

    if (detections.empty()) {
        return std::nullopt;
    }

    for (const auto& det : detections) {
        if (!det.contains(self_anchor_)) {
            candidates_.push_back(det);
        }
    }

    if (candidates_.empty()) {
        PURSUIT_LOG_TRACE(kModule, "All {} detections excluded by self anchor",
                          detections.size());
        return std::nullopt;
    }

    // Strict '<' keeps the first box on an exact tie
    float min_distance = std::numeric_limits<float>::infinity();
    const BoundingBox* nearest = nullptr;
    for (const auto& det : candidates_) {
        float d = distance(det.center(), cursor);
        if (d < min_distance) {
            min_distance = d;
            nearest = &det;
        }
    }

    // Non-finite centers never compare less and leave nothing selected
    if (!nearest) {
        return std::nullopt;
    }
    current_target_ = *nearest;

    PURSUIT_LOG_TRACE(kModule, "Selected target at ({:.1f}, {:.1f}), {} candidates",
                      current_target_->center_x(), current_target_->center_y(),
                      candidates_.size());

    return current_target_;
}

float TargetSelector::distance(const Point2D& a, const Point2D& b) {
    return pursuit::distance(a, b);
}

// ============================================================================
// Factory Functions
// ============================================================================

SelectorConfig load_selector_config(const Config& config) {
    SelectorConfig sc;
    sc.surface_size.width = config.get_float("selector.screen_width",
                                             DEFAULT_SCREEN_SIZE.width);
    sc.surface_size.height = config.get_float("selector.screen_height",
                                              DEFAULT_SCREEN_SIZE.height);

    if (config.has("selector.anchor_x") && config.has("selector.anchor_y")) {
        sc.self_anchor = Point2D{config.get_float("selector.anchor_x"),
                                 config.get_float("selector.anchor_y")};
    }
    return sc;
}

std::unique_ptr<TargetSelector> create_target_selector(const Config& config) {
    return std::make_unique<TargetSelector>(load_selector_config(config));
}

}  // namespace pursuit
