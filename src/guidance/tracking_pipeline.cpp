#include "pursuit/guidance/tracking_pipeline.hpp"
#include "pursuit/core/config.hpp"
#include "pursuit/core/logger.hpp"

namespace pursuit {

namespace {

constexpr const char* kModule = "pipeline";

}  // namespace

TrackingPipeline::TrackingPipeline(const PipelineConfig& config)
    : scale_(get_scale_factors(config.model_size, config.selector.surface_size))
    , selector_(config.selector)
    , controller_(config.controller)
    , enabled_(config.start_enabled)
{
    PURSUIT_LOG_INFO(kModule, "Tracking pipeline: model {}x{} -> screen {}x{}, scale=({:.3f}, {:.3f})",
                     config.model_size.width, config.model_size.height,
                     config.selector.surface_size.width, config.selector.surface_size.height,
                     scale_.x, scale_.y);
}

TickResult TrackingPipeline::tick(const Detections& model_detections,
                                  const Point2D& cursor, float dt) {
    TickResult result;
    result.screen_detections = map_to_screen(model_detections, scale_);
    result.target = selector_.select(result.screen_detections, cursor);
    result.candidate_count = selector_.get_candidates().size();

    ++stats_.ticks;
    stats_.total_detections += model_detections.size();

    if (result.target) {
        ++stats_.ticks_with_target;

        // Without a target the controller is not ticked and keeps its state
        if (enabled_) {
            result.movement = controller_.compute(cursor, result.target->center(), dt);
            ++stats_.ticks_engaged;
            if (result.moved()) {
                ++stats_.ticks_moved;
            }
        }
    }

    return result;
}

void TrackingPipeline::set_enabled(bool enabled) {
    if (enabled == enabled_) {
        return;
    }
    if (enabled) {
        controller_.reset();
    }
    enabled_ = enabled;
    PURSUIT_LOG_INFO(kModule, "Tracking {}", enabled_ ? "ON" : "OFF");
}

bool TrackingPipeline::toggle() {
    set_enabled(!enabled_);
    return enabled_;
}

// ============================================================================
// Factory Functions
// ============================================================================

PipelineConfig load_pipeline_config(const Config& config) {
    PipelineConfig pc;
    pc.model_size.width = config.get_float("pipeline.model_width", DEFAULT_MODEL_SIZE.width);
    pc.model_size.height = config.get_float("pipeline.model_height", DEFAULT_MODEL_SIZE.height);
    pc.selector = load_selector_config(config);
    pc.controller = load_controller_params(config);
    pc.start_enabled = config.get_bool("pipeline.enabled", false);
    return pc;
}

std::unique_ptr<TrackingPipeline> create_tracking_pipeline(const Config& config) {
    return std::make_unique<TrackingPipeline>(load_pipeline_config(config));
}

}  // namespace pursuit
