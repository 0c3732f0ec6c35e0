#pragma once

#include "pursuit/core/coordinate.hpp"
#include "pursuit/core/types.hpp"
#include "pursuit/guidance/aim_controller.hpp"
#include "pursuit/guidance/target_selector.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace pursuit {

class Config;

/**
 * @brief Tracking pipeline configuration
 */
struct PipelineConfig {
    Size2D model_size = DEFAULT_MODEL_SIZE;   // Detector input resolution
    SelectorConfig selector;                   // Screen size and self anchor
    ControllerParams controller;
    bool start_enabled = false;
};

/**
 * @brief Output of one tick
 */
struct TickResult {
    std::optional<BoundingBox> target;   // Locked target, screen space
    Point2D movement;                    // Cursor delta to apply
    Detections screen_detections;        // All detections, screen space
    size_t candidate_count = 0;

    bool moved() const { return movement.x != 0.0f || movement.y != 0.0f; }
};

/**
 * @brief Running counters since construction or reset_stats()
 */
struct PipelineStats {
    uint64_t ticks = 0;
    uint64_t ticks_with_target = 0;
    uint64_t ticks_engaged = 0;     // Controller ran
    uint64_t ticks_moved = 0;       // Non-zero movement produced
    uint64_t total_detections = 0;
};

/**
 * @brief Per-tick selection and control
 *
 * Rescales model-space detections to the screen, selects a target and, when
 * enabled, steers the cursor toward its center. Selection runs even while
 * disabled so the locked target stays observable.
 */
class TrackingPipeline {
public:
    explicit TrackingPipeline(const PipelineConfig& config = PipelineConfig{});

    /**
     * @brief Run one tick
     *
     * @param model_detections Detector output in model coordinates
     * @param cursor Cursor position in screen coordinates
     * @param dt Tick duration in frames
     */
    TickResult tick(const Detections& model_detections, const Point2D& cursor,
                    float dt = 1.0f);

    /**
     * @brief Engage or disengage steering
     *
     * Engaging from the disabled state resets the controller so no history
     * from a previous engagement leaks in.
     */
    void set_enabled(bool enabled);

    /**
     * @brief Flip the enabled flag
     * @return New enabled state
     */
    bool toggle();

    bool is_enabled() const { return enabled_; }

    const PipelineStats& stats() const { return stats_; }
    void reset_stats() { stats_ = PipelineStats{}; }

    const ScaleFactors& scale_factors() const { return scale_; }

    TargetSelector& selector() { return selector_; }
    const TargetSelector& selector() const { return selector_; }

    AimController& controller() { return controller_; }
    const AimController& controller() const { return controller_; }

private:
    ScaleFactors scale_;
    TargetSelector selector_;
    AimController controller_;
    bool enabled_ = false;
    PipelineStats stats_;
};

/**
 * @brief Read pipeline.*, selector.* and controller.* keys
 */
PipelineConfig load_pipeline_config(const Config& config);

/**
 * @brief Create tracking pipeline from configuration
 */
std::unique_ptr<TrackingPipeline> create_tracking_pipeline(const Config& config);

}  // namespace pursuit
