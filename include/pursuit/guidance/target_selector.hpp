#pragma once

#include "pursuit/core/coordinate.hpp"
#include "pursuit/core/types.hpp"

#include <memory>
#include <optional>

namespace pursuit {

class Config;

/**
 * @brief Target selector configuration
 */
struct SelectorConfig {
    // Tracked surface, in cursor coordinates
    Size2D surface_size = DEFAULT_SCREEN_SIZE;

    // Explicit self-anchor; defaults to the surface center when unset
    std::optional<Point2D> self_anchor;

    Point2D resolved_anchor() const {
        return self_anchor ? *self_anchor : surface_center(surface_size);
    }
};

/**
 * @brief Picks the detection to track
 *
 * Boxes containing the self-anchor (the tracked subject's own on-screen
 * representation) are never candidates. Among the rest, the box whose center
 * is nearest the cursor wins; on an exact tie the earlier box in input order
 * is kept.
 */
class TargetSelector {
public:
    TargetSelector();
    explicit TargetSelector(const SelectorConfig& config);

    /**
     * @brief Select a target for this tick
     *
     * @param detections Boxes in cursor coordinates
     * @param cursor Current cursor position
     * @return Selected box, or std::nullopt if nothing survives exclusion
     */
    std::optional<BoundingBox> select(const Detections& detections, const Point2D& cursor);

    /**
     * @brief Candidates left after exclusion on the last select()
     */
    const Detections& get_candidates() const { return candidates_; }

    /**
     * @brief Target chosen by the last select()
     */
    const std::optional<BoundingBox>& get_current_target() const { return current_target_; }

    const Point2D& self_anchor() const { return self_anchor_; }

    static float distance(const Point2D& a, const Point2D& b);

private:
    Point2D self_anchor_;
    Detections candidates_;
    std::optional<BoundingBox> current_target_;
};

/**
 * @brief Read selector.* keys
 */
SelectorConfig load_selector_config(const Config& config);

/**
 * @brief Create target selector from configuration
 */
std::unique_ptr<TargetSelector> create_target_selector(const Config& config);

}  // namespace pursuit
