#pragma once

#include "pursuit/core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace pursuit {

class Config;

/**
 * @brief Aim controller tuning
 *
 * No bounds are enforced. A negative max_speed or an alpha outside [0, 1]
 * produce whatever the arithmetic gives.
 */
struct ControllerParams {
    float kp = 0.15f;          // Proportional gain
    float kd = 0.05f;          // Derivative gain
    float alpha = 0.85f;       // Smoothing weight of the new sample
    float dead_zone = 5.0f;    // Pixels; no output while closer than this
    float max_speed = 30.0f;   // Pixels per tick
};

/**
 * @brief Partial parameter update, unset fields are left unchanged
 */
struct ControllerParamsUpdate {
    std::optional<float> kp;
    std::optional<float> kd;
    std::optional<float> alpha;
    std::optional<float> dead_zone;
    std::optional<float> max_speed;

    ControllerParams apply_to(const ControllerParams& params) const;

    bool empty() const {
        return !kp && !kd && !alpha && !dead_zone && !max_speed;
    }
};

/**
 * @brief Filter history carried from one tick to the next
 */
struct ControllerState {
    Point2D previous_error;
    Point2D previous_output;
};

/**
 * @brief Logical state of the controller after the most recent tick
 */
enum class ControlPhase : uint8_t {
    IDLE = 0,    // No tick since construction or reset
    DEAD_ZONE,   // Last tick was inside the dead zone, output zero
    ACTIVE       // Last tick ran the full PD / smoothing / clamp path
};

const char* to_string(ControlPhase phase);

/**
 * @brief PD aim controller with exponential smoothing and speed clamp
 *
 * One instance per tracking session. Not thread-safe: compute() reads and
 * then writes the filter state.
 */
class AimController {
public:
    explicit AimController(const ControllerParams& params = ControllerParams{});

    /**
     * @brief Compute the cursor movement for this tick
     *
     * @param cursor Current cursor position
     * @param target Target center in the same space
     * @param dt Tick duration in frames, must be > 0
     * @return Movement delta, magnitude <= max_speed
     */
    Point2D compute(const Point2D& cursor, const Point2D& target, float dt = 1.0f);

    /**
     * @brief Clear derivative and smoothing history
     *
     * Call when the control loop is re-engaged.
     */
    void reset();

    /**
     * @brief Update any subset of the gains
     */
    void update_params(const ControllerParamsUpdate& update);

    /**
     * @brief Replace all gains at once
     */
    void set_params(const ControllerParams& params);

    const ControllerParams& params() const { return params_; }
    const ControllerState& state() const { return state_; }
    ControlPhase phase() const { return phase_; }

private:
    ControllerParams params_;
    ControllerState state_;
    ControlPhase phase_ = ControlPhase::IDLE;
};

/**
 * @brief Read controller.* keys, falling back to ControllerParams defaults
 */
ControllerParams load_controller_params(const Config& config);

/**
 * @brief Create aim controller from configuration
 */
std::unique_ptr<AimController> create_aim_controller(const Config& config);

/**
 * @brief Forward runtime controller.* overrides to the controller
 *
 * The controller must outlive the config's callbacks.
 */
void bind_controller_params(Config& config, AimController& controller);

}  // namespace pursuit
