#include "pursuit/guidance/aim_controller.hpp"
#include "pursuit/core/config.hpp"
#include "pursuit/core/logger.hpp"

#include <string>

namespace pursuit {

namespace {

constexpr const char* kModule = "controller";

}  // namespace

const char* to_string(ControlPhase phase) {
    switch (phase) {
        case ControlPhase::IDLE: return "IDLE";
        case ControlPhase::DEAD_ZONE: return "DEAD_ZONE";
        case ControlPhase::ACTIVE: return "ACTIVE";
        default: return "UNKNOWN";
    }
}

ControllerParams ControllerParamsUpdate::apply_to(const ControllerParams& params) const {
    ControllerParams out = params;
    if (kp) out.kp = *kp;
    if (kd) out.kd = *kd;
    if (alpha) out.alpha = *alpha;
    if (dead_zone) out.dead_zone = *dead_zone;
    if (max_speed) out.max_speed = *max_speed;
    return out;
}

// ============================================================================
// AimController Implementation
// ============================================================================

AimController::AimController(const ControllerParams& params)
    : params_(params) {
    PURSUIT_LOG_DEBUG(kModule,
                      "Aim controller created: kp={} kd={} alpha={} dead_zone={} max_speed={}",
                      params_.kp, params_.kd, params_.alpha,
                      params_.dead_zone, params_.max_speed);
}

Point2D AimController::compute(const Point2D& cursor, const Point2D& target, float dt) {
    Point2D error = target - cursor;
    float distance = error.norm();

    // Inside the dead zone the derivative still sees the fresh error, but the
    // smoothing baseline keeps the last real output.
    if (distance < params_.dead_zone) {
        state_.previous_error = error;
        phase_ = ControlPhase::DEAD_ZONE;
        return Point2D{0.0f, 0.0f};
    }

    Point2D p_term = error * params_.kp;
    Point2D delta = error - state_.previous_error;
    Point2D d_term{params_.kd * delta.x / dt, params_.kd * delta.y / dt};
    Point2D raw = p_term + d_term;

    Point2D smoothed = raw * params_.alpha +
                       state_.previous_output * (1.0f - params_.alpha);

    float speed = smoothed.norm();
    if (speed > params_.max_speed) {
        smoothed = smoothed * (params_.max_speed / speed);
    }

    // The clamped value is the next smoothing baseline
    state_.previous_error = error;
    state_.previous_output = smoothed;
    phase_ = ControlPhase::ACTIVE;

    PURSUIT_LOG_TRACE(kModule, "error=({:.2f}, {:.2f}) raw=({:.2f}, {:.2f}) out=({:.2f}, {:.2f})",
                      error.x, error.y, raw.x, raw.y, smoothed.x, smoothed.y);

    return smoothed;
}

void AimController::reset() {
    state_ = ControllerState{};
    phase_ = ControlPhase::IDLE;
    PURSUIT_LOG_DEBUG(kModule, "Aim controller reset");
}

void AimController::update_params(const ControllerParamsUpdate& update) {
    if (update.empty()) {
        return;
    }
    set_params(update.apply_to(params_));
}

void AimController::set_params(const ControllerParams& params) {
    params_ = params;
    PURSUIT_LOG_INFO(kModule,
                     "Controller params: kp={} kd={} alpha={} dead_zone={} max_speed={}",
                     params_.kp, params_.kd, params_.alpha,
                     params_.dead_zone, params_.max_speed);
}

// ============================================================================
// Factory Functions
// ============================================================================

ControllerParams load_controller_params(const Config& config) {
    ControllerParams defaults;
    ControllerParams params;
    params.kp = config.get_float("controller.kp", defaults.kp);
    params.kd = config.get_float("controller.kd", defaults.kd);
    params.alpha = config.get_float("controller.alpha", defaults.alpha);
    params.dead_zone = config.get_float("controller.dead_zone", defaults.dead_zone);
    params.max_speed = config.get_float("controller.max_speed", defaults.max_speed);
    return params;
}

std::unique_ptr<AimController> create_aim_controller(const Config& config) {
    return std::make_unique<AimController>(load_controller_params(config));
}

void bind_controller_params(Config& config, AimController& controller) {
    struct Binding {
        const char* key;
        std::optional<float> ControllerParamsUpdate::*field;
        float ControllerParams::*param;
    };

    const Binding bindings[] = {
        {"controller.kp", &ControllerParamsUpdate::kp, &ControllerParams::kp},
        {"controller.kd", &ControllerParamsUpdate::kd, &ControllerParams::kd},
        {"controller.alpha", &ControllerParamsUpdate::alpha, &ControllerParams::alpha},
        {"controller.dead_zone", &ControllerParamsUpdate::dead_zone, &ControllerParams::dead_zone},
        {"controller.max_speed", &ControllerParamsUpdate::max_speed, &ControllerParams::max_speed},
    };

    for (const auto& binding : bindings) {
        config.on_change(binding.key, [&config, &controller, binding](const std::string& changed) {
            if (!config.has(changed)) {
                return;
            }
            // An unparsable override keeps the current gain
            ControllerParamsUpdate update;
            update.*binding.field = config.get_float(changed, controller.params().*binding.param);
            controller.update_params(update);
        });
    }
}

}  // namespace pursuit
