#pragma once

#include "pursuit/core/types.hpp"

namespace pursuit {

/// Model input resolution the detector runs at
constexpr Size2D DEFAULT_MODEL_SIZE{640.0f, 360.0f};

/// Screen resolution the cursor lives in
constexpr Size2D DEFAULT_SCREEN_SIZE{1920.0f, 1080.0f};

/**
 * @brief Per-axis scale factors between two coordinate spaces
 */
struct ScaleFactors {
    float x = 1.0f;
    float y = 1.0f;
};

/**
 * @brief Rescale a point from one space to another
 *
 * Linear per axis: out = p * (to / from). A zero-sized source space is a
 * caller error and yields non-finite values.
 */
Point2D scale_coordinates(const Point2D& p, const Size2D& from, const Size2D& to);

/**
 * @brief Map a model-space point onto the screen
 */
Point2D map_to_screen(const Point2D& p,
                      const Size2D& model_size = DEFAULT_MODEL_SIZE,
                      const Size2D& screen_size = DEFAULT_SCREEN_SIZE);

/**
 * @brief Map a screen-space point into model space
 */
Point2D map_to_model(const Point2D& p,
                     const Size2D& screen_size = DEFAULT_SCREEN_SIZE,
                     const Size2D& model_size = DEFAULT_MODEL_SIZE);

/**
 * @brief Factors taking model coordinates to screen coordinates
 */
ScaleFactors get_scale_factors(const Size2D& model_size = DEFAULT_MODEL_SIZE,
                               const Size2D& screen_size = DEFAULT_SCREEN_SIZE);

/**
 * @brief Rescale every box of a detection set
 */
Detections map_to_screen(const Detections& detections, const ScaleFactors& factors);

/**
 * @brief Center of a surface of the given size
 */
inline Point2D surface_center(const Size2D& size) {
    return Point2D{size.width / 2.0f, size.height / 2.0f};
}

}  // namespace pursuit
