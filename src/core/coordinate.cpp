#include "pursuit/core/coordinate.hpp"

namespace pursuit {

Point2D scale_coordinates(const Point2D& p, const Size2D& from, const Size2D& to) {
    float scale_x = to.width / from.width;
    float scale_y = to.height / from.height;
    return Point2D{p.x * scale_x, p.y * scale_y};
}

Point2D map_to_screen(const Point2D& p, const Size2D& model_size,
                      const Size2D& screen_size) {
    return scale_coordinates(p, model_size, screen_size);
}

Point2D map_to_model(const Point2D& p, const Size2D& screen_size,
                     const Size2D& model_size) {
    return scale_coordinates(p, screen_size, model_size);
}

ScaleFactors get_scale_factors(const Size2D& model_size, const Size2D& screen_size) {
    return ScaleFactors{screen_size.width / model_size.width,
                        screen_size.height / model_size.height};
}

Detections map_to_screen(const Detections& detections, const ScaleFactors& factors) {
    Detections out;
    out.reserve(detections.size());
    for (const auto& det : detections) {
        out.push_back(det.scaled(factors.x, factors.y));
    }
    return out;
}

}  // namespace pursuit
