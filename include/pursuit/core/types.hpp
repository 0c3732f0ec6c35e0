#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

namespace pursuit {

// ============================================================================
// Time Types
// ============================================================================
using Clock = std::chrono::steady_clock;

// ============================================================================
// Point
// ============================================================================
struct Point2D {
    float x = 0.0f;
    float y = 0.0f;

    Point2D operator+(const Point2D& other) const {
        return Point2D{x + other.x, y + other.y};
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D{x - other.x, y - other.y};
    }

    Point2D operator*(float scale) const {
        return Point2D{x * scale, y * scale};
    }

    bool operator==(const Point2D& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2D& other) const {
        return !(*this == other);
    }

    // Euclidean length
    float norm() const {
        return std::sqrt(x * x + y * y);
    }
};

inline Point2D operator*(float scale, const Point2D& p) {
    return p * scale;
}

inline float distance(const Point2D& a, const Point2D& b) {
    return (a - b).norm();
}

// ============================================================================
// Size
// ============================================================================
struct Size2D {
    float width = 0.0f;
    float height = 0.0f;
};

// ============================================================================
// Bounding Box
// ============================================================================

/**
 * @brief Axis-aligned detection box in absolute coordinates
 *
 * Corners are expected to satisfy x1 <= x2 and y1 <= y2. This is not
 * validated; derived values of a malformed box are whatever the arithmetic
 * produces.
 */
struct BoundingBox {
    float x1 = 0.0f;   // Left
    float y1 = 0.0f;   // Top
    float x2 = 0.0f;   // Right
    float y2 = 0.0f;   // Bottom
    float score = 0.0f;
    int class_id = -1;

    float center_x() const { return (x1 + x2) / 2.0f; }
    float center_y() const { return (y1 + y2) / 2.0f; }
    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }

    Point2D center() const {
        return Point2D{center_x(), center_y()};
    }

    // Inclusive on all four edges
    bool contains(const Point2D& p) const {
        return x1 <= p.x && p.x <= x2 && y1 <= p.y && p.y <= y2;
    }

    // Copy with corners multiplied per axis (model -> screen space etc.)
    BoundingBox scaled(float scale_x, float scale_y) const {
        return BoundingBox{x1 * scale_x, y1 * scale_y,
                           x2 * scale_x, y2 * scale_y,
                           score, class_id};
    }

    bool operator==(const BoundingBox& other) const {
        return x1 == other.x1 && y1 == other.y1 &&
               x2 == other.x2 && y2 == other.y2 &&
               score == other.score && class_id == other.class_id;
    }

    bool operator!=(const BoundingBox& other) const {
        return !(*this == other);
    }
};

using Detections = std::vector<BoundingBox>;

}  // namespace pursuit
