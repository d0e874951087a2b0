#pragma once

#include <cmath>
#include <limits>

namespace trellis {

/// Width/height sentinel for "no constraint on this axis"
constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

/// True when a constraint places no limit on its axis
inline bool isUnbounded(double constraint) {
    return std::isinf(constraint) && constraint > 0.0;
}

/// A width/height pair. Either axis may be UNBOUNDED when used as a constraint.
struct Size {
    double width = 0.0;
    double height = 0.0;

    constexpr Size() = default;
    constexpr Size(double w, double h) : width(w), height(h) {}

    bool operator==(const Size& other) const { return width == other.width && height == other.height; }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

/// Axis-aligned rectangle in the parent's coordinate space
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    constexpr Rect() = default;
    constexpr Rect(double x, double y, double w, double h)
        : x(x), y(y), width(w), height(h) {}

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

/// Visibility state of an element
enum class Visibility {
    Visible,    // Measured, placed and drawn
    Hidden,     // Keeps its slot but is not measured
    Collapsed   // Same as Hidden for uniform grids
};

} // namespace trellis
