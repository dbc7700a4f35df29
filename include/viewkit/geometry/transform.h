#pragma once
#include <viewkit/geometry/basic_types.h>

#include <optional>

namespace viewkit::geometry {

// 2D affine transform laid out like a canvas matrix:
//   | a c tx |
//   | b d ty |
//   | 0 0 1  |
struct Transform2D {
    float a = 1, b = 0, c = 0, d = 1, tx = 0, ty = 0;

    static Transform2D identity() { return {}; }
    static Transform2D translation(float dx, float dy) { return {1, 0, 0, 1, dx, dy}; }
    static Transform2D scaling(float sx, float sy) { return {sx, 0, 0, sy, 0, 0}; }

    bool is_identity() const {
        return a == 1 && b == 0 && c == 0 && d == 1 && tx == 0 && ty == 0;
    }

    // this = this * other; other is applied to points first.
    void multiply(const Transform2D& other);
    // this = this * translation(dx, dy)
    void translate(float dx, float dy) { multiply(translation(dx, dy)); }
    void scale(float sx, float sy) { multiply(scaling(sx, sy)); }

    std::optional<Transform2D> inverted() const;

    Offset map_point(const Offset& point) const {
        return {a * point.dx + c * point.dy + tx, b * point.dx + d * point.dy + ty};
    }
    // Bounding box of the four transformed corners.
    Rect map_rect(const Rect& rect) const;

    bool operator==(const Transform2D& o) const {
        return a == o.a && b == o.b && c == o.c && d == o.d && tx == o.tx && ty == o.ty;
    }
    bool operator!=(const Transform2D& o) const { return !(*this == o); }
};

} // namespace viewkit::geometry
