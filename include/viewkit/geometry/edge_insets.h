#pragma once
#include <viewkit/geometry/axis.h>
#include <viewkit/geometry/basic_types.h>

namespace viewkit::geometry {

// Insets on the four sides of a box. Directional insets store start/end and
// must be resolved against a text direction before use.
struct EdgeInsets {
    float left = 0, top = 0, right = 0, bottom = 0;
    bool directional = false;

    static EdgeInsets all(float value) { return {value, value, value, value, false}; }
    static EdgeInsets symmetric(float horizontal, float vertical) {
        return {horizontal, vertical, horizontal, vertical, false};
    }
    static EdgeInsets only(float left, float top, float right, float bottom) {
        return {left, top, right, bottom, false};
    }
    // start/end follow the reading direction.
    static EdgeInsets directional_only(float start, float top, float end, float bottom) {
        return {start, top, end, bottom, true};
    }

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }
    Offset top_left() const { return {left, top}; }

    EdgeInsets resolve(TextDirection direction) const {
        if (!directional) return *this;
        if (direction == TextDirection::RTL) {
            return {right, top, left, bottom, false};
        }
        return {left, top, right, bottom, false};
    }

    bool operator==(const EdgeInsets& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom &&
               directional == o.directional;
    }
    bool operator!=(const EdgeInsets& o) const { return !(*this == o); }
};

} // namespace viewkit::geometry
