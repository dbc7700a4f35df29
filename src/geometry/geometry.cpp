#include <viewkit/geometry/axis.h>
#include <viewkit/geometry/basic_types.h>
#include <viewkit/geometry/box_constraints.h>
#include <viewkit/geometry/transform.h>

#include <algorithm>
#include <cmath>

namespace viewkit::geometry {

Rect Rect::intersect(const Rect& other) const {
    return from_ltrb(std::max(left(), other.left()), std::max(top(), other.top()),
                     std::min(right(), other.right()), std::min(bottom(), other.bottom()));
}

Rect Rect::expand_to_include(const Rect& other) const {
    return from_ltrb(std::min(left(), other.left()), std::min(top(), other.top()),
                     std::max(right(), other.right()), std::max(bottom(), other.bottom()));
}

std::ostream& operator<<(std::ostream& os, const Offset& offset) {
    return os << "Offset(" << offset.dx << ", " << offset.dy << ")";
}

std::ostream& operator<<(std::ostream& os, const Size& size) {
    return os << "Size(" << size.width << ", " << size.height << ")";
}

std::ostream& operator<<(std::ostream& os, const Rect& rect) {
    return os << "Rect.fromLTRB(" << rect.left() << ", " << rect.top() << ", "
              << rect.right() << ", " << rect.bottom() << ")";
}

// ---------------------------------------------------------------------------
// Axis helpers
// ---------------------------------------------------------------------------

AxisDirection axis_direction_from_axis_reverse_and_directionality(
    Axis axis, bool reverse, TextDirection text_direction) {
    switch (axis) {
        case Axis::Horizontal: {
            AxisDirection direction = text_direction_to_axis_direction(text_direction);
            return reverse ? flip_axis_direction(direction) : direction;
        }
        case Axis::Vertical:
            return reverse ? AxisDirection::Up : AxisDirection::Down;
    }
    return AxisDirection::Down;
}

const char* axis_direction_name(AxisDirection direction) {
    switch (direction) {
        case AxisDirection::Up:    return "up";
        case AxisDirection::Down:  return "down";
        case AxisDirection::Left:  return "left";
        case AxisDirection::Right: return "right";
    }
    return "unknown";
}

const char* axis_name(Axis axis) {
    return axis == Axis::Horizontal ? "horizontal" : "vertical";
}

// ---------------------------------------------------------------------------
// BoxConstraints
// ---------------------------------------------------------------------------

float BoxConstraints::constrain_width(float width) const {
    return std::max(min_width, std::min(max_width, width));
}

float BoxConstraints::constrain_height(float height) const {
    return std::max(min_height, std::min(max_height, height));
}

BoxConstraints BoxConstraints::deflate(const EdgeInsets& insets) const {
    const float horizontal = insets.horizontal();
    const float vertical = insets.vertical();
    const float deflated_min_width = std::max(0.0f, min_width - horizontal);
    const float deflated_min_height = std::max(0.0f, min_height - vertical);
    return {
        deflated_min_width,
        std::max(deflated_min_width, max_width - horizontal),
        deflated_min_height,
        std::max(deflated_min_height, max_height - vertical),
    };
}

BoxConstraints BoxConstraints::enforce(const BoxConstraints& outer) const {
    auto clamp = [](float v, float lo, float hi) { return std::max(lo, std::min(hi, v)); };
    return {
        clamp(min_width, outer.min_width, outer.max_width),
        clamp(max_width, outer.min_width, outer.max_width),
        clamp(min_height, outer.min_height, outer.max_height),
        clamp(max_height, outer.min_height, outer.max_height),
    };
}

std::ostream& operator<<(std::ostream& os, const BoxConstraints& c) {
    return os << "BoxConstraints(" << c.min_width << "<=w<=" << c.max_width << ", "
              << c.min_height << "<=h<=" << c.max_height << ")";
}

// ---------------------------------------------------------------------------
// Transform2D
// ---------------------------------------------------------------------------

void Transform2D::multiply(const Transform2D& o) {
    Transform2D r;
    r.a = a * o.a + c * o.b;
    r.b = b * o.a + d * o.b;
    r.c = a * o.c + c * o.d;
    r.d = b * o.c + d * o.d;
    r.tx = a * o.tx + c * o.ty + tx;
    r.ty = b * o.tx + d * o.ty + ty;
    *this = r;
}

std::optional<Transform2D> Transform2D::inverted() const {
    const float det = a * d - b * c;
    if (det == 0 || !std::isfinite(det)) {
        return std::nullopt;
    }
    Transform2D inv;
    inv.a = d / det;
    inv.b = -b / det;
    inv.c = -c / det;
    inv.d = a / det;
    inv.tx = (c * ty - d * tx) / det;
    inv.ty = (b * tx - a * ty) / det;
    return inv;
}

Rect Transform2D::map_rect(const Rect& rect) const {
    // Pure translations keep the rect exact.
    if (a == 1 && b == 0 && c == 0 && d == 1) {
        return rect.shift({tx, ty});
    }
    const Offset p0 = map_point({rect.left(), rect.top()});
    const Offset p1 = map_point({rect.right(), rect.top()});
    const Offset p2 = map_point({rect.left(), rect.bottom()});
    const Offset p3 = map_point({rect.right(), rect.bottom()});
    const float left = std::min({p0.dx, p1.dx, p2.dx, p3.dx});
    const float top = std::min({p0.dy, p1.dy, p2.dy, p3.dy});
    const float right = std::max({p0.dx, p1.dx, p2.dx, p3.dx});
    const float bottom = std::max({p0.dy, p1.dy, p2.dy, p3.dy});
    return Rect::from_ltrb(left, top, right, bottom);
}

} // namespace viewkit::geometry
