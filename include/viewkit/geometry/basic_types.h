#pragma once
#include <limits>
#include <ostream>

namespace viewkit::geometry {

inline constexpr float kInfinity = std::numeric_limits<float>::infinity();

struct Offset {
    float dx = 0, dy = 0;

    Offset operator+(const Offset& o) const { return {dx + o.dx, dy + o.dy}; }
    Offset operator-(const Offset& o) const { return {dx - o.dx, dy - o.dy}; }
    Offset operator-() const { return {-dx, -dy}; }
    bool operator==(const Offset& o) const { return dx == o.dx && dy == o.dy; }
    bool operator!=(const Offset& o) const { return !(*this == o); }
};

struct Size {
    float width = 0, height = 0;

    bool operator==(const Size& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Size& o) const { return !(*this == o); }

    // True if the point lies inside [0, width) x [0, height).
    bool contains(const Offset& p) const {
        return p.dx >= 0 && p.dx < width && p.dy >= 0 && p.dy < height;
    }
};

struct Rect {
    float x = 0, y = 0, width = 0, height = 0;

    static Rect from_ltrb(float left, float top, float right, float bottom) {
        return {left, top, right - left, bottom - top};
    }
    static Rect from_origin_size(const Offset& origin, const Size& size) {
        return {origin.dx, origin.dy, size.width, size.height};
    }

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + width; }
    float bottom() const { return y + height; }
    Offset top_left() const { return {x, y}; }
    Size size() const { return {width, height}; }
    bool is_empty() const { return width <= 0 || height <= 0; }

    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
    bool contains(const Offset& p) const { return contains(p.dx, p.dy); }

    Rect shift(const Offset& by) const { return {x + by.dx, y + by.dy, width, height}; }
    Rect intersect(const Rect& other) const;
    Rect expand_to_include(const Rect& other) const;

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const Offset& offset);
std::ostream& operator<<(std::ostream& os, const Size& size);
std::ostream& operator<<(std::ostream& os, const Rect& rect);

} // namespace viewkit::geometry
