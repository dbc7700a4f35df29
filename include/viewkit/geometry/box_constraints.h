#pragma once
#include <viewkit/geometry/basic_types.h>
#include <viewkit/geometry/edge_insets.h>

#include <ostream>

namespace viewkit::geometry {

// Immutable min/max bounds for a box's width and height.
struct BoxConstraints {
    float min_width = 0;
    float max_width = kInfinity;
    float min_height = 0;
    float max_height = kInfinity;

    static BoxConstraints tight(const Size& size) {
        return {size.width, size.width, size.height, size.height};
    }
    static BoxConstraints loose(const Size& size) {
        return {0, size.width, 0, size.height};
    }
    static BoxConstraints tight_for(float width, float height) {
        return {width, width, height, height};
    }

    // Only the width bounds are kept; height becomes [0, inf).
    BoxConstraints width_constraints() const { return {min_width, max_width, 0, kInfinity}; }
    // Only the height bounds are kept; width becomes [0, inf).
    BoxConstraints height_constraints() const { return {0, kInfinity, min_height, max_height}; }

    BoxConstraints loosen() const { return {0, max_width, 0, max_height}; }
    BoxConstraints deflate(const EdgeInsets& insets) const;
    BoxConstraints enforce(const BoxConstraints& outer) const;

    float constrain_width(float width = kInfinity) const;
    float constrain_height(float height = kInfinity) const;
    Size constrain(const Size& size) const {
        return {constrain_width(size.width), constrain_height(size.height)};
    }
    Size smallest() const { return {constrain_width(0), constrain_height(0)}; }
    Size biggest() const { return {constrain_width(), constrain_height()}; }

    bool has_bounded_width() const { return max_width < kInfinity; }
    bool has_bounded_height() const { return max_height < kInfinity; }
    bool has_tight_width() const { return min_width >= max_width; }
    bool has_tight_height() const { return min_height >= max_height; }
    bool is_tight() const { return has_tight_width() && has_tight_height(); }
    bool is_normalized() const {
        return min_width >= 0 && min_width <= max_width &&
               min_height >= 0 && min_height <= max_height;
    }
    bool is_satisfied_by(const Size& size) const {
        return min_width <= size.width && size.width <= max_width &&
               min_height <= size.height && size.height <= max_height;
    }

    bool operator==(const BoxConstraints& o) const {
        return min_width == o.min_width && max_width == o.max_width &&
               min_height == o.min_height && max_height == o.max_height;
    }
    bool operator!=(const BoxConstraints& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const BoxConstraints& constraints);

} // namespace viewkit::geometry
