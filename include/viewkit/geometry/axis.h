#pragma once

namespace viewkit::geometry {

enum class Axis { Horizontal, Vertical };

// Direction in which the scroll offset grows.
enum class AxisDirection { Up, Down, Left, Right };

enum class TextDirection { LTR, RTL };

inline Axis axis_direction_to_axis(AxisDirection direction) {
    switch (direction) {
        case AxisDirection::Up:
        case AxisDirection::Down:
            return Axis::Vertical;
        case AxisDirection::Left:
        case AxisDirection::Right:
            return Axis::Horizontal;
    }
    return Axis::Vertical;
}

inline AxisDirection flip_axis_direction(AxisDirection direction) {
    switch (direction) {
        case AxisDirection::Up:    return AxisDirection::Down;
        case AxisDirection::Down:  return AxisDirection::Up;
        case AxisDirection::Left:  return AxisDirection::Right;
        case AxisDirection::Right: return AxisDirection::Left;
    }
    return direction;
}

// Up and Left grow the offset against the coordinate system.
inline bool axis_direction_is_reversed(AxisDirection direction) {
    return direction == AxisDirection::Up || direction == AxisDirection::Left;
}

inline AxisDirection text_direction_to_axis_direction(TextDirection direction) {
    return direction == TextDirection::RTL ? AxisDirection::Left : AxisDirection::Right;
}

// Resolves the scroll direction of a scrollable from its axis, its reverse
// flag and, for horizontal axes, the ambient reading direction.
AxisDirection axis_direction_from_axis_reverse_and_directionality(
    Axis axis, bool reverse, TextDirection text_direction);

const char* axis_direction_name(AxisDirection direction);
const char* axis_name(Axis axis);

} // namespace viewkit::geometry
