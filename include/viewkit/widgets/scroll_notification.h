#pragma once
#include <viewkit/geometry/axis.h>
#include <viewkit/geometry/basic_types.h>

#include <functional>
#include <optional>

namespace viewkit::widgets {

using geometry::AxisDirection;
using geometry::Offset;

// Pointer movement that produced a scroll update.
struct DragUpdateDetails {
    Offset delta;
    // Component of |delta| along the scroll axis.
    float primary_delta = 0;
};

// Snapshot of a scroll position taken when a notification is sent.
struct ScrollMetrics {
    float pixels = 0;
    float min_scroll_extent = 0;
    float max_scroll_extent = 0;
    float viewport_dimension = 0;
    AxisDirection axis_direction = AxisDirection::Down;

    bool out_of_range() const { return pixels < min_scroll_extent || pixels > max_scroll_extent; }
    float extent_before() const { return pixels - min_scroll_extent; }
    float extent_after() const { return max_scroll_extent - pixels; }
};

class ScrollUpdateNotification;

// Signal sent up the tree by a scroll position. |depth| counts the scroll
// views it has bubbled through.
class ScrollNotification {
public:
    explicit ScrollNotification(const ScrollMetrics& metrics, int depth = 0)
        : metrics_(metrics), depth_(depth) {}
    virtual ~ScrollNotification() = default;

    const ScrollMetrics& metrics() const { return metrics_; }
    int depth() const { return depth_; }

    virtual const ScrollUpdateNotification* as_update() const { return nullptr; }
    virtual const char* kind() const { return "ScrollNotification"; }

private:
    ScrollMetrics metrics_;
    int depth_;
};

// The position moved by |scroll_delta| pixels. Carries the drag that caused
// it, if the move came from the user.
class ScrollUpdateNotification : public ScrollNotification {
public:
    ScrollUpdateNotification(const ScrollMetrics& metrics, float scroll_delta,
                             std::optional<DragUpdateDetails> drag_details = std::nullopt,
                             int depth = 0)
        : ScrollNotification(metrics, depth)
        , scroll_delta_(scroll_delta)
        , drag_details_(drag_details) {}

    float scroll_delta() const { return scroll_delta_; }
    const std::optional<DragUpdateDetails>& drag_details() const { return drag_details_; }

    const ScrollUpdateNotification* as_update() const override { return this; }
    const char* kind() const override { return "ScrollUpdateNotification"; }

private:
    float scroll_delta_;
    std::optional<DragUpdateDetails> drag_details_;
};

// Returns true to stop the notification from bubbling further.
using NotificationListener = std::function<bool(const ScrollNotification& notification)>;

// What a scroll position needs from the scrollable that owns it.
class ScrollContext {
public:
    virtual ~ScrollContext() = default;

    virtual void dispatch_notification(const ScrollNotification& notification) = 0;
    virtual AxisDirection axis_direction() const = 0;
};

} // namespace viewkit::widgets
