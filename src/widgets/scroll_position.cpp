#include <viewkit/widgets/scroll_position.h>
#include <viewkit/core/config.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace viewkit::widgets {

ScrollPosition::ScrollPosition(std::shared_ptr<const ScrollPhysics> physics,
                               ScrollContext* context, float initial_pixels,
                               bool keep_scroll_offset, const ScrollPosition* old_position,
                               std::string debug_label)
    : physics_(physics ? std::move(physics) : ScrollPhysics::default_physics())
    , context_(context)
    , initial_pixels_(initial_pixels)
    , keep_scroll_offset_(keep_scroll_offset)
    , debug_label_(std::move(debug_label)) {
    if (old_position && keep_scroll_offset_ && old_position->has_pixels()) {
        // Extents are re-reported on the next layout; only pixels carry over.
        initial_pixels_ = old_position->pixels();
    }
}

float ScrollPosition::clamp_to_range(float value) const {
    if (!has_content_dimensions()) {
        return value;
    }
    return std::clamp(value, min_scroll_extent(), max_scroll_extent());
}

bool ScrollPosition::apply_viewport_dimension(float viewport_dimension) {
    viewport_dimension_ = viewport_dimension;
    return true;
}

bool ScrollPosition::apply_content_dimensions(float min_extent, float max_extent) {
    min_scroll_extent_ = min_extent;
    max_scroll_extent_ = std::max(min_extent, max_extent);

    const float wanted = pixels_.value_or(initial_pixels_);
    const float clamped = clamp_to_range(wanted);
    const bool first = !pixels_.has_value();
    pixels_ = clamped;

    if (std::fabs(clamped - wanted) > core::config::kPixelTolerance) {
        std::ostringstream oss;
        oss << "pixels " << wanted << " clamped to " << clamped << " in [" << min_scroll_extent()
            << ", " << max_scroll_extent() << "]";
        log(core::Severity::Debug, "correct", oss.str());
        // The range shrank under the current position.
        if (!first) {
            notify_listeners();
        }
        return false;
    }
    return true;
}

void ScrollPosition::correct_by(float correction) {
    pixels_ = pixels() + correction;
}

void ScrollPosition::jump_to(float value) {
    user_scroll_direction_ = ScrollDirection::Idle;
    const float delta = set_pixels(clamp_to_range(value), std::nullopt);
    if (delta != 0.0f) {
        log(core::Severity::Debug, "jump", "moved by " + std::to_string(delta));
    }
}

void ScrollPosition::animate_to(float to, std::chrono::milliseconds duration) {
    if (duration.count() == 0 || !animation_handler_) {
        jump_to(to);
        return;
    }
    log(core::Severity::Debug, "animate",
        "to " + std::to_string(to) + " over " + std::to_string(duration.count()) + "ms");
    animation_handler_(*this, clamp_to_range(to), duration);
}

float ScrollPosition::drag_update(const DragUpdateDetails& details) {
    if (!physics_->allow_user_scrolling() || details.primary_delta == 0.0f) {
        return 0.0f;
    }
    const AxisDirection direction = context_ ? context_->axis_direction() : AxisDirection::Down;
    // Dragging content toward the leading edge scrolls forward in reading
    // order; reversed axes grow pixels the other way.
    const float scroll_delta = geometry::axis_direction_is_reversed(direction)
        ? details.primary_delta
        : -details.primary_delta;

    const float applied = set_pixels(clamp_to_range(pixels() + scroll_delta), details);
    if (applied > 0.0f) {
        user_scroll_direction_ = ScrollDirection::Reverse;
    } else if (applied < 0.0f) {
        user_scroll_direction_ = ScrollDirection::Forward;
    }
    return applied;
}

void ScrollPosition::restore_offset(float value) {
    if (has_pixels()) {
        jump_to(value);
    } else {
        initial_pixels_ = value;
    }
}

float ScrollPosition::set_pixels(float value, std::optional<DragUpdateDetails> drag_details) {
    const float old = pixels();
    const float delta = value - old;
    pixels_ = value;
    if (delta == 0.0f) {
        return 0.0f;
    }
    notify_listeners();
    dispatch_update(delta, std::move(drag_details));
    return delta;
}

void ScrollPosition::dispatch_update(float delta, std::optional<DragUpdateDetails> drag_details) {
    if (!context_) return;
    const ScrollUpdateNotification notification(metrics(), delta, std::move(drag_details));
    context_->dispatch_notification(notification);
}

ScrollMetrics ScrollPosition::metrics() const {
    ScrollMetrics m;
    m.pixels = pixels();
    m.min_scroll_extent = min_scroll_extent();
    m.max_scroll_extent = max_scroll_extent();
    m.viewport_dimension = viewport_dimension();
    m.axis_direction = context_ ? context_->axis_direction() : AxisDirection::Down;
    return m;
}

void ScrollPosition::log(core::Severity severity, const char* stage,
                         const std::string& message) const {
    if (diagnostics_) {
        diagnostics_->emit(severity, core::config::kScrollPositionModule, stage, message);
    }
}

void ScrollPosition::describe_into(std::vector<std::string>& description) const {
    if (!debug_label_.empty()) {
        description.push_back(debug_label_);
    }
    ViewportOffset::describe_into(description);
    std::ostringstream range;
    if (has_content_dimensions()) {
        range << "range: " << min_scroll_extent() << ".." << max_scroll_extent();
    } else {
        range << "range: <unknown>";
    }
    description.push_back(range.str());
    if (has_viewport_dimension()) {
        std::ostringstream viewport;
        viewport << "viewport: " << viewport_dimension();
        description.push_back(viewport.str());
    }
    description.push_back(std::string("physics: ") + physics_->name());
}

} // namespace viewkit::widgets
