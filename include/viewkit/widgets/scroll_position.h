#pragma once
#include <viewkit/core/diagnostics.h>
#include <viewkit/render/viewport_offset.h>
#include <viewkit/widgets/scroll_notification.h>
#include <viewkit/widgets/scroll_physics.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace viewkit::widgets {

using render::ScrollDirection;

// Viewport offset driven by a scroll view. Keeps pixels inside the content
// range the viewport reports, accepts drags when its physics allows, and
// reports every move to its context as a ScrollUpdateNotification.
class ScrollPosition : public render::ViewportOffset {
public:
    // Receives non-zero-duration moves. Without one, animate_to jumps.
    using AnimationHandler =
        std::function<void(ScrollPosition& position, float to, std::chrono::milliseconds duration)>;

    // |old_position|, when given, hands over its pixels instead of
    // |initial_pixels| (used when a scroll view rebuilds its position).
    ScrollPosition(std::shared_ptr<const ScrollPhysics> physics, ScrollContext* context,
                   float initial_pixels = 0.0f, bool keep_scroll_offset = true,
                   const ScrollPosition* old_position = nullptr,
                   std::string debug_label = {});

    // ViewportOffset
    float pixels() const override { return pixels_.value_or(initial_pixels_); }
    bool has_pixels() const override { return pixels_.has_value(); }
    bool apply_viewport_dimension(float viewport_dimension) override;
    bool apply_content_dimensions(float min_scroll_extent, float max_scroll_extent) override;
    void correct_by(float correction) override;
    void jump_to(float value) override;
    void animate_to(float to, std::chrono::milliseconds duration) override;
    ScrollDirection user_scroll_direction() const override { return user_scroll_direction_; }
    bool allow_implicit_scrolling() const override { return physics_->allow_implicit_scrolling(); }

    // Applies a user drag along the scroll axis. Returns the distance the
    // position actually moved.
    float drag_update(const DragUpdateDetails& details);

    // Sets the position a restored scroll view should start from.
    void restore_offset(float value);

    bool has_content_dimensions() const { return min_scroll_extent_.has_value(); }
    float min_scroll_extent() const { return min_scroll_extent_.value_or(0.0f); }
    float max_scroll_extent() const { return max_scroll_extent_.value_or(0.0f); }
    bool has_viewport_dimension() const { return viewport_dimension_.has_value(); }
    float viewport_dimension() const { return viewport_dimension_.value_or(0.0f); }
    ScrollMetrics metrics() const;

    const std::shared_ptr<const ScrollPhysics>& physics() const { return physics_; }
    ScrollContext* context() const { return context_; }
    bool keep_scroll_offset() const { return keep_scroll_offset_; }
    const std::string& debug_label() const { return debug_label_; }

    void set_animation_handler(AnimationHandler handler) { animation_handler_ = std::move(handler); }

    // Emitter for range corrections and jumps; null disables logging.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }

protected:
    void describe_into(std::vector<std::string>& description) const override;

private:
    float clamp_to_range(float value) const;
    // Moves to |value| and reports the change. Returns the delta applied.
    float set_pixels(float value, std::optional<DragUpdateDetails> drag_details);
    void dispatch_update(float delta, std::optional<DragUpdateDetails> drag_details);
    void log(core::Severity severity, const char* stage, const std::string& message) const;

    std::shared_ptr<const ScrollPhysics> physics_;
    ScrollContext* context_;
    float initial_pixels_;
    bool keep_scroll_offset_;
    std::string debug_label_;

    std::optional<float> pixels_;
    std::optional<float> min_scroll_extent_;
    std::optional<float> max_scroll_extent_;
    std::optional<float> viewport_dimension_;
    ScrollDirection user_scroll_direction_ = ScrollDirection::Idle;
    AnimationHandler animation_handler_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

} // namespace viewkit::widgets
