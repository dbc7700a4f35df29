#include <viewkit/widgets/single_child_scroll_view.h>

#include <stdexcept>
#include <utility>

namespace viewkit::widgets {

SingleChildScrollView::SingleChildScrollView(Options options)
    : options_(std::move(options)) {
    if (options_.controller != nullptr && options_.primary.value_or(false)) {
        throw std::invalid_argument(
            "SingleChildScrollView: primary cannot be true when a controller is given; "
            "a primary scroll view uses the inherited PrimaryScrollController");
    }
}

AxisDirection SingleChildScrollView::axis_direction(const BuildEnvironment& env) const {
    return geometry::axis_direction_from_axis_reverse_and_directionality(
        options_.scroll_direction, options_.reverse, env.text_direction);
}

bool SingleChildScrollView::effective_primary(const BuildEnvironment& env) const {
    if (options_.primary) {
        return *options_.primary;
    }
    return options_.controller == nullptr &&
           PrimaryScrollController::should_inherit(env, options_.scroll_direction);
}

ScrollController* SingleChildScrollView::effective_controller(const BuildEnvironment& env) const {
    return effective_primary(env) ? PrimaryScrollController::maybe_of(env) : options_.controller;
}

ResolvedScrollView SingleChildScrollView::resolve(const BuildEnvironment& env) const {
    ResolvedScrollView resolved;
    resolved.axis_direction = axis_direction(env);
    resolved.primary = effective_primary(env);
    resolved.controller = effective_controller(env);
    resolved.inherited_controller = resolved.primary && resolved.controller != nullptr;
    if (options_.padding) {
        resolved.padding = options_.padding->resolve(env.text_direction);
    }
    resolved.physics = options_.physics;
    resolved.clip_behavior = options_.clip_behavior;
    resolved.drag_start_behavior = options_.drag_start_behavior;
    resolved.keyboard_dismiss_behavior = options_.keyboard_dismiss_behavior;
    resolved.restoration_id = options_.restoration_id;
    return resolved;
}

} // namespace viewkit::widgets
