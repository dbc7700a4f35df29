#include <viewkit/widgets/scroll_view_host.h>
#include <viewkit/core/config.h>
#include <viewkit/widgets/scroll_controller.h>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace viewkit::widgets {

ScrollViewHost::~ScrollViewHost() {
    unmount();
}

void ScrollViewHost::mount(const SingleChildScrollView& view, const BuildEnvironment& env,
                           std::unique_ptr<render::RenderBox> child) {
    if (mounted()) {
        throw std::logic_error("ScrollViewHost::mount: already mounted");
    }
    env_ = env;
    resolved_ = view.resolve(env);
    physics_ = resolved_.physics;
    controller_ = resolved_.controller;

    position_ = create_position(resolved_, nullptr);
    position_->set_diagnostics(env_.diagnostics);
    restore_offset();
    if (controller_) {
        controller_->attach(*position_);
    }

    viewport_ = std::make_unique<render::RenderSingleChildViewport>(
        resolved_.axis_direction, *position_, resolved_.clip_behavior);
    update_padding(resolved_.padding);
    set_child(std::move(child));

    std::ostringstream oss;
    oss << "axis=" << geometry::axis_direction_name(resolved_.axis_direction)
        << " primary=" << (resolved_.primary ? "true" : "false")
        << " controller=" << (controller_ ? controller_->describe() : std::string("none"))
        << " padding=" << (resolved_.padding ? "yes" : "no");
    log(core::Severity::Info, "mount", oss.str());
}

void ScrollViewHost::update(const SingleChildScrollView& view, const BuildEnvironment& env) {
    if (!mounted()) {
        mount(view, env);
        return;
    }
    env_ = env;
    const ResolvedScrollView resolved = view.resolve(env);
    resolved_ = resolved;

    // Same order as the first build: direction, offset, clip.
    viewport_->set_axis_direction(resolved.axis_direction);
    update_position(resolved);
    viewport_->set_clip_behavior(resolved.clip_behavior);
    update_padding(resolved.padding);
}

void ScrollViewHost::unmount() {
    if (!mounted()) return;
    save_offset();

    viewport_->dispose();
    viewport_.reset();
    padding_ = nullptr;

    if (controller_) {
        controller_->detach(*position_);
    }
    position_.reset();
    controller_ = nullptr;
    physics_.reset();
    log(core::Severity::Info, "unmount", "scroll view removed");
}

void ScrollViewHost::set_child(std::unique_ptr<render::RenderBox> child) {
    if (!mounted()) {
        throw std::logic_error("ScrollViewHost::set_child: not mounted");
    }
    if (padding_) {
        padding_->set_child(std::move(child));
    } else {
        viewport_->set_child(std::move(child));
    }
}

render::RenderBox* ScrollViewHost::child() const {
    if (padding_) {
        return padding_->child();
    }
    return viewport_ ? viewport_->child() : nullptr;
}

std::unique_ptr<ScrollPosition> ScrollViewHost::create_position(
    const ResolvedScrollView& resolved, const ScrollPosition* old_position) {
    if (resolved.controller) {
        return resolved.controller->create_scroll_position(resolved.physics, *this, old_position);
    }
    return std::make_unique<ScrollPosition>(resolved.physics, this, 0.0f, true, old_position);
}

void ScrollViewHost::update_position(const ResolvedScrollView& resolved) {
    if (resolved.controller == controller_ && resolved.physics == physics_) {
        return;
    }

    std::unique_ptr<ScrollPosition> old_position = std::move(position_);
    if (controller_) {
        controller_->detach(*old_position);
    }
    position_ = create_position(resolved, old_position.get());
    position_->set_diagnostics(env_.diagnostics);
    controller_ = resolved.controller;
    physics_ = resolved.physics;
    if (controller_) {
        controller_->attach(*position_);
    }
    // The viewport must let go of the old position before it is destroyed.
    viewport_->set_offset(*position_);
    log(core::Severity::Info, "position", "position rebuilt: " + position_->describe());
}

void ScrollViewHost::update_padding(const std::optional<EdgeInsets>& padding) {
    if (padding) {
        if (padding_) {
            if (padding_->padding() != *padding) {
                padding_->set_padding(*padding);
            }
            return;
        }
        auto wrapper = std::make_unique<render::RenderPadding>(*padding, viewport_->take_child());
        padding_ = wrapper.get();
        viewport_->set_child(std::move(wrapper));
        return;
    }

    if (!padding_) return;
    std::unique_ptr<render::RenderBox> wrapper = viewport_->take_child();
    std::unique_ptr<render::RenderBox> content = padding_->take_child();
    padding_ = nullptr;
    wrapper->dispose();
    viewport_->set_child(std::move(content));
}

void ScrollViewHost::save_offset() {
    if (!resolved_.restoration_id || !env_.restoration_store || !position_ ||
        !position_->has_pixels()) {
        return;
    }
    env_.restoration_store->write(*resolved_.restoration_id, position_->pixels());
    log(core::Severity::Debug, "restoration",
        "saved " + *resolved_.restoration_id + " at " + std::to_string(position_->pixels()));
}

void ScrollViewHost::restore_offset() {
    if (!resolved_.restoration_id || !env_.restoration_store) return;
    std::optional<float> saved = env_.restoration_store->read(*resolved_.restoration_id);
    if (!saved) return;
    position_->restore_offset(*saved);
    log(core::Severity::Info, "restoration",
        "restored " + *resolved_.restoration_id + " to " + std::to_string(*saved));
}

BuildEnvironment ScrollViewHost::child_environment() {
    BuildEnvironment env = env_;
    if (resolved_.inherited_controller) {
        env.primary_scroll.reset();
    }
    env.notification_parent = [this](const ScrollNotification& notification) {
        forward_from_descendant(notification);
        return false;
    };
    return env;
}

void ScrollViewHost::forward_from_descendant(const ScrollNotification& notification) {
    if (const ScrollUpdateNotification* update = notification.as_update()) {
        const ScrollUpdateNotification deeper(update->metrics(), update->scroll_delta(),
                                              update->drag_details(), update->depth() + 1);
        dispatch_notification(deeper);
        return;
    }
    const ScrollNotification deeper(notification.metrics(), notification.depth() + 1);
    dispatch_notification(deeper);
}

void ScrollViewHost::dispatch_notification(const ScrollNotification& notification) {
    maybe_dismiss_keyboard(notification);
    if (env_.notification_parent) {
        env_.notification_parent(notification);
    }
}

void ScrollViewHost::maybe_dismiss_keyboard(const ScrollNotification& notification) {
    if (resolved_.keyboard_dismiss_behavior != ScrollViewKeyboardDismissBehavior::OnDrag) {
        return;
    }
    const ScrollUpdateNotification* update = notification.as_update();
    if (!update || !update->drag_details()) {
        return;
    }
    FocusScopeNode* focus = env_.focus_scope;
    if (!focus || !focus->has_focus()) {
        return;
    }
    focus->unfocus();
    log(core::Severity::Info, "keyboard", "focus dismissed by drag");
}

void ScrollViewHost::log(core::Severity severity, const char* stage,
                         const std::string& message) const {
    if (env_.diagnostics) {
        env_.diagnostics->emit(severity, core::config::kScrollViewModule, stage, message);
    }
}

} // namespace viewkit::widgets
