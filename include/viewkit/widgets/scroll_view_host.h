#pragma once
#include <viewkit/core/diagnostics.h>
#include <viewkit/render/proxy_box.h>
#include <viewkit/render/single_child_viewport.h>
#include <viewkit/widgets/build_environment.h>
#include <viewkit/widgets/scroll_notification.h>
#include <viewkit/widgets/scroll_position.h>
#include <viewkit/widgets/single_child_scroll_view.h>

#include <memory>
#include <string>

namespace viewkit::widgets {

// Keeps one SingleChildScrollView mounted: builds the viewport render
// object and the scroll position on mount, pushes new settings into them on
// update and tears both down on unmount. The host owns the viewport;
// attaching it to a pipeline owner is up to the caller.
class ScrollViewHost : public ScrollContext {
public:
    ScrollViewHost() = default;
    ~ScrollViewHost() override;

    // Non-copyable
    ScrollViewHost(const ScrollViewHost&) = delete;
    ScrollViewHost& operator=(const ScrollViewHost&) = delete;

    void mount(const SingleChildScrollView& view, const BuildEnvironment& env,
               std::unique_ptr<render::RenderBox> child = nullptr);
    void update(const SingleChildScrollView& view, const BuildEnvironment& env);
    void unmount();
    bool mounted() const { return viewport_ != nullptr; }

    // Replaces the scrolled content, keeping any padding wrapper.
    void set_child(std::unique_ptr<render::RenderBox> child);
    // The scrolled content, without the padding wrapper.
    render::RenderBox* child() const;

    render::RenderSingleChildViewport* viewport() const { return viewport_.get(); }
    ScrollPosition* position() const { return position_.get(); }
    render::RenderPadding* padding_box() const { return padding_; }
    const ResolvedScrollView& resolved() const { return resolved_; }

    // Environment handed to the scrolled subtree: scroll notifications from
    // below bubble through this host, and an inherited primary controller is
    // hidden so nested scroll views do not adopt it too.
    BuildEnvironment child_environment();

    // ScrollContext
    void dispatch_notification(const ScrollNotification& notification) override;
    AxisDirection axis_direction() const override { return resolved_.axis_direction; }

private:
    void update_position(const ResolvedScrollView& resolved);
    std::unique_ptr<ScrollPosition> create_position(const ResolvedScrollView& resolved,
                                                    const ScrollPosition* old_position);
    void forward_from_descendant(const ScrollNotification& notification);
    void update_padding(const std::optional<EdgeInsets>& padding);
    void save_offset();
    void restore_offset();
    void maybe_dismiss_keyboard(const ScrollNotification& notification);
    void log(core::Severity severity, const char* stage, const std::string& message) const;

    BuildEnvironment env_;
    ResolvedScrollView resolved_;
    std::unique_ptr<ScrollPosition> position_;
    // Physics named by the options, compared by identity across updates.
    std::shared_ptr<const ScrollPhysics> physics_;
    ScrollController* controller_ = nullptr;
    std::unique_ptr<render::RenderSingleChildViewport> viewport_;
    render::RenderPadding* padding_ = nullptr;
};

} // namespace viewkit::widgets
