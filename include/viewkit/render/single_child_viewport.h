#pragma once
#include <viewkit/core/diagnostics.h>
#include <viewkit/geometry/axis.h>
#include <viewkit/paint/display_list.h>
#include <viewkit/paint/layer.h>
#include <viewkit/render/abstract_viewport.h>
#include <viewkit/render/proxy_box.h>
#include <viewkit/render/viewport_offset.h>

#include <memory>
#include <optional>
#include <string>

namespace viewkit::render {

using geometry::Axis;
using geometry::AxisDirection;

// Viewport that scrolls a single box child along one axis.
//
// The child is laid out unconstrained along the scroll axis and with the
// incoming constraints on the cross axis; the viewport itself takes the
// incoming constraints applied to the child's size, so the child may extend
// past it. At paint time the child is translated by the current scroll
// offset and clipped to the viewport when it overflows. The offset object is
// shared with whoever drives scrolling and is never owned here.
class RenderSingleChildViewport : public SingleChildRenderBox, public RenderAbstractViewport {
public:
    RenderSingleChildViewport(AxisDirection axis_direction, ViewportOffset& offset,
                              paint::Clip clip_behavior = paint::Clip::HardEdge,
                              std::unique_ptr<RenderBox> child = nullptr);
    ~RenderSingleChildViewport() override;

    AxisDirection axis_direction() const { return axis_direction_; }
    void set_axis_direction(AxisDirection value);
    Axis axis() const { return geometry::axis_direction_to_axis(axis_direction_); }

    ViewportOffset& offset() const { return *offset_; }
    // Moves the change subscription to |value| (while attached).
    void set_offset(ViewportOffset& value);

    paint::Clip clip_behavior() const { return clip_behavior_; }
    void set_clip_behavior(paint::Clip value);

    // Render tree hooks
    std::unique_ptr<ParentData> create_parent_data() const override;
    void attach(PipelineOwner& owner) override;
    void detach() override;
    void dispose() override;
    bool is_repaint_boundary() const override { return true; }

    void paint(PaintingContext& context, const Offset& offset) override;
    void apply_paint_transform(const RenderObject& child, Transform2D& transform) const override;
    std::optional<Rect> describe_approximate_paint_clip(const RenderObject* child) const override;
    std::optional<Rect> describe_semantics_clip(const RenderObject* child) const override;

    // RenderAbstractViewport
    RevealedOffset get_offset_to_reveal(RenderObject& target, float alignment,
                                        std::optional<Rect> rect = std::nullopt) override;
    RenderObject& as_render_object() override { return *this; }
    RenderAbstractViewport* as_viewport() override { return this; }

    void show_on_screen(RenderObject* descendant = nullptr,
                        std::optional<Rect> rect = std::nullopt,
                        std::chrono::milliseconds duration = std::chrono::milliseconds(0)) override;

    // Translation applied to the child for the current scroll position.
    // Requires a child.
    Offset paint_offset() const { return paint_offset_for_position(offset_->pixels()); }
    Offset paint_offset_for_position(float position) const;
    bool should_clip_at_paint_offset(const Offset& paint_offset) const;

    float viewport_extent() const;
    float min_scroll_extent() const { return 0.0f; }
    float max_scroll_extent() const;

    // The clip layer held from the last paint, if any.
    paint::ClipRectLayer* clip_layer() const { return clip_rect_layer_.get(); }

    std::string debug_description() const;
    const char* type_name() const override { return "RenderSingleChildViewport"; }

protected:
    void perform_layout() override;
    Size compute_dry_layout(const BoxConstraints& constraints) const override;
    float compute_min_intrinsic_width(float height) const override;
    float compute_max_intrinsic_width(float height) const override;
    float compute_min_intrinsic_height(float width) const override;
    float compute_max_intrinsic_height(float width) const override;
    // No baseline: scrolling would otherwise shift a baseline-aligned parent.
    std::optional<float> compute_distance_to_actual_baseline() const override { return std::nullopt; }
    bool hit_test_children(BoxHitTestResult& result, const Offset& position) override;

private:
    BoxConstraints inner_constraints(const BoxConstraints& constraints) const;
    void has_scrolled();
    void subscribe_to_offset();
    void unsubscribe_from_offset();
    void log(core::Severity severity, const char* stage, const std::string& message) const;

    AxisDirection axis_direction_;
    ViewportOffset* offset_;
    paint::Clip clip_behavior_;
    std::optional<ListenerToken> offset_subscription_;
    paint::LayerHandle<paint::ClipRectLayer> clip_rect_layer_;
};

} // namespace viewkit::render
