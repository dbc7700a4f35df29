#include <viewkit/render/single_child_viewport.h>
#include <viewkit/core/config.h>
#include <viewkit/core/diagnostics.h>
#include <viewkit/render/painting_context.h>

#include <algorithm>
#include <sstream>

namespace viewkit::render {

RenderSingleChildViewport::RenderSingleChildViewport(AxisDirection axis_direction,
                                                     ViewportOffset& offset,
                                                     paint::Clip clip_behavior,
                                                     std::unique_ptr<RenderBox> child)
    : axis_direction_(axis_direction)
    , offset_(&offset)
    , clip_behavior_(clip_behavior) {
    set_child(std::move(child));
}

RenderSingleChildViewport::~RenderSingleChildViewport() {
    unsubscribe_from_offset();
}

void RenderSingleChildViewport::set_axis_direction(AxisDirection value) {
    if (value == axis_direction_) return;
    axis_direction_ = value;
    mark_needs_layout();
}

void RenderSingleChildViewport::set_offset(ViewportOffset& value) {
    if (&value == offset_) return;
    const bool was_subscribed = offset_subscription_.has_value();
    unsubscribe_from_offset();
    offset_ = &value;
    if (attached() || was_subscribed) {
        subscribe_to_offset();
    }
    log(core::Severity::Info, "offset", "offset replaced: " + offset_->describe());
    mark_needs_layout();
}

void RenderSingleChildViewport::set_clip_behavior(paint::Clip value) {
    if (value == clip_behavior_) return;
    clip_behavior_ = value;
    mark_needs_paint();
    mark_needs_semantics_update();
}

void RenderSingleChildViewport::has_scrolled() {
    // Scrolling only moves the child; its size and ours are unaffected.
    mark_needs_paint();
    mark_needs_semantics_update();
}

void RenderSingleChildViewport::subscribe_to_offset() {
    if (offset_subscription_) return;
    offset_subscription_ = offset_->subscribe([this]() { has_scrolled(); });
}

void RenderSingleChildViewport::unsubscribe_from_offset() {
    if (!offset_subscription_) return;
    offset_->unsubscribe(*offset_subscription_);
    offset_subscription_.reset();
}

std::unique_ptr<ParentData> RenderSingleChildViewport::create_parent_data() const {
    // The child's position comes from the scroll offset, not from parent data.
    return std::make_unique<ParentData>();
}

void RenderSingleChildViewport::attach(PipelineOwner& owner) {
    SingleChildRenderBox::attach(owner);
    subscribe_to_offset();
}

void RenderSingleChildViewport::detach() {
    unsubscribe_from_offset();
    SingleChildRenderBox::detach();
}

void RenderSingleChildViewport::dispose() {
    clip_rect_layer_.reset();
    unsubscribe_from_offset();
    SingleChildRenderBox::dispose();
}

// ---------------------------------------------------------------------------
// Extents and layout
// ---------------------------------------------------------------------------

float RenderSingleChildViewport::viewport_extent() const {
    const Size s = size();
    return axis() == Axis::Horizontal ? s.width : s.height;
}

float RenderSingleChildViewport::max_scroll_extent() const {
    RenderBox* content = child();
    if (!content) {
        return 0.0f;
    }
    const Size s = size();
    const Size c = content->size();
    if (axis() == Axis::Horizontal) {
        return std::max(0.0f, c.width - s.width);
    }
    return std::max(0.0f, c.height - s.height);
}

BoxConstraints RenderSingleChildViewport::inner_constraints(const BoxConstraints& constraints) const {
    switch (axis()) {
        case Axis::Horizontal:
            return constraints.height_constraints();
        case Axis::Vertical:
            return constraints.width_constraints();
    }
    return constraints;
}

float RenderSingleChildViewport::compute_min_intrinsic_width(float height) const {
    return child() ? child()->get_min_intrinsic_width(height) : 0.0f;
}

float RenderSingleChildViewport::compute_max_intrinsic_width(float height) const {
    return child() ? child()->get_max_intrinsic_width(height) : 0.0f;
}

float RenderSingleChildViewport::compute_min_intrinsic_height(float width) const {
    return child() ? child()->get_min_intrinsic_height(width) : 0.0f;
}

float RenderSingleChildViewport::compute_max_intrinsic_height(float width) const {
    return child() ? child()->get_max_intrinsic_height(width) : 0.0f;
}

Size RenderSingleChildViewport::compute_dry_layout(const BoxConstraints& constraints) const {
    RenderBox* content = child();
    if (!content) {
        return constraints.smallest();
    }
    const Size child_size = content->get_dry_layout(inner_constraints(constraints));
    return constraints.constrain(child_size);
}

void RenderSingleChildViewport::perform_layout() {
    const BoxConstraints& c = constraints();
    if (RenderBox* content = child()) {
        content->layout(inner_constraints(c), true);
        set_size(c.constrain(content->size()));
    } else {
        set_size(c.smallest());
    }

    const float extent = viewport_extent();
    const float max_extent = max_scroll_extent();
    if (!offset_->apply_viewport_dimension(extent)) {
        log(core::Severity::Debug, "layout", "offset corrected after viewport dimension");
    }
    if (!offset_->apply_content_dimensions(min_scroll_extent(), max_extent)) {
        log(core::Severity::Debug, "layout", "offset corrected after content dimensions");
    }

    std::ostringstream oss;
    oss << "extent=" << extent << " range=[" << min_scroll_extent() << ", " << max_extent << "]";
    log(core::Severity::Debug, "layout", oss.str());
}

// ---------------------------------------------------------------------------
// Painting
// ---------------------------------------------------------------------------

Offset RenderSingleChildViewport::paint_offset_for_position(float position) const {
    RenderBox* content = child();
    if (!content) {
        return {};
    }
    const Size s = size();
    const Size c = content->size();
    switch (axis_direction_) {
        case AxisDirection::Up:
            return {0.0f, position - c.height + s.height};
        case AxisDirection::Down:
            return {0.0f, -position};
        case AxisDirection::Left:
            return {position - c.width + s.width, 0.0f};
        case AxisDirection::Right:
            return {-position, 0.0f};
    }
    return {};
}

bool RenderSingleChildViewport::should_clip_at_paint_offset(const Offset& paint_offset) const {
    RenderBox* content = child();
    if (!content) {
        return false;
    }
    switch (clip_behavior_) {
        case paint::Clip::None:
            return false;
        case paint::Clip::HardEdge:
        case paint::Clip::AntiAlias:
        case paint::Clip::AntiAliasWithSaveLayer: {
            const Size s = size();
            const Size c = content->size();
            return paint_offset.dx < 0 ||
                   paint_offset.dy < 0 ||
                   paint_offset.dx + c.width > s.width ||
                   paint_offset.dy + c.height > s.height;
        }
    }
    return false;
}

void RenderSingleChildViewport::paint(PaintingContext& context, const Offset& origin) {
    RenderBox* content = child();
    if (!content) {
        clip_rect_layer_.reset();
        return;
    }

    const Offset scroll_offset = paint_offset();
    auto paint_contents = [content, scroll_offset](PaintingContext& ctx, const Offset& at) {
        ctx.paint_child(*content, at + scroll_offset);
    };

    if (should_clip_at_paint_offset(scroll_offset)) {
        clip_rect_layer_.set(context.push_clip_rect(
            needs_compositing(), origin, Rect::from_origin_size({0, 0}, size()),
            paint_contents, clip_behavior_, clip_rect_layer_.shared()));
    } else {
        clip_rect_layer_.reset();
        paint_contents(context, origin);
    }
}

void RenderSingleChildViewport::apply_paint_transform(const RenderObject&,
                                                      Transform2D& transform) const {
    const Offset scroll_offset = paint_offset();
    transform.translate(scroll_offset.dx, scroll_offset.dy);
}

std::optional<Rect> RenderSingleChildViewport::describe_approximate_paint_clip(
    const RenderObject* child_object) const {
    if (child_object && should_clip_at_paint_offset(paint_offset())) {
        return Rect::from_origin_size({0, 0}, size());
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Hit testing
// ---------------------------------------------------------------------------

bool RenderSingleChildViewport::hit_test_children(BoxHitTestResult& result,
                                                  const Offset& position) {
    RenderBox* content = child();
    if (!content) {
        return false;
    }
    return result.add_with_paint_offset(paint_offset(), position,
        [content](BoxHitTestResult& r, const Offset& transformed) {
            return content->hit_test(r, transformed);
        });
}

// ---------------------------------------------------------------------------
// Revealing descendants
// ---------------------------------------------------------------------------

RevealedOffset RenderSingleChildViewport::get_offset_to_reveal(RenderObject& target,
                                                               float alignment,
                                                               std::optional<Rect> rect) {
    const Rect target_rect = rect.value_or(target.paint_bounds());
    RenderBox* content = child();
    if (!target.is_box()) {
        log(core::Severity::Warning, "reveal",
            std::string("target ") + target.type_name() + " is not a box; keeping current offset");
        return {offset_->pixels(), target_rect};
    }
    if (!content) {
        return {offset_->pixels(), target_rect};
    }

    const Transform2D transform = target.get_transform_to(content);
    const Rect bounds = transform.map_rect(target_rect);
    const Size content_size = content->size();

    float leading_scroll_offset = 0.0f;
    float target_main_axis_extent = 0.0f;
    float main_axis_extent = 0.0f;

    switch (axis_direction_) {
        case AxisDirection::Up:
            main_axis_extent = size().height;
            leading_scroll_offset = content_size.height - bounds.bottom();
            target_main_axis_extent = bounds.height;
            break;
        case AxisDirection::Right:
            main_axis_extent = size().width;
            leading_scroll_offset = bounds.left();
            target_main_axis_extent = bounds.width;
            break;
        case AxisDirection::Down:
            main_axis_extent = size().height;
            leading_scroll_offset = bounds.top();
            target_main_axis_extent = bounds.height;
            break;
        case AxisDirection::Left:
            main_axis_extent = size().width;
            leading_scroll_offset = content_size.width - bounds.right();
            target_main_axis_extent = bounds.width;
            break;
    }

    const float target_offset =
        leading_scroll_offset - (main_axis_extent - target_main_axis_extent) * alignment;
    const Rect target_rect_at_offset = bounds.shift(paint_offset_for_position(target_offset));
    return {target_offset, target_rect_at_offset};
}

void RenderSingleChildViewport::show_on_screen(RenderObject* descendant, std::optional<Rect> rect,
                                               std::chrono::milliseconds duration) {
    if (!offset_->allow_implicit_scrolling()) {
        SingleChildRenderBox::show_on_screen(descendant, rect, duration);
        return;
    }

    const float before = offset_->pixels();
    std::optional<Rect> new_rect =
        RenderAbstractViewport::show_in_viewport(descendant, rect, *this, *offset_, duration);
    if (offset_->pixels() != before) {
        log(core::Severity::Debug, "show_on_screen",
            "implicit scroll to " + std::to_string(offset_->pixels()));
    }
    SingleChildRenderBox::show_on_screen(nullptr, new_rect, duration);
}

// ---------------------------------------------------------------------------
// Semantics and debugging
// ---------------------------------------------------------------------------

std::optional<Rect> RenderSingleChildViewport::describe_semantics_clip(const RenderObject*) const {
    const float pixels = offset_->pixels();
    const float remaining_offset = max_scroll_extent() - pixels;
    const Rect b = semantic_bounds();
    switch (axis_direction_) {
        case AxisDirection::Up:
            return Rect::from_ltrb(b.left(), b.top() - remaining_offset,
                                   b.right(), b.bottom() + pixels);
        case AxisDirection::Right:
            return Rect::from_ltrb(b.left() - pixels, b.top(),
                                   b.right() + remaining_offset, b.bottom());
        case AxisDirection::Down:
            return Rect::from_ltrb(b.left(), b.top() - pixels,
                                   b.right(), b.bottom() + remaining_offset);
        case AxisDirection::Left:
            return Rect::from_ltrb(b.left() - remaining_offset, b.top(),
                                   b.right() + pixels, b.bottom());
    }
    return b;
}

std::string RenderSingleChildViewport::debug_description() const {
    std::ostringstream oss;
    oss << type_name() << "(axisDirection: " << geometry::axis_direction_name(axis_direction_)
        << ", clipBehavior: " << paint::clip_name(clip_behavior_);
    if (has_size()) {
        oss << ", size: " << size();
    }
    if (child()) {
        oss << ", offset: " << paint_offset();
    }
    oss << ")";
    return oss.str();
}

void RenderSingleChildViewport::log(core::Severity severity, const char* stage,
                                    const std::string& message) const {
    if (core::DiagnosticEmitter* emitter = diagnostics()) {
        emitter->emit(severity, core::config::kViewportModule, stage, message);
    }
}

} // namespace viewkit::render
