#include <viewkit/render/proxy_box.h>
#include <viewkit/render/painting_context.h>

#include <algorithm>

namespace viewkit::render {

// ---------------------------------------------------------------------------
// SingleChildRenderBox
// ---------------------------------------------------------------------------

void SingleChildRenderBox::set_child(std::unique_ptr<RenderBox> child) {
    if (child_) {
        drop_child(*child_);
        child_->dispose();
        child_.reset();
    }
    child_ = std::move(child);
    if (child_) {
        adopt_child(*child_);
    }
}

std::unique_ptr<RenderBox> SingleChildRenderBox::take_child() {
    if (!child_) return nullptr;
    drop_child(*child_);
    return std::move(child_);
}

void SingleChildRenderBox::visit_children(const std::function<void(RenderObject&)>& visitor) {
    if (child_) {
        visitor(*child_);
    }
}

void SingleChildRenderBox::dispose() {
    if (child_) {
        child_->dispose();
    }
    RenderBox::dispose();
}

Offset SingleChildRenderBox::child_offset() const {
    if (child_ && child_->parent_data()) {
        if (BoxParentData* data = child_->parent_data()->as_box_parent_data()) {
            return data->offset;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// RenderProxyBox
// ---------------------------------------------------------------------------

RenderProxyBox::RenderProxyBox(std::unique_ptr<RenderBox> child) {
    set_child(std::move(child));
}

void RenderProxyBox::perform_layout() {
    if (RenderBox* c = child()) {
        c->layout(constraints(), true);
        set_size(c->size());
    } else {
        set_size(constraints().smallest());
    }
}

Size RenderProxyBox::compute_dry_layout(const BoxConstraints& constraints) const {
    if (RenderBox* c = child()) {
        return c->get_dry_layout(constraints);
    }
    return constraints.smallest();
}

float RenderProxyBox::compute_min_intrinsic_width(float height) const {
    return child() ? child()->get_min_intrinsic_width(height) : 0.0f;
}

float RenderProxyBox::compute_max_intrinsic_width(float height) const {
    return child() ? child()->get_max_intrinsic_width(height) : 0.0f;
}

float RenderProxyBox::compute_min_intrinsic_height(float width) const {
    return child() ? child()->get_min_intrinsic_height(width) : 0.0f;
}

float RenderProxyBox::compute_max_intrinsic_height(float width) const {
    return child() ? child()->get_max_intrinsic_height(width) : 0.0f;
}

std::optional<float> RenderProxyBox::compute_distance_to_actual_baseline() const {
    if (RenderBox* c = child()) {
        auto baseline = c->get_distance_to_actual_baseline();
        if (baseline) {
            return *baseline + child_offset().dy;
        }
    }
    return std::nullopt;
}

void RenderProxyBox::paint(PaintingContext& context, const Offset& offset) {
    if (RenderBox* c = child()) {
        context.paint_child(*c, offset + child_offset());
    }
}

bool RenderProxyBox::hit_test_children(BoxHitTestResult& result, const Offset& position) {
    RenderBox* c = child();
    if (!c) return false;
    return result.add_with_paint_offset(child_offset(), position,
        [c](BoxHitTestResult& r, const Offset& transformed) {
            return c->hit_test(r, transformed);
        });
}

// ---------------------------------------------------------------------------
// RenderPadding
// ---------------------------------------------------------------------------

RenderPadding::RenderPadding(const EdgeInsets& padding, std::unique_ptr<RenderBox> child)
    : RenderProxyBox(std::move(child))
    , padding_(padding) {}

void RenderPadding::set_padding(const EdgeInsets& padding) {
    if (padding == padding_) return;
    padding_ = padding;
    mark_needs_layout();
}

void RenderPadding::perform_layout() {
    const BoxConstraints& c = constraints();
    RenderBox* content = child();
    if (!content) {
        set_size(c.constrain({padding_.horizontal(), padding_.vertical()}));
        return;
    }
    content->layout(c.deflate(padding_), true);
    content->parent_data()->as_box_parent_data()->offset = padding_.top_left();
    const Size child_size = content->size();
    set_size(c.constrain({child_size.width + padding_.horizontal(),
                          child_size.height + padding_.vertical()}));
}

Size RenderPadding::compute_dry_layout(const BoxConstraints& constraints) const {
    RenderBox* content = child();
    if (!content) {
        return constraints.constrain({padding_.horizontal(), padding_.vertical()});
    }
    const Size child_size = content->get_dry_layout(constraints.deflate(padding_));
    return constraints.constrain({child_size.width + padding_.horizontal(),
                                  child_size.height + padding_.vertical()});
}

float RenderPadding::compute_min_intrinsic_width(float height) const {
    const float inner = child()
        ? child()->get_min_intrinsic_width(std::max(0.0f, height - padding_.vertical()))
        : 0.0f;
    return inner + padding_.horizontal();
}

float RenderPadding::compute_max_intrinsic_width(float height) const {
    const float inner = child()
        ? child()->get_max_intrinsic_width(std::max(0.0f, height - padding_.vertical()))
        : 0.0f;
    return inner + padding_.horizontal();
}

float RenderPadding::compute_min_intrinsic_height(float width) const {
    const float inner = child()
        ? child()->get_min_intrinsic_height(std::max(0.0f, width - padding_.horizontal()))
        : 0.0f;
    return inner + padding_.vertical();
}

float RenderPadding::compute_max_intrinsic_height(float width) const {
    const float inner = child()
        ? child()->get_max_intrinsic_height(std::max(0.0f, width - padding_.horizontal()))
        : 0.0f;
    return inner + padding_.vertical();
}

// ---------------------------------------------------------------------------
// RenderConstrainedBox
// ---------------------------------------------------------------------------

RenderConstrainedBox::RenderConstrainedBox(const BoxConstraints& additional_constraints,
                                           std::unique_ptr<RenderBox> child)
    : RenderProxyBox(std::move(child))
    , additional_constraints_(additional_constraints) {}

void RenderConstrainedBox::set_additional_constraints(const BoxConstraints& constraints) {
    if (constraints == additional_constraints_) return;
    additional_constraints_ = constraints;
    mark_needs_layout();
}

void RenderConstrainedBox::perform_layout() {
    const BoxConstraints enforced = additional_constraints_.enforce(constraints());
    if (RenderBox* c = child()) {
        c->layout(enforced, true);
        set_size(c->size());
    } else {
        set_size(enforced.constrain({0, 0}));
    }
}

Size RenderConstrainedBox::compute_dry_layout(const BoxConstraints& constraints) const {
    const BoxConstraints enforced = additional_constraints_.enforce(constraints);
    if (RenderBox* c = child()) {
        return c->get_dry_layout(enforced);
    }
    return enforced.constrain({0, 0});
}

float RenderConstrainedBox::compute_min_intrinsic_width(float height) const {
    if (additional_constraints_.has_bounded_width() && additional_constraints_.has_tight_width()) {
        return additional_constraints_.min_width;
    }
    return additional_constraints_.constrain_width(RenderProxyBox::compute_min_intrinsic_width(height));
}

float RenderConstrainedBox::compute_max_intrinsic_width(float height) const {
    if (additional_constraints_.has_bounded_width() && additional_constraints_.has_tight_width()) {
        return additional_constraints_.min_width;
    }
    return additional_constraints_.constrain_width(RenderProxyBox::compute_max_intrinsic_width(height));
}

float RenderConstrainedBox::compute_min_intrinsic_height(float width) const {
    if (additional_constraints_.has_bounded_height() && additional_constraints_.has_tight_height()) {
        return additional_constraints_.min_height;
    }
    return additional_constraints_.constrain_height(RenderProxyBox::compute_min_intrinsic_height(width));
}

float RenderConstrainedBox::compute_max_intrinsic_height(float width) const {
    if (additional_constraints_.has_bounded_height() && additional_constraints_.has_tight_height()) {
        return additional_constraints_.min_height;
    }
    return additional_constraints_.constrain_height(RenderProxyBox::compute_max_intrinsic_height(width));
}

// ---------------------------------------------------------------------------
// RenderColoredBox
// ---------------------------------------------------------------------------

RenderColoredBox::RenderColoredBox(const paint::Color& color, std::unique_ptr<RenderBox> child)
    : RenderProxyBox(std::move(child))
    , color_(color) {}

void RenderColoredBox::set_color(const paint::Color& color) {
    if (color == color_) return;
    color_ = color;
    mark_needs_paint();
}

void RenderColoredBox::paint(PaintingContext& context, const Offset& offset) {
    const Size s = size();
    if (s.width > 0 && s.height > 0) {
        context.canvas().fill_rect(Rect::from_origin_size(offset, s), color_);
    }
    RenderProxyBox::paint(context, offset);
}

bool RenderColoredBox::hit_test_self(const Offset&) {
    return true;
}

} // namespace viewkit::render
