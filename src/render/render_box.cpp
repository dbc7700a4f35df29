#include <viewkit/render/render_box.h>

namespace viewkit::render {

// ---------------------------------------------------------------------------
// BoxHitTestResult
// ---------------------------------------------------------------------------

bool BoxHitTestResult::add_with_paint_offset(const std::optional<Offset>& offset,
                                             const Offset& position,
                                             const HitTestFn& hit_test) {
    const Offset transformed = offset ? position - *offset : position;
    return hit_test(*this, transformed);
}

bool BoxHitTestResult::add_with_paint_transform(const std::optional<Transform2D>& transform,
                                                const Offset& position,
                                                const HitTestFn& hit_test) {
    if (!transform) {
        return hit_test(*this, position);
    }
    auto inverse = transform->inverted();
    if (!inverse) {
        return false;
    }
    return hit_test(*this, inverse->map_point(position));
}

// ---------------------------------------------------------------------------
// RenderBox
// ---------------------------------------------------------------------------

std::unique_ptr<ParentData> RenderBox::create_parent_data() const {
    return std::make_unique<BoxParentData>();
}

void RenderBox::layout(const BoxConstraints& constraints, bool parent_uses_size) {
    // A box whose size cannot affect its parent can be relaid out alone.
    set_relayout_boundary(!parent_uses_size || constraints.is_tight() || parent() == nullptr);

    if (!needs_layout() && has_constraints_ && constraints == constraints_) {
        return;
    }
    constraints_ = constraints;
    has_constraints_ = true;
    perform_layout();
    clear_flag(DirtyFlags::Layout);
    mark_needs_paint();
}

void RenderBox::layout_without_resize() {
    if (!has_constraints_) {
        RenderObject::layout_without_resize();
        return;
    }
    perform_layout();
    clear_flag(DirtyFlags::Layout);
    mark_needs_paint();
}

void RenderBox::perform_layout() {
    set_size(compute_dry_layout(constraints_));
}

Size RenderBox::get_dry_layout(const BoxConstraints& constraints) const {
    return compute_dry_layout(constraints);
}

Size RenderBox::compute_dry_layout(const BoxConstraints& constraints) const {
    return constraints.smallest();
}

float RenderBox::get_min_intrinsic_width(float height) const {
    return compute_min_intrinsic_width(height);
}

float RenderBox::get_max_intrinsic_width(float height) const {
    return compute_max_intrinsic_width(height);
}

float RenderBox::get_min_intrinsic_height(float width) const {
    return compute_min_intrinsic_height(width);
}

float RenderBox::get_max_intrinsic_height(float width) const {
    return compute_max_intrinsic_height(width);
}

float RenderBox::compute_min_intrinsic_width(float) const { return 0.0f; }
float RenderBox::compute_max_intrinsic_width(float) const { return 0.0f; }
float RenderBox::compute_min_intrinsic_height(float) const { return 0.0f; }
float RenderBox::compute_max_intrinsic_height(float) const { return 0.0f; }

std::optional<float> RenderBox::get_distance_to_actual_baseline() const {
    return compute_distance_to_actual_baseline();
}

std::optional<float> RenderBox::compute_distance_to_actual_baseline() const {
    return std::nullopt;
}

bool RenderBox::hit_test(BoxHitTestResult& result, const Offset& position) {
    if (!size_ || !size_->contains(position)) {
        return false;
    }
    if (hit_test_children(result, position) || hit_test_self(position)) {
        result.add({this, position});
        return true;
    }
    return false;
}

bool RenderBox::hit_test_self(const Offset&) { return false; }

bool RenderBox::hit_test_children(BoxHitTestResult&, const Offset&) { return false; }

void RenderBox::apply_paint_transform(const RenderObject& child, Transform2D& transform) const {
    if (ParentData* data = child.parent_data()) {
        if (BoxParentData* box_data = data->as_box_parent_data()) {
            transform.translate(box_data->offset.dx, box_data->offset.dy);
        }
    }
}

} // namespace viewkit::render
