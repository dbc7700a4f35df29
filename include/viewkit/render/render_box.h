#pragma once
#include <viewkit/geometry/box_constraints.h>
#include <viewkit/render/render_object.h>

#include <functional>
#include <optional>
#include <vector>

namespace viewkit::render {

using geometry::BoxConstraints;

struct HitTestEntry {
    RenderBox* target = nullptr;
    Offset local_position; // position in target's coordinate space
};

// Collects the boxes hit by a pointer, deepest first.
class BoxHitTestResult {
public:
    using HitTestFn = std::function<bool(BoxHitTestResult& result, const Offset& transformed)>;

    void add(const HitTestEntry& entry) { path_.push_back(entry); }
    const std::vector<HitTestEntry>& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Runs |hit_test| with |position| moved into a child painted at |offset|.
    bool add_with_paint_offset(const std::optional<Offset>& offset, const Offset& position,
                               const HitTestFn& hit_test);

    // Runs |hit_test| with |position| mapped through the inverse of
    // |transform|. Returns false when the transform is not invertible.
    bool add_with_paint_transform(const std::optional<Transform2D>& transform,
                                  const Offset& position, const HitTestFn& hit_test);

private:
    std::vector<HitTestEntry> path_;
};

// A render object with a rectangular size, laid out with box constraints.
class RenderBox : public RenderObject {
public:
    bool is_box() const override { return true; }
    std::unique_ptr<ParentData> create_parent_data() const override;

    // Layout
    void layout(const BoxConstraints& constraints, bool parent_uses_size = false);
    void layout_without_resize() override;
    const BoxConstraints& constraints() const { return constraints_; }
    bool has_size() const { return size_.has_value(); }
    Size size() const { return size_.value_or(Size{}); }

    // Size this box would have under |constraints|, without side effects.
    Size get_dry_layout(const BoxConstraints& constraints) const;

    float get_min_intrinsic_width(float height) const;
    float get_max_intrinsic_width(float height) const;
    float get_min_intrinsic_height(float width) const;
    float get_max_intrinsic_height(float width) const;

    // Distance from the top of the box to its first baseline, if any.
    std::optional<float> get_distance_to_actual_baseline() const;

    // Hit testing
    bool hit_test(BoxHitTestResult& result, const Offset& position);

    Rect paint_bounds() const override { return Rect::from_origin_size({0, 0}, size()); }
    Rect semantic_bounds() const override { return paint_bounds(); }

    void apply_paint_transform(const RenderObject& child, Transform2D& transform) const override;

protected:
    virtual void perform_layout();
    virtual Size compute_dry_layout(const BoxConstraints& constraints) const;
    virtual float compute_min_intrinsic_width(float height) const;
    virtual float compute_max_intrinsic_width(float height) const;
    virtual float compute_min_intrinsic_height(float width) const;
    virtual float compute_max_intrinsic_height(float width) const;
    virtual std::optional<float> compute_distance_to_actual_baseline() const;

    virtual bool hit_test_self(const Offset& position);
    virtual bool hit_test_children(BoxHitTestResult& result, const Offset& position);

    void set_size(const Size& size) { size_ = size; }

private:
    BoxConstraints constraints_;
    bool has_constraints_ = false;
    std::optional<Size> size_;
};

} // namespace viewkit::render
