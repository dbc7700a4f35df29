#pragma once
#include <viewkit/geometry/edge_insets.h>
#include <viewkit/paint/display_list.h>
#include <viewkit/render/render_box.h>

#include <memory>

namespace viewkit::render {

using geometry::EdgeInsets;

// A box that exclusively owns at most one child box.
class SingleChildRenderBox : public RenderBox {
public:
    RenderBox* child() const { return child_.get(); }

    // Replaces the child. The previous child is disposed and destroyed.
    void set_child(std::unique_ptr<RenderBox> child);
    // Gives up ownership of the child without disposing it.
    std::unique_ptr<RenderBox> take_child();

    void visit_children(const std::function<void(RenderObject&)>& visitor) override;
    void dispose() override;

protected:
    Offset child_offset() const;

private:
    std::unique_ptr<RenderBox> child_;
};

// Sizes itself to its child and paints it unchanged.
class RenderProxyBox : public SingleChildRenderBox {
public:
    explicit RenderProxyBox(std::unique_ptr<RenderBox> child = nullptr);

    void paint(PaintingContext& context, const Offset& offset) override;
    const char* type_name() const override { return "RenderProxyBox"; }

protected:
    void perform_layout() override;
    Size compute_dry_layout(const BoxConstraints& constraints) const override;
    float compute_min_intrinsic_width(float height) const override;
    float compute_max_intrinsic_width(float height) const override;
    float compute_min_intrinsic_height(float width) const override;
    float compute_max_intrinsic_height(float width) const override;
    std::optional<float> compute_distance_to_actual_baseline() const override;
    bool hit_test_children(BoxHitTestResult& result, const Offset& position) override;
};

// Insets its child by the given padding.
class RenderPadding : public RenderProxyBox {
public:
    explicit RenderPadding(const EdgeInsets& padding, std::unique_ptr<RenderBox> child = nullptr);

    const EdgeInsets& padding() const { return padding_; }
    void set_padding(const EdgeInsets& padding);

    const char* type_name() const override { return "RenderPadding"; }

protected:
    void perform_layout() override;
    Size compute_dry_layout(const BoxConstraints& constraints) const override;
    float compute_min_intrinsic_width(float height) const override;
    float compute_max_intrinsic_width(float height) const override;
    float compute_min_intrinsic_height(float width) const override;
    float compute_max_intrinsic_height(float width) const override;

private:
    EdgeInsets padding_;
};

// Imposes additional constraints on its child, or on itself when childless.
class RenderConstrainedBox : public RenderProxyBox {
public:
    explicit RenderConstrainedBox(const BoxConstraints& additional_constraints,
                                  std::unique_ptr<RenderBox> child = nullptr);

    const BoxConstraints& additional_constraints() const { return additional_constraints_; }
    void set_additional_constraints(const BoxConstraints& constraints);

    const char* type_name() const override { return "RenderConstrainedBox"; }

protected:
    void perform_layout() override;
    Size compute_dry_layout(const BoxConstraints& constraints) const override;
    float compute_min_intrinsic_width(float height) const override;
    float compute_max_intrinsic_width(float height) const override;
    float compute_min_intrinsic_height(float width) const override;
    float compute_max_intrinsic_height(float width) const override;

private:
    BoxConstraints additional_constraints_;
};

// Fills its bounds with a solid color and is opaque to hit testing.
class RenderColoredBox : public RenderProxyBox {
public:
    explicit RenderColoredBox(const paint::Color& color, std::unique_ptr<RenderBox> child = nullptr);

    const paint::Color& color() const { return color_; }
    void set_color(const paint::Color& color);

    void paint(PaintingContext& context, const Offset& offset) override;
    const char* type_name() const override { return "RenderColoredBox"; }

protected:
    bool hit_test_self(const Offset& position) override;

private:
    paint::Color color_;
};

} // namespace viewkit::render
