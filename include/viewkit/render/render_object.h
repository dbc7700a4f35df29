#pragma once
#include <viewkit/geometry/basic_types.h>
#include <viewkit/geometry/transform.h>
#include <viewkit/paint/layer.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace viewkit::core {
class DiagnosticEmitter;
}

namespace viewkit::render {

using geometry::Offset;
using geometry::Rect;
using geometry::Size;
using geometry::Transform2D;

class PaintingContext;
class PipelineOwner;
class RenderAbstractViewport;
class RenderBox;

enum class DirtyFlags : uint8_t {
    None = 0,
    Layout = 1 << 0,
    Paint = 1 << 1,
    Semantics = 1 << 2,
    CompositingBits = 1 << 3,
    All = Layout | Paint | Semantics | CompositingBits
};

inline DirtyFlags operator|(DirtyFlags a, DirtyFlags b) {
    return static_cast<DirtyFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline DirtyFlags operator&(DirtyFlags a, DirtyFlags b) {
    return static_cast<DirtyFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline DirtyFlags operator~(DirtyFlags a) {
    return static_cast<DirtyFlags>(~static_cast<uint8_t>(a));
}

struct BoxParentData;

// Per-child data a parent stores on its children.
struct ParentData {
    virtual ~ParentData() = default;
    virtual BoxParentData* as_box_parent_data() { return nullptr; }
};

// Parent data carrying the child's paint offset inside its parent.
struct BoxParentData : ParentData {
    Offset offset;
    BoxParentData* as_box_parent_data() override { return this; }
};

// Base node of the render tree. A render object is owned by its parent (or
// by whoever built the root), knows its parent through a raw back pointer and
// records the minimal work it needs in dirty flags; the PipelineOwner it is
// attached to performs that work on flush.
class RenderObject {
public:
    RenderObject();
    virtual ~RenderObject();

    // Non-copyable
    RenderObject(const RenderObject&) = delete;
    RenderObject& operator=(const RenderObject&) = delete;

    RenderObject* parent() const { return parent_; }
    ParentData* parent_data() const { return parent_data_.get(); }
    int depth() const { return depth_; }

    // Tree ownership hooks; parents call these when they take or give up a child.
    virtual std::unique_ptr<ParentData> create_parent_data() const;
    void adopt_child(RenderObject& child);
    void drop_child(RenderObject& child);
    virtual void visit_children(const std::function<void(RenderObject&)>& visitor);

    PipelineOwner* owner() const { return owner_; }
    bool attached() const { return owner_ != nullptr; }
    virtual void attach(PipelineOwner& owner);
    virtual void detach();

    // Releases retained resources. Called when the subtree is torn down.
    virtual void dispose();
    bool disposed() const { return disposed_; }

    // Dirty state
    DirtyFlags dirty_flags() const { return dirty_; }
    bool needs_layout() const { return has_flag(DirtyFlags::Layout); }
    bool needs_paint() const { return has_flag(DirtyFlags::Paint); }
    bool needs_semantics_update() const { return has_flag(DirtyFlags::Semantics); }
    bool needs_compositing_bits_update() const { return has_flag(DirtyFlags::CompositingBits); }

    void mark_needs_layout();
    // Re-runs layout with the constraints from the previous pass. Used by the
    // pipeline owner for dirty relayout boundaries.
    virtual void layout_without_resize();
    bool is_relayout_boundary() const { return relayout_boundary_; }
    void mark_needs_paint();
    void mark_needs_semantics_update();
    void mark_needs_compositing_bits_update();

    // Compositing
    virtual bool is_repaint_boundary() const { return false; }
    virtual bool always_needs_compositing() const { return false; }
    bool needs_compositing() const { return needs_compositing_; }
    void update_compositing_bits();

    // The layer a repaint boundary painted into last frame.
    paint::OffsetLayer* layer() const { return layer_.get(); }
    const std::shared_ptr<paint::OffsetLayer>& layer_shared() const { return layer_.shared(); }
    void set_layer(std::shared_ptr<paint::OffsetLayer> layer) { layer_.set(std::move(layer)); }

    // Painting
    virtual void paint(PaintingContext& context, const Offset& offset);
    void paint_with_context(PaintingContext& context, const Offset& offset);
    virtual Rect paint_bounds() const = 0;

    // Geometry between coordinate spaces
    virtual void apply_paint_transform(const RenderObject& child, Transform2D& transform) const;
    // Transform mapping this object's paint space into |ancestor|'s (the
    // root's when null). Throws std::invalid_argument when |ancestor| is not
    // an ancestor.
    Transform2D get_transform_to(const RenderObject* ancestor) const;
    virtual std::optional<Rect> describe_approximate_paint_clip(const RenderObject* child) const;

    // Semantics
    virtual Rect semantic_bounds() const = 0;
    virtual void update_semantics() { clear_flag(DirtyFlags::Semantics); }
    virtual std::optional<Rect> describe_semantics_clip(const RenderObject* child) const;

    // Asks ancestors to scroll so |rect| (in |descendant|'s space, defaulting
    // to this object's paint bounds) becomes visible.
    virtual void show_on_screen(RenderObject* descendant = nullptr,
                                std::optional<Rect> rect = std::nullopt,
                                std::chrono::milliseconds duration = std::chrono::milliseconds(0));

    // Type tags
    virtual bool is_box() const { return false; }
    RenderBox* as_box();
    const RenderBox* as_box() const;
    virtual RenderAbstractViewport* as_viewport() { return nullptr; }

    virtual const char* type_name() const = 0;

protected:
    bool has_flag(DirtyFlags flag) const { return (dirty_ & flag) != DirtyFlags::None; }
    void set_flag(DirtyFlags flag) { dirty_ = dirty_ | flag; }
    void clear_flag(DirtyFlags flag) { dirty_ = dirty_ & ~flag; }
    void set_relayout_boundary(bool boundary) { relayout_boundary_ = boundary; }

    // Emitter of the attached owner, or null while detached.
    core::DiagnosticEmitter* diagnostics() const;

private:
    void redepth_child(RenderObject& child);

    RenderObject* parent_ = nullptr;
    std::unique_ptr<ParentData> parent_data_;
    PipelineOwner* owner_ = nullptr;
    int depth_ = 0;
    DirtyFlags dirty_ = DirtyFlags::All;
    bool needs_compositing_ = false;
    bool relayout_boundary_ = false;
    bool disposed_ = false;
    paint::LayerHandle<paint::OffsetLayer> layer_;
};

} // namespace viewkit::render
