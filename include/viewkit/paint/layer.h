#pragma once
#include <viewkit/paint/display_list.h>

#include <memory>
#include <vector>

namespace viewkit::paint {

class ContainerLayer;

// A node in the composited layer tree. Layers are shared: a render object
// keeps a handle to the layer it produced last frame so the same layer can be
// reused instead of being rebuilt.
class Layer {
public:
    virtual ~Layer() = default;

    ContainerLayer* parent() const { return parent_; }

    // Detaches this layer from its parent, if any.
    void remove();

    // Replays this layer into |out|, in the parent layer's coordinate space.
    virtual void add_to_display_list(DisplayList& out) const = 0;

    virtual const char* layer_type() const = 0;
    virtual const ContainerLayer* as_container() const { return nullptr; }

private:
    friend class ContainerLayer;
    ContainerLayer* parent_ = nullptr;
};

class ContainerLayer : public Layer {
public:
    ContainerLayer() = default;
    // Children outliving this layer are left without a parent.
    ~ContainerLayer() override;

    // Appends |child|, detaching it from any previous parent first.
    void append(std::shared_ptr<Layer> child);
    void remove_child(Layer& child);
    void remove_all_children();

    const std::vector<std::shared_ptr<Layer>>& children() const { return children_; }
    bool has_children() const { return !children_.empty(); }

    void add_to_display_list(DisplayList& out) const override;
    const char* layer_type() const override { return "ContainerLayer"; }
    const ContainerLayer* as_container() const override { return this; }

protected:
    void add_children_to_display_list(DisplayList& out) const;

private:
    std::vector<std::shared_ptr<Layer>> children_;
};

// Translates its children. Repaint boundaries paint into one of these.
class OffsetLayer : public ContainerLayer {
public:
    explicit OffsetLayer(const Offset& offset = {}) : offset_(offset) {}

    const Offset& offset() const { return offset_; }
    void set_offset(const Offset& offset) { offset_ = offset; }

    void add_to_display_list(DisplayList& out) const override;
    const char* layer_type() const override { return "OffsetLayer"; }

private:
    Offset offset_;
};

// Clips its children to a rectangle expressed in the parent's space.
class ClipRectLayer : public ContainerLayer {
public:
    ClipRectLayer() = default;
    ClipRectLayer(const Rect& clip_rect, Clip clip_behavior)
        : clip_rect_(clip_rect), clip_behavior_(clip_behavior) {}

    const Rect& clip_rect() const { return clip_rect_; }
    void set_clip_rect(const Rect& rect) { clip_rect_ = rect; }

    Clip clip_behavior() const { return clip_behavior_; }
    void set_clip_behavior(Clip clip) { clip_behavior_ = clip; }

    void add_to_display_list(DisplayList& out) const override;
    const char* layer_type() const override { return "ClipRectLayer"; }

private:
    Rect clip_rect_;
    Clip clip_behavior_ = Clip::HardEdge;
};

// Leaf holding recorded paint commands.
class PictureLayer : public Layer {
public:
    explicit PictureLayer(const Rect& canvas_bounds) : canvas_bounds_(canvas_bounds) {}

    DisplayList& display_list() { return display_list_; }
    const DisplayList& display_list() const { return display_list_; }
    const Rect& canvas_bounds() const { return canvas_bounds_; }

    void add_to_display_list(DisplayList& out) const override;
    const char* layer_type() const override { return "PictureLayer"; }

private:
    Rect canvas_bounds_;
    DisplayList display_list_;
};

// Owning slot for one layer. Setting a different layer releases the old one;
// reset() releases it outright.
template <typename T>
class LayerHandle {
public:
    LayerHandle() = default;
    explicit LayerHandle(std::shared_ptr<T> layer) : layer_(std::move(layer)) {}

    T* get() const { return layer_.get(); }
    const std::shared_ptr<T>& shared() const { return layer_; }
    void set(std::shared_ptr<T> layer) { layer_ = std::move(layer); }
    void reset() { layer_.reset(); }
    explicit operator bool() const { return layer_ != nullptr; }

private:
    std::shared_ptr<T> layer_;
};

// Counts layers of the given type in the tree rooted at |root|, inclusive.
size_t count_layers(const Layer& root, const char* layer_type);

} // namespace viewkit::paint
