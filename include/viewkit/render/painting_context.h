#pragma once
#include <viewkit/paint/display_list.h>
#include <viewkit/paint/layer.h>
#include <viewkit/render/render_object.h>

#include <functional>
#include <memory>
#include <optional>

namespace viewkit::render {

// Records painting for one container layer. Drawing goes into a picture
// layer that is started lazily; pushing a child layer or compositing a
// repaint boundary closes the current picture.
class PaintingContext {
public:
    using Painter = std::function<void(PaintingContext& context, const Offset& offset)>;

    PaintingContext(paint::ContainerLayer& container, const Rect& estimated_bounds);

    // Non-copyable
    PaintingContext(const PaintingContext&) = delete;
    PaintingContext& operator=(const PaintingContext&) = delete;

    const Rect& estimated_bounds() const { return estimated_bounds_; }

    paint::DisplayList& canvas();

    // Paints |child| at |offset|. Repaint boundaries are composited as their
    // own layer, repainting only when they are dirty.
    void paint_child(RenderObject& child, const Offset& offset);

    void add_layer(std::shared_ptr<paint::Layer> layer);

    // Appends |layer| and paints |painter| into it.
    void push_layer(std::shared_ptr<paint::ContainerLayer> layer, const Painter& painter,
                    const Offset& offset,
                    std::optional<Rect> child_paint_bounds = std::nullopt);

    // Clips |painter| to |clip_rect| (relative to |offset|). With
    // compositing the clip becomes a ClipRectLayer: |old_layer| is reused
    // when given and the layer used is returned. Without compositing the clip
    // is recorded on the canvas and null is returned.
    std::shared_ptr<paint::ClipRectLayer> push_clip_rect(
        bool needs_compositing, const Offset& offset, const Rect& clip_rect,
        const Painter& painter, paint::Clip clip_behavior = paint::Clip::HardEdge,
        std::shared_ptr<paint::ClipRectLayer> old_layer = nullptr);

    // Repaints a repaint boundary into its own OffsetLayer, creating the
    // layer on first use.
    static void repaint_composited_child(RenderObject& child);

    void stop_recording_if_needed();

private:
    void composite_child(RenderObject& child, const Offset& offset);

    paint::ContainerLayer& container_;
    Rect estimated_bounds_;
    std::shared_ptr<paint::PictureLayer> current_picture_;
};

} // namespace viewkit::render
