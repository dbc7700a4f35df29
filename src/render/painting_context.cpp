#include <viewkit/render/painting_context.h>

namespace viewkit::render {

PaintingContext::PaintingContext(paint::ContainerLayer& container, const Rect& estimated_bounds)
    : container_(container)
    , estimated_bounds_(estimated_bounds) {}

paint::DisplayList& PaintingContext::canvas() {
    if (!current_picture_) {
        current_picture_ = std::make_shared<paint::PictureLayer>(estimated_bounds_);
        container_.append(current_picture_);
    }
    return current_picture_->display_list();
}

void PaintingContext::stop_recording_if_needed() {
    current_picture_.reset();
}

void PaintingContext::paint_child(RenderObject& child, const Offset& offset) {
    if (child.is_repaint_boundary()) {
        stop_recording_if_needed();
        composite_child(child, offset);
    } else {
        child.paint_with_context(*this, offset);
    }
}

void PaintingContext::composite_child(RenderObject& child, const Offset& offset) {
    if (child.needs_paint() || !child.layer()) {
        repaint_composited_child(child);
    }
    std::shared_ptr<paint::OffsetLayer> layer = child.layer_shared();
    layer->set_offset(offset);
    add_layer(layer);
}

void PaintingContext::add_layer(std::shared_ptr<paint::Layer> layer) {
    stop_recording_if_needed();
    container_.append(std::move(layer));
}

void PaintingContext::push_layer(std::shared_ptr<paint::ContainerLayer> layer,
                                 const Painter& painter, const Offset& offset,
                                 std::optional<Rect> child_paint_bounds) {
    // A reused layer still holds last frame's children.
    if (layer->has_children()) {
        layer->remove_all_children();
    }
    paint::ContainerLayer& target = *layer;
    add_layer(std::move(layer));
    PaintingContext child_context(target, child_paint_bounds.value_or(estimated_bounds_));
    painter(child_context, offset);
    child_context.stop_recording_if_needed();
}

std::shared_ptr<paint::ClipRectLayer> PaintingContext::push_clip_rect(
    bool needs_compositing, const Offset& offset, const Rect& clip_rect,
    const Painter& painter, paint::Clip clip_behavior,
    std::shared_ptr<paint::ClipRectLayer> old_layer) {
    if (clip_behavior == paint::Clip::None) {
        painter(*this, offset);
        return nullptr;
    }

    const Rect offset_clip_rect = clip_rect.shift(offset);
    if (needs_compositing) {
        std::shared_ptr<paint::ClipRectLayer> layer =
            old_layer ? std::move(old_layer) : std::make_shared<paint::ClipRectLayer>();
        layer->set_clip_rect(offset_clip_rect);
        layer->set_clip_behavior(clip_behavior);
        push_layer(layer, painter, offset, offset_clip_rect);
        return layer;
    }

    const bool save_layer = clip_behavior == paint::Clip::AntiAliasWithSaveLayer;
    canvas().push_clip(offset_clip_rect, clip_behavior != paint::Clip::HardEdge);
    if (save_layer) {
        canvas().save_layer(offset_clip_rect);
    }
    painter(*this, offset);
    if (save_layer) {
        canvas().restore_layer();
    }
    canvas().pop_clip();
    return nullptr;
}

void PaintingContext::repaint_composited_child(RenderObject& child) {
    std::shared_ptr<paint::OffsetLayer> layer = child.layer_shared();
    if (!layer) {
        layer = std::make_shared<paint::OffsetLayer>();
        child.set_layer(layer);
    } else {
        layer->remove_all_children();
    }
    PaintingContext child_context(*layer, child.paint_bounds());
    child.paint_with_context(child_context, Offset{});
    child_context.stop_recording_if_needed();
}

} // namespace viewkit::render
