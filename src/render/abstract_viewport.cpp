#include <viewkit/render/abstract_viewport.h>
#include <viewkit/render/viewport_offset.h>

namespace viewkit::render {

std::optional<RevealedOffset> RevealedOffset::clamp_offset(
    const RevealedOffset& leading_edge_offset,
    const RevealedOffset& trailing_edge_offset,
    float current_offset) {
    // When the target is larger than the viewport the leading reveal offset
    // exceeds the trailing one; order them before comparing.
    const bool inverted = leading_edge_offset.offset < trailing_edge_offset.offset;
    const RevealedOffset& smaller = inverted ? leading_edge_offset : trailing_edge_offset;
    const RevealedOffset& larger = inverted ? trailing_edge_offset : leading_edge_offset;
    if (current_offset > larger.offset) {
        return larger;
    }
    if (current_offset < smaller.offset) {
        return smaller;
    }
    return std::nullopt;
}

RenderAbstractViewport* RenderAbstractViewport::maybe_of(RenderObject* object) {
    for (RenderObject* node = object; node != nullptr; node = node->parent()) {
        if (RenderAbstractViewport* viewport = node->as_viewport()) {
            return viewport;
        }
    }
    return nullptr;
}

std::optional<Rect> RenderAbstractViewport::show_in_viewport(RenderObject* descendant,
                                                             std::optional<Rect> rect,
                                                             RenderAbstractViewport& viewport,
                                                             ViewportOffset& offset,
                                                             std::chrono::milliseconds duration) {
    if (descendant == nullptr) {
        return rect;
    }

    const RevealedOffset leading_edge_offset = viewport.get_offset_to_reveal(*descendant, 0.0f, rect);
    const RevealedOffset trailing_edge_offset = viewport.get_offset_to_reveal(*descendant, 1.0f, rect);
    const float current_offset = offset.pixels();

    std::optional<RevealedOffset> target_offset =
        RevealedOffset::clamp_offset(leading_edge_offset, trailing_edge_offset, current_offset);
    if (!target_offset) {
        // Already visible; report the rect where it currently is.
        const Transform2D transform =
            descendant->get_transform_to(viewport.as_render_object().parent());
        return transform.map_rect(rect.value_or(descendant->paint_bounds()));
    }

    offset.move_to(target_offset->offset, duration);
    return target_offset->rect;
}

} // namespace viewkit::render
