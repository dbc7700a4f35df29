#pragma once
#include <viewkit/geometry/basic_types.h>
#include <viewkit/render/render_object.h>

#include <chrono>
#include <optional>

namespace viewkit::render {

class ViewportOffset;

// A scroll offset paired with where the target rect would sit, in the
// viewport's coordinate space, once the viewport scrolled there.
struct RevealedOffset {
    float offset = 0;
    Rect rect;

    // Picks whichever of the two reveal positions needs the least scrolling
    // from |current_offset|, or nothing when the target is already fully
    // between them.
    static std::optional<RevealedOffset> clamp_offset(const RevealedOffset& leading_edge_offset,
                                                      const RevealedOffset& trailing_edge_offset,
                                                      float current_offset);
};

// Capability of render objects that scroll their contents. Ancestors reach
// viewports through this interface only.
class RenderAbstractViewport {
public:
    virtual ~RenderAbstractViewport() = default;

    // Offset at which |rect| (in |target|'s space, defaulting to its paint
    // bounds) sits at |alignment| along the scroll axis: 0 puts its leading
    // edge at the viewport's leading edge, 1 its trailing edge at the
    // trailing edge, 0.5 centers it. Does not move the offset.
    virtual RevealedOffset get_offset_to_reveal(RenderObject& target, float alignment,
                                                std::optional<Rect> rect = std::nullopt) = 0;

    virtual RenderObject& as_render_object() = 0;

    // Nearest viewport at or above |object|, or null.
    static RenderAbstractViewport* maybe_of(RenderObject* object);

    // Scrolls |offset| the least amount that makes |rect| on |descendant|
    // fully visible inside |viewport| and returns the rect to pass on to the
    // viewport's own ancestors. Returns |rect| unchanged without a descendant.
    static std::optional<Rect> show_in_viewport(RenderObject* descendant,
                                                std::optional<Rect> rect,
                                                RenderAbstractViewport& viewport,
                                                ViewportOffset& offset,
                                                std::chrono::milliseconds duration =
                                                    std::chrono::milliseconds(0));
};

} // namespace viewkit::render
