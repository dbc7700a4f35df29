#pragma once
#include <viewkit/geometry/basic_types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace viewkit::paint {

using geometry::Offset;
using geometry::Rect;

// How overflowing content is cropped.
enum class Clip {
    None,
    HardEdge,
    AntiAlias,
    AntiAliasWithSaveLayer
};

const char* clip_name(Clip clip);

struct Color {
    uint8_t r, g, b, a;
    static Color from_argb(uint32_t argb) {
        return {
            static_cast<uint8_t>((argb >> 16) & 0xFF),
            static_cast<uint8_t>((argb >> 8) & 0xFF),
            static_cast<uint8_t>(argb & 0xFF),
            static_cast<uint8_t>((argb >> 24) & 0xFF)
        };
    }
    uint32_t to_argb() const {
        return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) | b;
    }
    bool operator==(const Color& o) const { return to_argb() == o.to_argb(); }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

struct PaintCommand {
    enum Type {
        FillRect, PushClip, PopClip, PushTranslate, PopTransform, SaveLayer, RestoreLayer
    };
    Type type;
    Rect bounds;
    Color color = {0, 0, 0, 0};
    // PushClip: 0=hard edge, 1=anti-aliased
    bool anti_alias = false;
    // PushTranslate
    float translate_x = 0;
    float translate_y = 0;
};

// Flat recording of paint operations. Coordinates are in the space active
// when the command was recorded; PushTranslate/PopTransform nest.
class DisplayList {
public:
    void fill_rect(const Rect& rect, const Color& color);
    void push_clip(const Rect& clip_rect, bool anti_alias = false);
    void pop_clip();
    void push_translate(float tx, float ty);
    void pop_transform();
    void save_layer(const Rect& bounds);
    void restore_layer();

    // Appends every command of |other|.
    void append(const DisplayList& other);

    const std::vector<PaintCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); }

    size_t count(PaintCommand::Type type) const;

    // Resolves the FillRect commands into absolute coordinates by applying
    // the active translations; each rect is intersected with the clip stack.
    std::vector<Rect> resolved_fill_rects() const;

    std::string dump() const;

private:
    std::vector<PaintCommand> commands_;
};

} // namespace viewkit::paint
