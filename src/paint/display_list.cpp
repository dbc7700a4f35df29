#include <viewkit/paint/display_list.h>

#include <sstream>

namespace viewkit::paint {

const char* clip_name(Clip clip) {
    switch (clip) {
        case Clip::None:                   return "none";
        case Clip::HardEdge:               return "hardEdge";
        case Clip::AntiAlias:              return "antiAlias";
        case Clip::AntiAliasWithSaveLayer: return "antiAliasWithSaveLayer";
    }
    return "unknown";
}

void DisplayList::fill_rect(const Rect& rect, const Color& color) {
    PaintCommand cmd;
    cmd.type = PaintCommand::FillRect;
    cmd.bounds = rect;
    cmd.color = color;
    commands_.push_back(cmd);
}

void DisplayList::push_clip(const Rect& clip_rect, bool anti_alias) {
    PaintCommand cmd;
    cmd.type = PaintCommand::PushClip;
    cmd.bounds = clip_rect;
    cmd.anti_alias = anti_alias;
    commands_.push_back(cmd);
}

void DisplayList::pop_clip() {
    PaintCommand cmd;
    cmd.type = PaintCommand::PopClip;
    commands_.push_back(cmd);
}

void DisplayList::push_translate(float tx, float ty) {
    PaintCommand cmd;
    cmd.type = PaintCommand::PushTranslate;
    cmd.translate_x = tx;
    cmd.translate_y = ty;
    commands_.push_back(cmd);
}

void DisplayList::pop_transform() {
    PaintCommand cmd;
    cmd.type = PaintCommand::PopTransform;
    commands_.push_back(cmd);
}

void DisplayList::save_layer(const Rect& bounds) {
    PaintCommand cmd;
    cmd.type = PaintCommand::SaveLayer;
    cmd.bounds = bounds;
    commands_.push_back(cmd);
}

void DisplayList::restore_layer() {
    PaintCommand cmd;
    cmd.type = PaintCommand::RestoreLayer;
    commands_.push_back(cmd);
}

void DisplayList::append(const DisplayList& other) {
    commands_.insert(commands_.end(), other.commands_.begin(), other.commands_.end());
}

size_t DisplayList::count(PaintCommand::Type type) const {
    size_t n = 0;
    for (const auto& cmd : commands_) {
        if (cmd.type == type) ++n;
    }
    return n;
}

std::vector<Rect> DisplayList::resolved_fill_rects() const {
    std::vector<Rect> result;
    std::vector<Offset> translations{{0, 0}};
    std::vector<Rect> clips;
    for (const auto& cmd : commands_) {
        const Offset origin = translations.back();
        switch (cmd.type) {
            case PaintCommand::FillRect: {
                Rect r = cmd.bounds.shift(origin);
                for (const auto& clip : clips) {
                    r = r.intersect(clip);
                }
                if (!r.is_empty()) {
                    result.push_back(r);
                }
                break;
            }
            case PaintCommand::PushClip:
                clips.push_back(cmd.bounds.shift(origin));
                break;
            case PaintCommand::PopClip:
                if (!clips.empty()) clips.pop_back();
                break;
            case PaintCommand::PushTranslate:
                translations.push_back(origin + Offset{cmd.translate_x, cmd.translate_y});
                break;
            case PaintCommand::PopTransform:
                if (translations.size() > 1) translations.pop_back();
                break;
            case PaintCommand::SaveLayer:
            case PaintCommand::RestoreLayer:
                break;
        }
    }
    return result;
}

std::string DisplayList::dump() const {
    std::ostringstream oss;
    int depth = 0;
    for (const auto& cmd : commands_) {
        if (cmd.type == PaintCommand::PopClip || cmd.type == PaintCommand::PopTransform ||
            cmd.type == PaintCommand::RestoreLayer) {
            --depth;
        }
        oss << std::string(static_cast<size_t>(depth > 0 ? depth * 2 : 0), ' ');
        switch (cmd.type) {
            case PaintCommand::FillRect:
                oss << "fillRect " << cmd.bounds << " #" << std::hex << cmd.color.to_argb()
                    << std::dec;
                break;
            case PaintCommand::PushClip:
                oss << "clipRect " << cmd.bounds << (cmd.anti_alias ? " aa" : "");
                ++depth;
                break;
            case PaintCommand::PopClip:
                oss << "restoreClip";
                break;
            case PaintCommand::PushTranslate:
                oss << "translate(" << cmd.translate_x << ", " << cmd.translate_y << ")";
                ++depth;
                break;
            case PaintCommand::PopTransform:
                oss << "restoreTransform";
                break;
            case PaintCommand::SaveLayer:
                oss << "saveLayer " << cmd.bounds;
                ++depth;
                break;
            case PaintCommand::RestoreLayer:
                oss << "restoreLayer";
                break;
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace viewkit::paint
