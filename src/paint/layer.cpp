#include <viewkit/paint/layer.h>

#include <algorithm>
#include <cassert>
#include <cstring>

namespace viewkit::paint {

void Layer::remove() {
    if (parent_) {
        parent_->remove_child(*this);
    }
}

ContainerLayer::~ContainerLayer() {
    remove_all_children();
}

void ContainerLayer::append(std::shared_ptr<Layer> child) {
    assert(child != nullptr);
    assert(child.get() != this);
    if (child->parent_ == this) {
        // Re-appending moves the layer to the end.
        remove_child(*child);
    } else if (child->parent_) {
        child->parent_->remove_child(*child);
    }
    child->parent_ = this;
    children_.push_back(std::move(child));
}

void ContainerLayer::remove_child(Layer& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::shared_ptr<Layer>& c) {
            return c.get() == &child;
        });
    assert(it != children_.end() && "layer is not a child of this layer");
    if (it == children_.end()) return;
    child.parent_ = nullptr;
    children_.erase(it);
}

void ContainerLayer::remove_all_children() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
    children_.clear();
}

void ContainerLayer::add_children_to_display_list(DisplayList& out) const {
    for (const auto& child : children_) {
        child->add_to_display_list(out);
    }
}

void ContainerLayer::add_to_display_list(DisplayList& out) const {
    add_children_to_display_list(out);
}

void OffsetLayer::add_to_display_list(DisplayList& out) const {
    const bool translated = offset_.dx != 0 || offset_.dy != 0;
    if (translated) {
        out.push_translate(offset_.dx, offset_.dy);
    }
    add_children_to_display_list(out);
    if (translated) {
        out.pop_transform();
    }
}

void ClipRectLayer::add_to_display_list(DisplayList& out) const {
    if (clip_behavior_ == Clip::None) {
        add_children_to_display_list(out);
        return;
    }
    out.push_clip(clip_rect_, clip_behavior_ != Clip::HardEdge);
    if (clip_behavior_ == Clip::AntiAliasWithSaveLayer) {
        out.save_layer(clip_rect_);
    }
    add_children_to_display_list(out);
    if (clip_behavior_ == Clip::AntiAliasWithSaveLayer) {
        out.restore_layer();
    }
    out.pop_clip();
}

void PictureLayer::add_to_display_list(DisplayList& out) const {
    out.append(display_list_);
}

size_t count_layers(const Layer& root, const char* layer_type) {
    size_t n = std::strcmp(root.layer_type(), layer_type) == 0 ? 1 : 0;
    if (const ContainerLayer* container = root.as_container()) {
        for (const auto& child : container->children()) {
            n += count_layers(*child, layer_type);
        }
    }
    return n;
}

} // namespace viewkit::paint
