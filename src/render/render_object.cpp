#include <viewkit/render/render_object.h>
#include <viewkit/render/pipeline_owner.h>
#include <viewkit/render/render_box.h>

#include <cassert>
#include <stdexcept>
#include <vector>

namespace viewkit::render {

RenderObject::RenderObject() = default;

RenderObject::~RenderObject() {
    if (owner_) {
        owner_->forget(*this);
    }
}

std::unique_ptr<ParentData> RenderObject::create_parent_data() const {
    return std::make_unique<ParentData>();
}

void RenderObject::adopt_child(RenderObject& child) {
    assert(child.parent_ == nullptr && "child already has a parent");
    assert(&child != this);

    child.parent_data_ = create_parent_data();
    child.parent_ = this;
    if (attached()) {
        child.attach(*owner_);
    }
    redepth_child(child);

    mark_needs_layout();
    mark_needs_compositing_bits_update();
    mark_needs_semantics_update();
}

void RenderObject::drop_child(RenderObject& child) {
    assert(child.parent_ == this && "child is not a child of this node");

    child.parent_data_.reset();
    child.parent_ = nullptr;
    child.relayout_boundary_ = false;
    if (attached()) {
        child.detach();
    }

    mark_needs_layout();
    mark_needs_compositing_bits_update();
    mark_needs_semantics_update();
}

void RenderObject::redepth_child(RenderObject& child) {
    if (child.depth_ <= depth_) {
        child.depth_ = depth_ + 1;
        child.visit_children([&child](RenderObject& grandchild) {
            child.redepth_child(grandchild);
        });
    }
}

void RenderObject::visit_children(const std::function<void(RenderObject&)>&) {}

void RenderObject::attach(PipelineOwner& owner) {
    owner_ = &owner;

    // Re-register pending work that could not be queued while detached.
    if (needs_layout() && (relayout_boundary_ || parent_ == nullptr)) {
        owner.request_layout(*this);
    }
    if (needs_compositing_bits_update() && parent_ == nullptr) {
        owner.request_compositing_bits(*this);
    }
    if (needs_paint() && (is_repaint_boundary() || parent_ == nullptr)) {
        owner.request_paint(*this);
    }
    if (needs_semantics_update()) {
        owner.request_semantics(*this);
    }

    visit_children([&owner](RenderObject& child) {
        child.attach(owner);
    });
}

void RenderObject::detach() {
    if (owner_) {
        owner_->forget(*this);
    }
    owner_ = nullptr;
    visit_children([](RenderObject& child) {
        child.detach();
    });
}

void RenderObject::dispose() {
    layer_.reset();
    disposed_ = true;
}

// ---------------------------------------------------------------------------
// Dirty marking
// ---------------------------------------------------------------------------

void RenderObject::mark_needs_layout() {
    if (needs_layout()) return;
    set_flag(DirtyFlags::Layout);
    if (relayout_boundary_ || parent_ == nullptr) {
        if (owner_) {
            owner_->request_layout(*this);
        }
    } else {
        parent_->mark_needs_layout();
    }
}

void RenderObject::layout_without_resize() {
    clear_flag(DirtyFlags::Layout);
}

void RenderObject::mark_needs_paint() {
    if (needs_paint()) return;
    set_flag(DirtyFlags::Paint);
    if (is_repaint_boundary() || parent_ == nullptr) {
        // Boundaries repaint into their own layer; the parent keeps it as is.
        if (owner_) {
            owner_->request_paint(*this);
        }
    } else {
        parent_->mark_needs_paint();
    }
}

void RenderObject::mark_needs_semantics_update() {
    if (needs_semantics_update()) return;
    set_flag(DirtyFlags::Semantics);
    if (owner_) {
        owner_->request_semantics(*this);
    }
}

void RenderObject::mark_needs_compositing_bits_update() {
    if (needs_compositing_bits_update()) return;
    set_flag(DirtyFlags::CompositingBits);
    if (parent_) {
        parent_->mark_needs_compositing_bits_update();
    } else if (owner_) {
        owner_->request_compositing_bits(*this);
    }
}

void RenderObject::update_compositing_bits() {
    if (!needs_compositing_bits_update()) return;

    const bool old_needs_compositing = needs_compositing_;
    needs_compositing_ = false;
    visit_children([this](RenderObject& child) {
        child.update_compositing_bits();
        if (child.needs_compositing()) {
            needs_compositing_ = true;
        }
    });
    if (is_repaint_boundary() || always_needs_compositing()) {
        needs_compositing_ = true;
    }
    clear_flag(DirtyFlags::CompositingBits);

    if (old_needs_compositing != needs_compositing_) {
        mark_needs_paint();
    }
}

// ---------------------------------------------------------------------------
// Painting and coordinate spaces
// ---------------------------------------------------------------------------

void RenderObject::paint(PaintingContext&, const Offset&) {}

void RenderObject::paint_with_context(PaintingContext& context, const Offset& offset) {
    clear_flag(DirtyFlags::Paint);
    paint(context, offset);
}

void RenderObject::apply_paint_transform(const RenderObject&, Transform2D&) const {}

Transform2D RenderObject::get_transform_to(const RenderObject* ancestor) const {
    std::vector<const RenderObject*> chain;
    for (const RenderObject* node = this; node != ancestor; node = node->parent_) {
        if (node == nullptr) {
            throw std::invalid_argument("get_transform_to: target is not an ancestor");
        }
        chain.push_back(node);
    }
    if (ancestor) {
        chain.push_back(ancestor);
    }

    Transform2D transform;
    for (size_t index = chain.size(); index > 1; --index) {
        chain[index - 1]->apply_paint_transform(*chain[index - 2], transform);
    }
    return transform;
}

std::optional<Rect> RenderObject::describe_approximate_paint_clip(const RenderObject*) const {
    return std::nullopt;
}

std::optional<Rect> RenderObject::describe_semantics_clip(const RenderObject*) const {
    return std::nullopt;
}

void RenderObject::show_on_screen(RenderObject* descendant, std::optional<Rect> rect,
                                  std::chrono::milliseconds duration) {
    if (parent_) {
        parent_->show_on_screen(descendant ? descendant : this, rect, duration);
    }
}

RenderBox* RenderObject::as_box() {
    return is_box() ? static_cast<RenderBox*>(this) : nullptr;
}

const RenderBox* RenderObject::as_box() const {
    return is_box() ? static_cast<const RenderBox*>(this) : nullptr;
}

core::DiagnosticEmitter* RenderObject::diagnostics() const {
    return owner_ ? &owner_->diagnostics() : nullptr;
}

} // namespace viewkit::render
