#include <viewkit/render/pipeline_owner.h>
#include <viewkit/core/config.h>
#include <viewkit/render/painting_context.h>
#include <viewkit/render/render_box.h>

#include <algorithm>
#include <string>

namespace viewkit::render {

namespace {

void sort_by_depth(std::vector<RenderObject*>& nodes, bool deepest_first) {
    std::stable_sort(nodes.begin(), nodes.end(),
        [deepest_first](const RenderObject* a, const RenderObject* b) {
            return deepest_first ? a->depth() > b->depth() : a->depth() < b->depth();
        });
}

void enqueue(std::vector<RenderObject*>& queue, RenderObject& node) {
    if (std::find(queue.begin(), queue.end(), &node) == queue.end()) {
        queue.push_back(&node);
    }
}

void erase(std::vector<RenderObject*>& queue, RenderObject& node) {
    queue.erase(std::remove(queue.begin(), queue.end(), &node), queue.end());
}

} // namespace

PipelineOwner::PipelineOwner() = default;

PipelineOwner::~PipelineOwner() {
    if (root_ && root_->owner() == this) {
        root_->detach();
    }
}

void PipelineOwner::set_root(RenderBox* root, const geometry::BoxConstraints& constraints) {
    if (root_ && root_->owner() == this) {
        root_->detach();
    }
    root_ = root;
    root_constraints_ = constraints;
    if (root_) {
        root_->attach(*this);
        root_->mark_needs_layout();
    }
}

void PipelineOwner::set_root_constraints(const geometry::BoxConstraints& constraints) {
    if (constraints == root_constraints_) return;
    root_constraints_ = constraints;
    if (root_) {
        root_->mark_needs_layout();
        request_layout(*root_);
    }
}

void PipelineOwner::request_layout(RenderObject& node) {
    enqueue(nodes_needing_layout_, node);
}

void PipelineOwner::request_compositing_bits(RenderObject& node) {
    enqueue(nodes_needing_compositing_bits_, node);
}

void PipelineOwner::request_paint(RenderObject& node) {
    enqueue(nodes_needing_paint_, node);
}

void PipelineOwner::request_semantics(RenderObject& node) {
    enqueue(nodes_needing_semantics_, node);
}

void PipelineOwner::forget(RenderObject& node) {
    erase(nodes_needing_layout_, node);
    erase(nodes_needing_compositing_bits_, node);
    erase(nodes_needing_paint_, node);
    erase(nodes_needing_semantics_, node);
    if (root_ == &node) {
        root_ = nullptr;
    }
}

void PipelineOwner::flush_layout() {
    while (!nodes_needing_layout_.empty()) {
        std::vector<RenderObject*> dirty;
        dirty.swap(nodes_needing_layout_);
        sort_by_depth(dirty, false);
        for (RenderObject* node : dirty) {
            if (!node->needs_layout() || node->owner() != this) continue;
            if (node == root_) {
                root_->layout(root_constraints_);
            } else {
                node->layout_without_resize();
            }
            ++stats_.layouts;
        }
    }
}

void PipelineOwner::flush_compositing_bits() {
    std::vector<RenderObject*> dirty;
    dirty.swap(nodes_needing_compositing_bits_);
    sort_by_depth(dirty, false);
    for (RenderObject* node : dirty) {
        if (node->needs_compositing_bits_update() && node->owner() == this) {
            node->update_compositing_bits();
        }
    }
}

void PipelineOwner::flush_paint() {
    std::vector<RenderObject*> dirty;
    dirty.swap(nodes_needing_paint_);
    // Deepest first so parents composite freshly painted child layers.
    sort_by_depth(dirty, true);
    for (RenderObject* node : dirty) {
        if (!node->needs_paint() || node->owner() != this) continue;
        if (node->needs_layout()) {
            diagnostics_.warning(core::config::kPipelineModule, "paint",
                                 std::string("skipping paint of ") + node->type_name() +
                                     " with pending layout");
            continue;
        }
        PaintingContext::repaint_composited_child(*node);
        ++stats_.repaints;
    }
}

void PipelineOwner::flush_semantics() {
    std::vector<RenderObject*> dirty;
    dirty.swap(nodes_needing_semantics_);
    sort_by_depth(dirty, false);
    for (RenderObject* node : dirty) {
        if (node->needs_semantics_update() && node->owner() == this) {
            node->update_semantics();
            ++stats_.semantics_updates;
        }
    }
}

void PipelineOwner::draw_frame() {
    ++frame_;
    diagnostics_.set_frame(frame_);
    stats_ = FrameStats{};

    flush_layout();
    flush_compositing_bits();
    flush_paint();
    flush_semantics();

    diagnostics_.debug(core::config::kPipelineModule, "frame",
                       "layouts=" + std::to_string(stats_.layouts) +
                           " repaints=" + std::to_string(stats_.repaints) +
                           " semantics=" + std::to_string(stats_.semantics_updates));
}

paint::OffsetLayer* PipelineOwner::root_layer() const {
    return root_ ? root_->layer() : nullptr;
}

paint::DisplayList PipelineOwner::composite() const {
    paint::DisplayList out;
    if (paint::OffsetLayer* layer = root_layer()) {
        layer->add_to_display_list(out);
    }
    return out;
}

bool PipelineOwner::has_pending_work() const {
    return !nodes_needing_layout_.empty() || !nodes_needing_compositing_bits_.empty() ||
           !nodes_needing_paint_.empty() || !nodes_needing_semantics_.empty();
}

} // namespace viewkit::render
