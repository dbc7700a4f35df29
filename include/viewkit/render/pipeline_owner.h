#pragma once
#include <viewkit/core/diagnostics.h>
#include <viewkit/geometry/box_constraints.h>
#include <viewkit/paint/display_list.h>
#include <viewkit/paint/layer.h>

#include <cstdint>
#include <vector>

namespace viewkit::render {

class RenderBox;
class RenderObject;

// Per-frame counters, reset at the start of every draw_frame().
struct FrameStats {
    size_t layouts = 0;          // relayout boundaries laid out
    size_t repaints = 0;         // repaint boundaries repainted
    size_t semantics_updates = 0;
};

// Schedules and runs the layout, compositing-bits, paint and semantics
// passes for one render tree. Render objects only record what they need;
// nothing is recomputed until a flush runs.
class PipelineOwner {
public:
    PipelineOwner();
    ~PipelineOwner();

    // Non-copyable
    PipelineOwner(const PipelineOwner&) = delete;
    PipelineOwner& operator=(const PipelineOwner&) = delete;

    // Attaches |root| (not owned) and lays it out with |constraints| on flush.
    // Passing null detaches the current root.
    void set_root(RenderBox* root, const geometry::BoxConstraints& constraints);
    RenderBox* root() const { return root_; }
    void set_root_constraints(const geometry::BoxConstraints& constraints);
    const geometry::BoxConstraints& root_constraints() const { return root_constraints_; }

    void request_layout(RenderObject& node);
    void request_compositing_bits(RenderObject& node);
    void request_paint(RenderObject& node);
    void request_semantics(RenderObject& node);
    // Drops every pending request for |node|.
    void forget(RenderObject& node);

    void flush_layout();
    void flush_compositing_bits();
    void flush_paint();
    void flush_semantics();

    // Runs all four flushes and advances the frame counter.
    void draw_frame();

    uint64_t frame() const { return frame_; }
    const FrameStats& last_frame_stats() const { return stats_; }

    // Layer the root painted into; null before the first paint.
    paint::OffsetLayer* root_layer() const;

    // Flattens the current layer tree into a single display list.
    paint::DisplayList composite() const;

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

    bool has_pending_work() const;

private:
    RenderBox* root_ = nullptr;
    geometry::BoxConstraints root_constraints_;
    std::vector<RenderObject*> nodes_needing_layout_;
    std::vector<RenderObject*> nodes_needing_compositing_bits_;
    std::vector<RenderObject*> nodes_needing_paint_;
    std::vector<RenderObject*> nodes_needing_semantics_;
    core::DiagnosticEmitter diagnostics_;
    FrameStats stats_;
    uint64_t frame_ = 0;
};

} // namespace viewkit::render
