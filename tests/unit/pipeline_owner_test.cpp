#include <viewkit/core/config.h>
#include <viewkit/render/painting_context.h>
#include <viewkit/render/pipeline_owner.h>
#include <viewkit/render/proxy_box.h>

#include <gtest/gtest.h>

#include <memory>

using namespace viewkit::render;
using viewkit::core::Severity;
using viewkit::geometry::BoxConstraints;
using viewkit::geometry::EdgeInsets;
using viewkit::paint::Color;
using viewkit::paint::PaintCommand;

namespace {

const Color kBlue{0, 0, 0xff, 0xff};
const Color kRed{0xff, 0, 0, 0xff};

// A colored box that paints into its own layer and counts its paints.
class BoundaryBox : public RenderColoredBox {
public:
    BoundaryBox(const Color& color, float width, float height)
        : RenderColoredBox(color, std::make_unique<RenderConstrainedBox>(
                                      BoxConstraints::tight_for(width, height))) {}

    bool is_repaint_boundary() const override { return true; }
    const char* type_name() const override { return "BoundaryBox"; }

    void paint(PaintingContext& context, const Offset& offset) override {
        ++paint_count;
        RenderColoredBox::paint(context, offset);
    }

    int paint_count = 0;
};

}  // namespace

TEST(PipelineOwnerTest, DrawFrameLaysOutPaintsAndComposites) {
    RenderColoredBox root(kBlue);
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::tight({50, 40}));
    EXPECT_TRUE(owner.has_pending_work());

    owner.draw_frame();
    EXPECT_EQ(owner.frame(), 1u);
    EXPECT_EQ(owner.last_frame_stats().layouts, 1u);
    EXPECT_EQ(owner.last_frame_stats().repaints, 1u);
    EXPECT_FALSE(owner.has_pending_work());
    ASSERT_NE(owner.root_layer(), nullptr);

    const auto rects = owner.composite().resolved_fill_rects();
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], Rect::from_ltrb(0, 0, 50, 40));
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, RepaintBoundaryRepaintsAlone) {
    auto boundary = std::make_unique<BoundaryBox>(kBlue, 20, 20);
    BoundaryBox* inner = boundary.get();
    RenderPadding root(EdgeInsets::all(10), std::move(boundary));
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::loose({100, 100}));
    owner.draw_frame();
    EXPECT_EQ(inner->paint_count, 1);
    ASSERT_NE(inner->layer(), nullptr);
    EXPECT_EQ(inner->layer()->offset(), (Offset{10, 10}));
    viewkit::paint::OffsetLayer* inner_layer = inner->layer();

    inner->set_color(kRed);
    EXPECT_TRUE(inner->needs_paint());
    EXPECT_FALSE(root.needs_paint());

    owner.draw_frame();
    EXPECT_EQ(owner.last_frame_stats().repaints, 1u);
    EXPECT_EQ(owner.last_frame_stats().layouts, 0u);
    EXPECT_EQ(inner->paint_count, 2);
    EXPECT_EQ(inner->layer(), inner_layer);

    const viewkit::paint::DisplayList list = owner.composite();
    ASSERT_EQ(list.count(PaintCommand::FillRect), 1u);
    for (const auto& cmd : list.commands()) {
        if (cmd.type == PaintCommand::FillRect) {
            EXPECT_EQ(cmd.color, kRed);
        }
    }
    EXPECT_EQ(list.resolved_fill_rects()[0], Rect::from_ltrb(10, 10, 30, 30));
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, TightlyConstrainedChildIsRelayoutBoundary) {
    auto constrained = std::make_unique<RenderConstrainedBox>(BoxConstraints::tight_for(20, 20));
    RenderConstrainedBox* child = constrained.get();
    RenderPadding root(EdgeInsets::all(10), std::move(constrained));
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::tight({100, 100}));
    owner.draw_frame();
    ASSERT_TRUE(child->is_relayout_boundary());

    child->set_additional_constraints(BoxConstraints::tight_for(30, 30));
    EXPECT_TRUE(child->needs_layout());
    EXPECT_FALSE(root.needs_layout());

    owner.draw_frame();
    EXPECT_EQ(owner.last_frame_stats().layouts, 1u);
    EXPECT_EQ(child->size(), (Size{80, 80}));
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, LooselyConstrainedChildDirtiesParent) {
    auto constrained = std::make_unique<RenderConstrainedBox>(BoxConstraints::tight_for(20, 20));
    RenderConstrainedBox* child = constrained.get();
    RenderPadding root(EdgeInsets::all(10), std::move(constrained));
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::loose({100, 100}));
    owner.draw_frame();
    ASSERT_FALSE(child->is_relayout_boundary());

    child->set_additional_constraints(BoxConstraints::tight_for(30, 30));
    EXPECT_TRUE(root.needs_layout());
    owner.draw_frame();
    EXPECT_EQ(root.size(), (Size{50, 50}));
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, PaintWithPendingLayoutIsSkippedAndLogged) {
    RenderColoredBox root(kBlue);
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::tight({10, 10}));
    owner.flush_paint();

    const auto events = owner.diagnostics().events_by_stage(
        viewkit::core::config::kPipelineModule, "paint");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, Severity::Warning);
    EXPECT_EQ(owner.root_layer(), nullptr);
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, SemanticsUpdatesAreFlushed) {
    RenderColoredBox root(kBlue);
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::tight({10, 10}));
    owner.draw_frame();
    EXPECT_FALSE(root.needs_semantics_update());

    root.mark_needs_semantics_update();
    owner.draw_frame();
    EXPECT_EQ(owner.last_frame_stats().semantics_updates, 1u);
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, FrameEventLoggedAtDebug) {
    RenderColoredBox root(kBlue);
    PipelineOwner owner;
    owner.diagnostics().set_min_severity(Severity::Debug);
    owner.set_root(&root, BoxConstraints::tight({10, 10}));
    owner.draw_frame();
    owner.draw_frame();

    const auto frames = owner.diagnostics().events_by_stage(
        viewkit::core::config::kPipelineModule, "frame");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].frame, 1u);
    EXPECT_EQ(frames[1].frame, 2u);
    owner.set_root(nullptr, {});
}

TEST(PipelineOwnerTest, DetachingRootDropsPendingWork) {
    RenderColoredBox root(kBlue);
    PipelineOwner owner;
    owner.set_root(&root, BoxConstraints::tight({10, 10}));
    EXPECT_TRUE(owner.has_pending_work());
    owner.set_root(nullptr, {});
    EXPECT_FALSE(owner.has_pending_work());
    EXPECT_FALSE(root.attached());
}
