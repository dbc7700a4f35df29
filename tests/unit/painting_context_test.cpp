#include <viewkit/render/painting_context.h>
#include <viewkit/render/proxy_box.h>

#include <gtest/gtest.h>

#include <memory>

using namespace viewkit::render;
using viewkit::paint::Clip;
using viewkit::paint::ClipRectLayer;
using viewkit::paint::Color;
using viewkit::paint::ContainerLayer;
using viewkit::paint::DisplayList;
using viewkit::paint::PaintCommand;
using viewkit::paint::count_layers;

namespace {

const Color kBlack{0, 0, 0, 0xff};

void fill_square(PaintingContext& context, const Offset& offset) {
    context.canvas().fill_rect(Rect::from_origin_size(offset, {10, 10}), kBlack);
}

}  // namespace

TEST(PaintingContextTest, CanvasStartsPictureLazily) {
    ContainerLayer root;
    PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
    EXPECT_FALSE(root.has_children());

    context.canvas().fill_rect(Rect::from_ltrb(0, 0, 1, 1), kBlack);
    context.canvas().fill_rect(Rect::from_ltrb(1, 1, 2, 2), kBlack);
    EXPECT_EQ(count_layers(root, "PictureLayer"), 1u);

    context.stop_recording_if_needed();
    context.canvas().fill_rect(Rect::from_ltrb(2, 2, 3, 3), kBlack);
    EXPECT_EQ(count_layers(root, "PictureLayer"), 2u);
}

TEST(PaintingContextTest, ClipNoneJustPaints) {
    ContainerLayer root;
    PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
    auto layer = context.push_clip_rect(true, {0, 0}, Rect::from_ltrb(0, 0, 5, 5), fill_square,
                                        Clip::None);
    EXPECT_EQ(layer, nullptr);
    EXPECT_EQ(count_layers(root, "ClipRectLayer"), 0u);

    DisplayList list;
    root.add_to_display_list(list);
    EXPECT_EQ(list.count(PaintCommand::PushClip), 0u);
    EXPECT_EQ(list.count(PaintCommand::FillRect), 1u);
}

TEST(PaintingContextTest, ClipWithoutCompositingRecordsOnCanvas) {
    ContainerLayer root;
    PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
    auto layer = context.push_clip_rect(false, {20, 30}, Rect::from_ltrb(0, 0, 5, 5),
                                        fill_square, Clip::AntiAlias);
    EXPECT_EQ(layer, nullptr);

    DisplayList list;
    root.add_to_display_list(list);
    ASSERT_EQ(list.count(PaintCommand::PushClip), 1u);
    EXPECT_EQ(list.commands().front().bounds, Rect::from_ltrb(20, 30, 25, 35));
    EXPECT_TRUE(list.commands().front().anti_alias);
    EXPECT_EQ(list.resolved_fill_rects()[0], Rect::from_ltrb(20, 30, 25, 35));
}

TEST(PaintingContextTest, CompositedClipReusesOldLayer) {
    ContainerLayer root;
    std::shared_ptr<ClipRectLayer> first;
    {
        PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
        first = context.push_clip_rect(true, {0, 0}, Rect::from_ltrb(0, 0, 5, 5), fill_square);
    }
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->clip_rect(), Rect::from_ltrb(0, 0, 5, 5));
    EXPECT_EQ(first->children().size(), 1u);

    root.remove_all_children();
    PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
    auto second = context.push_clip_rect(true, {1, 1}, Rect::from_ltrb(0, 0, 8, 8), fill_square,
                                         Clip::HardEdge, first);
    EXPECT_EQ(second, first);
    EXPECT_EQ(second->clip_rect(), Rect::from_ltrb(1, 1, 9, 9));
    // The previous frame's picture was replaced, not kept alongside.
    EXPECT_EQ(second->children().size(), 1u);
    EXPECT_EQ(second->parent(), &root);
}

TEST(PaintingContextTest, RepaintBoundaryChildGetsOffsetLayer) {
    class Boundary : public RenderColoredBox {
    public:
        Boundary() : RenderColoredBox(kBlack) {}
        bool is_repaint_boundary() const override { return true; }
    };

    Boundary boundary;
    boundary.layout(viewkit::geometry::BoxConstraints::tight({4, 4}));

    ContainerLayer root;
    PaintingContext context(root, Rect::from_ltrb(0, 0, 100, 100));
    context.canvas().fill_rect(Rect::from_ltrb(0, 0, 1, 1), kBlack);
    context.paint_child(boundary, {3, 4});

    ASSERT_NE(boundary.layer(), nullptr);
    EXPECT_EQ(boundary.layer()->offset(), (Offset{3, 4}));
    EXPECT_EQ(boundary.layer()->parent(), &root);
    EXPECT_FALSE(boundary.needs_paint());

    // Drawing after a composited child starts a new picture.
    context.canvas().fill_rect(Rect::from_ltrb(0, 0, 1, 1), kBlack);
    EXPECT_EQ(count_layers(root, "PictureLayer"), 3u);
}
