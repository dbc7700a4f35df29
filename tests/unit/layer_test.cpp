#include <viewkit/paint/layer.h>

#include <gtest/gtest.h>

#include <memory>

using namespace viewkit::paint;
using viewkit::geometry::Rect;

namespace {

std::shared_ptr<PictureLayer> make_picture(const Rect& rect) {
    auto picture = std::make_shared<PictureLayer>(rect);
    picture->display_list().fill_rect(rect, Color{0, 0, 0xff, 0xff});
    return picture;
}

}  // namespace

TEST(LayerTest, AppendReparentsLayer) {
    ContainerLayer a;
    ContainerLayer b;
    auto picture = make_picture(Rect::from_ltrb(0, 0, 1, 1));

    a.append(picture);
    EXPECT_EQ(picture->parent(), &a);
    b.append(picture);
    EXPECT_EQ(picture->parent(), &b);
    EXPECT_FALSE(a.has_children());
    EXPECT_EQ(b.children().size(), 1u);

    picture->remove();
    EXPECT_EQ(picture->parent(), nullptr);
    EXPECT_FALSE(b.has_children());
}

TEST(LayerTest, DestroyedContainerOrphansItsChildren) {
    auto picture = make_picture(Rect::from_ltrb(0, 0, 4, 4));
    {
        auto clip = std::make_shared<ClipRectLayer>(Rect::from_ltrb(0, 0, 2, 2), Clip::HardEdge);
        clip->append(picture);
        EXPECT_EQ(picture->parent(), clip.get());
    }
    EXPECT_EQ(picture->parent(), nullptr);

    OffsetLayer next;
    next.append(picture);
    EXPECT_EQ(picture->parent(), &next);
    EXPECT_EQ(next.children().size(), 1u);
}

TEST(LayerTest, OffsetLayerTranslatesOnlyWhenMoved) {
    OffsetLayer layer;
    layer.append(make_picture(Rect::from_ltrb(0, 0, 10, 10)));

    DisplayList still;
    layer.add_to_display_list(still);
    EXPECT_EQ(still.count(PaintCommand::PushTranslate), 0u);

    layer.set_offset({5, 6});
    DisplayList moved;
    layer.add_to_display_list(moved);
    ASSERT_EQ(moved.count(PaintCommand::PushTranslate), 1u);
    EXPECT_EQ(moved.resolved_fill_rects()[0], Rect::from_ltrb(5, 6, 15, 16));
}

TEST(LayerTest, ClipRectLayerBehaviors) {
    ClipRectLayer clip(Rect::from_ltrb(0, 0, 10, 10), Clip::HardEdge);
    clip.append(make_picture(Rect::from_ltrb(0, 0, 20, 20)));

    DisplayList hard;
    clip.add_to_display_list(hard);
    EXPECT_EQ(hard.commands().front().type, PaintCommand::PushClip);
    EXPECT_FALSE(hard.commands().front().anti_alias);
    EXPECT_EQ(hard.resolved_fill_rects()[0], Rect::from_ltrb(0, 0, 10, 10));

    clip.set_clip_behavior(Clip::AntiAliasWithSaveLayer);
    DisplayList saved;
    clip.add_to_display_list(saved);
    EXPECT_TRUE(saved.commands().front().anti_alias);
    EXPECT_EQ(saved.count(PaintCommand::SaveLayer), 1u);
    EXPECT_EQ(saved.count(PaintCommand::RestoreLayer), 1u);

    clip.set_clip_behavior(Clip::None);
    DisplayList none;
    clip.add_to_display_list(none);
    EXPECT_EQ(none.count(PaintCommand::PushClip), 0u);
}

TEST(LayerTest, HandleKeepsIdentityUntilReset) {
    LayerHandle<ClipRectLayer> handle;
    EXPECT_FALSE(handle);
    auto layer = std::make_shared<ClipRectLayer>();
    handle.set(layer);
    EXPECT_EQ(handle.get(), layer.get());
    EXPECT_EQ(layer.use_count(), 2);
    handle.reset();
    EXPECT_FALSE(handle);
    EXPECT_EQ(layer.use_count(), 1);
}

TEST(LayerTest, CountLayersWalksTree) {
    OffsetLayer root;
    auto clip = std::make_shared<ClipRectLayer>();
    clip->append(make_picture(Rect::from_ltrb(0, 0, 1, 1)));
    root.append(clip);
    root.append(make_picture(Rect::from_ltrb(0, 0, 1, 1)));

    EXPECT_EQ(count_layers(root, "OffsetLayer"), 1u);
    EXPECT_EQ(count_layers(root, "ClipRectLayer"), 1u);
    EXPECT_EQ(count_layers(root, "PictureLayer"), 2u);
}
