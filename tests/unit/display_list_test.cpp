#include <viewkit/paint/display_list.h>

#include <gtest/gtest.h>

using viewkit::paint::Clip;
using viewkit::paint::Color;
using viewkit::paint::DisplayList;
using viewkit::paint::PaintCommand;
using viewkit::paint::clip_name;
using viewkit::geometry::Rect;

namespace {

const Color kRed{0xff, 0, 0, 0xff};

}  // namespace

TEST(DisplayListTest, RecordsCommandsInOrder) {
    DisplayList list;
    list.push_clip(Rect::from_ltrb(0, 0, 10, 10));
    list.fill_rect(Rect::from_ltrb(0, 0, 5, 5), kRed);
    list.pop_clip();

    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list.commands()[0].type, PaintCommand::PushClip);
    EXPECT_EQ(list.commands()[1].type, PaintCommand::FillRect);
    EXPECT_EQ(list.commands()[1].color, kRed);
    EXPECT_EQ(list.commands()[2].type, PaintCommand::PopClip);
    EXPECT_EQ(list.count(PaintCommand::FillRect), 1u);
}

TEST(DisplayListTest, ResolvedRectsApplyTranslationAndClip) {
    DisplayList list;
    list.push_clip(Rect::from_ltrb(0, 0, 100, 100));
    list.push_translate(0, -50);
    list.fill_rect(Rect::from_ltrb(0, 0, 100, 300), kRed);
    list.pop_transform();
    list.pop_clip();
    list.fill_rect(Rect::from_ltrb(200, 200, 210, 210), kRed);

    const auto rects = list.resolved_fill_rects();
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], Rect::from_ltrb(0, 0, 100, 100));
    EXPECT_EQ(rects[1], Rect::from_ltrb(200, 200, 210, 210));
}

TEST(DisplayListTest, FullyClippedRectsAreDropped) {
    DisplayList list;
    list.push_clip(Rect::from_ltrb(0, 0, 10, 10));
    list.fill_rect(Rect::from_ltrb(20, 20, 30, 30), kRed);
    list.pop_clip();
    EXPECT_TRUE(list.resolved_fill_rects().empty());
}

TEST(DisplayListTest, AppendAndDump) {
    DisplayList inner;
    inner.fill_rect(Rect::from_ltrb(0, 0, 1, 1), Color::from_argb(0xff00ff00));
    DisplayList outer;
    outer.push_translate(2, 3);
    outer.append(inner);
    outer.pop_transform();

    EXPECT_EQ(outer.size(), 3u);
    const std::string dump = outer.dump();
    EXPECT_NE(dump.find("translate(2, 3)"), std::string::npos);
    EXPECT_NE(dump.find("  fillRect"), std::string::npos);
    EXPECT_NE(dump.find("restoreTransform"), std::string::npos);

    outer.clear();
    EXPECT_TRUE(outer.empty());
}

TEST(DisplayListTest, ColorArgbRoundTrip) {
    const Color c = Color::from_argb(0x80102030);
    EXPECT_EQ(c.a, 0x80);
    EXPECT_EQ(c.r, 0x10);
    EXPECT_EQ(c.g, 0x20);
    EXPECT_EQ(c.b, 0x30);
    EXPECT_EQ(c.to_argb(), 0x80102030u);
}

TEST(DisplayListTest, ClipNames) {
    EXPECT_STREQ(clip_name(Clip::None), "none");
    EXPECT_STREQ(clip_name(Clip::HardEdge), "hardEdge");
    EXPECT_STREQ(clip_name(Clip::AntiAliasWithSaveLayer), "antiAliasWithSaveLayer");
}
