#include <viewkit/render/viewport_offset.h>

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using viewkit::render::ChangeNotifier;
using viewkit::render::ListenerToken;
using viewkit::render::ScrollDirection;
using viewkit::render::ViewportOffset;

namespace {

class TestNotifier : public ChangeNotifier {
public:
    void fire() { notify_listeners(); }
};

}  // namespace

TEST(ChangeNotifierTest, SubscribeNotifyUnsubscribe) {
    TestNotifier notifier;
    int calls = 0;
    const ListenerToken token = notifier.subscribe([&calls]() { ++calls; });
    EXPECT_TRUE(notifier.is_subscribed(token));
    EXPECT_EQ(notifier.listener_count(), 1u);

    notifier.fire();
    EXPECT_EQ(calls, 1);

    EXPECT_TRUE(notifier.unsubscribe(token));
    EXPECT_FALSE(notifier.unsubscribe(token));
    notifier.fire();
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(notifier.has_listeners());
}

TEST(ChangeNotifierTest, ListenerRemovedDuringDispatchIsSkipped) {
    TestNotifier notifier;
    std::vector<int> order;
    ListenerToken second = 0;
    notifier.subscribe([&]() {
        order.push_back(1);
        notifier.unsubscribe(second);
    });
    second = notifier.subscribe([&]() { order.push_back(2); });

    notifier.fire();
    EXPECT_EQ(order, std::vector<int>{1});
}

TEST(ChangeNotifierTest, TokensAreUnique) {
    TestNotifier notifier;
    const ListenerToken a = notifier.subscribe([]() {});
    const ListenerToken b = notifier.subscribe([]() {});
    EXPECT_NE(a, b);
    notifier.unsubscribe(a);
    const ListenerToken c = notifier.subscribe([]() {});
    EXPECT_NE(a, c);
}

TEST(ViewportOffsetTest, FixedOffsetNeverMoves) {
    auto offset = ViewportOffset::fixed(42);
    EXPECT_FLOAT_EQ(offset->pixels(), 42);
    EXPECT_TRUE(offset->has_pixels());
    EXPECT_TRUE(offset->apply_viewport_dimension(100));
    EXPECT_TRUE(offset->apply_content_dimensions(0, 10));
    EXPECT_FLOAT_EQ(offset->pixels(), 42);

    offset->jump_to(5);
    offset->move_to(7, std::chrono::milliseconds(200));
    EXPECT_FLOAT_EQ(offset->pixels(), 42);
    EXPECT_FALSE(offset->allow_implicit_scrolling());
    EXPECT_EQ(offset->user_scroll_direction(), ScrollDirection::Idle);

    offset->correct_by(-2);
    EXPECT_FLOAT_EQ(offset->pixels(), 40);
}

TEST(ViewportOffsetTest, ZeroAndDescribe) {
    auto offset = ViewportOffset::zero();
    EXPECT_FLOAT_EQ(offset->pixels(), 0);
    EXPECT_EQ(offset->describe(), "ViewportOffset(offset: 0, direction: idle)");
}
