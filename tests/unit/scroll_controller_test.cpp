#include <viewkit/widgets/scroll_controller.h>
#include <viewkit/widgets/scroll_physics.h>
#include <viewkit/widgets/scroll_position.h>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace viewkit::widgets;
using viewkit::core::DiagnosticEmitter;
using viewkit::core::Severity;
using viewkit::geometry::AxisDirection;

namespace {

struct RecordedUpdate {
    float pixels;
    float scroll_delta;
    bool from_drag;
};

class RecordingContext : public ScrollContext {
public:
    explicit RecordingContext(AxisDirection direction = AxisDirection::Down)
        : direction_(direction) {}

    void dispatch_notification(const ScrollNotification& notification) override {
        if (const ScrollUpdateNotification* update = notification.as_update()) {
            updates.push_back({update->metrics().pixels, update->scroll_delta(),
                               update->drag_details().has_value()});
        }
    }
    AxisDirection axis_direction() const override { return direction_; }

    std::vector<RecordedUpdate> updates;

private:
    AxisDirection direction_;
};

DragUpdateDetails drag(float primary_delta) {
    return {{0, primary_delta}, primary_delta};
}

// Position laid out against 100px of viewport and 300px of content.
std::unique_ptr<ScrollPosition> laid_out_position(ScrollContext* context, float initial = 0) {
    auto position = std::make_unique<ScrollPosition>(nullptr, context, initial);
    position->apply_viewport_dimension(100);
    position->apply_content_dimensions(0, 200);
    return position;
}

}  // namespace

TEST(ScrollPositionTest, DefaultsBeforeLayout) {
    ScrollPosition position(nullptr, nullptr, 25);
    EXPECT_FALSE(position.has_pixels());
    EXPECT_FLOAT_EQ(position.pixels(), 25);
    EXPECT_FALSE(position.has_content_dimensions());
    EXPECT_EQ(position.physics(), ScrollPhysics::default_physics());
    EXPECT_TRUE(position.allow_implicit_scrolling());
    EXPECT_EQ(position.user_scroll_direction(), ScrollDirection::Idle);
}

TEST(ScrollPositionTest, ContentDimensionsClampPixels) {
    ScrollPosition position(nullptr, nullptr, 500);
    int notified = 0;
    position.subscribe([&notified]() { ++notified; });

    EXPECT_TRUE(position.apply_viewport_dimension(100));
    // First layout clamps the initial offset silently.
    EXPECT_FALSE(position.apply_content_dimensions(0, 200));
    EXPECT_FLOAT_EQ(position.pixels(), 200);
    EXPECT_EQ(notified, 0);

    // Same range: nothing to correct.
    EXPECT_TRUE(position.apply_content_dimensions(0, 200));

    // Content shrank under the position.
    EXPECT_FALSE(position.apply_content_dimensions(0, 50));
    EXPECT_FLOAT_EQ(position.pixels(), 50);
    EXPECT_EQ(notified, 1);

    // An inverted range collapses to its minimum.
    position.apply_content_dimensions(10, 0);
    EXPECT_FLOAT_EQ(position.min_scroll_extent(), 10);
    EXPECT_FLOAT_EQ(position.max_scroll_extent(), 10);
    EXPECT_FLOAT_EQ(position.pixels(), 10);
}

TEST(ScrollPositionTest, JumpClampsAndNotifies) {
    RecordingContext context;
    auto position = laid_out_position(&context);
    int notified = 0;
    position->subscribe([&notified]() { ++notified; });

    position->jump_to(80);
    EXPECT_FLOAT_EQ(position->pixels(), 80);
    position->jump_to(1000);
    EXPECT_FLOAT_EQ(position->pixels(), 200);
    position->jump_to(200);
    EXPECT_EQ(notified, 2);

    ASSERT_EQ(context.updates.size(), 2u);
    EXPECT_FLOAT_EQ(context.updates[0].scroll_delta, 80);
    EXPECT_FLOAT_EQ(context.updates[1].pixels, 200);
    EXPECT_FALSE(context.updates[1].from_drag);
}

TEST(ScrollPositionTest, CorrectByDoesNotNotify) {
    auto position = laid_out_position(nullptr);
    int notified = 0;
    position->subscribe([&notified]() { ++notified; });
    position->correct_by(15);
    EXPECT_FLOAT_EQ(position->pixels(), 15);
    EXPECT_EQ(notified, 0);
}

TEST(ScrollPositionTest, DragMovesAgainstFingerOnDownAxis) {
    RecordingContext context(AxisDirection::Down);
    auto position = laid_out_position(&context, 100);

    // Finger moves up: content follows, pixels grow.
    EXPECT_FLOAT_EQ(position->drag_update(drag(-30)), 30);
    EXPECT_FLOAT_EQ(position->pixels(), 130);
    EXPECT_EQ(position->user_scroll_direction(), ScrollDirection::Reverse);

    EXPECT_FLOAT_EQ(position->drag_update(drag(50)), -50);
    EXPECT_FLOAT_EQ(position->pixels(), 80);
    EXPECT_EQ(position->user_scroll_direction(), ScrollDirection::Forward);

    ASSERT_EQ(context.updates.size(), 2u);
    EXPECT_TRUE(context.updates[0].from_drag);
}

TEST(ScrollPositionTest, DragOnReversedAxis) {
    RecordingContext context(AxisDirection::Up);
    auto position = laid_out_position(&context, 100);
    EXPECT_FLOAT_EQ(position->drag_update(drag(30)), 30);
    EXPECT_FLOAT_EQ(position->pixels(), 130);
}

TEST(ScrollPositionTest, DragStopsAtEdges) {
    RecordingContext context;
    auto position = laid_out_position(&context, 190);
    EXPECT_FLOAT_EQ(position->drag_update(drag(-40)), 10);
    EXPECT_FLOAT_EQ(position->drag_update(drag(-40)), 0);
    EXPECT_FLOAT_EQ(position->drag_update(drag(0)), 0);
    EXPECT_EQ(context.updates.size(), 1u);
}

TEST(ScrollPositionTest, NeverScrollablePhysicsIgnoresDrags) {
    RecordingContext context;
    ScrollPosition position(std::make_shared<NeverScrollableScrollPhysics>(), &context, 50);
    position.apply_viewport_dimension(100);
    position.apply_content_dimensions(0, 200);

    EXPECT_FALSE(position.allow_implicit_scrolling());
    EXPECT_FLOAT_EQ(position.drag_update(drag(-20)), 0);
    EXPECT_FLOAT_EQ(position.pixels(), 50);

    // Programmatic moves still apply.
    position.jump_to(10);
    EXPECT_FLOAT_EQ(position.pixels(), 10);
}

TEST(ScrollPositionTest, AnimateUsesHandlerForNonZeroDuration) {
    auto position = laid_out_position(nullptr);
    std::optional<float> target;
    std::chrono::milliseconds duration{0};
    position->set_animation_handler(
        [&](ScrollPosition&, float to, std::chrono::milliseconds d) {
            target = to;
            duration = d;
        });

    position->animate_to(500, std::chrono::milliseconds(300));
    ASSERT_TRUE(target.has_value());
    EXPECT_FLOAT_EQ(*target, 200);
    EXPECT_EQ(duration, std::chrono::milliseconds(300));
    EXPECT_FLOAT_EQ(position->pixels(), 0);

    position->animate_to(40, std::chrono::milliseconds(0));
    EXPECT_FLOAT_EQ(position->pixels(), 40);
}

TEST(ScrollPositionTest, AnimateWithoutHandlerJumps) {
    auto position = laid_out_position(nullptr);
    position->animate_to(60, std::chrono::milliseconds(200));
    EXPECT_FLOAT_EQ(position->pixels(), 60);
    EXPECT_EQ(position->user_scroll_direction(), ScrollDirection::Idle);
}

TEST(ScrollPositionTest, RestoreOffsetBeforeAndAfterLayout) {
    ScrollPosition fresh(nullptr, nullptr);
    fresh.restore_offset(75);
    EXPECT_FALSE(fresh.has_pixels());
    fresh.apply_content_dimensions(0, 200);
    EXPECT_FLOAT_EQ(fresh.pixels(), 75);

    fresh.restore_offset(20);
    EXPECT_FLOAT_EQ(fresh.pixels(), 20);
}

TEST(ScrollPositionTest, OldPositionHandsOverPixels) {
    auto old = laid_out_position(nullptr, 120);
    ScrollPosition kept(nullptr, nullptr, 0, true, old.get());
    EXPECT_FLOAT_EQ(kept.pixels(), 120);

    ScrollPosition dropped(nullptr, nullptr, 5, false, old.get());
    EXPECT_FLOAT_EQ(dropped.pixels(), 5);

    ScrollPosition unused(nullptr, nullptr, 0, true, nullptr);
    EXPECT_FLOAT_EQ(unused.pixels(), 0);
}

TEST(ScrollPositionTest, LogsCorrectionsAndJumps) {
    DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(Severity::Debug);
    ScrollPosition position(nullptr, nullptr, 300);
    position.set_diagnostics(&diagnostics);

    position.apply_content_dimensions(0, 100);
    position.jump_to(50);
    EXPECT_EQ(diagnostics.events_by_stage("scroll_position", "correct").size(), 1u);
    EXPECT_EQ(diagnostics.events_by_stage("scroll_position", "jump").size(), 1u);
}

TEST(ScrollPositionTest, MetricsAndDescription) {
    RecordingContext context(AxisDirection::Right);
    ScrollPosition position(nullptr, &context, 30, true, nullptr, "list");
    position.apply_viewport_dimension(100);
    position.apply_content_dimensions(0, 200);

    const ScrollMetrics metrics = position.metrics();
    EXPECT_EQ(metrics.axis_direction, AxisDirection::Right);
    EXPECT_FLOAT_EQ(metrics.extent_before(), 30);
    EXPECT_FLOAT_EQ(metrics.extent_after(), 170);
    EXPECT_FALSE(metrics.out_of_range());

    const std::string description = position.describe();
    EXPECT_NE(description.find("list"), std::string::npos);
    EXPECT_NE(description.find("range: 0..200"), std::string::npos);
    EXPECT_NE(description.find("viewport: 100"), std::string::npos);
    EXPECT_NE(description.find("physics: ScrollPhysics"), std::string::npos);
}

TEST(ScrollControllerTest, PositionRequiresExactlyOneClient) {
    ScrollController controller;
    EXPECT_FALSE(controller.has_clients());
    EXPECT_THROW(controller.position(), std::logic_error);
    EXPECT_THROW(controller.offset(), std::logic_error);

    RecordingContext context;
    auto first = controller.create_scroll_position(nullptr, context, nullptr);
    auto second = controller.create_scroll_position(nullptr, context, nullptr);
    controller.attach(*first);
    EXPECT_EQ(&controller.position(), first.get());

    controller.attach(*second);
    EXPECT_EQ(controller.client_count(), 2u);
    EXPECT_THROW(controller.position(), std::logic_error);

    controller.detach(*second);
    controller.detach(*first);
    EXPECT_FALSE(controller.has_clients());
}

TEST(ScrollControllerTest, AttachIsIdempotent) {
    ScrollController controller;
    RecordingContext context;
    auto position = controller.create_scroll_position(nullptr, context, nullptr);

    controller.attach(*position);
    controller.attach(*position);
    EXPECT_EQ(controller.client_count(), 1u);
    EXPECT_EQ(position->listener_count(), 1u);

    controller.detach(*position);
    controller.detach(*position);
    EXPECT_EQ(position->listener_count(), 0u);
}

TEST(ScrollControllerTest, CreatesPositionsFromItsSettings) {
    ScrollController controller(40, false, "feed");
    RecordingContext context;
    auto position = controller.create_scroll_position(nullptr, context, nullptr);
    EXPECT_FLOAT_EQ(position->pixels(), 40);
    EXPECT_FALSE(position->keep_scroll_offset());
    EXPECT_EQ(position->debug_label(), "feed");
    EXPECT_EQ(position->context(), &context);
}

TEST(ScrollControllerTest, ForwardsPositionChanges) {
    ScrollController controller;
    RecordingContext context;
    auto position = controller.create_scroll_position(nullptr, context, nullptr);
    position->apply_content_dimensions(0, 200);
    controller.attach(*position);

    int notified = 0;
    controller.subscribe([&notified]() { ++notified; });

    controller.jump_to(90);
    EXPECT_FLOAT_EQ(controller.offset(), 90);
    EXPECT_EQ(notified, 1);

    controller.detach(*position);
    position->jump_to(10);
    EXPECT_EQ(notified, 1);
}

TEST(ScrollControllerTest, MovesEveryAttachedPosition) {
    ScrollController controller;
    RecordingContext context;
    auto first = controller.create_scroll_position(nullptr, context, nullptr);
    auto second = controller.create_scroll_position(nullptr, context, nullptr);
    first->apply_content_dimensions(0, 50);
    second->apply_content_dimensions(0, 500);
    controller.attach(*first);
    controller.attach(*second);

    controller.jump_to(100);
    EXPECT_FLOAT_EQ(first->pixels(), 50);
    EXPECT_FLOAT_EQ(second->pixels(), 100);

    controller.animate_to(0, std::chrono::milliseconds(0));
    EXPECT_FLOAT_EQ(first->pixels(), 0);
    EXPECT_FLOAT_EQ(second->pixels(), 0);

    controller.detach(*first);
    controller.detach(*second);
}

TEST(ScrollControllerTest, DestructionReleasesSubscriptions) {
    RecordingContext context;
    auto position = std::make_unique<ScrollPosition>(nullptr, &context);
    {
        ScrollController controller;
        controller.attach(*position);
        EXPECT_EQ(position->listener_count(), 1u);
    }
    EXPECT_EQ(position->listener_count(), 0u);
}

TEST(ScrollControllerTest, Describe) {
    ScrollController plain;
    EXPECT_EQ(plain.describe(), "ScrollController(no clients)");

    ScrollController labelled(20, false, "feed");
    RecordingContext context;
    auto position = labelled.create_scroll_position(nullptr, context, nullptr);
    labelled.attach(*position);
    EXPECT_EQ(labelled.describe(),
              "ScrollController(feed, initialScrollOffset: 20, no keepScrollOffset, one client, "
              "offset 20)");
    labelled.detach(*position);
}
