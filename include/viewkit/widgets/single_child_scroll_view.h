#pragma once
#include <viewkit/geometry/axis.h>
#include <viewkit/geometry/edge_insets.h>
#include <viewkit/paint/display_list.h>
#include <viewkit/widgets/build_environment.h>
#include <viewkit/widgets/scroll_physics.h>

#include <memory>
#include <optional>
#include <string>

namespace viewkit::widgets {

using geometry::AxisDirection;
using geometry::EdgeInsets;

class ScrollController;

// Where a drag is considered to start: at the first contact or once the
// gesture is recognized as a drag.
enum class DragStartBehavior { Down, Start };

enum class ScrollViewKeyboardDismissBehavior { Manual, OnDrag };

// Settings of a scroll view after reading the ambient environment.
struct ResolvedScrollView {
    AxisDirection axis_direction = AxisDirection::Down;
    bool primary = false;
    // The controller came from the environment rather than the options.
    bool inherited_controller = false;
    ScrollController* controller = nullptr;
    std::optional<EdgeInsets> padding; // resolved, never directional
    std::shared_ptr<const ScrollPhysics> physics;
    paint::Clip clip_behavior = paint::Clip::HardEdge;
    DragStartBehavior drag_start_behavior = DragStartBehavior::Start;
    ScrollViewKeyboardDismissBehavior keyboard_dismiss_behavior =
        ScrollViewKeyboardDismissBehavior::Manual;
    std::optional<std::string> restoration_id;
};

// Immutable description of a box that scrolls a single child. A
// ScrollViewHost turns it into a viewport render object and keeps that
// object in sync across rebuilds.
class SingleChildScrollView {
public:
    struct Options {
        Axis scroll_direction = Axis::Vertical;
        bool reverse = false;
        std::optional<EdgeInsets> padding;
        std::optional<bool> primary;
        std::shared_ptr<const ScrollPhysics> physics;
        ScrollController* controller = nullptr;
        DragStartBehavior drag_start_behavior = DragStartBehavior::Start;
        paint::Clip clip_behavior = paint::Clip::HardEdge;
        std::optional<std::string> restoration_id;
        ScrollViewKeyboardDismissBehavior keyboard_dismiss_behavior =
            ScrollViewKeyboardDismissBehavior::Manual;
    };

    // Throws std::invalid_argument when |options| names a controller and
    // asks to be primary at the same time.
    explicit SingleChildScrollView(Options options);

    const Options& options() const { return options_; }

    AxisDirection axis_direction(const BuildEnvironment& env) const;
    bool effective_primary(const BuildEnvironment& env) const;
    ScrollController* effective_controller(const BuildEnvironment& env) const;

    ResolvedScrollView resolve(const BuildEnvironment& env) const;

private:
    Options options_;
};

} // namespace viewkit::widgets
