#include <viewkit/widgets/scroll_physics.h>

namespace viewkit::widgets {

std::shared_ptr<const ScrollPhysics> ScrollPhysics::default_physics() {
    static const std::shared_ptr<const ScrollPhysics> physics = std::make_shared<ScrollPhysics>();
    return physics;
}

} // namespace viewkit::widgets
