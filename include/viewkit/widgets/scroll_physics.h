#pragma once
#include <memory>

namespace viewkit::widgets {

// Decides which kinds of scrolling a scroll position accepts. Physics
// objects are immutable and shared; a host compares them by identity to
// decide whether its position must be rebuilt.
class ScrollPhysics {
public:
    virtual ~ScrollPhysics() = default;

    // Whether descendants may scroll the position to reveal themselves.
    virtual bool allow_implicit_scrolling() const { return true; }
    // Whether drags move the position.
    virtual bool allow_user_scrolling() const { return true; }

    virtual const char* name() const { return "ScrollPhysics"; }

    // Shared instance used when a scroll view names no physics.
    static std::shared_ptr<const ScrollPhysics> default_physics();
};

// Keeps the position where it is no matter what the user or a descendant does.
class NeverScrollableScrollPhysics : public ScrollPhysics {
public:
    bool allow_implicit_scrolling() const override { return false; }
    bool allow_user_scrolling() const override { return false; }
    const char* name() const override { return "NeverScrollableScrollPhysics"; }
};

} // namespace viewkit::widgets
