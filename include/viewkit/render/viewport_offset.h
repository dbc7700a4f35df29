#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace viewkit::render {

using ListenerToken = std::uint64_t;

// Observer list with explicit subscription tokens. Listeners may unsubscribe
// themselves (or others) while being notified.
class ChangeNotifier {
public:
    using Listener = std::function<void()>;

    ChangeNotifier() = default;
    virtual ~ChangeNotifier() = default;

    // Non-copyable
    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    ListenerToken subscribe(Listener listener);
    // Returns false when |token| is not subscribed.
    bool unsubscribe(ListenerToken token);
    bool is_subscribed(ListenerToken token) const;

    size_t listener_count() const { return listeners_.size(); }
    bool has_listeners() const { return !listeners_.empty(); }

protected:
    void notify_listeners();

private:
    std::vector<std::pair<ListenerToken, Listener>> listeners_;
    ListenerToken next_token_ = 1;
};

// Direction of the most recent user-driven scroll.
enum class ScrollDirection { Idle, Forward, Reverse };

// The scroll position a viewport paints at. Owned outside the viewport; the
// viewport reads pixels() and reports its extents back after every layout.
// Clamping pixels into the reported range is the offset's responsibility.
class ViewportOffset : public ChangeNotifier {
public:
    // An offset that never moves and disallows implicit scrolling.
    static std::unique_ptr<ViewportOffset> fixed(float value);
    static std::unique_ptr<ViewportOffset> zero();

    virtual float pixels() const = 0;
    virtual bool has_pixels() const { return true; }

    // Returns false if the offset corrected itself in response.
    virtual bool apply_viewport_dimension(float viewport_dimension) = 0;
    virtual bool apply_content_dimensions(float min_scroll_extent, float max_scroll_extent) = 0;

    // Adjusts pixels without notifying listeners; used during layout.
    virtual void correct_by(float correction) = 0;

    virtual void jump_to(float pixels) = 0;
    virtual void animate_to(float to, std::chrono::milliseconds duration) = 0;

    // Jumps when |duration| is zero, animates otherwise.
    void move_to(float to, std::chrono::milliseconds duration = std::chrono::milliseconds(0));

    virtual ScrollDirection user_scroll_direction() const = 0;

    // Whether descendants may scroll this offset to show themselves
    // (for example on focus).
    virtual bool allow_implicit_scrolling() const = 0;

    std::string describe() const;

protected:
    virtual void describe_into(std::vector<std::string>& description) const;
};

} // namespace viewkit::render
