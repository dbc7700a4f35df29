#include <viewkit/render/viewport_offset.h>

#include <algorithm>
#include <sstream>

namespace viewkit::render {

// ---------------------------------------------------------------------------
// ChangeNotifier
// ---------------------------------------------------------------------------

ListenerToken ChangeNotifier::subscribe(Listener listener) {
    const ListenerToken token = next_token_++;
    listeners_.emplace_back(token, std::move(listener));
    return token;
}

bool ChangeNotifier::unsubscribe(ListenerToken token) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [token](const std::pair<ListenerToken, Listener>& entry) {
            return entry.first == token;
        });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

bool ChangeNotifier::is_subscribed(ListenerToken token) const {
    return std::any_of(listeners_.begin(), listeners_.end(),
        [token](const std::pair<ListenerToken, Listener>& entry) {
            return entry.first == token;
        });
}

void ChangeNotifier::notify_listeners() {
    // Snapshot so listeners can (un)subscribe while being notified; a
    // listener removed mid-dispatch is not called.
    const auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        if (is_subscribed(entry.first)) {
            entry.second();
        }
    }
}

// ---------------------------------------------------------------------------
// ViewportOffset
// ---------------------------------------------------------------------------

namespace {

class FixedViewportOffset : public ViewportOffset {
public:
    explicit FixedViewportOffset(float pixels) : pixels_(pixels) {}

    float pixels() const override { return pixels_; }
    bool apply_viewport_dimension(float) override { return true; }
    bool apply_content_dimensions(float, float) override { return true; }
    void correct_by(float correction) override { pixels_ += correction; }
    void jump_to(float) override {}
    void animate_to(float, std::chrono::milliseconds) override {}
    ScrollDirection user_scroll_direction() const override { return ScrollDirection::Idle; }
    bool allow_implicit_scrolling() const override { return false; }

private:
    float pixels_;
};

const char* scroll_direction_name(ScrollDirection direction) {
    switch (direction) {
        case ScrollDirection::Idle:    return "idle";
        case ScrollDirection::Forward: return "forward";
        case ScrollDirection::Reverse: return "reverse";
    }
    return "unknown";
}

} // namespace

std::unique_ptr<ViewportOffset> ViewportOffset::fixed(float value) {
    return std::make_unique<FixedViewportOffset>(value);
}

std::unique_ptr<ViewportOffset> ViewportOffset::zero() {
    return std::make_unique<FixedViewportOffset>(0.0f);
}

void ViewportOffset::move_to(float to, std::chrono::milliseconds duration) {
    if (duration.count() == 0) {
        jump_to(to);
    } else {
        animate_to(to, duration);
    }
}

std::string ViewportOffset::describe() const {
    std::vector<std::string> description;
    describe_into(description);
    std::ostringstream oss;
    oss << "ViewportOffset(";
    for (size_t i = 0; i < description.size(); ++i) {
        if (i) oss << ", ";
        oss << description[i];
    }
    oss << ")";
    return oss.str();
}

void ViewportOffset::describe_into(std::vector<std::string>& description) const {
    std::ostringstream oss;
    if (has_pixels()) {
        oss << "offset: " << pixels();
    } else {
        oss << "offset: <unknown>";
    }
    description.push_back(oss.str());
    description.push_back(std::string("direction: ") +
                          scroll_direction_name(user_scroll_direction()));
}

} // namespace viewkit::render
