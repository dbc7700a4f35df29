#pragma once
#include <viewkit/render/viewport_offset.h>
#include <viewkit/widgets/scroll_position.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace viewkit::widgets {

// Controls the scroll positions of the scroll views it is attached to.
// Positions are owned by their scroll views; the controller only tracks
// them and relays their change notifications to its own subscribers.
class ScrollController : public render::ChangeNotifier {
public:
    explicit ScrollController(float initial_scroll_offset = 0.0f, bool keep_scroll_offset = true,
                              std::string debug_label = {});
    ~ScrollController() override;

    float initial_scroll_offset() const { return initial_scroll_offset_; }
    bool keep_scroll_offset() const { return keep_scroll_offset_; }
    const std::string& debug_label() const { return debug_label_; }

    // Builds the position a scroll view using this controller should own.
    virtual std::unique_ptr<ScrollPosition> create_scroll_position(
        std::shared_ptr<const ScrollPhysics> physics, ScrollContext& context,
        const ScrollPosition* old_position);

    void attach(ScrollPosition& position);
    void detach(ScrollPosition& position);

    bool has_clients() const { return !positions_.empty(); }
    size_t client_count() const { return positions_.size(); }

    // The single attached position. Throws std::logic_error when none or
    // several are attached.
    ScrollPosition& position() const;
    // Pixels of the single attached position, same preconditions.
    float offset() const { return position().pixels(); }

    // Moves every attached position.
    void jump_to(float value);
    void animate_to(float to, std::chrono::milliseconds duration);

    std::string describe() const;

private:
    float initial_scroll_offset_;
    bool keep_scroll_offset_;
    std::string debug_label_;
    std::vector<std::pair<ScrollPosition*, render::ListenerToken>> positions_;
};

} // namespace viewkit::widgets
