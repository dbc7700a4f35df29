#include <viewkit/widgets/scroll_controller.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace viewkit::widgets {

ScrollController::ScrollController(float initial_scroll_offset, bool keep_scroll_offset,
                                   std::string debug_label)
    : initial_scroll_offset_(initial_scroll_offset)
    , keep_scroll_offset_(keep_scroll_offset)
    , debug_label_(std::move(debug_label)) {}

ScrollController::~ScrollController() {
    for (const auto& entry : positions_) {
        entry.first->unsubscribe(entry.second);
    }
}

std::unique_ptr<ScrollPosition> ScrollController::create_scroll_position(
    std::shared_ptr<const ScrollPhysics> physics, ScrollContext& context,
    const ScrollPosition* old_position) {
    return std::make_unique<ScrollPosition>(std::move(physics), &context, initial_scroll_offset_,
                                            keep_scroll_offset_, old_position, debug_label_);
}

void ScrollController::attach(ScrollPosition& position) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
        [&position](const std::pair<ScrollPosition*, render::ListenerToken>& entry) {
            return entry.first == &position;
        });
    if (it != positions_.end()) return;
    const render::ListenerToken token = position.subscribe([this]() { notify_listeners(); });
    positions_.emplace_back(&position, token);
}

void ScrollController::detach(ScrollPosition& position) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
        [&position](const std::pair<ScrollPosition*, render::ListenerToken>& entry) {
            return entry.first == &position;
        });
    if (it == positions_.end()) return;
    position.unsubscribe(it->second);
    positions_.erase(it);
}

ScrollPosition& ScrollController::position() const {
    if (positions_.empty()) {
        throw std::logic_error("ScrollController not attached to any scroll views");
    }
    if (positions_.size() > 1) {
        throw std::logic_error("ScrollController attached to multiple scroll views");
    }
    return *positions_.front().first;
}

void ScrollController::jump_to(float value) {
    // Copy: a jump can rebuild a listening scroll view and detach it.
    const auto positions = positions_;
    for (const auto& entry : positions) {
        entry.first->jump_to(value);
    }
}

void ScrollController::animate_to(float to, std::chrono::milliseconds duration) {
    const auto positions = positions_;
    for (const auto& entry : positions) {
        entry.first->animate_to(to, duration);
    }
}

std::string ScrollController::describe() const {
    std::ostringstream oss;
    oss << "ScrollController(";
    if (!debug_label_.empty()) {
        oss << debug_label_ << ", ";
    }
    if (initial_scroll_offset_ != 0.0f) {
        oss << "initialScrollOffset: " << initial_scroll_offset_ << ", ";
    }
    if (!keep_scroll_offset_) {
        oss << "no keepScrollOffset, ";
    }
    if (positions_.empty()) {
        oss << "no clients";
    } else if (positions_.size() == 1) {
        oss << "one client, offset " << positions_.front().first->pixels();
    } else {
        oss << positions_.size() << " clients";
    }
    oss << ")";
    return oss.str();
}

} // namespace viewkit::widgets
