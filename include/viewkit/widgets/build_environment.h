#pragma once
#include <viewkit/core/diagnostics.h>
#include <viewkit/geometry/axis.h>
#include <viewkit/widgets/scroll_notification.h>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace viewkit::widgets {

using geometry::Axis;
using geometry::TextDirection;

class ScrollController;

enum class TargetPlatform { Android, Fuchsia, iOS, Linux, MacOS, Windows };

const char* target_platform_name(TargetPlatform platform);

// Platforms on which scroll views pick up the primary controller without
// being asked to.
const std::set<TargetPlatform>& default_primary_inherit_platforms();

// Keyboard focus of a subtree. Scroll views dismiss it when dragged.
class FocusScopeNode {
public:
    bool has_focus() const { return has_focus_; }
    void request_focus() { has_focus_ = true; }
    void unfocus() { has_focus_ = false; ++unfocus_count_; }
    std::uint32_t unfocus_count() const { return unfocus_count_; }

private:
    bool has_focus_ = false;
    std::uint32_t unfocus_count_ = 0;
};

// Scroll offsets saved by restoration id across remounts.
class ScrollRestorationStore {
public:
    void write(const std::string& id, float pixels) { offsets_[id] = pixels; }
    std::optional<float> read(const std::string& id) const;
    bool erase(const std::string& id) { return offsets_.erase(id) > 0; }
    size_t size() const { return offsets_.size(); }

private:
    std::unordered_map<std::string, float> offsets_;
};

// The primary scroll controller published to a subtree.
struct PrimaryScrollScope {
    ScrollController* controller = nullptr;
    Axis scroll_direction = Axis::Vertical;
    std::set<TargetPlatform> automatically_inherit_for_platforms =
        default_primary_inherit_platforms();
};

// Ambient values a scroll view reads from its position in the tree.
// Everything is non-owning; absent collaborators are simply skipped.
struct BuildEnvironment {
    TextDirection text_direction = TextDirection::LTR;
    TargetPlatform platform = TargetPlatform::Android;
    std::optional<PrimaryScrollScope> primary_scroll;
    FocusScopeNode* focus_scope = nullptr;
    ScrollRestorationStore* restoration_store = nullptr;
    core::DiagnosticEmitter* diagnostics = nullptr;
    // Next listener up the tree for scroll notifications.
    NotificationListener notification_parent;
};

// Lookups on the primary scroll controller published in an environment.
class PrimaryScrollController {
public:
    // True when a scroll view along |scroll_direction| without its own
    // controller should adopt the environment's primary controller.
    static bool should_inherit(const BuildEnvironment& env, Axis scroll_direction);

    // The published primary controller, or null.
    static ScrollController* maybe_of(const BuildEnvironment& env);
};

} // namespace viewkit::widgets
