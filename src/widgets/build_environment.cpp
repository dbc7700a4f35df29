#include <viewkit/widgets/build_environment.h>

namespace viewkit::widgets {

const char* target_platform_name(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::Android: return "android";
        case TargetPlatform::Fuchsia: return "fuchsia";
        case TargetPlatform::iOS:     return "iOS";
        case TargetPlatform::Linux:   return "linux";
        case TargetPlatform::MacOS:   return "macOS";
        case TargetPlatform::Windows: return "windows";
    }
    return "unknown";
}

const std::set<TargetPlatform>& default_primary_inherit_platforms() {
    // Mobile platforms, where one scroll view usually fills the screen.
    static const std::set<TargetPlatform> platforms = {
        TargetPlatform::Android,
        TargetPlatform::iOS,
        TargetPlatform::Fuchsia,
    };
    return platforms;
}

std::optional<float> ScrollRestorationStore::read(const std::string& id) const {
    auto it = offsets_.find(id);
    if (it == offsets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PrimaryScrollController::should_inherit(const BuildEnvironment& env, Axis scroll_direction) {
    if (!env.primary_scroll || env.primary_scroll->controller == nullptr) {
        return false;
    }
    if (env.primary_scroll->scroll_direction != scroll_direction) {
        return false;
    }
    return env.primary_scroll->automatically_inherit_for_platforms.count(env.platform) > 0;
}

ScrollController* PrimaryScrollController::maybe_of(const BuildEnvironment& env) {
    return env.primary_scroll ? env.primary_scroll->controller : nullptr;
}

} // namespace viewkit::widgets
