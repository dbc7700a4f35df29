#pragma once
#include <cstdint>

namespace viewkit::core::config {

// Tolerance for comparing scroll positions and extents.
inline constexpr float kPixelTolerance = 1e-3f;

// Viewport size used by the demo shell.
inline constexpr std::uint32_t kDemoViewportWidth = 320;
inline constexpr std::uint32_t kDemoViewportHeight = 240;

// Diagnostic module names.
inline constexpr const char kViewportModule[] = "viewport";
inline constexpr const char kPipelineModule[] = "pipeline";
inline constexpr const char kScrollViewModule[] = "scroll_view";
inline constexpr const char kScrollPositionModule[] = "scroll_position";

}  // namespace viewkit::core::config
