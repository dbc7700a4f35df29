#include <viewkit/core/config.h>
#include <viewkit/core/diagnostics.h>
#include <viewkit/render/pipeline_owner.h>
#include <viewkit/render/proxy_box.h>
#include <viewkit/widgets/scroll_controller.h>
#include <viewkit/widgets/scroll_view_host.h>
#include <viewkit/widgets/single_child_scroll_view.h>

#include <charconv>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr const char kProgramName[] = "viewkit_demo";
constexpr const char kVersionString[] = "viewkit_demo 0.1.0";
constexpr int kStripeCount = 12;
constexpr float kStripeExtent = 60.0f;

struct DemoOptions {
  int width = static_cast<int>(viewkit::core::config::kDemoViewportWidth);
  int height = static_cast<int>(viewkit::core::config::kDemoViewportHeight);
  int scroll = 0;
  bool horizontal = false;
  bool reverse = false;
  bool verbose = false;
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " [--size=WIDTHxHEIGHT] [--scroll=PIXELS] [--horizontal] [--reverse] [--verbose]\n";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_int(std::string_view text, int& value, bool require_positive) {
  if (text.empty()) {
    return false;
  }
  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end) {
    return false;
  }
  if (require_positive ? parsed <= 0 : parsed < 0) {
    return false;
  }
  value = parsed;
  return true;
}

bool parse_size(std::string_view dimensions, int& width, int& height) {
  const std::size_t separator = dimensions.find('x');
  if (separator == std::string_view::npos ||
      dimensions.find('x', separator + 1) != std::string_view::npos) {
    return false;
  }
  int parsed_width = 0;
  int parsed_height = 0;
  if (!parse_int(dimensions.substr(0, separator), parsed_width, true) ||
      !parse_int(dimensions.substr(separator + 1), parsed_height, true)) {
    return false;
  }
  width = parsed_width;
  height = parsed_height;
  return true;
}

bool parse_arguments(int argc, char** argv, DemoOptions& options) {
  constexpr std::string_view kSizePrefix = "--size=";
  constexpr std::string_view kScrollPrefix = "--scroll=";
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (starts_with(arg, kSizePrefix)) {
      if (!parse_size(arg.substr(kSizePrefix.size()), options.width, options.height)) {
        std::cerr << "error: invalid size '" << arg << "'\n";
        return false;
      }
    } else if (starts_with(arg, kScrollPrefix)) {
      if (!parse_int(arg.substr(kScrollPrefix.size()), options.scroll, false)) {
        std::cerr << "error: invalid scroll offset '" << arg << "'\n";
        return false;
      }
    } else if (arg == "--horizontal") {
      options.horizontal = true;
    } else if (arg == "--reverse") {
      options.reverse = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "error: unknown argument '" << arg << "'\n";
      return false;
    }
  }
  return true;
}

// A column (or row) of alternating stripes, long enough to need scrolling.
std::unique_ptr<viewkit::render::RenderBox> build_content(bool horizontal) {
  using viewkit::geometry::BoxConstraints;
  using viewkit::paint::Color;
  using viewkit::render::RenderColoredBox;
  using viewkit::render::RenderConstrainedBox;

  const float total = kStripeCount * kStripeExtent;
  const BoxConstraints extent = horizontal
      ? BoxConstraints{total, total, 0.0f, viewkit::geometry::kInfinity}
      : BoxConstraints{0.0f, viewkit::geometry::kInfinity, total, total};
  return std::make_unique<RenderColoredBox>(
      Color{0x20, 0x60, 0xa0, 0xff},
      std::make_unique<RenderConstrainedBox>(extent));
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2) {
    const std::string_view arg(argv[1]);
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cout);
      return 0;
    }
    if (arg == "-V" || arg == "--version") {
      std::cout << kVersionString << "\n";
      return 0;
    }
  }

  DemoOptions options;
  if (!parse_arguments(argc, argv, options)) {
    print_usage(std::cerr);
    return 1;
  }

  using namespace viewkit;

  render::PipelineOwner owner;
  core::DiagnosticEmitter& diagnostics = owner.diagnostics();
  if (options.verbose) {
    diagnostics.set_min_severity(core::Severity::Debug);
  }

  widgets::ScrollController controller(0.0f, true, "demo");
  widgets::BuildEnvironment env;
  env.diagnostics = &diagnostics;

  widgets::SingleChildScrollView::Options view_options;
  view_options.scroll_direction =
      options.horizontal ? geometry::Axis::Horizontal : geometry::Axis::Vertical;
  view_options.reverse = options.reverse;
  view_options.controller = &controller;
  view_options.padding = geometry::EdgeInsets::all(8.0f);

  widgets::ScrollViewHost host;
  try {
    const widgets::SingleChildScrollView view(view_options);
    host.mount(view, env, build_content(options.horizontal));

    owner.set_root(host.viewport(),
                   geometry::BoxConstraints::tight({static_cast<float>(options.width),
                                                    static_cast<float>(options.height)}));
    owner.draw_frame();

    if (options.scroll != 0) {
      controller.jump_to(static_cast<float>(options.scroll));
      owner.draw_frame();
    }

    std::cout << host.viewport()->debug_description() << "\n";
    std::cout << controller.describe() << "\n";
    std::cout << owner.composite().dump();

    for (const core::DiagnosticEvent& event : diagnostics.events()) {
      std::cerr << core::format_diagnostic(event) << "\n";
    }
    owner.set_root(nullptr, {});
  } catch (const std::exception& e) {
    owner.set_root(nullptr, {});
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
