#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/logger.hpp"
#include <map>

namespace facet {

// ============================================================================
// Compiler configuration
// ============================================================================

// Shorthand strategy selection: a strategy name plus free-form options
struct ShorthandSelection {
    String name{"keep-shorthands"};
    std::map<String, String> options;
};

struct CompilerConfig {
    String class_name_prefix{"x"};

    // Class names become "<property>-<prefix><hash>"
    bool debug_class_names{false};

    // Wrap atomic rules in @layer blocks instead of bumping specificity
    bool use_css_layers{false};

    // Numeric font-size values are emitted in rem
    bool font_size_px_to_rem{false};
    f64 font_size_root_px{16.0};

    ShorthandSelection shorthand;

    LogLevel log_level{LogLevel::Warn};
};

} // namespace facet
