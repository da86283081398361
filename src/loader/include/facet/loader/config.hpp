#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include <json/json.h>

namespace facet::loader {

/**
 * Reads a CompilerConfig from a JSON object. Absent fields keep their
 * defaults.
 *
 *   {
 *     "class_name_prefix": "x",
 *     "debug_class_names": false,
 *     "use_css_layers": false,
 *     "font_size_px_to_rem": false,
 *     "font_size_root_px": 16,
 *     "shorthand": "keep-shorthands" | { "name": "...", "options": { ... } },
 *     "log_level": "warn"
 *   }
 *
 * A field of the wrong type is an Input error whose context is the field path.
 */
[[nodiscard]] CompileResult<CompilerConfig> parse_config(const Json::Value& json,
                                                         const String& path = "config"_s);

} // namespace facet::loader
