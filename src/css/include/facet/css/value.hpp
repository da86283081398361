#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"

namespace facet::css {

// ============================================================================
// Value normalization (StyleX normalize-value)
// ============================================================================

/**
 * Canonical text of a declared value, so equal values hash equally.
 *
 * - whitespace: trimmed, collapsed, removed around commas and inside
 *   parentheses, "red !important" -> "red!important"
 * - timings of at least 10ms become seconds: "500ms" -> ".5s"
 * - leading zeros are dropped: "0.5" -> ".5"
 * - zero dimensions: "0px" -> "0", "0rad" -> "0deg", "0ms" -> "0s"
 * - '' -> ""
 */
[[nodiscard]] String normalize_value(const String& value);

// Rounds to at most `max_decimals` places, trailing zeros trimmed ("1.5", "2", "-0.25").
// Infinities and NaN have no CSS spelling and format as "0".
[[nodiscard]] String format_number(f64 value, i32 max_decimals = 4);

// Numeric declaration value with the property's unit ("10" -> "10px", opacity stays bare)
[[nodiscard]] String number_to_css(f64 value, const String& property, const CompilerConfig& config);

// String declaration value, normalized and quoted where the property needs it
[[nodiscard]] String string_to_css(const String& value, const String& property);

// "var(" ... ")"
[[nodiscard]] inline bool is_css_var(const String& value) {
    return value.starts_with("var("_s) && value.ends_with(")"_s);
}

} // namespace facet::css
