#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <vector>

namespace facet::css {

// ============================================================================
// Property classification
// ============================================================================

enum class PropertyCategory : u8 {
    CustomProperty,         // --*
    ShorthandOfShorthands,  // margin, padding, border, ...
    ShorthandOfLonghands,   // margin-block, border-color, flex, ...
    Longhand,               // everything else, physical or logical
};

[[nodiscard]] PropertyCategory property_category(const String& property);

[[nodiscard]] inline bool is_custom_property(const String& property) {
    return property.starts_with("--"_s);
}

// Numeric values of these properties are emitted without a unit
[[nodiscard]] bool is_unitless(const String& property);

// Numeric values of these properties are milliseconds
[[nodiscard]] bool is_time_property(const String& property);

// "", "ms" or "px"
[[nodiscard]] String unit_suffix(const String& property);

// Properties accepted inside @position-try
[[nodiscard]] bool is_position_try_property(const String& property);

// ============================================================================
// Shorthands refused by the reject-shorthands strategy
// ============================================================================

[[nodiscard]] bool is_disallowed_shorthand(const String& property);

// The longhands that replace a disallowed shorthand (empty if not disallowed)
[[nodiscard]] std::vector<String> disallowed_shorthand_longhands(const String& property);

// ============================================================================
// Property names
// ============================================================================

/**
 * Converts a declared property key to its CSS name.
 *
 * snake_case keys become kebab-case ("background_color" -> "background-color"),
 * custom properties are kept verbatim and a bare "var(--name)" key unwraps to
 * "--name".
 */
[[nodiscard]] String to_css_property(const String& key);

} // namespace facet::css
