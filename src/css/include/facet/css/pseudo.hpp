#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <vector>

namespace facet::css {

// ============================================================================
// Pseudo-classes and pseudo-elements
// ============================================================================

constexpr i32 PSEUDO_ELEMENT_PRIORITY = 5000;
constexpr i32 UNKNOWN_PSEUDO_CLASS_PRIORITY = 40;

[[nodiscard]] inline bool is_pseudo_element(const String& pseudo) {
    return pseudo.starts_with("::"_s);
}

/**
 * Splits a combined pseudo string into its parts.
 *
 * ":hover:active" -> [":hover", ":active"], "::before:hover" -> ["::before",
 * ":hover"]. Colons nested inside parentheses do not split, so
 * ":where(.m:hover *)" stays whole.
 */
[[nodiscard]] std::vector<String> split_pseudos(const String& combined);

/**
 * Canonical ordering of a pseudo list.
 *
 * Pseudo-elements keep their position and act as separators; each run of
 * pseudo-classes between them is sorted alphabetically.
 */
[[nodiscard]] std::vector<String> sort_pseudos(std::vector<String> pseudos);

// Splits, sorts and re-joins; strings containing '(' are returned unchanged
[[nodiscard]] String sort_combined_pseudos(const String& combined);

// Fixed table value for one pseudo-class base name (":hover" -> 130)
[[nodiscard]] i32 pseudo_class_priority(const String& pseudo_class);

// Priority contributed by a pseudo selector such as ":hover:active" or "::before:hover"
[[nodiscard]] i32 pseudo_priority(const String& selector);

} // namespace facet::css
