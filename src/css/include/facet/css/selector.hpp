#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include <vector>

namespace facet::css {

// ============================================================================
// Atomic rule selectors
// ============================================================================

/**
 * Selector for one atomic class.
 *
 * Plain rules use ".x123". A rule carrying an at-rule or a pseudo gets its
 * specificity bumped so it beats the plain rule for the same property:
 * ".x123:not(#\#)" + suffix, or ".x123.x123" + suffix when the sheet uses
 * cascade layers. The suffix is the pseudo list in declared order, with each
 * run of pseudo-classes between pseudo-elements sorted (see sort_pseudos), so
 * ":hover::before" keeps the hover on the element. Vendor-prefixed variants
 * are expanded last.
 */
[[nodiscard]] String atomic_selector(const CompilerConfig& config,
                                     const String& class_name,
                                     const std::vector<String>& pseudos,
                                     bool has_at_rule);

// "html[dir=\"rtl\"] " in front of every top-level comma-separated selector
[[nodiscard]] String prefix_rtl(const String& selector);

/**
 * Wraps a rule in its at-rules.
 *
 * At-rules are sorted first, then each one wraps the text built so far, so
 * the last at-rule in sort order ends up outermost.
 */
[[nodiscard]] String wrap_at_rules(const String& rule, const std::vector<String>& at_rules);

// ============================================================================
// Vendor prefixes
// ============================================================================

// Prefixed spellings of a pseudo-element or pseudo-class, or empty if none apply
[[nodiscard]] std::vector<String> selector_variants(const String& pseudo);

/**
 * Expands the first prefixable pseudo in a selector into all its variants:
 *
 *   ".x1::placeholder" -> ".x1::-webkit-input-placeholder, .x1::-moz-placeholder,
 *                         .x1:-ms-input-placeholder, .x1::placeholder"
 */
[[nodiscard]] String prefix_selector(const String& selector);

} // namespace facet::css
