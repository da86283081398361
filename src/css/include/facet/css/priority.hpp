#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <vector>

namespace facet::css {

// ============================================================================
// Cascade priority
// ============================================================================
//
// Atomic rules are emitted in ascending priority, so a rule with a higher
// priority wins over a lower one regardless of source order:
//
//   custom property            1
//   shorthand of shorthands    1000   (margin, padding, background, ...)
//   shorthand of longhands     2000   (margin-block, border-color, flex, ...)
//   longhand                   3000
//   + pseudo-element           5000
//   + pseudo-classes           table value per pseudo-class, summed
//   + @supports 30, @media 200, @container 300 (per at-rule)

[[nodiscard]] i32 property_priority(const String& property);

[[nodiscard]] i32 at_rule_priority(const String& at_rule);

[[nodiscard]] i32 calculate_priority(const String& property,
                                     const std::vector<String>& pseudos,
                                     const std::vector<String>& at_rules);

} // namespace facet::css
