#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <optional>
#include <vector>

namespace facet::css {

// ============================================================================
// Width media queries
// ============================================================================

enum class WidthBound : u8 { Min, Max };

struct WidthQuery {
    WidthBound bound{WidthBound::Min};
    f64 value{0};
    String unit;  // px, em or rem
};

// Parses exactly "@media (min-width: N<unit>)" or "@media (max-width: N<unit>)"
[[nodiscard]] std::optional<WidthQuery> parse_width_query(const String& key);

/**
 * "Last media query wins" rewrite over the keys of one condition map.
 *
 * With at least two "@media " keys, every min-width query except the largest
 * gains an upper bound just below the next one, and every max-width query
 * except the smallest gains a lower bound just above the next one:
 *
 *   @media (min-width: 768px)   -> @media (min-width: 768px) and (max-width: 1023.99px)
 *   @media (min-width: 1024px)     (unchanged)
 *
 * Keys keep their positions; other keys are returned unchanged.
 */
[[nodiscard]] std::vector<String> bound_media_queries(const std::vector<String>& keys);

} // namespace facet::css
