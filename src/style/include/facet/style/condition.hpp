#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/style_value.hpp"
#include <vector>

namespace facet::style {

// ============================================================================
// Condition paths
// ============================================================================

// The conditions wrapping one leaf of a condition map
struct ConditionPath {
    std::vector<String> at_rules;  // Outer to inner, as declared
    std::vector<String> pseudos;   // In declaration order

    [[nodiscard]] bool empty() const { return at_rules.empty() && pseudos.empty(); }

    // "default", or the at-rules followed by the pseudos, concatenated
    [[nodiscard]] String key() const;

    [[nodiscard]] bool operator==(const ConditionPath& other) const = default;
};

struct FlatCondition {
    ConditionPath path;
    StyleValue value;
};

// Which keys a condition map may use
enum class ConditionScope : u8 {
    Property,  // "default", pseudo-classes/elements, contextual selectors, at-rules
    Variable,  // "default" and at-rules only
};

/**
 * Flattens a condition tree into (path, leaf) pairs in declaration order.
 *
 * Every level with two or more "@media" width queries is range bounded first
 * (see css::bound_media_queries). Keys other than "default", ":..." and
 * "@..." are an InvalidCondition error. Null leaves are kept so callers can
 * tell a removed branch from a missing one.
 *
 *   { "default": "red", ":hover": { "default": "blue", "@media (x)": "green" } }
 *     -> [({}, red), ({:hover}, blue), ({@media (x), :hover}, green)]
 */
[[nodiscard]] CompileResult<std::vector<FlatCondition>> flatten_conditions(
    const StyleValue& value, ConditionScope scope = ConditionScope::Property);

} // namespace facet::style
