#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/style_value.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace facet::style {

// ============================================================================
// Value splitting
// ============================================================================

/**
 * Splits a shorthand value on top-level whitespace.
 *
 * Parenthesized groups stay whole ("calc(1px + 2px) 4px" -> two parts) and a
 * trailing "!important" is re-attached to every part.
 */
[[nodiscard]] std::vector<String> split_css_value(const String& value);

// ============================================================================
// Shorthand strategies
// ============================================================================

class ShorthandStrategy {
public:
    virtual ~ShorthandStrategy() = default;

    // Canonical strategy name ("keep-shorthands", ...)
    [[nodiscard]] virtual std::string_view name() const = 0;

    // Expands one unconditional declaration
    [[nodiscard]] virtual CompileResult<std::vector<StyleDeclaration>> expand(
        const String& property, const StyleValue& value) const = 0;

    // Expands a condition map, regrouping the branches per resulting property
    [[nodiscard]] virtual CompileResult<std::vector<StyleDeclaration>> expand_conditions(
        const String& property, const StyleValue& conditions) const = 0;

    /**
     * Creates the strategy named by the selection. Accepted names:
     *
     *   keep-shorthands      (keep, accept, accept-shorthands)
     *   expand-to-longhands  (expand, flatten, flatten-shorthands)
     *   reject-shorthands    (reject, forbid, forbid-shorthands)
     */
    [[nodiscard]] static CompileResult<std::unique_ptr<ShorthandStrategy>> create(
        const ShorthandSelection& selection);
};

// Shorthands kept as written; legacy aliases and a few splitting shorthands
// are rewritten to the properties browsers understand
class KeepShorthands : public ShorthandStrategy {
public:
    [[nodiscard]] std::string_view name() const override { return "keep-shorthands"; }

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand(
        const String& property, const StyleValue& value) const override;

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand_conditions(
        const String& property, const StyleValue& conditions) const override;
};

// Multi-value shorthands become one declaration per longhand
class ExpandToLonghands : public ShorthandStrategy {
public:
    [[nodiscard]] std::string_view name() const override { return "expand-to-longhands"; }

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand(
        const String& property, const StyleValue& value) const override;

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand_conditions(
        const String& property, const StyleValue& conditions) const override;
};

// Ambiguous shorthands (border, background, font, ...) are compile errors
class RejectShorthands : public ShorthandStrategy {
public:
    [[nodiscard]] std::string_view name() const override { return "reject-shorthands"; }

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand(
        const String& property, const StyleValue& value) const override;

    [[nodiscard]] CompileResult<std::vector<StyleDeclaration>> expand_conditions(
        const String& property, const StyleValue& conditions) const override;
};

} // namespace facet::style
