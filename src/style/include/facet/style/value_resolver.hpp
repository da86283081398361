#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/style_value.hpp"
#include <vector>

namespace facet::style {

// ============================================================================
// Leaf value resolution
// ============================================================================

struct ResolvedValue {
    // Text fed to the class-name hash
    String hash_value;

    // Declaration values in emission order; more than one means
    // "prop:v1;prop:v2" inside a single rule
    std::vector<String> declarations;
};

/**
 * Resolves a leaf (Scalar, Number, Fallback or FirstThatWorks) for a CSS
 * property into normalized declaration text.
 *
 * Fallback arrays nest variables around the plain values that precede them:
 *
 *   ["red", "var(--c)"]  -> "var(--c,red)"
 *   ["var(--c)", "red"]  -> "var(--c)", "red"
 *
 * firstThatWorks lists read in reverse and nest every variable tried before
 * a plain value:
 *
 *   firstThatWorks("sticky", "fixed")          -> "fixed", "sticky"
 *   firstThatWorks("var(--a)", "var(--b)", "red") -> "var(--a,var(--b,red))"
 */
[[nodiscard]] CompileResult<ResolvedValue> resolve_value(const String& property,
                                                         const StyleValue& leaf,
                                                         const CompilerConfig& config);

// Single leaf to CSS text ("10" -> "10px" for width), no fallback handling
[[nodiscard]] CompileResult<String> leaf_to_css(const String& property,
                                                const StyleValue& leaf,
                                                const CompilerConfig& config);

/**
 * Nests a value list into one expression. The first entry is the innermost
 * fallback; each later var() wraps everything before it and later plain
 * values are ignored:
 *
 *   ["red", "var(--b)", "var(--a)"] -> "var(--a,var(--b,red))"
 */
[[nodiscard]] String compose_vars(const std::vector<String>& values);

// Fallback array transform over normalized values
[[nodiscard]] std::vector<String> variable_fallbacks(const std::vector<String>& values);

// firstThatWorks transform over normalized values
[[nodiscard]] std::vector<String> first_that_works(const std::vector<String>& values);

} // namespace facet::style
