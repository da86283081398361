#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/css/rtl.hpp"
#include "facet/style/style_value.hpp"
#include <map>
#include <vector>

namespace facet::style {

// ============================================================================
// Inputs
// ============================================================================

// A keyed declaration list: one keyframe ("from", "50%") or one view
// transition pseudo-element ("old", "group")
struct DeclarationBlock {
    String key;
    std::vector<StyleDeclaration> declarations;
};

// ============================================================================
// Keyframes
// ============================================================================

struct Keyframe {
    String key;
    f64 position{0};  // 0 for "from", 100 for "to"
    std::vector<css::Declaration> declarations;

    [[nodiscard]] bool operator==(const Keyframe& other) const = default;
};

struct KeyframesEntry {
    String css_name;              // prefix + hash + "-B"
    std::vector<Keyframe> frames; // Ascending position

    [[nodiscard]] bool operator==(const KeyframesEntry& other) const = default;
};

// Position of a frame key ("from" -> 0, "to" -> 100, "25%, 75%" -> 25)
[[nodiscard]] CompileResult<f64> keyframe_position(const String& key);

[[nodiscard]] CompileResult<KeyframesEntry> compile_keyframes(
    const CompilerConfig& config, const std::vector<DeclarationBlock>& frames);

// "@keyframes name{from{...}to{...}}", plus an html[dir="rtl"] copy when
// a frame is direction dependent
[[nodiscard]] String keyframes_css(const KeyframesEntry& entry);

// ============================================================================
// @position-try
// ============================================================================

struct PositionTryEntry {
    String css_name;                              // "--" + prefix + hash
    std::vector<css::Declaration> declarations;   // Sorted by property

    [[nodiscard]] bool operator==(const PositionTryEntry& other) const = default;
};

/**
 * Compiles a position fallback. Only anchor positioning properties (insets,
 * margins, sizes, self-alignment, position-anchor, position-area) are
 * allowed; numbers get "px".
 */
[[nodiscard]] CompileResult<PositionTryEntry> compile_position_try(
    const CompilerConfig& config, const std::vector<StyleDeclaration>& declarations);

[[nodiscard]] String position_try_css(const PositionTryEntry& entry);

// ============================================================================
// View transitions
// ============================================================================

struct ViewTransitionStyle {
    String pseudo;                                // "group", "image-pair", "old", "new"
    bool only_child{false};                       // Adds ":only-child" to the pseudo-element
    std::vector<css::Declaration> declarations;   // Sorted by property

    [[nodiscard]] bool operator==(const ViewTransitionStyle& other) const = default;
};

struct ViewTransitionEntry {
    String css_name;
    std::vector<ViewTransitionStyle> styles;  // group, image-pair, old, new, then their only-child forms

    [[nodiscard]] bool operator==(const ViewTransitionEntry& other) const = default;
};

/**
 * Keys are "group", "image-pair", "old" and "new", each optionally suffixed
 * with "-only-child" ("old_only_child" and ":old" are accepted too).
 */
[[nodiscard]] CompileResult<ViewTransitionEntry> compile_view_transition(
    const CompilerConfig& config, const std::vector<DeclarationBlock>& styles);

// "::view-transition-old(*.x...){...}::view-transition-new(*.x...):only-child{...}"
[[nodiscard]] String view_transition_css(const ViewTransitionEntry& entry);

} // namespace facet::style
