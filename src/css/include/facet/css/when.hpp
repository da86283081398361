#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"

namespace facet::css {

// ============================================================================
// Markers
// ============================================================================

// Class used only as the anchor of contextual selectors
struct Marker {
    String class_name;

    [[nodiscard]] bool operator==(const Marker& other) const = default;
};

// "<prefix>-default-marker"
[[nodiscard]] Marker default_marker(const CompilerConfig& config);

// "<prefix>" + hash("marker:" + name); equal names give equal markers
[[nodiscard]] Marker define_marker(const CompilerConfig& config, const String& name);

// ============================================================================
// Contextual selectors
// ============================================================================
//
// Each builder returns a ":where(...)" selector usable as a condition key.
// The pseudo must be a pseudo-class (":hover", ":focus-visible", ...).

// :where(.M:hover *)
[[nodiscard]] CompileResult<String> ancestor(const String& pseudo, const Marker& marker);

// :where(:has(.M:hover))
[[nodiscard]] CompileResult<String> descendant(const String& pseudo, const Marker& marker);

// :where(.M:hover ~ *)
[[nodiscard]] CompileResult<String> sibling_before(const String& pseudo, const Marker& marker);

// :where(:has(~ .M:hover))
[[nodiscard]] CompileResult<String> sibling_after(const String& pseudo, const Marker& marker);

// :where(.M:hover ~ *, :has(~ .M:hover))
[[nodiscard]] CompileResult<String> any_sibling(const String& pseudo, const Marker& marker);

// Same builders anchored on default_marker(config)
[[nodiscard]] CompileResult<String> ancestor(const String& pseudo, const CompilerConfig& config);
[[nodiscard]] CompileResult<String> descendant(const String& pseudo, const CompilerConfig& config);
[[nodiscard]] CompileResult<String> sibling_before(const String& pseudo, const CompilerConfig& config);
[[nodiscard]] CompileResult<String> sibling_after(const String& pseudo, const CompilerConfig& config);
[[nodiscard]] CompileResult<String> any_sibling(const String& pseudo, const CompilerConfig& config);

} // namespace facet::css
