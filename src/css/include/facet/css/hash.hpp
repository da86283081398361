#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include <string_view>
#include <vector>

namespace facet::css {

// ============================================================================
// Content hashing
// ============================================================================

// MurmurHash2 (32-bit) over the raw UTF-8 bytes, as used by StyleX
[[nodiscard]] u32 murmurhash2_32(std::string_view data, u32 seed = 1);

// Lower-case base-36 rendering of an unsigned value
[[nodiscard]] String to_base36(u32 value);

// base36(murmurhash2_32(input, 1))
[[nodiscard]] String create_hash(std::string_view input);

// ============================================================================
// Identifier builders
// ============================================================================

/**
 * Atomic class name for one (property, value, condition) triple.
 *
 * The hashed input is "<>" + property + value + modifier where the modifier
 * is the pseudos ordered by sort_pseudos followed by the sorted at-rules, or
 * "null" when the declaration is unconditional.
 */
[[nodiscard]] String atomic_class_name(const CompilerConfig& config,
                                       const String& property,
                                       const String& value,
                                       const std::vector<String>& pseudos,
                                       const std::vector<String>& at_rules);

// "--v" + hash("var:" + group + "." + name), group being "<module>.<namespace>"
[[nodiscard]] String var_name(const String& group, const String& name);

// "t" + hash("theme:" + group + "." + theme)
[[nodiscard]] String theme_class_name(const String& group, const String& theme);

// prefix + hash("<>" + frames) + "-B"
[[nodiscard]] String keyframes_name(const CompilerConfig& config, const String& frames);

// prefix + hash("marker:" + name)
[[nodiscard]] String marker_class_name(const CompilerConfig& config, const String& name);

// "--" + prefix + hash(declarations)
[[nodiscard]] String position_try_name(const CompilerConfig& config, const String& declarations);

// prefix + hash(css)
[[nodiscard]] String view_transition_class_name(const CompilerConfig& config, const String& css);

// "--" + prefix + "-" + property
[[nodiscard]] String dynamic_var_name(const CompilerConfig& config, const String& property);

} // namespace facet::css
