#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/style/atomic_class.hpp"
#include <vector>

namespace facet::style {

class Manifest;

// ============================================================================
// CSSAssembler - manifest to stylesheet
// ============================================================================

/**
 * Emits the stylesheet for a manifest. Sections, separated by a blank line
 * and skipped when empty:
 *
 *   1. :root variable blocks
 *   2. @property rules (typed variables, then dynamic rule variables)
 *   3. theme blocks
 *   4. atomic rules, RTL overrides last
 *   5. @keyframes
 *   6. @position-try
 *   7. view transitions
 *
 * The output depends only on the manifest contents.
 */
class CSSAssembler {
public:
    explicit CSSAssembler(const CompilerConfig& config) : m_config(config) {}

    [[nodiscard]] String assemble(const Manifest& manifest) const;

    // Atomic rule section alone, flat or grouped into @layer blocks
    [[nodiscard]] String atomic_rules(const Manifest& manifest) const;

private:
    const CompilerConfig& m_config;
};

// Every atomic class of the manifest once, by ascending priority then class name
[[nodiscard]] std::vector<AtomicClassMeta> collect_atomic_classes(const Manifest& manifest);

// "@property --x-prop { syntax: \"*\"; inherits: false; }" for each dynamic variable
[[nodiscard]] String generate_dynamic_property_rules(const Manifest& manifest);

} // namespace facet::style
