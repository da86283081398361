#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/style_value.hpp"
#include "facet/style/condition.hpp"
#include "facet/style/value_resolver.hpp"
#include <map>
#include <optional>
#include <vector>

namespace facet::style {

class ShorthandStrategy;

// ============================================================================
// Compiled records
// ============================================================================

// One atomic rule: a single declaration under a single condition
struct AtomicClassMeta {
    String class_name;
    String condition{"default"};  // ConditionPath::key()
    String property;              // CSS property as declared
    String value;                 // First declaration value
    String ltr;                   // Complete rule text
    std::optional<String> rtl;    // html[dir="rtl"] override, if direction dependent
    i32 priority{0};

    [[nodiscard]] bool operator==(const AtomicClassMeta& other) const = default;
};

// All classes one property contributes to a rule. An unset property carries
// no classes and clears the property when rules are merged.
struct PropertyClasses {
    bool unset{false};
    std::vector<AtomicClassMeta> classes;  // Ascending priority

    [[nodiscard]] static PropertyClasses make_unset() {
        PropertyClasses p;
        p.unset = true;
        return p;
    }

    // Space separated class names, empty when unset
    [[nodiscard]] String class_string() const;

    [[nodiscard]] bool operator==(const PropertyClasses& other) const = default;
};

// A runtime-parametrized declaration: `property: var(css_var)`, with the
// variable set inline from `value_template` ("{w}", "{w} solid", ...)
struct DynamicDeclaration {
    String property;
    String css_var;
    String value_template;

    [[nodiscard]] bool operator==(const DynamicDeclaration& other) const = default;
};

struct ClassRule {
    // Keyed by CSS property, plus the pseudo-element for "::before" blocks
    std::map<String, PropertyClasses> atomic_classes;
    String class_string;
    bool dynamic{false};
    std::vector<String> param_names;
    std::vector<DynamicDeclaration> dynamic_declarations;

    // Static body with includes already resolved; what later includes merge
    std::vector<StyleDeclaration> declarations;

    [[nodiscard]] bool operator==(const ClassRule& other) const = default;
};

// ============================================================================
// Declarations
// ============================================================================

// A named rule body as handed over by the front end
struct RuleDeclaration {
    String name;
    std::vector<StyleDeclaration> declarations;

    // Dynamic rules: parameter names and per-property templates
    std::vector<String> params;
    std::vector<StyleDeclaration> dynamic_declarations;

    // Previously compiled rules whose bodies come first, in order. A bare
    // name refers to the same module, otherwise "<module>.<rule>".
    std::vector<String> includes;
};

/**
 * Merges a declaration into an ordered body, StyleX style:
 *
 * - plain over plain: last value wins
 * - condition map over condition map: keys are combined, later keys win
 * - plain over condition map: the plain value becomes "default"
 * - condition map over plain: the plain value becomes "default" unless the
 *   map declares its own
 */
void merge_declaration(std::vector<StyleDeclaration>& body, StyleDeclaration declaration);

// ============================================================================
// Atomic class compiler
// ============================================================================

class AtomicClassCompiler {
public:
    AtomicClassCompiler(const CompilerConfig& config, const ShorthandStrategy& strategy);

    [[nodiscard]] CompileResult<ClassRule> compile(const RuleDeclaration& rule) const;

    // The classes one (property, value) pair produces, before shorthand expansion
    [[nodiscard]] CompileResult<std::map<String, PropertyClasses>> compile_declaration(
        const String& property, const StyleValue& value) const;

    // One atomic rule for a resolved leaf under a condition path
    [[nodiscard]] AtomicClassMeta build(const String& property,
                                        const ResolvedValue& value,
                                        const ConditionPath& path) const;

private:
    Result<void, CompileError> compile_property(const String& property,
                                                const StyleValue& value,
                                                const std::vector<String>& outer_pseudos,
                                                std::map<String, PropertyClasses>& out) const;

    Result<void, CompileError> compile_pseudo_element(const String& element,
                                                      const StyleValue& block,
                                                      std::map<String, PropertyClasses>& out) const;

    Result<void, CompileError> compile_dynamic(const RuleDeclaration& rule, ClassRule& out) const;

    const CompilerConfig& m_config;
    const ShorthandStrategy& m_strategy;
};

} // namespace facet::style
