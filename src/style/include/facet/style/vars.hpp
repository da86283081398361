#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/style_value.hpp"
#include <map>
#include <optional>
#include <vector>

namespace facet::style {

class Manifest;

// ============================================================================
// Variable records
// ============================================================================

// @property registration for a typed variable
struct VarType {
    String syntax;           // "<color>", "<length>", "*", ...
    bool inherits{true};
    String initial_value;    // Default branch, or the scalar itself

    [[nodiscard]] bool operator==(const VarType& other) const = default;
};

// One declaration of a variable under the at-rules wrapping it
struct VarValue {
    std::vector<String> at_rules;  // As declared, outer to inner
    String text;

    [[nodiscard]] bool operator==(const VarValue& other) const = default;
};

struct VarEntry {
    String css_name;               // "--v<hash>"
    StyleValue value;              // As declared, without the type wrapper
    std::optional<VarType> type;
    std::vector<VarValue> values;  // Flattened for :root emission

    [[nodiscard]] bool operator==(const VarEntry& other) const = default;
};

// Compile-time constant, never emitted
struct ConstEntry {
    StyleValue value;

    [[nodiscard]] bool operator==(const ConstEntry& other) const = default;
};

struct ThemeEntry {
    String css_name;                                    // "t<hash>"
    std::map<String, std::vector<VarValue>> overrides;  // Keyed by variable css name

    [[nodiscard]] bool operator==(const ThemeEntry& other) const = default;
};

struct VarDefinition {
    String name;
    StyleValue value;
};

// "<module>.<namespace>.<name>"
[[nodiscard]] String var_key(const String& module, const String& ns, const String& name);

// ============================================================================
// Vars and themes
// ============================================================================

/**
 * Registers variables, constants and themes in a manifest.
 *
 * Variable values are condition maps restricted to "default" and at-rule
 * keys. A Typed value registers an @property rule whose initial value is the
 * default branch. Definitions are validated completely before anything is
 * stored, so a failing call leaves the manifest untouched.
 */
class VarsThemeEngine {
public:
    explicit VarsThemeEngine(Manifest& manifest) : m_manifest(manifest) {}

    [[nodiscard]] Result<void, CompileError> define_vars(const String& module,
                                                         const String& ns,
                                                         const std::vector<VarDefinition>& vars);

    void define_consts(const String& module,
                       const String& ns,
                       const std::vector<VarDefinition>& consts);

    /**
     * Creates a theme overriding variables of `base_group`
     * ("<module>.<namespace>" of a define_vars call).
     *
     * Overriding a variable the group does not define is an UnknownReference
     * error. Untouched variables keep their :root value.
     */
    [[nodiscard]] CompileResult<String> create_theme(const String& module,
                                                     const String& name,
                                                     const String& base_group,
                                                     const std::vector<VarDefinition>& overrides);

    // "var(--v...)" for a defined variable
    [[nodiscard]] CompileResult<String> var_reference(const String& module,
                                                      const String& ns,
                                                      const String& name) const;

    [[nodiscard]] CompileResult<StyleValue> const_value(const String& module,
                                                        const String& ns,
                                                        const String& name) const;

private:
    Manifest& m_manifest;
};

// ============================================================================
// CSS output
// ============================================================================

// ":root{...}" blocks grouped by at-rule path, unconditional block first
[[nodiscard]] String generate_var_rules(const std::map<String, VarEntry>& vars);

// "@property --v... { syntax: ...; inherits: ...; initial-value: ... }" per typed variable
[[nodiscard]] String generate_property_rules(const std::map<String, VarEntry>& vars);

// ".t...,.t...:root{...}" blocks, themes ordered by class name
[[nodiscard]] String generate_theme_rules(const std::map<String, ThemeEntry>& themes);

} // namespace facet::style
