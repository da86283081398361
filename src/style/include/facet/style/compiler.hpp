#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/atomic_class.hpp"
#include "facet/style/manifest.hpp"
#include "facet/style/shorthand.hpp"
#include "facet/style/structural.hpp"
#include "facet/style/style_resolver.hpp"
#include "facet/style/vars.hpp"
#include <memory>
#include <vector>

namespace facet::style {

// ============================================================================
// BuildContext - state of one build
// ============================================================================

/**
 * Owns the configuration, the selected shorthand strategy, the manifest and
 * the diagnostics of a build. Nothing else in the engine keeps state.
 */
class BuildContext {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Fails when the shorthand selection names no known strategy
    [[nodiscard]] static CompileResult<std::unique_ptr<BuildContext>> create(CompilerConfig config);

    // Only reachable through create()
    BuildContext(PrivateTag, CompilerConfig config, std::unique_ptr<ShorthandStrategy> strategy);

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    [[nodiscard]] const CompilerConfig& config() const { return m_config; }
    [[nodiscard]] const ShorthandStrategy& strategy() const { return *m_strategy; }

    [[nodiscard]] Manifest& manifest() { return m_manifest; }
    [[nodiscard]] const Manifest& manifest() const { return m_manifest; }

    [[nodiscard]] DiagnosticSink& diagnostics() { return m_diagnostics; }
    [[nodiscard]] const DiagnosticSink& diagnostics() const { return m_diagnostics; }

    // Clears manifest and diagnostics, keeping configuration and strategy
    void reset();

private:
    CompilerConfig m_config;
    std::unique_ptr<ShorthandStrategy> m_strategy;
    Manifest m_manifest;
    DiagnosticSink m_diagnostics;
};

// ============================================================================
// Compiler - registers declarations of one build
// ============================================================================

/**
 * Entry point for compiling declarations into a BuildContext.
 *
 * Every definition is keyed by its module id. Failures are returned and
 * also recorded in the context's diagnostics; a failed definition leaves
 * the manifest unchanged.
 */
class Compiler {
public:
    explicit Compiler(BuildContext& context) : m_context(context) {}

    // Compiles a rule, stored as "<module>.<rule name>"; returns its class string.
    // Included rules are looked up in the manifest and merged ahead of the body.
    [[nodiscard]] CompileResult<String> compile_rule(const String& module, const RuleDeclaration& rule);

    [[nodiscard]] Result<void, CompileError> define_vars(const String& module,
                                                         const String& ns,
                                                         const std::vector<VarDefinition>& vars);

    void define_consts(const String& module, const String& ns, const std::vector<VarDefinition>& consts);

    // Returns the theme class name
    [[nodiscard]] CompileResult<String> create_theme(const String& module,
                                                     const String& name,
                                                     const String& base_group,
                                                     const std::vector<VarDefinition>& overrides);

    // Each returns the generated identifier
    [[nodiscard]] CompileResult<String> define_keyframes(const String& module,
                                                         const String& name,
                                                         const std::vector<DeclarationBlock>& frames);

    [[nodiscard]] CompileResult<String> define_position_try(const String& module,
                                                            const String& name,
                                                            const std::vector<StyleDeclaration>& declarations);

    [[nodiscard]] CompileResult<String> define_view_transition(const String& module,
                                                               const String& name,
                                                               const std::vector<DeclarationBlock>& styles);

    [[nodiscard]] CompileResult<String> var_reference(const String& module,
                                                      const String& ns,
                                                      const String& name) const;

    // Complete stylesheet of everything compiled so far
    [[nodiscard]] String stylesheet() const;

    [[nodiscard]] StyleResolver resolver() const { return StyleResolver(m_context.manifest()); }

private:
    CompileError record(CompileError error);

    CompileResult<RuleDeclaration> resolve_includes(const String& module, const RuleDeclaration& rule) const;

    BuildContext& m_context;
};

} // namespace facet::style
