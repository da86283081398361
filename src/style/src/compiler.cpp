/**
 * Build context and compiler facade
 */

#include "facet/style/compiler.hpp"
#include "facet/style/assembler.hpp"
#include "facet/core/logger.hpp"

namespace facet::style {

namespace {

Logger& compiler_log() {
    static Logger& log = logging::get("facet.style");
    return log;
}

// "<key>" or "<key>.<inner context>"
CompileError in_context(CompileError error, const String& key) {
    String context = error.context.empty() ? key : key + "."_s + error.context;
    return error.with_context(std::move(context));
}

} // anonymous namespace

// ============================================================================
// BuildContext
// ============================================================================

BuildContext::BuildContext(PrivateTag, CompilerConfig config, std::unique_ptr<ShorthandStrategy> strategy)
    : m_config(std::move(config)), m_strategy(std::move(strategy)) {}

CompileResult<std::unique_ptr<BuildContext>> BuildContext::create(CompilerConfig config) {
    auto strategy = ShorthandStrategy::create(config.shorthand);
    if (!strategy) {
        return make_error(std::move(strategy).error());
    }
    compiler_log().debug_fmt("BuildContext::create: prefix '{}', shorthand strategy {}",
                             config.class_name_prefix, strategy.value()->name());
    return std::make_unique<BuildContext>(PrivateTag{}, std::move(config), std::move(strategy).value());
}

void BuildContext::reset() {
    m_manifest.clear();
    m_diagnostics.clear();
}

// ============================================================================
// Compiler
// ============================================================================

CompileError Compiler::record(CompileError error) {
    m_context.diagnostics().add_error(DiagnosticStage::Compiler, error);
    return error;
}

CompileResult<RuleDeclaration> Compiler::resolve_includes(const String& module,
                                                          const RuleDeclaration& rule) const {
    if (rule.includes.empty()) {
        return rule;
    }

    RuleDeclaration resolved = rule;
    resolved.includes.clear();
    resolved.declarations.clear();
    for (const auto& include : rule.includes) {
        const ClassRule* included = m_context.manifest().find_class(module + "."_s + include);
        if (!included) {
            included = m_context.manifest().find_class(include);
        }
        if (!included) {
            return make_error(CompileError(ErrorKind::UnknownReference,
                                           "Cannot include '"_s + include + "': rule not found"_s,
                                           "Included rules must be compiled before the rule including them"_s));
        }
        // Compile merges repeated properties, last one wins
        resolved.declarations.insert(resolved.declarations.end(),
                                     included->declarations.begin(), included->declarations.end());
    }
    resolved.declarations.insert(resolved.declarations.end(),
                                 rule.declarations.begin(), rule.declarations.end());
    compiler_log().debug_fmt("Compiler::resolve_includes: {}.{} includes {} rules",
                             module, rule.name, rule.includes.size());
    return resolved;
}

CompileResult<String> Compiler::compile_rule(const String& module, const RuleDeclaration& rule) {
    String key = module + "."_s + rule.name;

    auto resolved = resolve_includes(module, rule);
    if (!resolved) {
        return make_error(record(in_context(std::move(resolved).error(), key)));
    }

    AtomicClassCompiler compiler(m_context.config(), m_context.strategy());
    auto compiled = compiler.compile(resolved.value());
    if (!compiled) {
        return make_error(record(in_context(std::move(compiled).error(), key)));
    }

    String class_string = compiled.value().class_string;
    compiler_log().debug_fmt("Compiler::compile_rule: {} -> \"{}\"", key, class_string);
    m_context.manifest().put_class(std::move(key), std::move(compiled).value());
    return class_string;
}

Result<void, CompileError> Compiler::define_vars(const String& module,
                                                 const String& ns,
                                                 const std::vector<VarDefinition>& vars) {
    VarsThemeEngine engine(m_context.manifest());
    auto result = engine.define_vars(module, ns, vars);
    if (!result) {
        return make_error(record(std::move(result).error()));
    }
    return {};
}

void Compiler::define_consts(const String& module,
                             const String& ns,
                             const std::vector<VarDefinition>& consts) {
    VarsThemeEngine engine(m_context.manifest());
    engine.define_consts(module, ns, consts);
}

CompileResult<String> Compiler::create_theme(const String& module,
                                             const String& name,
                                             const String& base_group,
                                             const std::vector<VarDefinition>& overrides) {
    VarsThemeEngine engine(m_context.manifest());
    auto result = engine.create_theme(module, name, base_group, overrides);
    if (!result) {
        return make_error(record(std::move(result).error()));
    }
    return result;
}

CompileResult<String> Compiler::define_keyframes(const String& module,
                                                 const String& name,
                                                 const std::vector<DeclarationBlock>& frames) {
    String key = module + "."_s + name;
    auto entry = compile_keyframes(m_context.config(), frames);
    if (!entry) {
        return make_error(record(in_context(std::move(entry).error(), key)));
    }

    String css_name = entry.value().css_name;
    compiler_log().debug_fmt("Compiler::define_keyframes: {} -> {}", key, css_name);
    m_context.manifest().put_keyframes(std::move(key), std::move(entry).value());
    return css_name;
}

CompileResult<String> Compiler::define_position_try(const String& module,
                                                    const String& name,
                                                    const std::vector<StyleDeclaration>& declarations) {
    String key = module + "."_s + name;
    auto entry = compile_position_try(m_context.config(), declarations);
    if (!entry) {
        return make_error(record(in_context(std::move(entry).error(), key)));
    }

    String css_name = entry.value().css_name;
    compiler_log().debug_fmt("Compiler::define_position_try: {} -> {}", key, css_name);
    m_context.manifest().put_position_try(std::move(key), std::move(entry).value());
    return css_name;
}

CompileResult<String> Compiler::define_view_transition(const String& module,
                                                       const String& name,
                                                       const std::vector<DeclarationBlock>& styles) {
    String key = module + "."_s + name;
    auto entry = compile_view_transition(m_context.config(), styles);
    if (!entry) {
        return make_error(record(in_context(std::move(entry).error(), key)));
    }

    String css_name = entry.value().css_name;
    compiler_log().debug_fmt("Compiler::define_view_transition: {} -> {}", key, css_name);
    m_context.manifest().put_view_transition(std::move(key), std::move(entry).value());
    return css_name;
}

CompileResult<String> Compiler::var_reference(const String& module,
                                              const String& ns,
                                              const String& name) const {
    VarsThemeEngine engine(m_context.manifest());
    return engine.var_reference(module, ns, name);
}

String Compiler::stylesheet() const {
    CSSAssembler assembler(m_context.config());
    return assembler.assemble(m_context.manifest());
}

} // namespace facet::style
