/**
 * CSS variables, constants and themes
 */

#include "facet/style/vars.hpp"
#include "facet/style/condition.hpp"
#include "facet/style/manifest.hpp"
#include "facet/css/hash.hpp"
#include "facet/css/value.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>
#include <utility>

namespace facet::style {

namespace {

Logger& vars_log() {
    static Logger& log = logging::get("facet.style");
    return log;
}

CompileResult<String> var_leaf_text(const String& name, const StyleValue& leaf) {
    if (leaf.is_scalar()) {
        return leaf.text().trim();
    }
    if (leaf.is_number()) {
        return css::format_number(leaf.number());
    }
    StringBuilder message;
    message.append_format("Value of variable '{}' must be a string, number or condition map", name);
    return make_error(CompileError(ErrorKind::InvalidValue, message.build()));
}

// Declarations of one variable per at-rule path
CompileResult<std::vector<VarValue>> flatten_var(const String& name, const StyleValue& value) {
    std::vector<VarValue> values;
    if (value.is_null()) {
        return values;
    }

    if (value.kind() != ValueKind::Conditional) {
        auto text = var_leaf_text(name, value);
        if (!text) {
            return make_error(std::move(text).error());
        }
        values.push_back(VarValue{{}, std::move(text).value()});
        return values;
    }

    auto flat = flatten_conditions(value, ConditionScope::Variable);
    if (!flat) {
        return make_error(std::move(flat).error());
    }
    for (const auto& [path, leaf] : flat.value()) {
        if (leaf.is_null()) {
            continue;
        }
        auto text = var_leaf_text(name, leaf);
        if (!text) {
            return make_error(std::move(text).error());
        }
        values.push_back(VarValue{path.at_rules, std::move(text).value()});
    }
    return values;
}

// The "default" branch, or the first branch when there is none
CompileResult<String> initial_value(const String& name, const StyleValue& value) {
    if (value.kind() != ValueKind::Conditional) {
        return var_leaf_text(name, value);
    }
    if (value.items().empty()) {
        StringBuilder message;
        message.append_format("Typed variable '{}' has no value", name);
        return make_error(CompileError(ErrorKind::InvalidValue, message.build()));
    }
    const StyleValue* branch = value.find("default"_s);
    return initial_value(name, branch ? *branch : value.items().front());
}

using GroupedDeclarations = std::map<std::vector<String>, std::vector<std::pair<String, String>>>;

// The innermost declared at-rule ends up as the outermost wrapper
String wrap_declared(String rule, const std::vector<String>& at_rules) {
    for (const auto& at_rule : at_rules) {
        rule = at_rule + "{"_s + rule + "}"_s;
    }
    return rule;
}

// One block per at-rule path: unconditional first, then by depth
void emit_groups(const String& selector, GroupedDeclarations groups, std::vector<String>& out) {
    std::vector<std::pair<std::vector<String>, std::vector<std::pair<String, String>>>> ordered(
        groups.begin(), groups.end());
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.first.size() < b.first.size();
    });

    for (auto& [at_rules, declarations] : ordered) {
        std::stable_sort(declarations.begin(), declarations.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        StringBuilder block;
        block.append(selector);
        block.append('{');
        for (const auto& [name, text] : declarations) {
            block.append_format("{}:{};", name, text);
        }
        block.append('}');
        out.push_back(wrap_declared(block.build(), at_rules));
    }
}

} // anonymous namespace

String var_key(const String& module, const String& ns, const String& name) {
    return module + "."_s + ns + "."_s + name;
}

// ============================================================================
// VarsThemeEngine
// ============================================================================

Result<void, CompileError> VarsThemeEngine::define_vars(const String& module,
                                                        const String& ns,
                                                        const std::vector<VarDefinition>& vars) {
    String group = module + "."_s + ns;
    std::vector<std::pair<String, VarEntry>> entries;

    for (const auto& def : vars) {
        VarEntry entry;
        entry.css_name = css::var_name(group, def.name);
        entry.value = def.value.untyped();

        if (def.value.is_typed()) {
            auto initial = initial_value(def.name, entry.value);
            if (!initial) {
                return make_error(std::move(initial).error().with_context(group + "."_s + def.name));
            }
            entry.type = VarType{def.value.syntax(), def.value.inherits(), std::move(initial).value()};
        }

        auto values = flatten_var(def.name, entry.value);
        if (!values) {
            return make_error(std::move(values).error().with_context(group + "."_s + def.name));
        }
        entry.values = std::move(values).value();
        entries.emplace_back(var_key(module, ns, def.name), std::move(entry));
    }

    for (auto& [key, entry] : entries) {
        vars_log().debug_fmt("VarsThemeEngine::define_vars: {} -> {}", key, entry.css_name);
        m_manifest.put_var(std::move(key), std::move(entry));
    }
    return {};
}

void VarsThemeEngine::define_consts(const String& module,
                                    const String& ns,
                                    const std::vector<VarDefinition>& consts) {
    for (const auto& def : consts) {
        m_manifest.put_const(var_key(module, ns, def.name), ConstEntry{def.value});
    }
    vars_log().debug_fmt("VarsThemeEngine::define_consts: {}.{} ({} constants)", module, ns,
                         consts.size());
}

CompileResult<String> VarsThemeEngine::create_theme(const String& module,
                                                    const String& name,
                                                    const String& base_group,
                                                    const std::vector<VarDefinition>& overrides) {
    String theme_key = module + "."_s + name;

    ThemeEntry entry;
    entry.css_name = css::theme_class_name(module, name);

    for (const auto& override_def : overrides) {
        const VarEntry* var = m_manifest.find_var(base_group + "."_s + override_def.name);
        if (!var) {
            StringBuilder message;
            message.append_format("Unknown variable '{}' in theme '{}'", override_def.name, theme_key);
            StringBuilder hint;
            hint.append_format("Theme overrides must name variables defined in {}", base_group);
            return make_error(CompileError(ErrorKind::UnknownReference, message.build(), hint.build())
                                  .with_context(theme_key));
        }

        auto values = flatten_var(override_def.name, override_def.value.untyped());
        if (!values) {
            return make_error(std::move(values).error().with_context(theme_key));
        }
        entry.overrides[var->css_name] = std::move(values).value();
    }

    String css_name = entry.css_name;
    vars_log().debug_fmt("VarsThemeEngine::create_theme: {} -> {} ({} overrides)", theme_key,
                         css_name, entry.overrides.size());
    m_manifest.put_theme(theme_key, std::move(entry));
    return css_name;
}

CompileResult<String> VarsThemeEngine::var_reference(const String& module,
                                                     const String& ns,
                                                     const String& name) const {
    String key = var_key(module, ns, name);
    const VarEntry* var = m_manifest.find_var(key);
    if (!var) {
        StringBuilder message;
        message.append_format("Unknown variable '{}'", key);
        return make_error(CompileError(ErrorKind::UnknownReference, message.build()));
    }
    return "var("_s + var->css_name + ")"_s;
}

CompileResult<StyleValue> VarsThemeEngine::const_value(const String& module,
                                                       const String& ns,
                                                       const String& name) const {
    String key = var_key(module, ns, name);
    const ConstEntry* entry = m_manifest.find_const(key);
    if (!entry) {
        StringBuilder message;
        message.append_format("Unknown constant '{}'", key);
        return make_error(CompileError(ErrorKind::UnknownReference, message.build()));
    }
    return entry->value;
}

// ============================================================================
// CSS output
// ============================================================================

String generate_var_rules(const std::map<String, VarEntry>& vars) {
    GroupedDeclarations groups;
    for (const auto& [key, entry] : vars) {
        for (const auto& value : entry.values) {
            groups[value.at_rules].emplace_back(entry.css_name, value.text);
        }
    }

    std::vector<String> blocks;
    emit_groups(":root"_s, std::move(groups), blocks);
    return join(blocks, "\n");
}

String generate_property_rules(const std::map<String, VarEntry>& vars) {
    std::vector<String> rules;
    for (const auto& [key, entry] : vars) {
        if (!entry.type) {
            continue;
        }
        StringBuilder sb;
        sb.append_format("@property {} {{ syntax: \"{}\"; inherits: {}; initial-value: {} }}",
                         entry.css_name, entry.type->syntax,
                         entry.type->inherits ? "true" : "false", entry.type->initial_value);
        rules.push_back(sb.build());
    }
    return join(rules, "\n");
}

String generate_theme_rules(const std::map<String, ThemeEntry>& themes) {
    std::vector<const ThemeEntry*> ordered;
    for (const auto& [key, entry] : themes) {
        ordered.push_back(&entry);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const ThemeEntry* a, const ThemeEntry* b) {
        return a->css_name < b->css_name;
    });

    std::vector<String> blocks;
    for (const auto* theme : ordered) {
        GroupedDeclarations groups;
        for (const auto& [css_name, values] : theme->overrides) {
            for (const auto& value : values) {
                groups[value.at_rules].emplace_back(css_name, value.text);
            }
        }
        emit_groups("."_s + theme->css_name + ",."_s + theme->css_name + ":root"_s,
                    std::move(groups), blocks);
    }
    return join(blocks, "\n");
}

} // namespace facet::style
