/**
 * Atomic class compilation: declarations to hashed single-property rules
 */

#include "facet/style/atomic_class.hpp"
#include "facet/style/shorthand.hpp"
#include "facet/css/hash.hpp"
#include "facet/css/priority.hpp"
#include "facet/css/property.hpp"
#include "facet/css/pseudo.hpp"
#include "facet/css/rtl.hpp"
#include "facet/css/selector.hpp"
#include "facet/css/value.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>

namespace facet::style {

namespace {

Logger& style_log() {
    static Logger& log = logging::get("facet.style");
    return log;
}

CompileError legacy_syntax_error(const String& key) {
    if (key.starts_with("@"_s)) {
        return CompileError(
            ErrorKind::LegacySyntax,
            "Legacy at-rule object syntax is not supported. Nest at-rules under properties instead"_s,
            "e.g. color: { \"default\": ..., \"@media (...)\": ... }"_s);
    }
    return CompileError(
        ErrorKind::LegacySyntax,
        "Legacy pseudo-class object syntax is not supported. Nest pseudo-classes under properties instead"_s,
        "e.g. color: { \"default\": ..., \":hover\": ... }"_s);
}

// Names between braces in a dynamic value template
std::vector<String> template_placeholders(const String& text) {
    std::vector<String> names;
    usize pos = 0;
    while (auto open = text.find('{', pos)) {
        auto close = text.find('}', *open + 1);
        if (!close) {
            break;
        }
        names.push_back(text.substring(*open + 1, *close - *open - 1).trim());
        pos = *close + 1;
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// PropertyClasses
// ============================================================================

String PropertyClasses::class_string() const {
    std::vector<String> names;
    for (const auto& meta : classes) {
        names.push_back(meta.class_name);
    }
    return join(names, " ");
}

// ============================================================================
// Declaration merging
// ============================================================================

void merge_declaration(std::vector<StyleDeclaration>& body, StyleDeclaration declaration) {
    auto existing = std::find_if(body.begin(), body.end(), [&](const StyleDeclaration& d) {
        return d.property == declaration.property;
    });
    if (existing == body.end()) {
        body.push_back(std::move(declaration));
        return;
    }

    const StyleValue& old_value = existing->value;
    const StyleValue& new_value = declaration.value;
    bool old_conditional = old_value.is_condition_map();
    bool new_conditional = new_value.is_condition_map();

    if (old_conditional && new_conditional) {
        std::vector<String> keys = old_value.keys();
        std::vector<StyleValue> values = old_value.items();
        for (usize i = 0; i < new_value.keys().size(); ++i) {
            auto it = std::find(keys.begin(), keys.end(), new_value.keys()[i]);
            if (it == keys.end()) {
                keys.push_back(new_value.keys()[i]);
                values.push_back(new_value.items()[i]);
            } else {
                values[static_cast<usize>(it - keys.begin())] = new_value.items()[i];
            }
        }
        existing->value = StyleValue::conditional(std::move(keys), std::move(values));
    } else if (old_conditional) {
        std::vector<String> keys = old_value.keys();
        std::vector<StyleValue> values = old_value.items();
        auto it = std::find(keys.begin(), keys.end(), "default"_s);
        if (it == keys.end()) {
            keys.insert(keys.begin(), "default"_s);
            values.insert(values.begin(), new_value);
        } else {
            values[static_cast<usize>(it - keys.begin())] = new_value;
        }
        existing->value = StyleValue::conditional(std::move(keys), std::move(values));
    } else if (new_conditional) {
        if (new_value.find("default"_s)) {
            existing->value = new_value;
        } else {
            std::vector<String> keys = new_value.keys();
            std::vector<StyleValue> values = new_value.items();
            keys.insert(keys.begin(), "default"_s);
            values.insert(values.begin(), old_value);
            existing->value = StyleValue::conditional(std::move(keys), std::move(values));
        }
    } else {
        existing->value = std::move(declaration.value);
    }
}

// ============================================================================
// AtomicClassCompiler
// ============================================================================

AtomicClassCompiler::AtomicClassCompiler(const CompilerConfig& config,
                                         const ShorthandStrategy& strategy)
    : m_config(config), m_strategy(strategy) {}

AtomicClassMeta AtomicClassCompiler::build(const String& property,
                                           const ResolvedValue& value,
                                           const ConditionPath& path) const {
    AtomicClassMeta meta;
    meta.class_name = css::atomic_class_name(m_config, property, value.hash_value,
                                             path.pseudos, path.at_rules);
    meta.condition = path.key();
    meta.property = property;
    meta.value = value.declarations.front();
    meta.priority = css::calculate_priority(property, path.pseudos, path.at_rules);

    String selector = css::atomic_selector(m_config, meta.class_name, path.pseudos,
                                           !path.at_rules.empty());

    std::vector<String> declarations;
    for (const auto& text : value.declarations) {
        auto ltr = css::to_ltr(property, text);
        declarations.push_back(ltr.property + ":"_s + ltr.value);
    }
    meta.ltr = css::wrap_at_rules(selector + "{"_s + join(declarations, ";") + "}"_s,
                                  path.at_rules);

    if (value.declarations.size() == 1) {
        if (auto rtl = css::to_rtl(property, meta.value)) {
            String rule = css::prefix_rtl(selector) + "{"_s + rtl->property + ":"_s +
                          rtl->value + "}"_s;
            meta.rtl = css::wrap_at_rules(rule, path.at_rules);
        }
    }
    return meta;
}

Result<void, CompileError> AtomicClassCompiler::compile_property(
    const String& property,
    const StyleValue& value,
    const std::vector<String>& outer_pseudos,
    std::map<String, PropertyClasses>& out) const {
    auto expanded = value.kind() == ValueKind::Conditional
                        ? m_strategy.expand_conditions(property, value)
                        : m_strategy.expand(property, value);
    if (!expanded) {
        return make_error(std::move(expanded).error());
    }

    for (const auto& [longhand, longhand_value] : expanded.value()) {
        String key = longhand + join(outer_pseudos, "");

        if (longhand_value.is_null()) {
            out[key] = PropertyClasses::make_unset();
            continue;
        }

        auto flat = flatten_conditions(longhand_value);
        if (!flat) {
            return make_error(std::move(flat).error());
        }

        PropertyClasses classes;
        for (auto& [path, leaf] : flat.value()) {
            if (leaf.is_null()) {
                continue;
            }
            auto resolved = resolve_value(longhand, leaf, m_config);
            if (!resolved) {
                return make_error(std::move(resolved).error());
            }

            ConditionPath full = path;
            full.pseudos.insert(full.pseudos.begin(), outer_pseudos.begin(), outer_pseudos.end());
            classes.classes.push_back(build(longhand, resolved.value(), full));
        }

        std::stable_sort(classes.classes.begin(), classes.classes.end(),
                         [](const AtomicClassMeta& a, const AtomicClassMeta& b) {
                             return a.priority < b.priority;
                         });
        out[key] = classes.classes.empty() ? PropertyClasses::make_unset() : std::move(classes);
    }
    return {};
}

Result<void, CompileError> AtomicClassCompiler::compile_pseudo_element(
    const String& element,
    const StyleValue& block,
    std::map<String, PropertyClasses>& out) const {
    if (block.kind() != ValueKind::Conditional) {
        StringBuilder message;
        message.append_format("Pseudo-element block '{}' must map properties to values", element);
        return make_error(CompileError(ErrorKind::InvalidValue, message.build()));
    }

    std::vector<String> outer = css::split_pseudos(element);
    for (usize i = 0; i < block.keys().size(); ++i) {
        const String& key = block.keys()[i];
        if (key.starts_with(":"_s) || key.starts_with("@"_s)) {
            return make_error(legacy_syntax_error(key));
        }
        auto result = compile_property(css::to_css_property(key), block.items()[i], outer, out);
        if (!result) {
            return result;
        }
    }
    return {};
}

Result<void, CompileError> AtomicClassCompiler::compile_dynamic(const RuleDeclaration& rule,
                                                                ClassRule& out) const {
    for (const auto& decl : rule.dynamic_declarations) {
        String property = css::to_css_property(decl.property);

        String value_template;
        if (decl.value.is_scalar()) {
            value_template = decl.value.text();
        } else if (decl.value.is_number()) {
            value_template = css::format_number(decl.value.number());
        } else {
            StringBuilder message;
            message.append_format("Dynamic value for '{}' must be a string template", property);
            return make_error(CompileError(ErrorKind::InvalidValue, message.build()));
        }

        for (const auto& name : template_placeholders(value_template)) {
            if (std::find(rule.params.begin(), rule.params.end(), name) == rule.params.end()) {
                StringBuilder message;
                message.append_format("Unknown parameter '{}' in dynamic value for '{}'", name,
                                      property);
                return make_error(CompileError(ErrorKind::UnknownReference, message.build()));
            }
        }

        String css_var = css::dynamic_var_name(m_config, property);
        ResolvedValue resolved;
        resolved.hash_value = "var("_s + css_var + ")"_s;
        resolved.declarations.push_back(resolved.hash_value);

        PropertyClasses classes;
        classes.classes.push_back(build(property, resolved, ConditionPath{}));
        out.atomic_classes[property] = std::move(classes);
        out.dynamic_declarations.push_back(DynamicDeclaration{property, css_var, value_template});
    }
    return {};
}

CompileResult<std::map<String, PropertyClasses>> AtomicClassCompiler::compile_declaration(
    const String& property, const StyleValue& value) const {
    std::map<String, PropertyClasses> out;
    if (auto result = compile_property(css::to_css_property(property), value, {}, out); !result) {
        return make_error(std::move(result).error());
    }
    return out;
}

CompileResult<ClassRule> AtomicClassCompiler::compile(const RuleDeclaration& rule) const {
    std::vector<StyleDeclaration> body;
    std::vector<const StyleDeclaration*> elements;

    for (const auto& decl : rule.declarations) {
        if (css::is_pseudo_element(decl.property)) {
            elements.push_back(&decl);
        } else if (decl.property.starts_with(":"_s) || decl.property.starts_with("@"_s)) {
            return make_error(legacy_syntax_error(decl.property));
        } else {
            merge_declaration(body, StyleDeclaration{css::to_css_property(decl.property), decl.value});
        }
    }

    ClassRule out;
    for (const auto& decl : body) {
        if (auto result = compile_property(decl.property, decl.value, {}, out.atomic_classes); !result) {
            return make_error(std::move(result).error().with_context(decl.property));
        }
    }
    for (const auto* element : elements) {
        if (auto result = compile_pseudo_element(element->property, element->value, out.atomic_classes);
            !result) {
            return make_error(std::move(result).error().with_context(element->property));
        }
    }

    out.declarations = rule.declarations;
    out.param_names = rule.params;
    out.dynamic = !rule.params.empty() || !rule.dynamic_declarations.empty();
    if (auto result = compile_dynamic(rule, out); !result) {
        return make_error(std::move(result).error());
    }

    std::vector<String> names;
    for (const auto& [key, classes] : out.atomic_classes) {
        for (const auto& meta : classes.classes) {
            names.push_back(meta.class_name);
        }
    }
    out.class_string = join(names, " ");

    style_log().debug_fmt("AtomicClassCompiler::compile: {} -> {} properties, {} classes",
                          rule.name, out.atomic_classes.size(), names.size());
    return out;
}

} // namespace facet::style
