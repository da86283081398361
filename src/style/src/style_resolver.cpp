/**
 * Runtime merging of compiled rules into class and style attributes
 */

#include "facet/style/style_resolver.hpp"
#include "facet/style/manifest.hpp"
#include "facet/css/property.hpp"
#include "facet/css/value.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>
#include <charconv>
#include <utility>

namespace facet::style {

namespace {

Logger& runtime_log() {
    static Logger& log = logging::get("facet.runtime");
    return log;
}

using KeyStore = std::vector<std::pair<String, String>>;

// Replaces the value in place, or appends a new key
void keystore(KeyStore& store, const String& key, String value) {
    auto it = std::find_if(store.begin(), store.end(),
                           [&](const auto& entry) { return entry.first == key; });
    if (it == store.end()) {
        store.emplace_back(key, std::move(value));
    } else {
        it->second = std::move(value);
    }
}

void keydelete(KeyStore& store, const String& key) {
    store.erase(std::remove_if(store.begin(), store.end(),
                               [&](const auto& entry) { return entry.first == key; }),
                store.end());
}

void flatten_refs(const std::vector<StyleRef>& refs, std::vector<const StyleRef*>& out) {
    for (const auto& ref : refs) {
        switch (ref.kind()) {
            case StyleRef::Kind::None:
                break;
            case StyleRef::Kind::List:
                flatten_refs(ref.children(), out);
                break;
            case StyleRef::Kind::Raw:
                if (!ref.text().empty()) {
                    out.push_back(&ref);
                }
                break;
            case StyleRef::Kind::Rule:
            case StyleRef::Kind::Dynamic:
                out.push_back(&ref);
                break;
        }
    }
}

bool is_plain_number(const String& text) {
    auto view = text.view();
    if (view.empty()) {
        return false;
    }
    f64 value = 0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    return ec == std::errc() && ptr == view.data() + view.size();
}

std::optional<String> argument_text(const StyleValue& arg) {
    if (arg.is_scalar()) {
        return arg.text();
    }
    if (arg.is_number()) {
        return css::format_number(arg.number());
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<String> fill_template(const String& property,
                                    const String& value_template,
                                    const std::vector<String>& param_names,
                                    const std::vector<StyleValue>& args) {
    StringBuilder sb;
    usize pos = 0;
    while (pos < value_template.size()) {
        auto open = value_template.find('{', pos);
        auto close = open ? value_template.find('}', *open + 1) : std::nullopt;
        if (!open || !close) {
            sb.append(value_template.substring(pos));
            break;
        }

        sb.append(value_template.substring(pos, *open - pos));
        String name = value_template.substring(*open + 1, *close - *open - 1).trim();
        auto param = std::find(param_names.begin(), param_names.end(), name);
        auto index = static_cast<usize>(param - param_names.begin());
        if (param == param_names.end() || index >= args.size()) {
            return std::nullopt;
        }
        auto text = argument_text(args[index]);
        if (!text) {
            return std::nullopt;
        }
        sb.append(*text);
        pos = *close + 1;
    }

    String value = sb.build().trim();
    if (is_plain_number(value)) {
        value = value + css::unit_suffix(property);
    }
    return value;
}

// ============================================================================
// StyleResolver
// ============================================================================

ResolvedStyle StyleResolver::resolve(const std::vector<StyleRef>& refs,
                                     const std::vector<css::Declaration>& extra_style) const {
    std::vector<const StyleRef*> flat;
    flatten_refs(refs, flat);

    KeyStore properties;
    KeyStore variables;
    std::vector<String> extra_classes;

    for (const auto* ref : flat) {
        if (ref->kind() == StyleRef::Kind::Raw) {
            extra_classes.push_back(ref->text());
            continue;
        }

        const ClassRule* rule = m_manifest.find_class(ref->text());
        if (!rule) {
            runtime_log().debug_fmt("StyleResolver::resolve: unknown rule {}", ref->text());
            continue;
        }

        for (const auto& [property, classes] : rule->atomic_classes) {
            if (classes.unset) {
                keydelete(properties, property);
            } else {
                keystore(properties, property, classes.class_string());
            }
        }

        if (ref->kind() != StyleRef::Kind::Dynamic) {
            continue;
        }
        for (const auto& decl : rule->dynamic_declarations) {
            auto value = fill_template(decl.property, decl.value_template, rule->param_names,
                                       ref->args());
            if (!value) {
                runtime_log().debug_fmt("StyleResolver::resolve: missing argument for {} in {}",
                                        decl.property, ref->text());
                continue;
            }
            keystore(variables, decl.css_var, std::move(*value));
        }
    }

    std::vector<String> names;
    auto add_name = [&](const String& name) {
        if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    };
    for (const auto& [property, class_string] : properties) {
        add_name(class_string);
    }
    for (const auto& name : extra_classes) {
        add_name(name);
    }

    ResolvedStyle result;
    result.class_name = join(names, " ");

    std::vector<String> style;
    for (const auto& [name, value] : variables) {
        style.push_back(name + ": "_s + value);
    }
    for (const auto& decl : extra_style) {
        style.push_back(css::to_css_property(decl.property) + ": "_s + decl.value);
    }
    if (!style.empty()) {
        result.style = join(style, "; ");
    }
    return result;
}

} // namespace facet::style
