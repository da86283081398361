/**
 * Stylesheet assembly
 */

#include "facet/style/assembler.hpp"
#include "facet/style/manifest.hpp"
#include "facet/style/vars.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace facet::style {

namespace {

// LTR rules, then the RTL overrides after a marker comment
String render_ltr_rtl(const std::vector<AtomicClassMeta>& classes) {
    std::vector<String> ltr;
    std::vector<String> rtl;
    for (const auto& meta : classes) {
        ltr.push_back(meta.ltr);
        if (meta.rtl) {
            rtl.push_back(*meta.rtl);
        }
    }

    String css = join(ltr, "\n");
    if (!rtl.empty()) {
        css += "\n\n/* RTL Overrides */\n";
        css += join(rtl, "\n");
    }
    return css;
}

String render_layers(const std::vector<AtomicClassMeta>& classes) {
    std::map<i32, std::vector<AtomicClassMeta>> levels;
    for (const auto& meta : classes) {
        levels[meta.priority / 1000].push_back(meta);
    }

    std::vector<String> names;
    std::vector<String> blocks;
    usize index = 1;
    for (const auto& [level, level_classes] : levels) {
        StringBuilder name;
        name.append_format("priority{}", index++);
        blocks.push_back("@layer "_s + name.build() + "{\n"_s + render_ltr_rtl(level_classes) + "\n}"_s);
        names.push_back(name.build());
    }
    return "@layer "_s + join(names, ", ") + ";\n"_s + join(blocks, "\n");
}

template<typename Entry, typename Render>
String render_each(const std::map<String, Entry>& entries, Render render) {
    std::vector<String> parts;
    for (const auto& [key, entry] : entries) {
        parts.push_back(render(entry));
    }
    return join(parts, "\n");
}

} // anonymous namespace

std::vector<AtomicClassMeta> collect_atomic_classes(const Manifest& manifest) {
    std::map<String, AtomicClassMeta> unique;
    for (const auto& [key, rule] : manifest.classes()) {
        for (const auto& [property, classes] : rule.atomic_classes) {
            for (const auto& meta : classes.classes) {
                unique.emplace(meta.class_name, meta);
            }
        }
    }

    std::vector<AtomicClassMeta> ordered;
    ordered.reserve(unique.size());
    for (auto& [name, meta] : unique) {
        ordered.push_back(std::move(meta));
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const AtomicClassMeta& a, const AtomicClassMeta& b) {
                         return a.priority < b.priority;
                     });
    return ordered;
}

String generate_dynamic_property_rules(const Manifest& manifest) {
    std::set<String> names;
    for (const auto& [key, rule] : manifest.classes()) {
        for (const auto& decl : rule.dynamic_declarations) {
            names.insert(decl.css_var);
        }
    }

    std::vector<String> rules;
    for (const auto& name : names) {
        rules.push_back("@property "_s + name + " { syntax: \"*\"; inherits: false; }"_s);
    }
    return join(rules, "\n");
}

// ============================================================================
// CSSAssembler
// ============================================================================

String CSSAssembler::atomic_rules(const Manifest& manifest) const {
    auto classes = collect_atomic_classes(manifest);
    if (classes.empty()) {
        return String();
    }
    return m_config.use_css_layers ? render_layers(classes) : render_ltr_rtl(classes);
}

String CSSAssembler::assemble(const Manifest& manifest) const {
    std::vector<String> property_rules;
    for (auto rules : {generate_property_rules(manifest.vars()),
                       generate_dynamic_property_rules(manifest)}) {
        if (!rules.empty()) {
            property_rules.push_back(std::move(rules));
        }
    }

    std::vector<String> sections = {
        generate_var_rules(manifest.vars()),
        join(property_rules, "\n"),
        generate_theme_rules(manifest.themes()),
        atomic_rules(manifest),
        render_each(manifest.keyframes(), keyframes_css),
        render_each(manifest.position_try(), position_try_css),
        render_each(manifest.view_transitions(), view_transition_css),
    };
    sections.erase(std::remove_if(sections.begin(), sections.end(),
                                  [](const String& s) { return s.empty(); }),
                   sections.end());

    FACET_LOG_DEBUG_FMT("CSSAssembler::assemble: {} sections, {} rules", sections.size(),
                        manifest.classes().size());

    if (sections.empty()) {
        return String();
    }
    return join(sections, "\n\n") + "\n"_s;
}

} // namespace facet::style
