/**
 * Atomic rule selectors, RTL prefixing, at-rule wrapping and vendor prefixes
 */

#include "facet/css/selector.hpp"
#include "facet/css/pseudo.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace facet::css {

namespace {

struct SelectorExpansion {
    std::string_view pseudo;
    std::vector<std::string_view> variants;
};

// Tried in this order at every position, so "::placeholder" wins over
// ":placeholder-shown" where both could start
const std::array<SelectorExpansion, 6>& expansions() {
    static const std::array<SelectorExpansion, 6> table = {{
        {"::file-selector-button", {"::-webkit-file-upload-button", "::file-selector-button"}},
        {"::placeholder", {"::-webkit-input-placeholder", "::-moz-placeholder",
                           ":-ms-input-placeholder", "::placeholder"}},
        {"::thumb", {"::-webkit-slider-thumb", "::-moz-range-thumb", "::-ms-thumb"}},
        {":autofill", {":-webkit-autofill", ":autofill"}},
        {":fullscreen", {":-webkit-full-screen", ":-moz-full-screen", ":fullscreen"}},
        {":placeholder-shown", {":-moz-placeholder-shown", ":placeholder-shown"}},
    }};
    return table;
}

// Comma-separated selectors; commas inside :where(...) or :has(...) do not split
std::vector<String> split_selector_list(const String& selector) {
    std::vector<String> parts;
    std::string current;
    i32 depth = 0;

    for (char c : selector.view()) {
        if (c == '(') {
            ++depth;
        } else if (c == ')' && depth > 0) {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.emplace_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.emplace_back(std::move(current));
    return parts;
}

} // anonymous namespace

// ============================================================================
// Atomic selectors
// ============================================================================

String atomic_selector(const CompilerConfig& config,
                       const String& class_name,
                       const std::vector<String>& pseudos,
                       bool has_at_rule) {
    String suffix = join(sort_pseudos(pseudos), "");

    StringBuilder sb;
    sb.append('.');
    sb.append(class_name);
    if (has_at_rule || !pseudos.empty()) {
        if (config.use_css_layers) {
            sb.append('.');
            sb.append(class_name);
        } else {
            sb.append(":not(#\\#)");
        }
    }
    sb.append(suffix);

    return prefix_selector(sb.build());
}

String prefix_rtl(const String& selector) {
    std::vector<String> parts;
    for (const auto& part : split_selector_list(selector)) {
        parts.push_back("html[dir=\"rtl\"] "_s + part.trim());
    }
    return join(parts, ",");
}

String wrap_at_rules(const String& rule, const std::vector<String>& at_rules) {
    std::vector<String> sorted = at_rules;
    std::sort(sorted.begin(), sorted.end());

    String result = rule;
    for (const auto& at_rule : sorted) {
        result = at_rule + "{"_s + result + "}"_s;
    }
    return result;
}

// ============================================================================
// Vendor prefixes
// ============================================================================

std::vector<String> selector_variants(const String& pseudo) {
    for (const auto& expansion : expansions()) {
        if (pseudo.view() == expansion.pseudo) {
            std::vector<String> variants;
            for (auto variant : expansion.variants) {
                variants.emplace_back(variant);
            }
            return variants;
        }
    }
    return {};
}

String prefix_selector(const String& selector) {
    auto text = selector.view();

    for (usize pos = 0; pos < text.size(); ++pos) {
        if (text[pos] != ':') {
            continue;
        }
        for (const auto& expansion : expansions()) {
            if (!text.substr(pos).starts_with(expansion.pseudo)) {
                continue;
            }

            auto before = text.substr(0, pos);
            auto after = text.substr(pos + expansion.pseudo.size());

            StringBuilder sb;
            for (usize i = 0; i < expansion.variants.size(); ++i) {
                if (i > 0) {
                    sb.append(", ");
                }
                sb.append(before);
                sb.append(expansion.variants[i]);
                sb.append(after);
            }
            return sb.build();
        }
    }
    return selector;
}

} // namespace facet::css
