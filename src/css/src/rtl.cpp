/**
 * Left-to-right and right-to-left forms of direction-dependent declarations
 */

#include "facet/css/rtl.hpp"
#include <string_view>
#include <unordered_map>
#include <vector>

namespace facet::css {

namespace {

struct PhysicalPair {
    std::string_view ltr;
    std::string_view rtl;
};

const std::unordered_map<std::string_view, PhysicalPair>& logical_properties() {
    static const std::unordered_map<std::string_view, PhysicalPair> table = {
        {"margin-start", {"margin-left", "margin-right"}},
        {"margin-end", {"margin-right", "margin-left"}},
        {"padding-start", {"padding-left", "padding-right"}},
        {"padding-end", {"padding-right", "padding-left"}},
        {"border-start", {"border-left", "border-right"}},
        {"border-end", {"border-right", "border-left"}},
        {"border-start-width", {"border-left-width", "border-right-width"}},
        {"border-end-width", {"border-right-width", "border-left-width"}},
        {"border-start-color", {"border-left-color", "border-right-color"}},
        {"border-end-color", {"border-right-color", "border-left-color"}},
        {"border-start-style", {"border-left-style", "border-right-style"}},
        {"border-end-style", {"border-right-style", "border-left-style"}},
        {"border-top-start-radius", {"border-top-left-radius", "border-top-right-radius"}},
        {"border-top-end-radius", {"border-top-right-radius", "border-top-left-radius"}},
        {"border-bottom-start-radius", {"border-bottom-left-radius", "border-bottom-right-radius"}},
        {"border-bottom-end-radius", {"border-bottom-right-radius", "border-bottom-left-radius"}},
        {"start", {"left", "right"}},
        {"end", {"right", "left"}},
    };
    return table;
}

// Logical keywords of float, clear and background-position
const std::unordered_map<std::string_view, PhysicalPair>& logical_values() {
    static const std::unordered_map<std::string_view, PhysicalPair> table = {
        {"start", {"left", "right"}},
        {"end", {"right", "left"}},
        {"inline-start", {"left", "right"}},
        {"inline-end", {"right", "left"}},
    };
    return table;
}

bool has_logical_keyword_value(const String& property) {
    return property == "float"_s || property == "clear"_s;
}

// Maps every space-separated logical word; returns whether anything changed
bool flip_position_words(const String& value, bool rtl, String& out) {
    std::vector<String> words = value.split(' ');
    bool changed = false;
    for (auto& word : words) {
        auto it = logical_values().find(word.view());
        if (it != logical_values().end()) {
            word = String(rtl ? it->second.rtl : it->second.ltr);
            changed = true;
        }
    }
    out = join(words, " ");
    return changed;
}

} // anonymous namespace

Declaration to_ltr(const String& property, const String& value) {
    auto prop_it = logical_properties().find(property.view());
    if (prop_it != logical_properties().end()) {
        return {String(prop_it->second.ltr), value};
    }

    if (has_logical_keyword_value(property)) {
        auto value_it = logical_values().find(value.view());
        if (value_it != logical_values().end()) {
            return {property, String(value_it->second.ltr)};
        }
    }

    if (property == "background-position"_s) {
        String flipped;
        flip_position_words(value, false, flipped);
        return {property, flipped};
    }

    return {property, value};
}

std::optional<Declaration> to_rtl(const String& property, const String& value) {
    auto prop_it = logical_properties().find(property.view());
    if (prop_it != logical_properties().end()) {
        return Declaration{String(prop_it->second.rtl), value};
    }

    if (has_logical_keyword_value(property)) {
        auto value_it = logical_values().find(value.view());
        if (value_it != logical_values().end()) {
            return Declaration{property, String(value_it->second.rtl)};
        }
        return std::nullopt;
    }

    if (property == "background-position"_s) {
        String flipped;
        if (flip_position_words(value, true, flipped)) {
            return Declaration{property, flipped};
        }
    }

    return std::nullopt;
}

} // namespace facet::css
