/**
 * Shorthand strategies: keep, expand to longhands, reject
 */

#include "facet/style/shorthand.hpp"
#include "facet/css/property.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>
#include <array>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace facet::style {

namespace {

// ============================================================================
// Value helpers
// ============================================================================

// "10px !important" -> {"10px", true}
std::pair<String, bool> extract_important(const String& value) {
    String trimmed = value.trim();
    if (trimmed.to_lowercase().ends_with("!important"_s)) {
        return {trimmed.substring(0, trimmed.size() - 10).trim(), true};
    }
    return {trimmed, false};
}

// Whitespace split that keeps parenthesized groups whole
std::vector<String> split_top_level(const String& value) {
    std::vector<String> parts;
    std::string current;
    i32 depth = 0;

    for (char c : value.view()) {
        if (c == '(') {
            ++depth;
        } else if (c == ')' && depth > 0) {
            --depth;
        }

        if (depth == 0 && ascii::is_whitespace(c)) {
            if (!current.empty()) {
                parts.emplace_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.emplace_back(std::move(current));
    }
    return parts;
}

StyleDeclaration declare(std::string_view property, StyleValue value) {
    return StyleDeclaration{String(property), std::move(value)};
}

StyleDeclaration declare(std::string_view property, const String& value, bool important) {
    return declare(property, important ? StyleValue(value + " !important"_s) : StyleValue(value));
}

using LeafExpander = std::function<std::vector<StyleDeclaration>(const String&, const StyleValue&)>;

/**
 * Applies a leaf expansion through a condition tree. Every branch is
 * expanded on its own and the results are regrouped into one condition map
 * per resulting property, keeping the branch order.
 */
std::vector<StyleDeclaration> expand_tree(const String& property,
                                          const StyleValue& value,
                                          const LeafExpander& expand_leaf) {
    if (value.kind() != ValueKind::Conditional) {
        return expand_leaf(property, value);
    }

    std::vector<std::vector<StyleDeclaration>> branches;
    std::vector<String> order;
    for (const auto& branch : value.items()) {
        branches.push_back(expand_tree(property, branch, expand_leaf));
        for (const auto& decl : branches.back()) {
            if (std::find(order.begin(), order.end(), decl.property) == order.end()) {
                order.push_back(decl.property);
            }
        }
    }

    std::vector<StyleDeclaration> result;
    for (const auto& longhand : order) {
        std::vector<String> keys;
        std::vector<StyleValue> values;
        for (usize i = 0; i < branches.size(); ++i) {
            for (const auto& decl : branches[i]) {
                if (decl.property == longhand) {
                    keys.push_back(value.keys()[i]);
                    values.push_back(decl.value);
                    break;
                }
            }
        }
        if (!keys.empty()) {
            result.push_back(StyleDeclaration{longhand, StyleValue::conditional(std::move(keys), std::move(values))});
        }
    }
    return result;
}

// ============================================================================
// Keep-shorthands table
// ============================================================================

const std::unordered_map<std::string_view, std::string_view>& legacy_aliases() {
    static const std::unordered_map<std::string_view, std::string_view> table = {
        {"margin-horizontal", "margin-inline"},
        {"margin-vertical", "margin-block"},
        {"padding-horizontal", "padding-inline"},
        {"padding-vertical", "padding-block"},
    };
    return table;
}

std::vector<StyleDeclaration> pair_or_nothing(std::string_view first,
                                              std::string_view second,
                                              std::optional<String> a,
                                              std::optional<String> b) {
    std::vector<StyleDeclaration> result;
    if (a) result.push_back(declare(first, StyleValue(*a)));
    if (b) result.push_back(declare(second, StyleValue(*b)));
    return result;
}

std::vector<StyleDeclaration> split_overscroll_behavior(const String& value) {
    auto parts = split_css_value(value);
    if (parts.size() == 1) {
        return pair_or_nothing("overscroll-behavior-x", "overscroll-behavior-y", parts[0], parts[0]);
    }
    if (parts.size() == 2) {
        return pair_or_nothing("overscroll-behavior-x", "overscroll-behavior-y", parts[0], parts[1]);
    }
    return {};
}

// "auto 10px 20px" -> width "auto 10px", height "20px"
std::vector<StyleDeclaration> split_contain_intrinsic_size(const String& value) {
    auto p = split_css_value(value);
    String width = value;
    String height = value;

    if (p.size() == 1) {
        width = height = p[0];
    } else if (p.size() == 2) {
        width = p[0];
        height = p[1];
    } else if (p.size() == 3 && p[0] == "auto"_s) {
        width = "auto "_s + p[1];
        height = p[2];
    } else if (p.size() == 3 && p[1] == "auto"_s) {
        width = p[0];
        height = "auto "_s + p[2];
    } else if (p.size() == 4 && p[0] == "auto"_s && p[2] == "auto"_s) {
        width = "auto "_s + p[1];
        height = "auto "_s + p[3];
    }
    return pair_or_nothing("contain-intrinsic-width", "contain-intrinsic-height", width, height);
}

std::vector<StyleDeclaration> keep_leaf(const String& property, const StyleValue& value) {
    if (auto alias = legacy_aliases().find(property.view()); alias != legacy_aliases().end()) {
        return {declare(alias->second, value)};
    }

    bool overscroll = property == "overscroll-behavior"_s;
    bool intrinsic = property == "contain-intrinsic-size"_s;
    if (!overscroll && !intrinsic) {
        return {StyleDeclaration{property, value}};
    }

    std::string_view x = overscroll ? "overscroll-behavior-x" : "contain-intrinsic-width";
    std::string_view y = overscroll ? "overscroll-behavior-y" : "contain-intrinsic-height";

    if (value.is_scalar()) {
        return overscroll ? split_overscroll_behavior(value.text())
                          : split_contain_intrinsic_size(value.text());
    }
    if (value.is_null() || value.is_number()) {
        return {declare(x, value), declare(y, value)};
    }
    return {StyleDeclaration{property, value}};
}

// ============================================================================
// Expand-to-longhands table
// ============================================================================

enum class Pattern : u8 {
    FourValue,
    TwoValue,
    BorderRadius,
    ListStyle,
};

struct Expansion {
    Pattern pattern;
    std::vector<std::string_view> longhands;
};

const std::unordered_map<std::string_view, Expansion>& longhand_expansions() {
    static const std::unordered_map<std::string_view, Expansion> table = {
        {"margin", {Pattern::FourValue, {"margin-top", "margin-right", "margin-bottom", "margin-left"}}},
        {"padding", {Pattern::FourValue, {"padding-top", "padding-right", "padding-bottom", "padding-left"}}},
        {"inset", {Pattern::FourValue, {"top", "right", "bottom", "left"}}},
        {"border-width", {Pattern::FourValue, {"border-top-width", "border-right-width",
                                               "border-bottom-width", "border-left-width"}}},
        {"border-style", {Pattern::FourValue, {"border-top-style", "border-right-style",
                                               "border-bottom-style", "border-left-style"}}},
        {"border-color", {Pattern::FourValue, {"border-top-color", "border-right-color",
                                               "border-bottom-color", "border-left-color"}}},
        {"gap", {Pattern::TwoValue, {"row-gap", "column-gap"}}},
        {"overflow", {Pattern::TwoValue, {"overflow-x", "overflow-y"}}},
        {"margin-block", {Pattern::TwoValue, {"margin-top", "margin-bottom"}}},
        {"margin-inline", {Pattern::TwoValue, {"margin-left", "margin-right"}}},
        {"padding-block", {Pattern::TwoValue, {"padding-top", "padding-bottom"}}},
        {"padding-inline", {Pattern::TwoValue, {"padding-left", "padding-right"}}},
        {"border-radius", {Pattern::BorderRadius, {"border-top-left-radius", "border-top-right-radius",
                                                   "border-bottom-right-radius",
                                                   "border-bottom-left-radius"}}},
        {"list-style", {Pattern::ListStyle, {"list-style-type", "list-style-position",
                                             "list-style-image"}}},
    };
    return table;
}

// 1, 2, 3 or 4 box values -> top, right, bottom, left
std::array<String, 4> box_values(const std::vector<String>& parts, const String& whole) {
    switch (parts.size()) {
        case 1: return {parts[0], parts[0], parts[0], parts[0]};
        case 2: return {parts[0], parts[1], parts[0], parts[1]};
        case 3: return {parts[0], parts[1], parts[2], parts[1]};
        case 4: return {parts[0], parts[1], parts[2], parts[3]};
        default: return {whole, whole, whole, whole};
    }
}

std::vector<StyleDeclaration> expand_four(const Expansion& expansion, const String& value) {
    auto [clean, important] = extract_important(value);
    auto values = box_values(split_top_level(clean), clean);

    std::vector<StyleDeclaration> result;
    for (usize i = 0; i < 4; ++i) {
        result.push_back(declare(expansion.longhands[i], values[i], important));
    }
    return result;
}

std::vector<StyleDeclaration> expand_two(const Expansion& expansion, const String& value) {
    auto [clean, important] = extract_important(value);
    auto parts = split_top_level(clean);

    String first = clean;
    String second = clean;
    if (parts.size() == 1) {
        first = second = parts[0];
    } else if (parts.size() == 2) {
        first = parts[0];
        second = parts[1];
    }
    return {declare(expansion.longhands[0], first, important),
            declare(expansion.longhands[1], second, important)};
}

// "10px 20px / 5px" -> "10px 5px", "20px 5px", "10px 5px", "20px 5px"
std::vector<StyleDeclaration> expand_border_radius(const Expansion& expansion, const String& value) {
    auto [clean, important] = extract_important(value);
    auto slash = clean.find('/');
    if (!slash) {
        return expand_four(expansion, value);
    }

    String horizontal = clean.substring(0, *slash).trim();
    String vertical = clean.substring(*slash + 1).trim();
    auto h = box_values(split_top_level(horizontal), horizontal);
    auto v = box_values(split_top_level(vertical), vertical);

    std::vector<StyleDeclaration> result;
    for (usize i = 0; i < 4; ++i) {
        String combined = (h[i] == v[i]) ? h[i] : h[i] + " "_s + v[i];
        result.push_back(declare(expansion.longhands[i], combined, important));
    }
    return result;
}

// Tokens are recognised in any order: url(...) / none is the image,
// inside / outside the position, anything else the type
std::vector<StyleDeclaration> expand_list_style(const String& value) {
    auto [clean, important] = extract_important(value);

    std::optional<String> type;
    std::optional<String> position;
    std::optional<String> image;
    for (const auto& part : split_top_level(clean)) {
        if (part.starts_with("url("_s) || (part == "none"_s && !image)) {
            image = part;
        } else if (part == "inside"_s || part == "outside"_s) {
            position = part;
        } else {
            type = part;
        }
    }

    std::vector<StyleDeclaration> result;
    if (type) result.push_back(declare("list-style-type", *type, important));
    if (position) result.push_back(declare("list-style-position", *position, important));
    if (image) result.push_back(declare("list-style-image", *image, important));
    return result;
}

std::vector<StyleDeclaration> longhand_leaf(const String& property, const StyleValue& value) {
    auto it = longhand_expansions().find(property.view());
    if (it == longhand_expansions().end()) {
        return {StyleDeclaration{property, value}};
    }
    const Expansion& expansion = it->second;

    if (value.is_null() || value.is_number()) {
        std::vector<StyleDeclaration> result;
        for (auto longhand : expansion.longhands) {
            result.push_back(declare(longhand, value));
        }
        return result;
    }
    if (!value.is_scalar()) {
        return {StyleDeclaration{property, value}};
    }

    switch (expansion.pattern) {
        case Pattern::FourValue:    return expand_four(expansion, value.text());
        case Pattern::TwoValue:     return expand_two(expansion, value.text());
        case Pattern::BorderRadius: return expand_border_radius(expansion, value.text());
        case Pattern::ListStyle:    return expand_list_style(value.text());
    }
    return {StyleDeclaration{property, value}};
}

// ============================================================================
// Reject-shorthands check
// ============================================================================

Result<void, CompileError> check_allowed(const String& property) {
    if (!css::is_disallowed_shorthand(property)) {
        return {};
    }
    StringBuilder message;
    message.append_format("'{}' is not supported. Use longhand properties instead.", property);
    StringBuilder hint;
    hint.append_format("Replace '{}' with: {}", property,
                       join(css::disallowed_shorthand_longhands(property), ", "));
    return make_error(CompileError(ErrorKind::RejectedShorthand, message.build(), hint.build()));
}

} // anonymous namespace

// ============================================================================
// Value splitting
// ============================================================================

std::vector<String> split_css_value(const String& value) {
    auto [clean, important] = extract_important(value);
    auto parts = split_top_level(clean);
    if (important) {
        for (auto& part : parts) {
            part += " !important";
        }
    }
    return parts;
}

// ============================================================================
// Strategy selection
// ============================================================================

CompileResult<std::unique_ptr<ShorthandStrategy>> ShorthandStrategy::create(
    const ShorthandSelection& selection) {
    static Logger& log = logging::get("facet.style");

    String name = selection.name.trim().to_lowercase().replace_all("_"_s, "-"_s);
    for (const auto& [key, value] : selection.options) {
        log.debug_fmt("ShorthandStrategy::create: option {}={} for {}", key, value, name);
    }

    std::unique_ptr<ShorthandStrategy> strategy;
    if (name == "keep-shorthands"_s || name == "keep"_s || name == "accept"_s ||
        name == "accept-shorthands"_s) {
        strategy = std::make_unique<KeepShorthands>();
    } else if (name == "expand-to-longhands"_s || name == "expand"_s || name == "flatten"_s ||
               name == "flatten-shorthands"_s) {
        strategy = std::make_unique<ExpandToLonghands>();
    } else if (name == "reject-shorthands"_s || name == "reject"_s || name == "forbid"_s ||
               name == "forbid-shorthands"_s) {
        strategy = std::make_unique<RejectShorthands>();
    } else {
        StringBuilder message;
        message.append_format("Unknown shorthand strategy \"{}\"", selection.name);
        return make_error(CompileError(
            ErrorKind::Configuration, message.build(),
            "Valid strategies: keep-shorthands, expand-to-longhands, reject-shorthands"_s));
    }

    log.debug_fmt("ShorthandStrategy::create: using {}", strategy->name());
    return strategy;
}

// ============================================================================
// KeepShorthands
// ============================================================================

CompileResult<std::vector<StyleDeclaration>> KeepShorthands::expand(
    const String& property, const StyleValue& value) const {
    return expand_tree(property, value, keep_leaf);
}

CompileResult<std::vector<StyleDeclaration>> KeepShorthands::expand_conditions(
    const String& property, const StyleValue& conditions) const {
    return expand_tree(property, conditions, keep_leaf);
}

// ============================================================================
// ExpandToLonghands
// ============================================================================

CompileResult<std::vector<StyleDeclaration>> ExpandToLonghands::expand(
    const String& property, const StyleValue& value) const {
    return expand_tree(property, value, longhand_leaf);
}

CompileResult<std::vector<StyleDeclaration>> ExpandToLonghands::expand_conditions(
    const String& property, const StyleValue& conditions) const {
    return expand_tree(property, conditions, longhand_leaf);
}

// ============================================================================
// RejectShorthands
// ============================================================================

CompileResult<std::vector<StyleDeclaration>> RejectShorthands::expand(
    const String& property, const StyleValue& value) const {
    if (auto allowed = check_allowed(property); !allowed) {
        return make_error(std::move(allowed).error());
    }
    return std::vector<StyleDeclaration>{StyleDeclaration{property, value}};
}

CompileResult<std::vector<StyleDeclaration>> RejectShorthands::expand_conditions(
    const String& property, const StyleValue& conditions) const {
    if (auto allowed = check_allowed(property); !allowed) {
        return make_error(std::move(allowed).error());
    }
    return std::vector<StyleDeclaration>{StyleDeclaration{property, conditions}};
}

} // namespace facet::style
