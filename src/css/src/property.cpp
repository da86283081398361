/**
 * CSS property tables
 */

#include "facet/css/property.hpp"
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace facet::css {

namespace {

using PropertySet = std::unordered_set<std::string_view>;

const PropertySet& shorthands_of_shorthands() {
    static const PropertySet set = {
        "all", "background", "border", "border-block", "border-inline",
        "font", "grid", "grid-area", "inset", "margin", "mask", "padding",
        "scroll-margin", "scroll-padding",
    };
    return set;
}

const PropertySet& shorthands_of_longhands() {
    static const PropertySet set = {
        "animation", "animation-range",
        "background-position",
        "border-block-color", "border-block-end", "border-block-start",
        "border-block-style", "border-block-width",
        "border-bottom", "border-color", "border-image",
        "border-inline-color", "border-inline-end", "border-inline-start",
        "border-inline-style", "border-inline-width",
        "border-left", "border-radius", "border-right", "border-style",
        "border-top", "border-width",
        "column-rule", "columns", "contain-intrinsic-size", "container",
        "flex", "flex-flow", "font-variant", "gap",
        "grid-column", "grid-row", "grid-template",
        "inset-block", "inset-inline",
        "list-style",
        "margin-block", "margin-inline",
        "mask-border", "offset", "outline",
        "overflow", "overscroll-behavior",
        "padding-block", "padding-inline",
        "place-content", "place-items", "place-self",
        "scroll-margin-block", "scroll-margin-inline",
        "scroll-padding-block", "scroll-padding-inline",
        "scroll-snap-type", "scroll-timeline",
        "text-decoration", "text-emphasis", "text-wrap", "transition",
        "view-timeline", "white-space",
    };
    return set;
}

const PropertySet& unitless_properties() {
    static const PropertySet set = {
        "animation-iteration-count", "aspect-ratio",
        "border-image-outset", "border-image-slice", "border-image-width",
        "column-count", "fill-opacity", "flex", "flex-grow", "flex-shrink",
        "flood-opacity", "font-size-adjust", "font-weight",
        "grid-area", "grid-column", "grid-column-end", "grid-column-start",
        "grid-row", "grid-row-end", "grid-row-start",
        "initial-letter", "line-clamp", "line-height", "math-depth",
        "opacity", "order", "orphans", "scale", "shape-image-threshold",
        "stop-opacity", "stroke-dashoffset", "stroke-miterlimit", "stroke-opacity",
        "stroke-width", "tab-size", "widows", "z-index", "zoom",
    };
    return set;
}

const PropertySet& time_properties() {
    static const PropertySet set = {
        "animation-delay", "animation-duration",
        "transition-delay", "transition-duration",
    };
    return set;
}

const PropertySet& position_try_properties() {
    static const PropertySet set = {
        "position-anchor", "position-area",
        // Insets
        "top", "right", "bottom", "left", "inset",
        "inset-block", "inset-block-start", "inset-block-end",
        "inset-inline", "inset-inline-start", "inset-inline-end",
        // Margins
        "margin", "margin-top", "margin-right", "margin-bottom", "margin-left",
        "margin-block", "margin-block-start", "margin-block-end",
        "margin-inline", "margin-inline-start", "margin-inline-end",
        // Sizing
        "width", "height", "min-width", "min-height", "max-width", "max-height",
        "block-size", "inline-size", "min-block-size", "min-inline-size",
        "max-block-size", "max-inline-size",
        // Self alignment
        "align-self", "justify-self", "place-self",
    };
    return set;
}

const std::unordered_map<std::string_view, std::vector<std::string_view>>& disallowed_shorthands() {
    static const std::unordered_map<std::string_view, std::vector<std::string_view>> table = {
        {"border", {"border-width", "border-style", "border-color"}},
        {"border-top", {"border-top-width", "border-top-style", "border-top-color"}},
        {"border-right", {"border-right-width", "border-right-style", "border-right-color"}},
        {"border-bottom", {"border-bottom-width", "border-bottom-style", "border-bottom-color"}},
        {"border-left", {"border-left-width", "border-left-style", "border-left-color"}},
        {"border-block", {"border-block-width", "border-block-style", "border-block-color"}},
        {"border-block-start", {"border-block-start-width", "border-block-start-style",
                                "border-block-start-color"}},
        {"border-block-end", {"border-block-end-width", "border-block-end-style",
                              "border-block-end-color"}},
        {"border-inline", {"border-inline-width", "border-inline-style", "border-inline-color"}},
        {"border-inline-start", {"border-inline-start-width", "border-inline-start-style",
                                 "border-inline-start-color"}},
        {"border-inline-end", {"border-inline-end-width", "border-inline-end-style",
                               "border-inline-end-color"}},
        {"background", {"background-color", "background-image", "background-position",
                        "background-size", "background-repeat", "background-attachment",
                        "background-origin", "background-clip"}},
        {"animation", {"animation-name", "animation-duration", "animation-timing-function",
                       "animation-delay", "animation-iteration-count", "animation-direction",
                       "animation-fill-mode", "animation-play-state"}},
        {"transition", {"transition-property", "transition-duration",
                        "transition-timing-function", "transition-delay"}},
        {"font", {"font-style", "font-variant", "font-weight", "font-size", "line-height",
                  "font-family"}},
        {"outline", {"outline-width", "outline-style", "outline-color"}},
        {"text-decoration", {"text-decoration-line", "text-decoration-style",
                             "text-decoration-color", "text-decoration-thickness"}},
        {"columns", {"column-width", "column-count"}},
        {"flex-flow", {"flex-direction", "flex-wrap"}},
        {"grid", {"grid-template-rows", "grid-template-columns", "grid-template-areas",
                  "grid-auto-rows", "grid-auto-columns", "grid-auto-flow"}},
        {"grid-area", {"grid-row-start", "grid-column-start", "grid-row-end",
                       "grid-column-end"}},
        {"list-style", {"list-style-type", "list-style-position", "list-style-image"}},
    };
    return table;
}

} // anonymous namespace

// ============================================================================
// Classification
// ============================================================================

PropertyCategory property_category(const String& property) {
    if (is_custom_property(property)) {
        return PropertyCategory::CustomProperty;
    }
    if (shorthands_of_shorthands().contains(property.view())) {
        return PropertyCategory::ShorthandOfShorthands;
    }
    if (shorthands_of_longhands().contains(property.view())) {
        return PropertyCategory::ShorthandOfLonghands;
    }
    return PropertyCategory::Longhand;
}

bool is_unitless(const String& property) {
    return is_custom_property(property) || unitless_properties().contains(property.view());
}

bool is_time_property(const String& property) {
    return time_properties().contains(property.view());
}

String unit_suffix(const String& property) {
    if (is_unitless(property)) {
        return String();
    }
    if (is_time_property(property)) {
        return "ms"_s;
    }
    return "px"_s;
}

bool is_position_try_property(const String& property) {
    return position_try_properties().contains(property.view());
}

bool is_disallowed_shorthand(const String& property) {
    return disallowed_shorthands().contains(property.view());
}

std::vector<String> disallowed_shorthand_longhands(const String& property) {
    std::vector<String> result;
    auto it = disallowed_shorthands().find(property.view());
    if (it == disallowed_shorthands().end()) {
        return result;
    }
    for (auto longhand : it->second) {
        result.emplace_back(longhand);
    }
    return result;
}

// ============================================================================
// Property names
// ============================================================================

String to_css_property(const String& key) {
    if (key.starts_with("var(--"_s) && key.ends_with(")"_s) && !key.contains(',')) {
        return key.substring(4, key.size() - 5);
    }
    if (is_custom_property(key)) {
        return key;
    }
    return key.replace_all("_"_s, "-"_s);
}

} // namespace facet::css
