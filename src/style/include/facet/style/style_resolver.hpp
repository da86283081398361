#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/css/rtl.hpp"
#include "facet/style/style_value.hpp"
#include <optional>
#include <vector>

namespace facet::style {

class Manifest;

// ============================================================================
// Style references
// ============================================================================

/**
 * One entry of a style list handed to StyleResolver::resolve:
 *
 *   StyleRef::rule("app.Button.base")
 *   StyleRef::dynamic("app.Button.sized", {100})
 *   StyleRef::raw(marker.class_name)
 *   StyleRef::none()                     (nil / false, skipped)
 *   StyleRef::list({...})                (nested, flattened in order)
 */
class StyleRef {
public:
    enum class Kind : u8 {
        None,
        Rule,
        Dynamic,
        Raw,
        List,
    };

    StyleRef() = default;

    [[nodiscard]] static StyleRef none() { return StyleRef(); }

    [[nodiscard]] static StyleRef rule(String key) {
        StyleRef r;
        r.m_kind = Kind::Rule;
        r.m_text = std::move(key);
        return r;
    }

    [[nodiscard]] static StyleRef dynamic(String key, std::vector<StyleValue> args) {
        StyleRef r;
        r.m_kind = Kind::Dynamic;
        r.m_text = std::move(key);
        r.m_args = std::move(args);
        return r;
    }

    [[nodiscard]] static StyleRef raw(String class_name) {
        StyleRef r;
        r.m_kind = Kind::Raw;
        r.m_text = std::move(class_name);
        return r;
    }

    [[nodiscard]] static StyleRef list(std::vector<StyleRef> refs) {
        StyleRef r;
        r.m_kind = Kind::List;
        r.m_children = std::move(refs);
        return r;
    }

    [[nodiscard]] Kind kind() const { return m_kind; }

    // Rule key for Rule/Dynamic, class name for Raw
    [[nodiscard]] const String& text() const { return m_text; }
    [[nodiscard]] const std::vector<StyleValue>& args() const { return m_args; }
    [[nodiscard]] const std::vector<StyleRef>& children() const { return m_children; }

private:
    Kind m_kind{Kind::None};
    String m_text;
    std::vector<StyleValue> m_args;
    std::vector<StyleRef> m_children;
};

struct ResolvedStyle {
    String class_name;
    std::optional<String> style;  // Inline declarations, when any

    [[nodiscard]] bool operator==(const ResolvedStyle& other) const = default;
};

// ============================================================================
// StyleResolver - runtime merging of compiled rules
// ============================================================================

/**
 * Merges a list of rule references into one class string.
 *
 * Properties are tracked by CSS name, so a later rule replaces an earlier
 * rule's classes for the same property while distinct properties
 * ("margin" and "margin-left") coexist. An unset property removes the
 * earlier classes. Unknown rules contribute nothing.
 */
class StyleResolver {
public:
    explicit StyleResolver(const Manifest& manifest) : m_manifest(manifest) {}

    [[nodiscard]] ResolvedStyle resolve(const std::vector<StyleRef>& refs,
                                        const std::vector<css::Declaration>& extra_style = {}) const;

private:
    const Manifest& m_manifest;
};

/**
 * Fills a dynamic value template ("{w} solid") with arguments matched by
 * parameter name. A result that is a bare number gets the property's unit.
 * Returns nullopt when the template names a parameter without an argument.
 */
[[nodiscard]] std::optional<String> fill_template(const String& property,
                                                  const String& value_template,
                                                  const std::vector<String>& param_names,
                                                  const std::vector<StyleValue>& args);

} // namespace facet::style
