#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <initializer_list>
#include <utility>
#include <vector>

namespace facet::style {

// ============================================================================
// Declared value tree
// ============================================================================

enum class ValueKind : u8 {
    Null,            // Removes the property, or one condition branch
    Scalar,
    Number,          // Converted with the property's unit
    Fallback,        // [v1, v2, ...] variable fallbacks
    FirstThatWorks,
    Conditional,     // { "default": ..., ":hover": ..., "@media ...": ... }
    Typed,           // Var value carrying a CSS type syntax
};

class StyleValue {
public:
    StyleValue() = default;
    StyleValue(const char* text) : m_kind(ValueKind::Scalar), m_text(text) {}
    StyleValue(String text) : m_kind(ValueKind::Scalar), m_text(std::move(text)) {}
    StyleValue(f64 number) : m_kind(ValueKind::Number), m_number(number) {}
    StyleValue(i32 number) : m_kind(ValueKind::Number), m_number(number) {}

    [[nodiscard]] static StyleValue null() { return StyleValue(); }

    [[nodiscard]] static StyleValue fallback(std::vector<StyleValue> items) {
        StyleValue v;
        v.m_kind = ValueKind::Fallback;
        v.m_items = std::move(items);
        return v;
    }

    [[nodiscard]] static StyleValue first_that_works(std::vector<StyleValue> items) {
        StyleValue v;
        v.m_kind = ValueKind::FirstThatWorks;
        v.m_items = std::move(items);
        return v;
    }

    [[nodiscard]] static StyleValue conditional(
        std::initializer_list<std::pair<String, StyleValue>> entries) {
        StyleValue v;
        v.m_kind = ValueKind::Conditional;
        for (const auto& [key, value] : entries) {
            v.m_keys.push_back(key);
            v.m_items.push_back(value);
        }
        return v;
    }

    [[nodiscard]] static StyleValue conditional(std::vector<String> keys,
                                                std::vector<StyleValue> values) {
        StyleValue v;
        v.m_kind = ValueKind::Conditional;
        v.m_keys = std::move(keys);
        v.m_items = std::move(values);
        return v;
    }

    [[nodiscard]] static StyleValue typed(String syntax, StyleValue value, bool inherits = true) {
        StyleValue v;
        v.m_kind = ValueKind::Typed;
        v.m_text = std::move(syntax);
        v.m_items.push_back(std::move(value));
        v.m_inherits = inherits;
        return v;
    }

    [[nodiscard]] ValueKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool is_null() const noexcept { return m_kind == ValueKind::Null; }
    [[nodiscard]] bool is_scalar() const noexcept { return m_kind == ValueKind::Scalar; }
    [[nodiscard]] bool is_number() const noexcept { return m_kind == ValueKind::Number; }
    [[nodiscard]] bool is_typed() const noexcept { return m_kind == ValueKind::Typed; }

    // Scalar or Number
    [[nodiscard]] bool is_leaf() const noexcept {
        return m_kind == ValueKind::Scalar || m_kind == ValueKind::Number;
    }

    // A Conditional whose keys are all "default", ":..." or "@..."
    [[nodiscard]] bool is_condition_map() const;

    // Scalar text
    [[nodiscard]] const String& text() const { return m_text; }
    [[nodiscard]] f64 number() const { return m_number; }

    // Fallback / FirstThatWorks items, or Conditional values
    [[nodiscard]] const std::vector<StyleValue>& items() const { return m_items; }

    // Conditional keys, parallel to items()
    [[nodiscard]] const std::vector<String>& keys() const { return m_keys; }

    // Conditional value for a key, or nullptr
    [[nodiscard]] const StyleValue* find(const String& key) const;

    // Typed accessors
    [[nodiscard]] const String& syntax() const { return m_text; }
    [[nodiscard]] bool inherits() const { return m_inherits; }
    [[nodiscard]] const StyleValue& typed_value() const { return m_items.front(); }

    // Typed values unwrap to their inner value; everything else is returned as is
    [[nodiscard]] const StyleValue& untyped() const {
        return m_kind == ValueKind::Typed ? m_items.front() : *this;
    }

    [[nodiscard]] bool operator==(const StyleValue& other) const = default;

private:
    ValueKind m_kind{ValueKind::Null};
    String m_text;
    f64 m_number{0};
    bool m_inherits{true};
    std::vector<String> m_keys;
    std::vector<StyleValue> m_items;
};

// One (property, value) pair of a rule body
struct StyleDeclaration {
    String property;
    StyleValue value;

    [[nodiscard]] bool operator==(const StyleDeclaration& other) const = default;
};

} // namespace facet::style
