/**
 * Leaf value resolution and variable fallback nesting
 */

#include "facet/style/value_resolver.hpp"
#include "facet/css/value.hpp"
#include <algorithm>

namespace facet::style {

namespace {

CompileResult<std::vector<String>> items_to_css(const String& property,
                                                const StyleValue& list,
                                                const CompilerConfig& config) {
    std::vector<String> values;
    for (const auto& item : list.items()) {
        if (!item.is_leaf()) {
            return make_error(CompileError(
                ErrorKind::InvalidValue,
                "A style array value can only contain strings or numbers"_s));
        }
        auto text = leaf_to_css(property, item, config);
        if (!text) {
            return make_error(std::move(text).error());
        }
        values.push_back(std::move(text).value());
    }
    if (values.empty()) {
        return make_error(CompileError(ErrorKind::InvalidValue,
                                       "A style array value cannot be empty"_s));
    }
    return values;
}

// Variables up to and including the first plain value
std::vector<String> leading_var_run(const std::vector<String>& values, usize from) {
    usize end = values.size();
    for (usize i = from; i < values.size(); ++i) {
        if (!css::is_css_var(values[i])) {
            end = i + 1;
            break;
        }
    }
    return std::vector<String>(values.begin() + static_cast<isize>(from),
                               values.begin() + static_cast<isize>(end));
}

std::vector<String> reversed(std::vector<String> values) {
    std::reverse(values.begin(), values.end());
    return values;
}

} // anonymous namespace

// ============================================================================
// Single values
// ============================================================================

CompileResult<String> leaf_to_css(const String& property,
                                  const StyleValue& leaf,
                                  const CompilerConfig& config) {
    switch (leaf.kind()) {
        case ValueKind::Scalar:
            return css::string_to_css(leaf.text(), property);
        case ValueKind::Number:
            return css::number_to_css(leaf.number(), property, config);
        default:
            break;
    }
    StringBuilder message;
    message.append_format("Unsupported value for '{}': expected a string or number", property);
    return make_error(CompileError(ErrorKind::InvalidValue, message.build()));
}

CompileResult<ResolvedValue> resolve_value(const String& property,
                                           const StyleValue& leaf,
                                           const CompilerConfig& config) {
    if (leaf.kind() == ValueKind::Fallback || leaf.kind() == ValueKind::FirstThatWorks) {
        auto values = items_to_css(property, leaf, config);
        if (!values) {
            return make_error(std::move(values).error());
        }

        ResolvedValue resolved;
        resolved.hash_value = join(values.value(), ", ");
        resolved.declarations = leaf.kind() == ValueKind::Fallback
                                    ? variable_fallbacks(values.value())
                                    : first_that_works(values.value());
        return resolved;
    }

    if (leaf.is_typed()) {
        return make_error(CompileError(
            ErrorKind::InvalidValue,
            "Typed values are only allowed in variable definitions"_s));
    }

    auto text = leaf_to_css(property, leaf, config);
    if (!text) {
        return make_error(std::move(text).error());
    }

    ResolvedValue resolved;
    resolved.hash_value = text.value();
    resolved.declarations.push_back(std::move(text).value());
    return resolved;
}

// ============================================================================
// Fallback nesting
// ============================================================================

String compose_vars(const std::vector<String>& values) {
    String so_far;
    for (const auto& value : values) {
        if (so_far.empty()) {
            so_far = value;
        } else if (css::is_css_var(value)) {
            // Strip the closing parenthesis of this var() only
            so_far = value.substring(0, value.size() - 1) + ","_s + so_far + ")"_s;
        }
    }
    return so_far;
}

std::vector<String> variable_fallbacks(const std::vector<String>& values) {
    auto first_var = std::find_if(values.begin(), values.end(),
                                  [](const String& v) { return css::is_css_var(v); });
    if (first_var == values.end()) {
        return values;
    }
    auto last_var = std::find_if(values.rbegin(), values.rend(),
                                 [](const String& v) { return css::is_css_var(v); });

    usize first = static_cast<usize>(first_var - values.begin());
    usize last = values.size() - 1 - static_cast<usize>(last_var - values.rbegin());

    std::vector<String> vars = reversed(std::vector<String>(
        values.begin() + static_cast<isize>(first), values.begin() + static_cast<isize>(last + 1)));

    std::vector<String> result;
    if (first == 0) {
        result.push_back(compose_vars(vars));
    } else {
        for (usize i = 0; i < first; ++i) {
            std::vector<String> chain{values[i]};
            chain.insert(chain.end(), vars.begin(), vars.end());
            result.push_back(compose_vars(chain));
        }
    }
    for (usize i = last + 1; i < values.size(); ++i) {
        result.push_back(values[i]);
    }
    return result;
}

std::vector<String> first_that_works(const std::vector<String>& values) {
    auto first_var = std::find_if(values.begin(), values.end(),
                                  [](const String& v) { return css::is_css_var(v); });
    if (first_var == values.end()) {
        return reversed(values);
    }

    usize index = static_cast<usize>(first_var - values.begin());
    std::vector<String> result{compose_vars(reversed(leading_var_run(values, index)))};
    for (usize i = index; i > 0; --i) {
        result.push_back(values[i - 1]);
    }
    return result;
}

} // namespace facet::style
