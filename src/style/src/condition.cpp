/**
 * Condition tree flattening
 */

#include "facet/style/condition.hpp"
#include "facet/css/media_query.hpp"
#include "facet/css/pseudo.hpp"

namespace facet::style {

namespace {

CompileError invalid_key(const String& key, ConditionScope scope) {
    StringBuilder message;
    if (scope == ConditionScope::Variable) {
        message.append_format("Invalid variable condition \"{}\"", key);
        return CompileError(ErrorKind::InvalidCondition, message.build(),
                            "Variable values accept only \"default\" and at-rule keys"_s);
    }
    message.append_format("Invalid condition \"{}\"", key);
    return CompileError(ErrorKind::InvalidCondition, message.build(),
                        "Condition keys are \"default\", pseudo selectors or at-rules"_s);
}

Result<void, CompileError> flatten_into(const StyleValue& value,
                                        const ConditionPath& parent,
                                        ConditionScope scope,
                                        std::vector<FlatCondition>& out) {
    if (value.kind() != ValueKind::Conditional) {
        out.push_back(FlatCondition{parent, value});
        return {};
    }

    std::vector<String> keys = css::bound_media_queries(value.keys());

    for (usize i = 0; i < keys.size(); ++i) {
        const String& key = keys[i];
        ConditionPath path = parent;

        if (key == "default"_s) {
            // no condition added
        } else if (key.starts_with("@"_s)) {
            path.at_rules.push_back(key);
        } else if (key.starts_with(":"_s) && scope == ConditionScope::Property) {
            for (auto& pseudo : css::split_pseudos(key)) {
                path.pseudos.push_back(std::move(pseudo));
            }
        } else {
            return make_error(invalid_key(value.keys()[i], scope));
        }

        if (auto nested = flatten_into(value.items()[i], path, scope, out); !nested) {
            return nested;
        }
    }
    return {};
}

} // anonymous namespace

String ConditionPath::key() const {
    if (empty()) {
        return "default"_s;
    }
    return join(at_rules, "") + join(pseudos, "");
}

CompileResult<std::vector<FlatCondition>> flatten_conditions(const StyleValue& value,
                                                             ConditionScope scope) {
    std::vector<FlatCondition> out;
    if (auto result = flatten_into(value, ConditionPath{}, scope, out); !result) {
        return make_error(std::move(result).error());
    }
    return out;
}

} // namespace facet::style
