/**
 * JSON declaration documents
 */

#include "facet/loader/document.hpp"
#include "facet/loader/config.hpp"
#include "facet/style/compiler.hpp"
#include "facet/core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace facet::loader {

using style::DeclarationBlock;
using style::RuleDeclaration;
using style::StyleDeclaration;
using style::StyleValue;
using style::VarDefinition;

namespace {

Logger& loader_log() {
    static Logger& log = logging::get("facet.loader");
    return log;
}

CompileError input_error(const String& path, String message) {
    return CompileError(ErrorKind::Input, std::move(message)).with_context(path);
}

String member_path(const String& path, const std::string& name) {
    return path + "."_s + String(name);
}

String index_path(const String& path, usize index) {
    StringBuilder sb;
    sb.append(path);
    sb.append_format("[{}]", index);
    return sb.build();
}

Result<void, CompileError> expect_object(const Json::Value& json, const String& path) {
    if (!json.isObject()) {
        return make_error(input_error(path, "Expected an object"_s));
    }
    return {};
}

CompileResult<std::vector<StyleDeclaration>> parse_declarations(const Json::Value& json,
                                                                const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }

    std::vector<StyleDeclaration> declarations;
    for (const auto& name : json.getMemberNames()) {
        auto value = parse_value(json[name], member_path(path, name));
        if (!value) {
            return make_error(std::move(value).error());
        }
        declarations.push_back(StyleDeclaration{String(name), std::move(value).value()});
    }
    return declarations;
}

CompileResult<std::vector<DeclarationBlock>> parse_blocks(const Json::Value& json, const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }

    std::vector<DeclarationBlock> blocks;
    for (const auto& key : json.getMemberNames()) {
        auto declarations = parse_declarations(json[key], member_path(path, key));
        if (!declarations) {
            return make_error(std::move(declarations).error());
        }
        blocks.push_back(DeclarationBlock{String(key), std::move(declarations).value()});
    }
    return blocks;
}

CompileResult<std::vector<VarDefinition>> parse_definitions(const Json::Value& json, const String& path) {
    auto declarations = parse_declarations(json, path);
    if (!declarations) {
        return make_error(std::move(declarations).error());
    }

    std::vector<VarDefinition> definitions;
    for (auto& decl : declarations.value()) {
        definitions.push_back(VarDefinition{std::move(decl.property), std::move(decl.value)});
    }
    return definitions;
}

// { "<namespace>": { "<name>": value } }
CompileResult<std::vector<NamespaceDefinitions>> parse_namespaces(const Json::Value& json,
                                                                  const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }

    std::vector<NamespaceDefinitions> namespaces;
    for (const auto& ns : json.getMemberNames()) {
        auto definitions = parse_definitions(json[ns], member_path(path, ns));
        if (!definitions) {
            return make_error(std::move(definitions).error());
        }
        namespaces.push_back(NamespaceDefinitions{String(ns), std::move(definitions).value()});
    }
    return namespaces;
}

CompileResult<ThemeDefinition> parse_theme(const std::string& name, const Json::Value& json,
                                           const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }
    if (!json["vars"].isString()) {
        return make_error(input_error(path + ".vars"_s,
                                      "Expected the \"<module>.<namespace>\" of the overridden variables"_s));
    }

    auto overrides = parse_definitions(json["overrides"], path + ".overrides"_s);
    if (!overrides) {
        return make_error(std::move(overrides).error());
    }
    return ThemeDefinition{String(name), String(json["vars"].asString()), std::move(overrides).value()};
}

CompileResult<RuleDeclaration> parse_rule(const std::string& name, const Json::Value& json,
                                          const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }

    RuleDeclaration rule;
    rule.name = String(name);

    for (const auto& key : json.getMemberNames()) {
        const Json::Value& value = json[key];
        String value_path = member_path(path, key);

        if (key == "params") {
            if (!value.isArray()) {
                return make_error(input_error(value_path, "Expected an array of parameter names"_s));
            }
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                if (!value[i].isString()) {
                    return make_error(input_error(index_path(value_path, i), "Expected a string"_s));
                }
                rule.params.emplace_back(value[i].asString());
            }
        } else if (key == "__include__") {
            if (value.isString()) {
                rule.includes.emplace_back(value.asString());
                continue;
            }
            if (!value.isArray()) {
                return make_error(input_error(value_path, "Expected a rule name or an array of rule names"_s));
            }
            for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
                if (!value[i].isString()) {
                    return make_error(input_error(index_path(value_path, i), "Expected a string"_s));
                }
                rule.includes.emplace_back(value[i].asString());
            }
        } else if (key == "dynamic") {
            auto dynamic = parse_declarations(value, value_path);
            if (!dynamic) {
                return make_error(std::move(dynamic).error());
            }
            rule.dynamic_declarations = std::move(dynamic).value();
        } else {
            auto parsed = parse_value(value, value_path);
            if (!parsed) {
                return make_error(std::move(parsed).error());
            }
            rule.declarations.push_back(StyleDeclaration{String(key), std::move(parsed).value()});
        }
    }
    return rule;
}

template<typename Body, typename Parse>
Result<void, CompileError> parse_named(const Json::Value& json,
                                       const String& path,
                                       std::vector<Named<Body>>& out,
                                       Parse parse) {
    if (auto result = expect_object(json, path); !result) {
        return result;
    }
    for (const auto& name : json.getMemberNames()) {
        auto body = parse(json[name], member_path(path, name));
        if (!body) {
            return make_error(std::move(body).error());
        }
        out.push_back(Named<Body>{String(name), std::move(body).value()});
    }
    return {};
}

CompileResult<ModuleDocument> parse_module(const Json::Value& json, const String& path) {
    if (auto result = expect_object(json, path); !result) {
        return make_error(std::move(result).error());
    }
    if (!json["id"].isString() || json["id"].asString().empty()) {
        return make_error(input_error(path + ".id"_s, "Expected a module id"_s));
    }

    ModuleDocument module;
    module.id = String(json["id"].asString());

    if (json.isMember("vars")) {
        auto vars = parse_namespaces(json["vars"], path + ".vars"_s);
        if (!vars) {
            return make_error(std::move(vars).error());
        }
        module.vars = std::move(vars).value();
    }

    if (json.isMember("consts")) {
        auto consts = parse_namespaces(json["consts"], path + ".consts"_s);
        if (!consts) {
            return make_error(std::move(consts).error());
        }
        module.consts = std::move(consts).value();
    }

    if (json.isMember("themes")) {
        const Json::Value& themes = json["themes"];
        String themes_path = path + ".themes"_s;
        if (auto result = expect_object(themes, themes_path); !result) {
            return make_error(std::move(result).error());
        }
        for (const auto& name : themes.getMemberNames()) {
            auto theme = parse_theme(name, themes[name], member_path(themes_path, name));
            if (!theme) {
                return make_error(std::move(theme).error());
            }
            module.themes.push_back(std::move(theme).value());
        }
    }

    if (json.isMember("keyframes")) {
        if (auto result = parse_named(json["keyframes"], path + ".keyframes"_s, module.keyframes,
                                      parse_blocks);
            !result) {
            return make_error(std::move(result).error());
        }
    }

    if (json.isMember("position_try")) {
        if (auto result = parse_named(json["position_try"], path + ".position_try"_s,
                                      module.position_try, parse_declarations);
            !result) {
            return make_error(std::move(result).error());
        }
    }

    if (json.isMember("view_transitions")) {
        if (auto result = parse_named(json["view_transitions"], path + ".view_transitions"_s,
                                      module.view_transitions, parse_blocks);
            !result) {
            return make_error(std::move(result).error());
        }
    }

    if (json.isMember("rules")) {
        const Json::Value& rules = json["rules"];
        String rules_path = path + ".rules"_s;
        if (auto result = expect_object(rules, rules_path); !result) {
            return make_error(std::move(result).error());
        }
        for (const auto& name : rules.getMemberNames()) {
            auto rule = parse_rule(name, rules[name], member_path(rules_path, name));
            if (!rule) {
                return make_error(std::move(rule).error());
            }
            module.rules.push_back(std::move(rule).value());
        }
    }

    return module;
}

// Rules of a module are compiled in name order, so local includes are
// compiled on demand ahead of the rule that includes them
Result<void, CompileError> compile_rule_after_includes(const ModuleDocument& module,
                                                       const RuleDeclaration& rule,
                                                       style::Compiler& compiler,
                                                       std::set<String>& compiled,
                                                       std::set<String>& pending) {
    if (compiled.count(rule.name) > 0) {
        return {};
    }
    if (!pending.insert(rule.name).second) {
        return make_error(CompileError(ErrorKind::Input,
                                       "Rule '"_s + rule.name + "' is part of an include cycle"_s,
                                       "Remove the cycle from the __include__ lists"_s)
                              .with_context(module.id + "."_s + rule.name));
    }

    for (const auto& include : rule.includes) {
        auto local = std::find_if(module.rules.begin(), module.rules.end(),
                                  [&](const RuleDeclaration& r) { return r.name == include; });
        if (local == module.rules.end()) {
            continue;
        }
        if (auto result = compile_rule_after_includes(module, *local, compiler, compiled, pending);
            !result) {
            return result;
        }
    }

    pending.erase(rule.name);
    if (auto result = compiler.compile_rule(module.id, rule); !result) {
        return make_error(std::move(result).error());
    }
    compiled.insert(rule.name);
    return {};
}

} // anonymous namespace

// ============================================================================
// Values
// ============================================================================

CompileResult<StyleValue> parse_value(const Json::Value& json, const String& path) {
    if (json.isNull()) {
        return StyleValue::null();
    }
    if (json.isBool()) {
        return make_error(CompileError(ErrorKind::InvalidValue,
                                       "Boolean values are not supported"_s,
                                       "Use a string, a number or null"_s)
                              .with_context(path));
    }
    if (json.isNumeric()) {
        return StyleValue(json.asDouble());
    }
    if (json.isString()) {
        return StyleValue(String(json.asString()));
    }

    if (json.isArray()) {
        std::vector<StyleValue> items;
        for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
            auto item = parse_value(json[i], index_path(path, i));
            if (!item) {
                return make_error(std::move(item).error());
            }
            items.push_back(std::move(item).value());
        }
        return StyleValue::fallback(std::move(items));
    }

    if (json.size() == 1 && json.isMember("firstThatWorks")) {
        const Json::Value& list = json["firstThatWorks"];
        auto parsed = parse_value(list, path + ".firstThatWorks"_s);
        if (!parsed) {
            return make_error(std::move(parsed).error());
        }
        if (!list.isArray()) {
            return make_error(input_error(path + ".firstThatWorks"_s, "Expected an array"_s));
        }
        return StyleValue::first_that_works(parsed.value().items());
    }

    if (json.isMember("type") && json.isMember("value") && json["type"].isString()) {
        auto inner = parse_value(json["value"], path + ".value"_s);
        if (!inner) {
            return make_error(std::move(inner).error());
        }
        bool inherits = true;
        if (json.isMember("inherits")) {
            if (!json["inherits"].isBool()) {
                return make_error(input_error(path + ".inherits"_s, "Expected a boolean"_s));
            }
            inherits = json["inherits"].asBool();
        }
        return StyleValue::typed(String(json["type"].asString()), std::move(inner).value(), inherits);
    }

    std::vector<String> keys;
    std::vector<StyleValue> values;
    for (const auto& key : json.getMemberNames()) {
        auto value = parse_value(json[key], member_path(path, key));
        if (!value) {
            return make_error(std::move(value).error());
        }
        keys.emplace_back(key);
        values.push_back(std::move(value).value());
    }
    return StyleValue::conditional(std::move(keys), std::move(values));
}

// ============================================================================
// Documents
// ============================================================================

CompileResult<Document> parse_document_json(const Json::Value& root) {
    if (!root.isObject()) {
        return make_error(input_error("$"_s, "Expected a document object"_s));
    }

    Document document;
    auto config = parse_config(root["config"]);
    if (!config) {
        return make_error(std::move(config).error());
    }
    document.config = std::move(config).value();

    const Json::Value& modules = root["modules"];
    if (!modules.isNull() && !modules.isArray()) {
        return make_error(input_error("modules"_s, "Expected an array of modules"_s));
    }
    for (Json::ArrayIndex i = 0; i < modules.size(); ++i) {
        auto module = parse_module(modules[i], index_path("modules"_s, i));
        if (!module) {
            return make_error(std::move(module).error());
        }
        document.modules.push_back(std::move(module).value());
    }

    loader_log().debug_fmt("parse_document: {} modules", document.modules.size());
    return document;
}

CompileResult<Document> parse_document(std::string_view text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return make_error(CompileError(ErrorKind::Input, String(String(errors).trim()))
                              .with_context("$"_s));
    }
    return parse_document_json(root);
}

CompileResult<Document> load_document(const String& file_path) {
    std::ifstream in(file_path.c_str(), std::ios::binary);
    if (!in) {
        StringBuilder message;
        message.append_format("Cannot open file '{}'", file_path);
        return make_error(CompileError(ErrorKind::Input, message.build()));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    loader_log().debug_fmt("load_document: {}", file_path);

    auto document = parse_document(std::string_view(buffer.str()));
    if (!document) {
        CompileError error = std::move(document).error();
        return make_error(error.with_context(file_path + ":"_s + error.context));
    }
    return document;
}

// ============================================================================
// Compilation
// ============================================================================

Result<void, CompileError> compile_document(const Document& document, style::Compiler& compiler) {
    for (const auto& module : document.modules) {
        for (const auto& group : module.consts) {
            compiler.define_consts(module.id, group.ns, group.definitions);
        }
        for (const auto& group : module.vars) {
            if (auto result = compiler.define_vars(module.id, group.ns, group.definitions); !result) {
                return result;
            }
        }
        for (const auto& theme : module.themes) {
            if (auto result = compiler.create_theme(module.id, theme.name, theme.base_group,
                                                    theme.overrides);
                !result) {
                return make_error(std::move(result).error());
            }
        }
        for (const auto& keyframes : module.keyframes) {
            if (auto result = compiler.define_keyframes(module.id, keyframes.name, keyframes.body);
                !result) {
                return make_error(std::move(result).error());
            }
        }
        for (const auto& position_try : module.position_try) {
            if (auto result = compiler.define_position_try(module.id, position_try.name,
                                                           position_try.body);
                !result) {
                return make_error(std::move(result).error());
            }
        }
        for (const auto& transition : module.view_transitions) {
            if (auto result = compiler.define_view_transition(module.id, transition.name,
                                                              transition.body);
                !result) {
                return make_error(std::move(result).error());
            }
        }
        std::set<String> compiled;
        std::set<String> pending;
        for (const auto& rule : module.rules) {
            if (auto result = compile_rule_after_includes(module, rule, compiler, compiled, pending);
                !result) {
                return result;
            }
        }
        loader_log().debug_fmt("compile_document: module {} compiled", module.id);
    }
    return {};
}

} // namespace facet::loader
