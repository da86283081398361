/**
 * JSON compiler configuration
 */

#include "facet/loader/config.hpp"
#include "facet/core/logger.hpp"

namespace facet::loader {

namespace {

CompileError field_error(const String& path, std::string_view expected) {
    StringBuilder message;
    message.append_format("Expected {}", expected);
    return CompileError(ErrorKind::Input, message.build()).with_context(path);
}

Result<void, CompileError> read_bool(const Json::Value& json, const char* field, const String& path,
                                     bool& out) {
    if (!json.isMember(field)) {
        return {};
    }
    const Json::Value& value = json[field];
    if (!value.isBool()) {
        return make_error(field_error(path + "."_s + field, "a boolean"));
    }
    out = value.asBool();
    return {};
}

Result<void, CompileError> read_string(const Json::Value& json, const char* field, const String& path,
                                       String& out) {
    if (!json.isMember(field)) {
        return {};
    }
    const Json::Value& value = json[field];
    if (!value.isString()) {
        return make_error(field_error(path + "."_s + field, "a string"));
    }
    out = String(value.asString());
    return {};
}

CompileResult<ShorthandSelection> read_shorthand(const Json::Value& value, const String& path) {
    ShorthandSelection selection;
    if (value.isString()) {
        selection.name = String(value.asString());
        return selection;
    }
    if (!value.isObject()) {
        return make_error(field_error(path, "a strategy name or { \"name\", \"options\" } object"));
    }

    if (auto result = read_string(value, "name", path, selection.name); !result) {
        return make_error(std::move(result).error());
    }
    if (value.isMember("options")) {
        const Json::Value& options = value["options"];
        if (!options.isObject()) {
            return make_error(field_error(path + ".options"_s, "an object"));
        }
        for (const auto& name : options.getMemberNames()) {
            const Json::Value& option = options[name];
            if (!option.isString() && !option.isBool() && !option.isNumeric()) {
                return make_error(field_error(path + ".options."_s + String(name), "a scalar"));
            }
            selection.options[String(name)] = String(option.asString());
        }
    }
    return selection;
}

} // anonymous namespace

CompileResult<CompilerConfig> parse_config(const Json::Value& json, const String& path) {
    CompilerConfig config;
    if (json.isNull()) {
        return config;
    }
    if (!json.isObject()) {
        return make_error(field_error(path, "an object"));
    }

    for (auto result : {read_string(json, "class_name_prefix", path, config.class_name_prefix),
                        read_bool(json, "debug_class_names", path, config.debug_class_names),
                        read_bool(json, "use_css_layers", path, config.use_css_layers),
                        read_bool(json, "font_size_px_to_rem", path, config.font_size_px_to_rem)}) {
        if (!result) {
            return make_error(std::move(result).error());
        }
    }

    if (config.class_name_prefix.empty()) {
        return make_error(CompileError(ErrorKind::Configuration, "Class name prefix must not be empty"_s)
                              .with_context(path + ".class_name_prefix"_s));
    }

    if (json.isMember("font_size_root_px")) {
        const Json::Value& value = json["font_size_root_px"];
        if (!value.isNumeric() || value.asDouble() <= 0) {
            return make_error(field_error(path + ".font_size_root_px"_s, "a positive number"));
        }
        config.font_size_root_px = value.asDouble();
    }

    if (json.isMember("shorthand")) {
        auto selection = read_shorthand(json["shorthand"], path + ".shorthand"_s);
        if (!selection) {
            return make_error(std::move(selection).error());
        }
        config.shorthand = std::move(selection).value();
    }

    if (json.isMember("log_level")) {
        const Json::Value& value = json["log_level"];
        auto level = value.isString() ? parse_log_level(value.asString()) : std::nullopt;
        if (!level) {
            return make_error(field_error(path + ".log_level"_s,
                                          "one of trace, debug, info, warn, error, fatal, off"));
        }
        config.log_level = *level;
    }

    return config;
}

} // namespace facet::loader
