/**
 * Marker classes and contextual (ancestor/descendant/sibling) selectors
 */

#include "facet/css/when.hpp"
#include "facet/css/hash.hpp"

namespace facet::css {

namespace {

Result<void, CompileError> validate_pseudo(const String& pseudo) {
    if (pseudo.starts_with("::"_s)) {
        return make_error(CompileError(
            ErrorKind::InvalidSelector,
            "Pseudo-elements (::) are not supported in contextual selectors"_s,
            "Use a pseudo-class such as \":hover\" or \":focus-visible\""_s));
    }
    if (!pseudo.starts_with(":"_s)) {
        StringBuilder sb;
        sb.append_format("Pseudo selector must start with ':' (got \"{}\")", pseudo);
        return make_error(CompileError(ErrorKind::InvalidSelector, sb.build()));
    }
    return {};
}

// ".<marker><pseudo>"
String marked(const String& pseudo, const Marker& marker) {
    return "."_s + marker.class_name + pseudo;
}

} // anonymous namespace

// ============================================================================
// Markers
// ============================================================================

Marker default_marker(const CompilerConfig& config) {
    return Marker{config.class_name_prefix + "-default-marker"_s};
}

Marker define_marker(const CompilerConfig& config, const String& name) {
    return Marker{marker_class_name(config, name)};
}

// ============================================================================
// Contextual selectors
// ============================================================================

CompileResult<String> ancestor(const String& pseudo, const Marker& marker) {
    if (auto valid = validate_pseudo(pseudo); !valid) {
        return make_error(std::move(valid).error());
    }
    return ":where("_s + marked(pseudo, marker) + " *)"_s;
}

CompileResult<String> descendant(const String& pseudo, const Marker& marker) {
    if (auto valid = validate_pseudo(pseudo); !valid) {
        return make_error(std::move(valid).error());
    }
    return ":where(:has("_s + marked(pseudo, marker) + "))"_s;
}

CompileResult<String> sibling_before(const String& pseudo, const Marker& marker) {
    if (auto valid = validate_pseudo(pseudo); !valid) {
        return make_error(std::move(valid).error());
    }
    return ":where("_s + marked(pseudo, marker) + " ~ *)"_s;
}

CompileResult<String> sibling_after(const String& pseudo, const Marker& marker) {
    if (auto valid = validate_pseudo(pseudo); !valid) {
        return make_error(std::move(valid).error());
    }
    return ":where(:has(~ "_s + marked(pseudo, marker) + "))"_s;
}

CompileResult<String> any_sibling(const String& pseudo, const Marker& marker) {
    if (auto valid = validate_pseudo(pseudo); !valid) {
        return make_error(std::move(valid).error());
    }
    String target = marked(pseudo, marker);
    return ":where("_s + target + " ~ *, :has(~ "_s + target + "))"_s;
}

CompileResult<String> ancestor(const String& pseudo, const CompilerConfig& config) {
    return ancestor(pseudo, default_marker(config));
}

CompileResult<String> descendant(const String& pseudo, const CompilerConfig& config) {
    return descendant(pseudo, default_marker(config));
}

CompileResult<String> sibling_before(const String& pseudo, const CompilerConfig& config) {
    return sibling_before(pseudo, default_marker(config));
}

CompileResult<String> sibling_after(const String& pseudo, const CompilerConfig& config) {
    return sibling_after(pseudo, default_marker(config));
}

CompileResult<String> any_sibling(const String& pseudo, const CompilerConfig& config) {
    return any_sibling(pseudo, default_marker(config));
}

} // namespace facet::css
