#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/config.hpp"
#include "facet/core/diagnostic.hpp"
#include "facet/style/atomic_class.hpp"
#include "facet/style/structural.hpp"
#include "facet/style/style_value.hpp"
#include "facet/style/vars.hpp"
#include <json/json.h>
#include <string_view>
#include <utility>
#include <vector>

namespace facet::style {
class Compiler;
}

namespace facet::loader {

// ============================================================================
// Declaration documents
// ============================================================================

struct NamespaceDefinitions {
    String ns;
    std::vector<style::VarDefinition> definitions;
};

struct ThemeDefinition {
    String name;
    String base_group;  // "<module>.<namespace>" of the overridden variables
    std::vector<style::VarDefinition> overrides;
};

template<typename Body>
struct Named {
    String name;
    Body body;
};

struct ModuleDocument {
    String id;
    std::vector<NamespaceDefinitions> vars;
    std::vector<NamespaceDefinitions> consts;
    std::vector<ThemeDefinition> themes;
    std::vector<Named<std::vector<style::DeclarationBlock>>> keyframes;
    std::vector<Named<std::vector<style::StyleDeclaration>>> position_try;
    std::vector<Named<std::vector<style::DeclarationBlock>>> view_transitions;
    std::vector<style::RuleDeclaration> rules;
};

struct Document {
    CompilerConfig config;
    std::vector<ModuleDocument> modules;
};

// ============================================================================
// Parsing
// ============================================================================

/**
 * Converts a JSON value to a StyleValue:
 *
 *   null                        -> Null
 *   "red", 10                   -> Scalar, Number
 *   [a, b]                      -> Fallback
 *   { "firstThatWorks": [...] } -> FirstThatWorks
 *   { "type": t, "value": v }   -> Typed (optional "inherits")
 *   { ... }                     -> Conditional
 *
 * Booleans are an InvalidValue error. Object keys are read in sorted order.
 */
[[nodiscard]] CompileResult<style::StyleValue> parse_value(const Json::Value& json, const String& path);

// Document from an already parsed JSON root
[[nodiscard]] CompileResult<Document> parse_document_json(const Json::Value& root);

// Parses JSON text; syntax errors are Input errors
[[nodiscard]] CompileResult<Document> parse_document(std::string_view text);

[[nodiscard]] CompileResult<Document> load_document(const String& file_path);

/**
 * Feeds every module of a document to the compiler: constants, variables,
 * themes, keyframes, position fallbacks, view transitions, then rules.
 * Stops at the first error.
 */
[[nodiscard]] Result<void, CompileError> compile_document(const Document& document,
                                                          style::Compiler& compiler);

} // namespace facet::loader
