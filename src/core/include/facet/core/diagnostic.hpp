#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <string_view>
#include <vector>

namespace facet {

// ============================================================================
// Compile errors
// ============================================================================

enum class ErrorKind {
    Configuration,          // Invalid compiler configuration (e.g. shorthand strategy)
    InvalidSelector,        // Contextual selector or pseudo syntax
    InvalidCondition,       // Unknown key inside a condition map
    RejectedShorthand,      // Shorthand refused by the active strategy
    InvalidValue,           // Value of an unsupported shape
    LegacySyntax,           // Top-level pseudo/at-rule objects
    InvalidKeyframe,
    InvalidPositionTry,
    InvalidViewTransition,
    UnknownReference,       // Theme override of a missing variable, etc.
    Input,                  // Malformed declaration document
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:         return "ConfigurationError";
        case ErrorKind::InvalidSelector:       return "InvalidSelectorError";
        case ErrorKind::InvalidCondition:      return "InvalidConditionError";
        case ErrorKind::RejectedShorthand:     return "RejectedShorthandError";
        case ErrorKind::InvalidValue:          return "InvalidValueError";
        case ErrorKind::LegacySyntax:          return "LegacySyntaxError";
        case ErrorKind::InvalidKeyframe:       return "InvalidKeyframeError";
        case ErrorKind::InvalidPositionTry:    return "InvalidPositionTryError";
        case ErrorKind::InvalidViewTransition: return "InvalidViewTransitionError";
        case ErrorKind::UnknownReference:      return "UnknownReferenceError";
        case ErrorKind::Input:                 return "InputError";
    }
    return "Error";
}

struct CompileError {
    ErrorKind kind{ErrorKind::InvalidValue};
    String message;
    String hint;      // Remediation, e.g. the longhands replacing a rejected shorthand
    String context;   // Dotted rule key or document path

    CompileError() = default;
    CompileError(ErrorKind k, String msg, String h = String())
        : kind(k), message(std::move(msg)), hint(std::move(h)) {}

    [[nodiscard]] CompileError with_context(String ctx) const {
        CompileError copy = *this;
        copy.context = std::move(ctx);
        return copy;
    }

    [[nodiscard]] String to_string() const {
        StringBuilder sb;
        sb.append(error_kind_name(kind));
        if (!context.empty()) {
            sb.append(" in ");
            sb.append(context);
        }
        sb.append(": ");
        sb.append(message);
        if (!hint.empty()) {
            sb.append('\n');
            sb.append(hint);
        }
        return sb.build();
    }
};

template<typename T>
using CompileResult = Result<T, CompileError>;

// ============================================================================
// Diagnostics collected across a build
// ============================================================================

enum class DiagnosticStage {
    Loader,
    Compiler,
    Assembler,
};

enum class DiagnosticLevel {
    Info,
    Warning,
    Error,
};

struct Diagnostic {
    DiagnosticStage stage{DiagnosticStage::Compiler};
    DiagnosticLevel level{DiagnosticLevel::Error};
    String message;
    String context;
};

class DiagnosticSink {
public:
    void add(DiagnosticStage stage,
             DiagnosticLevel level,
             String message,
             String context = ""_s) {
        Diagnostic d;
        d.stage = stage;
        d.level = level;
        d.message = std::move(message);
        d.context = std::move(context);
        m_diags.push_back(std::move(d));
    }

    void add_error(DiagnosticStage stage, const CompileError& error) {
        add(stage, DiagnosticLevel::Error, error.to_string(), error.context);
    }

    void clear() { m_diags.clear(); }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return m_diags; }

    [[nodiscard]] bool has_errors() const {
        for (const auto& d : m_diags) {
            if (d.level == DiagnosticLevel::Error) {
                return true;
            }
        }
        return false;
    }

private:
    std::vector<Diagnostic> m_diags;
};

} // namespace facet
