/**
 * Keyframes, @position-try and view transition code generation
 */

#include "facet/style/structural.hpp"
#include "facet/style/value_resolver.hpp"
#include "facet/css/hash.hpp"
#include "facet/css/property.hpp"
#include "facet/css/value.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <initializer_list>
#include <optional>

namespace facet::style {

namespace {

bool by_property(const css::Declaration& a, const css::Declaration& b) {
    return a.property < b.property;
}

// "prop:value;" for each declaration
String declaration_text(const std::vector<css::Declaration>& declarations) {
    StringBuilder sb;
    for (const auto& decl : declarations) {
        sb.append(decl.property);
        sb.append(':');
        sb.append(decl.value);
        sb.append(';');
    }
    return sb.build();
}

std::optional<f64> parse_percentage(const String& part) {
    String text = part.trim();
    if (!text.ends_with("%"_s) || text.size() < 2) {
        return std::nullopt;
    }
    auto digits = text.view().substr(0, text.size() - 1);
    f64 value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

constexpr std::array<std::string_view, 4> VIEW_TRANSITION_PSEUDOS = {
    "group", "image-pair", "old", "new",
};

constexpr std::string_view ONLY_CHILD_SUFFIX = "-only-child";

String view_transition_selector(const ViewTransitionStyle& style) {
    return style.only_child ? style.pseudo + ":only-child"_s : style.pseudo;
}

} // anonymous namespace

// ============================================================================
// Keyframes
// ============================================================================

CompileResult<f64> keyframe_position(const String& key) {
    String trimmed = key.trim();
    if (trimmed == "from"_s) {
        return 0.0;
    }
    if (trimmed == "to"_s) {
        return 100.0;
    }

    std::optional<f64> first;
    for (const auto& part : trimmed.split(',')) {
        auto position = parse_percentage(part);
        if (!position) {
            first.reset();
            break;
        }
        if (!first) {
            first = position;
        }
    }
    if (!first) {
        StringBuilder message;
        message.append_format("Invalid keyframe key \"{}\"", key);
        return make_error(CompileError(ErrorKind::InvalidKeyframe, message.build(),
                                       "Expected 'from', 'to', or a percentage like '50%'"_s));
    }
    return *first;
}

CompileResult<KeyframesEntry> compile_keyframes(const CompilerConfig& config,
                                                const std::vector<DeclarationBlock>& frames) {
    if (frames.empty()) {
        return make_error(CompileError(ErrorKind::InvalidKeyframe,
                                       "Keyframes must define at least one frame"_s));
    }

    KeyframesEntry entry;
    for (const auto& block : frames) {
        auto position = keyframe_position(block.key);
        if (!position) {
            return make_error(std::move(position).error());
        }

        Keyframe frame;
        frame.key = block.key.trim();
        frame.position = position.value();
        for (const auto& decl : block.declarations) {
            if (decl.value.is_null()) {
                continue;
            }
            String property = css::to_css_property(decl.property);
            if (!decl.value.is_leaf()) {
                StringBuilder message;
                message.append_format("Keyframe value for '{}' in frame '{}' must be a string or number",
                                      property, frame.key);
                return make_error(CompileError(ErrorKind::InvalidKeyframe, message.build()));
            }
            auto text = leaf_to_css(property, decl.value, config);
            if (!text) {
                return make_error(std::move(text).error());
            }
            frame.declarations.push_back(css::Declaration{property, std::move(text).value()});
        }
        entry.frames.push_back(std::move(frame));
    }

    // The name hashes frames by key and declarations by property, so
    // declaration order does not change the identity
    std::vector<Keyframe> canonical = entry.frames;
    std::sort(canonical.begin(), canonical.end(),
              [](const Keyframe& a, const Keyframe& b) { return a.key < b.key; });
    StringBuilder frames_text;
    for (auto& frame : canonical) {
        std::stable_sort(frame.declarations.begin(), frame.declarations.end(), by_property);
        frames_text.append(frame.key);
        frames_text.append('{');
        frames_text.append(declaration_text(frame.declarations));
        frames_text.append('}');
    }
    entry.css_name = css::keyframes_name(config, frames_text.build());

    std::stable_sort(entry.frames.begin(), entry.frames.end(),
                     [](const Keyframe& a, const Keyframe& b) {
                         if (a.position != b.position) {
                             return a.position < b.position;
                         }
                         return a.key < b.key;
                     });
    return entry;
}

String keyframes_css(const KeyframesEntry& entry) {
    StringBuilder ltr;
    StringBuilder rtl;
    bool direction_dependent = false;

    for (const auto& frame : entry.frames) {
        std::vector<css::Declaration> ltr_decls;
        std::vector<css::Declaration> rtl_decls;
        for (const auto& decl : frame.declarations) {
            ltr_decls.push_back(css::to_ltr(decl.property, decl.value));
            if (auto flipped = css::to_rtl(decl.property, decl.value)) {
                rtl_decls.push_back(std::move(*flipped));
                direction_dependent = true;
            } else {
                rtl_decls.push_back(ltr_decls.back());
            }
        }
        ltr.append_format("{}{{{}}}", frame.key, declaration_text(ltr_decls));
        rtl.append_format("{}{{{}}}", frame.key, declaration_text(rtl_decls));
    }

    StringBuilder out;
    out.append_format("@keyframes {}{{{}}}", entry.css_name, ltr.build());
    if (direction_dependent) {
        out.append_format("\nhtml[dir=\"rtl\"]{{@keyframes {}{{{}}}}}", entry.css_name, rtl.build());
    }
    return out.build();
}

// ============================================================================
// @position-try
// ============================================================================

CompileResult<PositionTryEntry> compile_position_try(
    const CompilerConfig& config, const std::vector<StyleDeclaration>& declarations) {
    std::vector<String> invalid;
    PositionTryEntry entry;

    for (const auto& decl : declarations) {
        String property = css::to_css_property(decl.property);
        if (!css::is_position_try_property(property)) {
            invalid.push_back(property);
            continue;
        }
        if (decl.value.is_null()) {
            continue;
        }

        String value;
        if (decl.value.is_number()) {
            value = css::format_number(decl.value.number()) + "px"_s;
        } else if (decl.value.is_scalar()) {
            value = css::string_to_css(decl.value.text(), property);
        } else {
            StringBuilder message;
            message.append_format("Position-try value for '{}' must be a string or number", property);
            return make_error(CompileError(ErrorKind::InvalidPositionTry, message.build()));
        }
        entry.declarations.push_back(css::Declaration{property, value});
    }

    if (!invalid.empty()) {
        StringBuilder message;
        message.append_format("Invalid properties in position-try: {}", join(invalid, ", "));
        return make_error(CompileError(
            ErrorKind::InvalidPositionTry, message.build(),
            "Only positioning properties are allowed: insets, margins, sizes, self-alignment, "
            "position-anchor and position-area"_s));
    }

    std::stable_sort(entry.declarations.begin(), entry.declarations.end(), by_property);

    StringBuilder hashed;
    for (const auto& decl : entry.declarations) {
        hashed.append_format("{}:{};{}:{};", decl.property, decl.property, decl.property, decl.value);
    }
    entry.css_name = css::position_try_name(config, hashed.build());
    return entry;
}

String position_try_css(const PositionTryEntry& entry) {
    StringBuilder sb;
    sb.append_format("@position-try {}{{{}}}", entry.css_name, declaration_text(entry.declarations));
    return sb.build();
}

// ============================================================================
// View transitions
// ============================================================================

CompileResult<ViewTransitionEntry> compile_view_transition(
    const CompilerConfig& config, const std::vector<DeclarationBlock>& styles) {
    std::vector<String> invalid;
    std::vector<ViewTransitionStyle> declared;

    for (const auto& block : styles) {
        String pseudo = block.key.trim().replace_all("_"_s, "-"_s);
        if (pseudo.starts_with(":"_s)) {
            pseudo = pseudo.substring(1);
        }
        bool only_child = pseudo.ends_with(String(ONLY_CHILD_SUFFIX));
        if (only_child) {
            pseudo = pseudo.substring(0, pseudo.size() - ONLY_CHILD_SUFFIX.size());
        }
        bool known = std::find(VIEW_TRANSITION_PSEUDOS.begin(), VIEW_TRANSITION_PSEUDOS.end(),
                               pseudo.view()) != VIEW_TRANSITION_PSEUDOS.end();
        if (!known) {
            invalid.push_back(block.key);
            continue;
        }

        ViewTransitionStyle style;
        style.pseudo = pseudo;
        style.only_child = only_child;
        for (const auto& decl : block.declarations) {
            if (decl.value.is_null()) {
                continue;
            }
            String property = css::to_css_property(decl.property);
            auto text = leaf_to_css(property, decl.value, config);
            if (!text) {
                return make_error(CompileError(ErrorKind::InvalidViewTransition,
                                               std::move(text).error().message));
            }
            style.declarations.push_back(css::Declaration{property, std::move(text).value()});
        }
        declared.push_back(std::move(style));
    }

    if (!invalid.empty()) {
        StringBuilder message;
        message.append_format("Invalid view transition keys: {}", join(invalid, ", "));
        return make_error(CompileError(ErrorKind::InvalidViewTransition, message.build(),
                                       "Valid keys: group, image-pair, old, new and their -only-child forms"_s));
    }

    StringBuilder hashed;
    for (const auto& style : declared) {
        hashed.append_format("::view-transition-{}:{};", view_transition_selector(style),
                             declaration_text(style.declarations));
    }

    ViewTransitionEntry entry;
    entry.css_name = css::view_transition_class_name(config, hashed.build());
    for (bool only_child : {false, true}) {
        for (auto name : VIEW_TRANSITION_PSEUDOS) {
            for (auto& style : declared) {
                if (style.pseudo.view() == name && style.only_child == only_child) {
                    std::stable_sort(style.declarations.begin(), style.declarations.end(),
                                     by_property);
                    entry.styles.push_back(style);
                }
            }
        }
    }
    return entry;
}

String view_transition_css(const ViewTransitionEntry& entry) {
    StringBuilder sb;
    for (const auto& style : entry.styles) {
        sb.append_format("::view-transition-{}(*.{}){}{{{}}}", style.pseudo, entry.css_name,
                         style.only_child ? ":only-child" : "",
                         declaration_text(style.declarations));
    }
    return sb.build();
}

} // namespace facet::style
