/**
 * CSS value normalization
 */

#include "facet/css/value.hpp"
#include "facet/css/property.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <string_view>

namespace facet::css {

namespace {

bool is_word_char(char c) {
    return ascii::is_alphanumeric(c) || c == '_';
}

// Index of the first non-whitespace character at or after pos
usize skip_whitespace(std::string_view text, usize pos) {
    while (pos < text.size() && ascii::is_whitespace(text[pos])) {
        ++pos;
    }
    return pos;
}

// ============================================================================
// Normalization passes
// ============================================================================

std::string normalize_whitespace(std::string_view input) {
    std::string trimmed(String(input).trim().view());
    std::string_view text(trimmed);

    std::string out;
    out.reserve(text.size());

    usize i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (!ascii::is_whitespace(c)) {
            out.push_back(c);
            ++i;
            continue;
        }

        usize next = skip_whitespace(text, i);
        char before = out.empty() ? '\0' : out.back();
        char after = next < text.size() ? text[next] : '\0';

        bool drop = before == ',' || before == '(' ||
                    after == ',' || after == ')' ||
                    text.substr(next).starts_with("!important");
        if (!drop) {
            out.push_back(' ');
        }
        i = next;
    }
    return out;
}

// "500ms" -> "0.5s" for values of at least 10ms
std::string normalize_timings(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    usize i = 0;
    while (i < text.size()) {
        char c = text[i];
        bool number_start = ascii::is_digit(c) &&
                            (i == 0 || (!ascii::is_digit(text[i - 1]) && text[i - 1] != '.'));
        if (!number_start) {
            out.push_back(c);
            ++i;
            continue;
        }

        usize end = i;
        while (end < text.size() && ascii::is_digit(text[end])) ++end;
        if (end + 1 < text.size() && text[end] == '.' && ascii::is_digit(text[end + 1])) {
            ++end;
            while (end < text.size() && ascii::is_digit(text[end])) ++end;
        }

        auto number = text.substr(i, end - i);
        bool is_ms = text.substr(end).starts_with("ms") &&
                     (end + 2 >= text.size() || !is_word_char(text[end + 2]));

        f64 ms = 0;
        std::from_chars(number.data(), number.data() + number.size(), ms);

        if (is_ms && ms >= 10) {
            char buffer[64];
            auto result = std::to_chars(buffer, buffer + sizeof(buffer), ms / 1000.0);
            out.append(buffer, static_cast<usize>(result.ptr - buffer));
            out.push_back('s');
            i = end + 2;
        } else {
            out.append(number);
            i = end;
        }
    }
    return out;
}

// "0.5" -> ".5"
std::string normalize_leading_zeros(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (usize i = 0; i < text.size(); ++i) {
        bool leading_zero = text[i] == '0' &&
                            (i == 0 || !ascii::is_digit(text[i - 1])) &&
                            i + 2 < text.size() &&
                            text[i + 1] == '.' && ascii::is_digit(text[i + 2]);
        if (!leading_zero) {
            out.push_back(text[i]);
        }
    }
    return out;
}

constexpr std::array<std::string_view, 4> ANGLE_UNITS = {"deg", "grad", "turn", "rad"};
constexpr std::array<std::string_view, 2> TIME_UNITS = {"ms", "s"};
constexpr std::array<std::string_view, 20> LENGTH_UNITS = {
    "px", "em", "rem", "vh", "vw", "vmin", "vmax", "ch", "ex", "cm", "mm", "in",
    "pt", "pc", "dvh", "dvw", "lvh", "lvw", "svh", "svw",
};

// Length of the unit following a zero at `pos`, if one of `units` matches as a whole word
template<usize N>
usize match_zero_unit(std::string_view text, usize pos, const std::array<std::string_view, N>& units) {
    for (auto unit : units) {
        if (!text.substr(pos).starts_with(unit)) {
            continue;
        }
        usize end = pos + unit.size();
        if (end >= text.size() || !is_word_char(text[end])) {
            return unit.size();
        }
    }
    return 0;
}

// Inside functions a zero length is only shortened right before a separator
bool followed_by_separator(std::string_view text, usize pos) {
    usize next = skip_whitespace(text, pos);
    if (next >= text.size()) {
        return true;
    }
    char c = text[next];
    return c == ';' || c == ',' || c == '}' || c == ')';
}

std::string normalize_zero_dimensions(std::string_view text) {
    bool careful = text.find('(') != std::string_view::npos;

    std::string out;
    out.reserve(text.size());

    usize i = 0;
    while (i < text.size()) {
        bool zero_start = text[i] == '0' && (i == 0 || !is_word_char(text[i - 1]));
        if (!zero_start) {
            out.push_back(text[i]);
            ++i;
            continue;
        }

        usize unit_pos = i + 1;
        if (usize len = match_zero_unit(text, unit_pos, ANGLE_UNITS); len > 0) {
            out.append("0deg");
            i = unit_pos + len;
        } else if (usize len = match_zero_unit(text, unit_pos, TIME_UNITS); len > 0) {
            out.append("0s");
            i = unit_pos + len;
        } else if (usize len = match_zero_unit(text, unit_pos, LENGTH_UNITS);
                   len > 0 && (!careful || followed_by_separator(text, unit_pos + len))) {
            out.push_back('0');
            i = unit_pos + len;
        } else {
            out.push_back('0');
            ++i;
        }
    }
    return out;
}

// ============================================================================
// Quoting
// ============================================================================

bool has_matching_quotes(std::string_view value) {
    usize doubles = 0;
    usize singles = 0;
    for (char c : value) {
        if (c == '"') ++doubles;
        if (c == '\'') ++singles;
    }
    return doubles >= 2 || singles >= 2;
}

bool is_one_of(std::string_view value, std::initializer_list<std::string_view> options) {
    for (auto option : options) {
        if (value == option) return true;
    }
    return false;
}

String quote_content(const String& value) {
    static constexpr std::string_view FUNCTIONS[] = {
        "attr(", "counter(", "counters(", "url(", "linear-gradient(", "image-set(", "var(--",
    };

    String trimmed = value.trim();
    auto text = trimmed.view();

    for (auto fn : FUNCTIONS) {
        if (text.find(fn) != std::string_view::npos) {
            return trimmed;
        }
    }
    if (is_one_of(text, {"normal", "none", "open-quote", "close-quote", "no-open-quote",
                         "no-close-quote", "inherit", "initial", "revert", "revert-layer",
                         "unset"}) ||
        has_matching_quotes(text)) {
        return trimmed;
    }
    return "\""_s + trimmed + "\""_s;
}

String quote_hyphenate_character(const String& value) {
    String trimmed = value.trim();
    auto text = trimmed.view();
    if (is_one_of(text, {"auto", "inherit", "initial", "revert", "revert-layer", "unset"}) ||
        has_matching_quotes(text)) {
        return trimmed;
    }
    return "\""_s + trimmed + "\""_s;
}

// "background_color, opacity" -> "background-color,opacity"
String kebab_case_list(const String& value) {
    std::vector<String> parts;
    for (const auto& part : value.split(',')) {
        String trimmed = part.trim();
        if (is_custom_property(trimmed)) {
            parts.push_back(trimmed);
        } else {
            parts.push_back(trimmed.replace_all("_"_s, "-"_s));
        }
    }
    return join(parts, ",");
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

String normalize_value(const String& value) {
    std::string text = normalize_whitespace(value.view());
    text = normalize_timings(text);
    text = normalize_leading_zeros(text);
    text = normalize_zero_dimensions(text);
    return String(std::move(text)).replace_all("''"_s, "\"\""_s);
}

String format_number(f64 value, i32 max_decimals) {
    if (!std::isfinite(value)) {
        return "0"_s;
    }

    constexpr f64 EXACT_LIMIT = 9007199254740992.0;  // 2^53

    // Rounding only while the scaled value is still exact
    f64 factor = std::pow(10.0, max_decimals);
    f64 rounded = std::fabs(value * factor) < EXACT_LIMIT ? std::round(value * factor) / factor : value;

    if (rounded == std::trunc(rounded) && std::fabs(rounded) < EXACT_LIMIT) {
        StringBuilder sb;
        sb.append(static_cast<i64>(rounded));
        return sb.build();
    }

    char buffer[512];
    std::snprintf(buffer, sizeof(buffer), "%.*f", max_decimals, rounded);
    std::string text(buffer);
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    return String(std::move(text));
}

String number_to_css(f64 value, const String& property, const CompilerConfig& config) {
    String suffix = unit_suffix(property);

    if (property == "font-size"_s && suffix == "px"_s && config.font_size_px_to_rem &&
        config.font_size_root_px > 0) {
        return normalize_value(format_number(value / config.font_size_root_px) + "rem"_s);
    }
    return normalize_value(format_number(value) + suffix);
}

String string_to_css(const String& value, const String& property) {
    String normalized = normalize_value(value);

    if (property == "content"_s) {
        return quote_content(normalized);
    }
    if (property == "hyphenate-character"_s) {
        return quote_hyphenate_character(normalized);
    }
    if (property == "transition-property"_s || property == "will-change"_s) {
        return kebab_case_list(normalized);
    }
    return normalized;
}

} // namespace facet::css
