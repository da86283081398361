/**
 * Pseudo selector splitting, canonical ordering and priorities
 */

#include "facet/css/pseudo.hpp"
#include <algorithm>
#include <string_view>
#include <unordered_map>

namespace facet::css {

namespace {

// StyleX pseudo-class priority table
const std::unordered_map<std::string_view, i32>& pseudo_class_table() {
    static const std::unordered_map<std::string_view, i32> table = {
        // Functional and structural
        {":is", 40}, {":where", 40}, {":not", 40},
        {":has", 45},
        {":dir", 50}, {":lang", 51},
        {":first-child", 52}, {":first-of-type", 53},
        {":last-child", 54}, {":last-of-type", 55},
        {":only-child", 56}, {":only-of-type", 57},
        {":nth-child", 60}, {":nth-last-child", 61},
        {":nth-of-type", 62}, {":nth-last-of-type", 63},
        {":empty", 70},
        // Links
        {":link", 80}, {":any-link", 81}, {":local-link", 82},
        {":target-within", 83}, {":target", 84}, {":visited", 85},
        // Form state
        {":enabled", 91}, {":disabled", 92}, {":required", 93}, {":optional", 94},
        {":read-only", 95}, {":read-write", 96}, {":placeholder-shown", 97},
        {":in-range", 98}, {":out-of-range", 99}, {":default", 100},
        {":checked", 101}, {":indeterminate", 101}, {":blank", 102},
        {":valid", 103}, {":invalid", 104}, {":user-invalid", 105},
        {":autofill", 110},
        // Element display and media state
        {":picture-in-picture", 120}, {":modal", 121}, {":fullscreen", 122},
        {":paused", 123}, {":playing", 124},
        {":current", 125}, {":past", 126}, {":future", 127},
        // User action
        {":hover", 130}, {":focus-within", 140}, {":focus", 150},
        {":focus-visible", 160}, {":active", 170},
    };
    return table;
}

bool is_ident_char(char c) {
    return ascii::is_alpha(c) || c == '-';
}

// Reads [a-zA-Z-]+ starting at pos
std::string_view read_ident(std::string_view text, usize pos) {
    usize end = pos;
    while (end < text.size() && is_ident_char(text[end])) {
        ++end;
    }
    return text.substr(pos, end - pos);
}

// Sums the table values of every ":name" or ":name(...)" token
i32 combined_priority(std::string_view selector) {
    i32 total = 0;
    usize i = 0;
    while (i < selector.size()) {
        if (selector[i] != ':') {
            ++i;
            continue;
        }

        auto ident = read_ident(selector, i + 1);
        if (ident.empty()) {
            ++i;
            continue;
        }

        String base = ":"_s + String(ident);
        total += pseudo_class_priority(base.to_lowercase());
        i += 1 + ident.size();

        // Skip a functional argument up to the first closing parenthesis
        if (i < selector.size() && selector[i] == '(') {
            auto close = selector.find(')', i);
            i = (close == std::string_view::npos) ? selector.size() : close + 1;
        }
    }
    return total;
}

// Priority of the first user-action pseudo-class found in a complex selector
i32 extract_from_complex(std::string_view selector) {
    static constexpr std::string_view ACTIONS[] = {"hover", "focus", "active", "checked"};

    for (usize i = 0; i < selector.size(); ++i) {
        if (selector[i] != ':') {
            continue;
        }
        auto ident = read_ident(selector, i + 1);
        for (auto action : ACTIONS) {
            if (ident.starts_with(action)) {
                return pseudo_class_priority(":"_s + String(action));
            }
        }
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// Splitting and ordering
// ============================================================================

std::vector<String> split_pseudos(const String& combined) {
    std::vector<String> parts;
    std::string current;
    i32 depth = 0;

    auto text = combined.view();
    for (usize i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (depth == 0 && c == ':' && (i == 0 || text[i - 1] != ':')) {
            if (!current.empty()) {
                parts.emplace_back(std::move(current));
                current.clear();
            }
            current.push_back(c);
            continue;
        }

        if (c == '(') {
            ++depth;
        } else if (c == ')' && depth > 0) {
            --depth;
        }
        current.push_back(c);
    }

    if (!current.empty()) {
        parts.emplace_back(std::move(current));
    }
    return parts;
}

std::vector<String> sort_pseudos(std::vector<String> pseudos) {
    if (pseudos.size() < 2) {
        return pseudos;
    }

    auto run_start = pseudos.begin();
    for (auto it = pseudos.begin(); it != pseudos.end(); ++it) {
        if (is_pseudo_element(*it)) {
            std::stable_sort(run_start, it);
            run_start = it + 1;
        }
    }
    std::stable_sort(run_start, pseudos.end());
    return pseudos;
}

String sort_combined_pseudos(const String& combined) {
    if (combined.empty() || combined.contains('(')) {
        return combined;
    }
    return join(sort_pseudos(split_pseudos(combined)), "");
}

// ============================================================================
// Priorities
// ============================================================================

i32 pseudo_class_priority(const String& pseudo_class) {
    auto it = pseudo_class_table().find(pseudo_class.view());
    if (it == pseudo_class_table().end()) {
        return UNKNOWN_PSEUDO_CLASS_PRIORITY;
    }
    return it->second;
}

i32 pseudo_priority(const String& selector) {
    if (selector.empty()) {
        return 0;
    }

    auto text = selector.view();

    if (selector.starts_with("::"_s)) {
        usize end = 2;
        while (end < text.size() && (is_ident_char(text[end]) || ascii::is_digit(text[end]) ||
                                     text[end] == '_')) {
            ++end;
        }
        return PSEUDO_ELEMENT_PRIORITY + combined_priority(text.substr(end));
    }

    if (selector.starts_with(":"_s)) {
        return combined_priority(text);
    }

    return extract_from_complex(text);
}

} // namespace facet::css
