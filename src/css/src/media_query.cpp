/**
 * Range bounding of sequential width media queries
 */

#include "facet/css/media_query.hpp"
#include "facet/css/value.hpp"
#include <algorithm>
#include <charconv>
#include <string_view>

namespace facet::css {

namespace {

struct IndexedQuery {
    usize index;
    WidthQuery query;
};

String width_clause(const char* feature, f64 value, const String& unit) {
    return "("_s + String(feature) + ": "_s + format_number(value, 2) + unit + ")"_s;
}

String bounded_key(f64 min_value, f64 max_value, const String& unit) {
    return "@media "_s + width_clause("min-width", min_value, unit) + " and "_s +
           width_clause("max-width", max_value, unit);
}

} // anonymous namespace

std::optional<WidthQuery> parse_width_query(const String& key) {
    String trimmed = key.trim();
    auto text = trimmed.view();
    if (!text.starts_with("@media")) {
        return std::nullopt;
    }
    text.remove_prefix(6);
    while (!text.empty() && ascii::is_whitespace(text.front())) text.remove_prefix(1);

    WidthQuery query;
    if (text.starts_with("(min-width:")) {
        query.bound = WidthBound::Min;
    } else if (text.starts_with("(max-width:")) {
        query.bound = WidthBound::Max;
    } else {
        return std::nullopt;
    }
    text.remove_prefix(11);
    while (!text.empty() && ascii::is_whitespace(text.front())) text.remove_prefix(1);

    usize end = 0;
    while (end < text.size() && (ascii::is_digit(text[end]) || text[end] == '.')) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    auto parsed = std::from_chars(text.data(), text.data() + end, query.value);
    if (parsed.ec != std::errc() || parsed.ptr != text.data() + end) {
        return std::nullopt;
    }
    text.remove_prefix(end);

    for (std::string_view unit : {"px)", "em)", "rem)"}) {
        if (text == unit) {
            query.unit = String(unit.substr(0, unit.size() - 1));
            return query;
        }
    }
    return std::nullopt;
}

std::vector<String> bound_media_queries(const std::vector<String>& keys) {
    std::vector<String> result = keys;

    usize media_count = std::count_if(keys.begin(), keys.end(), [](const String& key) {
        return key.starts_with("@media "_s);
    });
    if (media_count < 2) {
        return result;
    }

    std::vector<IndexedQuery> min_queries;
    std::vector<IndexedQuery> max_queries;
    for (usize i = 0; i < keys.size(); ++i) {
        auto query = parse_width_query(keys[i]);
        if (!query) continue;
        if (query->bound == WidthBound::Min) {
            min_queries.push_back({i, *query});
        } else {
            max_queries.push_back({i, *query});
        }
    }

    if (min_queries.size() >= 2) {
        std::stable_sort(min_queries.begin(), min_queries.end(),
                         [](const IndexedQuery& a, const IndexedQuery& b) {
                             return a.query.value < b.query.value;
                         });
        for (usize i = 0; i + 1 < min_queries.size(); ++i) {
            const auto& current = min_queries[i];
            f64 upper = min_queries[i + 1].query.value - 0.01;
            result[current.index] = bounded_key(current.query.value, upper, current.query.unit);
        }
    }

    if (max_queries.size() >= 2) {
        std::stable_sort(max_queries.begin(), max_queries.end(),
                         [](const IndexedQuery& a, const IndexedQuery& b) {
                             return a.query.value > b.query.value;
                         });
        for (usize i = 0; i + 1 < max_queries.size(); ++i) {
            const auto& current = max_queries[i];
            f64 lower = max_queries[i + 1].query.value + 0.01;
            result[current.index] = bounded_key(lower, current.query.value, current.query.unit);
        }
    }

    return result;
}

} // namespace facet::css
