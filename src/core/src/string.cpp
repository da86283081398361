/**
 * String utilities shared by the CSS tables and the style engine
 */

#include "facet/core/string.hpp"
#include <algorithm>
#include <charconv>
#include <cstring>

namespace facet {

// ============================================================================
// String implementation
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

String::String(usize count, char c) : m_data(count, c) {}

void String::append(const String& other) {
    m_data.append(other.m_data);
}

void String::append(std::string_view sv) {
    m_data.append(sv);
}

void String::append(const char* str) {
    if (str) {
        m_data.append(str);
    }
}

void String::append(char c) {
    m_data.push_back(c);
}

String String::substring(usize start, usize length) const {
    if (start >= m_data.size()) {
        return String();
    }
    return String(m_data.substr(start, length));
}

std::optional<usize> String::find(const String& needle, usize start) const {
    auto pos = m_data.find(needle.m_data, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<usize> String::find(char c, usize start) const {
    auto pos = m_data.find(c, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<usize> String::rfind(char c) const {
    auto pos = m_data.rfind(c);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::contains(const String& needle) const {
    return m_data.find(needle.m_data) != std::string::npos;
}

bool String::contains(char c) const {
    return m_data.find(c) != std::string::npos;
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

bool String::ends_with(const String& suffix) const {
    return m_data.ends_with(suffix.m_data);
}

String String::to_lowercase() const {
    std::string result(m_data);
    std::transform(result.begin(), result.end(), result.begin(), ascii::to_lower);
    return String(std::move(result));
}

String String::to_uppercase() const {
    std::string result(m_data);
    std::transform(result.begin(), result.end(), result.begin(), ascii::to_upper);
    return String(std::move(result));
}

String String::trim() const {
    return trim_start().trim_end();
}

String String::trim_start() const {
    auto start = m_data.begin();
    while (start != m_data.end() && ascii::is_whitespace(*start)) {
        ++start;
    }
    return String(std::string(start, m_data.end()));
}

String String::trim_end() const {
    auto end = m_data.end();
    while (end != m_data.begin() && ascii::is_whitespace(*(end - 1))) {
        --end;
    }
    return String(std::string(m_data.begin(), end));
}

String String::replace_all(const String& from, const String& to) const {
    if (from.empty()) {
        return *this;
    }

    std::string result;
    result.reserve(m_data.size());

    usize start = 0;
    usize pos = m_data.find(from.m_data);
    while (pos != std::string::npos) {
        result.append(m_data, start, pos - start);
        result.append(to.m_data);
        start = pos + from.size();
        pos = m_data.find(from.m_data, start);
    }
    result.append(m_data, start, std::string::npos);
    return String(std::move(result));
}

std::vector<String> String::split(char delimiter) const {
    std::vector<String> result;
    usize start = 0;
    usize end = m_data.find(delimiter);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + 1;
        end = m_data.find(delimiter, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

std::vector<String> String::split(const String& delimiter) const {
    std::vector<String> result;
    usize start = 0;
    usize end = m_data.find(delimiter.m_data);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + delimiter.size();
        end = m_data.find(delimiter.m_data, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

std::vector<String> String::split_whitespace() const {
    std::vector<String> result;
    usize i = 0;
    while (i < m_data.size()) {
        while (i < m_data.size() && ascii::is_whitespace(m_data[i])) {
            ++i;
        }
        usize start = i;
        while (i < m_data.size() && !ascii::is_whitespace(m_data[i])) {
            ++i;
        }
        if (i > start) {
            result.emplace_back(m_data.substr(start, i - start));
        }
    }
    return result;
}

bool String::equals_ignore_case(const String& other) const {
    return to_lowercase() == other.to_lowercase();
}

String& String::operator+=(const String& other) {
    m_data += other.m_data;
    return *this;
}

String& String::operator+=(std::string_view sv) {
    m_data += sv;
    return *this;
}

String& String::operator+=(const char* str) {
    append(str);
    return *this;
}

String& String::operator+=(char c) {
    m_data.push_back(c);
    return *this;
}

String join(const std::vector<String>& parts, std::string_view separator) {
    StringBuilder builder;
    for (usize i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            builder.append(separator);
        }
        builder.append(parts[i]);
    }
    return builder.build();
}

// ============================================================================
// StringBuilder implementation
// ============================================================================

StringBuilder::StringBuilder(usize initial_capacity) {
    m_buffer.reserve(initial_capacity);
}

StringBuilder& StringBuilder::append(const String& str) {
    m_buffer.append(str.std_string());
    return *this;
}

StringBuilder& StringBuilder::append(const std::string& str) {
    m_buffer.append(str);
    return *this;
}

StringBuilder& StringBuilder::append(std::string_view sv) {
    m_buffer.append(sv);
    return *this;
}

StringBuilder& StringBuilder::append(const char* str) {
    if (str) {
        m_buffer.append(str);
    }
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer.push_back(c);
    return *this;
}

StringBuilder& StringBuilder::append(i64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

StringBuilder& StringBuilder::append(u64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

} // namespace facet
