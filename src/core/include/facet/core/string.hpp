#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <ostream>
#include <format>

namespace facet {

// ============================================================================
// ASCII utilities
// ============================================================================

namespace ascii {

[[nodiscard]] constexpr bool is_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_alphanumeric(char c) {
    return is_alpha(c) || is_digit(c);
}

[[nodiscard]] constexpr bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

[[nodiscard]] constexpr bool is_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

[[nodiscard]] constexpr bool is_lower(char c) {
    return c >= 'a' && c <= 'z';
}

[[nodiscard]] constexpr char to_lower(char c) {
    if (is_upper(c)) {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return c;
}

[[nodiscard]] constexpr char to_upper(char c) {
    if (is_lower(c)) {
        return static_cast<char>(c - ('a' - 'A'));
    }
    return c;
}

} // namespace ascii

// ============================================================================
// String - UTF-8 byte string with utilities
// ============================================================================

class String {
public:
    using iterator = std::string::iterator;
    using const_iterator = std::string::const_iterator;

    // Constructors
    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);
    String(usize count, char c);

    // Access
    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] usize length() const noexcept { return m_data.length(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(m_data);
    }

    [[nodiscard]] const std::string& std_string() const noexcept {
        return m_data;
    }

    [[nodiscard]] char front() const { return m_data.front(); }
    [[nodiscard]] char back() const { return m_data.back(); }

    // Iterators
    iterator begin() { return m_data.begin(); }
    iterator end() { return m_data.end(); }
    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }
    const_iterator cbegin() const { return m_data.cbegin(); }
    const_iterator cend() const { return m_data.cend(); }

    // Modification
    void append(const String& other);
    void append(std::string_view sv);
    void append(const char* str);
    void append(char c);
    void clear() { m_data.clear(); }

    // Substring
    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    // Search
    [[nodiscard]] std::optional<usize> find(const String& needle, usize start = 0) const;
    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] std::optional<usize> rfind(char c) const;
    [[nodiscard]] bool contains(const String& needle) const;
    [[nodiscard]] bool contains(char c) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;
    [[nodiscard]] bool ends_with(const String& suffix) const;

    // Transformations
    [[nodiscard]] String to_lowercase() const;
    [[nodiscard]] String to_uppercase() const;
    [[nodiscard]] String trim() const;
    [[nodiscard]] String trim_start() const;
    [[nodiscard]] String trim_end() const;
    [[nodiscard]] String replace_all(const String& from, const String& to) const;

    // Split
    [[nodiscard]] std::vector<String> split(char delimiter) const;
    [[nodiscard]] std::vector<String> split(const String& delimiter) const;
    [[nodiscard]] std::vector<String> split_whitespace() const;

    // Comparison
    [[nodiscard]] bool equals_ignore_case(const String& other) const;

    [[nodiscard]] friend bool operator==(const String& a, const String& b) {
        return a.m_data == b.m_data;
    }

    [[nodiscard]] friend bool operator<(const String& a, const String& b) {
        return a.m_data < b.m_data;
    }

    // Concatenation
    friend String operator+(const String& a, const String& b) {
        return String(a.m_data + b.m_data);
    }

    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);
    String& operator+=(const char* str);
    String& operator+=(char c);

    // Index access (byte-level)
    char& operator[](usize index) { return m_data[index]; }
    const char& operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

// String literal operator
inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

inline std::ostream& operator<<(std::ostream& os, const String& str) {
    return os << str.view();
}

// Join parts with a separator
[[nodiscard]] String join(const std::vector<String>& parts, std::string_view separator);

// ============================================================================
// StringBuilder - Efficient string building
// ============================================================================

class StringBuilder {
public:
    StringBuilder() = default;
    explicit StringBuilder(usize initial_capacity);

    StringBuilder& append(const String& str);
    StringBuilder& append(const std::string& str);
    StringBuilder& append(std::string_view sv);
    StringBuilder& append(const char* str);
    StringBuilder& append(char c);
    StringBuilder& append(i64 value);
    StringBuilder& append(u64 value);

    template<typename... Args>
    StringBuilder& append_format(std::format_string<Args...> format, Args&&... args) {
        m_buffer.append(std::format(format, std::forward<Args>(args)...));
        return *this;
    }

    void clear() { m_buffer.clear(); }
    void reserve(usize capacity) { m_buffer.reserve(capacity); }

    [[nodiscard]] String build() const { return String(m_buffer); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] bool empty() const { return m_buffer.empty(); }

private:
    std::string m_buffer;
};

} // namespace facet

template<>
struct std::formatter<facet::String> : std::formatter<std::string_view> {
    auto format(const facet::String& str, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(str.view(), ctx);
    }
};
