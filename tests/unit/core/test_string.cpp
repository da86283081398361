#include <gtest/gtest.h>
#include "facet/core/string.hpp"

using namespace facet;

// ============================================================================
// ASCII Tests
// ============================================================================

TEST(AsciiTest, CharacterClasses) {
    EXPECT_TRUE(ascii::is_alpha('a'));
    EXPECT_TRUE(ascii::is_alpha('Z'));
    EXPECT_FALSE(ascii::is_alpha('1'));
    EXPECT_TRUE(ascii::is_digit('7'));
    EXPECT_TRUE(ascii::is_whitespace(' '));
    EXPECT_TRUE(ascii::is_whitespace('\n'));
    EXPECT_FALSE(ascii::is_whitespace('-'));
}

TEST(AsciiTest, CaseConversion) {
    EXPECT_EQ(ascii::to_lower('A'), 'a');
    EXPECT_EQ(ascii::to_lower('-'), '-');
    EXPECT_EQ(ascii::to_upper('z'), 'Z');
}

// ============================================================================
// String Tests
// ============================================================================

TEST(StringTest, DefaultConstruction) {
    String s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
}

TEST(StringTest, FromCString) {
    String s("hello");
    EXPECT_EQ(s.size(), 5u);
    EXPECT_EQ(s, "hello");
}

TEST(StringTest, Literal) {
    auto s = "color"_s;
    EXPECT_EQ(s, String("color"));
}

TEST(StringTest, Concatenation) {
    String s = "--x"_s + "-"_s + "width"_s;
    EXPECT_EQ(s, "--x-width");

    s += ':';
    s += "10px";
    EXPECT_EQ(s, "--x-width:10px");
}

TEST(StringTest, Comparison) {
    EXPECT_TRUE("a"_s < "b"_s);
    EXPECT_FALSE("b"_s < "a"_s);
    EXPECT_NE("a"_s, "A"_s);
}

TEST(StringTest, Find) {
    String s = "var(--x)";
    auto paren = s.find('(');
    ASSERT_TRUE(paren.has_value());
    EXPECT_EQ(*paren, 3u);

    EXPECT_FALSE(s.find('{').has_value());
    EXPECT_EQ(s.find("--"_s).value_or(0), 4u);
    EXPECT_FALSE(s.find('(', 4).has_value());
}

TEST(StringTest, Contains) {
    String s = "margin-inline-start";
    EXPECT_TRUE(s.contains("inline"_s));
    EXPECT_TRUE(s.contains('-'));
    EXPECT_FALSE(s.contains("block"_s));
}

TEST(StringTest, StartsEndsWith) {
    String s = "@media (min-width: 800px)";
    EXPECT_TRUE(s.starts_with("@media"_s));
    EXPECT_TRUE(s.ends_with(")"_s));
    EXPECT_FALSE(s.starts_with("@supports"_s));
}

TEST(StringTest, Substring) {
    String s = ":hover:focus";
    EXPECT_EQ(s.substring(0, 6), ":hover");
    EXPECT_EQ(s.substring(6), ":focus");
}

TEST(StringTest, Trim) {
    EXPECT_EQ("  red  "_s.trim(), "red");
    EXPECT_EQ("  red  "_s.trim_start(), "red  ");
    EXPECT_EQ("  red  "_s.trim_end(), "  red");
    EXPECT_EQ("   "_s.trim(), "");
}

TEST(StringTest, CaseConversion) {
    EXPECT_EQ("Hello"_s.to_lowercase(), "hello");
    EXPECT_EQ("Hello"_s.to_uppercase(), "HELLO");
    EXPECT_TRUE("DEBUG"_s.equals_ignore_case("debug"_s));
}

TEST(StringTest, ReplaceAll) {
    EXPECT_EQ("a_b_c"_s.replace_all("_"_s, "-"_s), "a-b-c");
    EXPECT_EQ("abc"_s.replace_all(""_s, "-"_s), "abc");
}

TEST(StringTest, SplitKeepsEmptyParts) {
    auto parts = "a,,b"_s.split(',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(StringTest, SplitByString) {
    auto parts = "a, b, c"_s.split(", "_s);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[2], "c");
}

TEST(StringTest, SplitWhitespace) {
    auto parts = "  1px \t solid\nred "_s.split_whitespace();
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "1px");
    EXPECT_EQ(parts[1], "solid");
    EXPECT_EQ(parts[2], "red");
}

TEST(StringTest, Join) {
    EXPECT_EQ(join({"x1", "x2", "x3"}, " "), "x1 x2 x3");
    EXPECT_EQ(join({}, " "), "");
}

TEST(StringTest, Format) {
    EXPECT_EQ(std::format("{}:{}", "color"_s, "red"_s), "color:red");
}

// ============================================================================
// StringBuilder Tests
// ============================================================================

TEST(StringBuilderTest, Basic) {
    StringBuilder sb;
    sb.append("Hello");
    sb.append(", ");
    sb.append("World"_s);
    sb.append('!');

    EXPECT_EQ(sb.build(), "Hello, World!");
}

TEST(StringBuilderTest, Numbers) {
    StringBuilder sb;
    sb.append(static_cast<i64>(-3));
    sb.append(' ');
    sb.append(static_cast<u64>(42));

    EXPECT_EQ(sb.build(), "-3 42");
}

TEST(StringBuilderTest, AppendFormat) {
    StringBuilder sb;
    sb.append_format(".{}{{{}:{}}}", "x1"_s, "color", "red");

    EXPECT_EQ(sb.build(), ".x1{color:red}");
}

TEST(StringBuilderTest, Clear) {
    StringBuilder sb;
    sb.append("abc");
    EXPECT_EQ(sb.size(), 3u);
    sb.clear();
    EXPECT_TRUE(sb.empty());
}
