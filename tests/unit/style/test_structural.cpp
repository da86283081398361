#include <gtest/gtest.h>
#include "facet/style/structural.hpp"

using namespace facet;
using namespace facet::style;

// ============================================================================
// Keyframes
// ============================================================================

TEST(KeyframesTest, Positions) {
    EXPECT_DOUBLE_EQ(keyframe_position("from").value(), 0.0);
    EXPECT_DOUBLE_EQ(keyframe_position("to").value(), 100.0);
    EXPECT_DOUBLE_EQ(keyframe_position("50%").value(), 50.0);
    EXPECT_DOUBLE_EQ(keyframe_position("25%, 75%").value(), 25.0);
}

TEST(KeyframesTest, InvalidPosition) {
    auto position = keyframe_position("middle");

    ASSERT_TRUE(position.is_err());
    EXPECT_EQ(position.error().kind, ErrorKind::InvalidKeyframe);
    EXPECT_EQ(position.error().message, "Invalid keyframe key \"middle\"");
    EXPECT_EQ(position.error().hint, "Expected 'from', 'to', or a percentage like '50%'");
}

TEST(KeyframesTest, FadeIn) {
    CompilerConfig config;
    auto entry = compile_keyframes(config, {
        {"to", {{"opacity", 1}}},
        {"from", {{"opacity", 0}}},
    });

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().css_name, "x18re5ia-B");
    ASSERT_EQ(entry.value().frames.size(), 2u);
    EXPECT_EQ(entry.value().frames[0].key, "from");
    EXPECT_EQ(keyframes_css(entry.value()),
              "@keyframes x18re5ia-B{from{opacity:0;}to{opacity:1;}}");
}

TEST(KeyframesTest, NameIgnoresDeclarationOrder) {
    CompilerConfig config;
    auto a = compile_keyframes(config, {{"from", {{"opacity", 0}, {"width", 10}}}});
    auto b = compile_keyframes(config, {{"from", {{"width", 10}, {"opacity", 0}}}});

    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value().css_name, b.value().css_name);
}

TEST(KeyframesTest, DirectionDependentFrames) {
    CompilerConfig config;
    auto entry = compile_keyframes(config, {{"to", {{"margin_start", "10px"}}}});

    ASSERT_TRUE(entry.is_ok());
    const String& name = entry.value().css_name;
    EXPECT_EQ(keyframes_css(entry.value()),
              "@keyframes "_s + name + "{to{margin-left:10px;}}\n"_s +
                  "html[dir=\"rtl\"]{@keyframes "_s + name + "{to{margin-right:10px;}}}"_s);
}

TEST(KeyframesTest, EmptyRejected) {
    CompilerConfig config;
    auto entry = compile_keyframes(config, {});

    ASSERT_TRUE(entry.is_err());
    EXPECT_EQ(entry.error().message, "Keyframes must define at least one frame");
}

TEST(KeyframesTest, NestedValueRejected) {
    CompilerConfig config;
    auto entry = compile_keyframes(
        config, {{"from", {{"color", StyleValue::conditional({{"default", "red"}})}}}});

    ASSERT_TRUE(entry.is_err());
    EXPECT_EQ(entry.error().kind, ErrorKind::InvalidKeyframe);
    EXPECT_EQ(entry.error().message,
              "Keyframe value for 'color' in frame 'from' must be a string or number");
}

// ============================================================================
// @position-try
// ============================================================================

TEST(PositionTryTest, Compile) {
    CompilerConfig config;
    auto entry = compile_position_try(config, {{"top", 10}});

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().css_name, "--x19fd9g3");
    EXPECT_EQ(position_try_css(entry.value()), "@position-try --x19fd9g3{top:10px;}");
}

TEST(PositionTryTest, DeclarationsSorted) {
    CompilerConfig config;
    auto entry = compile_position_try(config, {{"top", "anchor(bottom)"}, {"position_area", "bottom"}});

    ASSERT_TRUE(entry.is_ok());
    ASSERT_EQ(entry.value().declarations.size(), 2u);
    EXPECT_EQ(entry.value().declarations[0].property, "position-area");
    EXPECT_EQ(entry.value().declarations[1].property, "top");
}

TEST(PositionTryTest, InvalidProperties) {
    CompilerConfig config;
    auto entry = compile_position_try(config, {{"color", "red"}, {"top", 0}, {"opacity", 1}});

    ASSERT_TRUE(entry.is_err());
    EXPECT_EQ(entry.error().kind, ErrorKind::InvalidPositionTry);
    EXPECT_EQ(entry.error().message, "Invalid properties in position-try: color, opacity");
}

// ============================================================================
// View transitions
// ============================================================================

TEST(ViewTransitionTest, Compile) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {{"old", {{"opacity", 0}}}});

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().css_name, "xhh3f2y");
    EXPECT_EQ(view_transition_css(entry.value()), "::view-transition-old(*.xhh3f2y){opacity:0;}");
}

TEST(ViewTransitionTest, CanonicalPseudoOrder) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {
        {"new", {{"opacity", 1}}},
        {":old", {{"opacity", 0}}},
    });

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().css_name, "x5xv105");
    ASSERT_EQ(entry.value().styles.size(), 2u);
    EXPECT_EQ(entry.value().styles[0].pseudo, "old");
    EXPECT_EQ(entry.value().styles[1].pseudo, "new");
}

TEST(ViewTransitionTest, SnakeCaseKey) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {{"image_pair", {{"opacity", 1}}}});

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().styles[0].pseudo, "image-pair");
}

TEST(ViewTransitionTest, InvalidKeys) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {{"outline", {{"opacity", 1}}}});

    ASSERT_TRUE(entry.is_err());
    EXPECT_EQ(entry.error().kind, ErrorKind::InvalidViewTransition);
    EXPECT_EQ(entry.error().message, "Invalid view transition keys: outline");
    EXPECT_EQ(entry.error().hint, "Valid keys: group, image-pair, old, new and their -only-child forms");
}

TEST(ViewTransitionTest, OnlyChildVariants) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {
        {"old", {{"opacity", 0}}},
        {"new_only_child", {{"opacity", 1}}},
    });

    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.value().css_name, "xxn558z");
    ASSERT_EQ(entry.value().styles.size(), 2u);
    EXPECT_FALSE(entry.value().styles[0].only_child);
    EXPECT_EQ(entry.value().styles[1].pseudo, "new");
    EXPECT_TRUE(entry.value().styles[1].only_child);
    EXPECT_EQ(view_transition_css(entry.value()),
              "::view-transition-old(*.xxn558z){opacity:0;}"
              "::view-transition-new(*.xxn558z):only-child{opacity:1;}");
}

TEST(ViewTransitionTest, OnlyChildFormsFollowPlainOnes) {
    CompilerConfig config;
    auto entry = compile_view_transition(config, {
        {"group-only-child", {{"opacity", 1}}},
        {"image_pair_only_child", {{"opacity", 1}}},
        {"new", {{"opacity", 1}}},
        {"group", {{"opacity", 0}}},
    });

    ASSERT_TRUE(entry.is_ok());
    const auto& styles = entry.value().styles;
    ASSERT_EQ(styles.size(), 4u);
    EXPECT_TRUE(view_transition_css(entry.value()).starts_with("::view-transition-group(*.x"_s));
    EXPECT_EQ(styles[0].pseudo, "group");
    EXPECT_FALSE(styles[0].only_child);
    EXPECT_EQ(styles[1].pseudo, "new");
    EXPECT_EQ(styles[2].pseudo, "group");
    EXPECT_TRUE(styles[2].only_child);
    EXPECT_EQ(styles[3].pseudo, "image-pair");
    EXPECT_TRUE(styles[3].only_child);
}
