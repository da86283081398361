#include <gtest/gtest.h>
#include "facet/css/hash.hpp"

using namespace facet;
using namespace facet::css;

// ============================================================================
// MurmurHash2 / base-36
// ============================================================================

TEST(HashTest, MurmurKnownValues) {
    EXPECT_EQ(murmurhash2_32("hello"), 2788266382u);
    EXPECT_EQ(murmurhash2_32(""), 1540447798u);
}

TEST(HashTest, Base36) {
    EXPECT_EQ(to_base36(0), "0");
    EXPECT_EQ(to_base36(35), "z");
    EXPECT_EQ(to_base36(36), "10");
    EXPECT_EQ(to_base36(2788266382u), "1a4283y");
}

TEST(HashTest, CreateHash) {
    EXPECT_EQ(create_hash("hello"), "1a4283y");
    EXPECT_EQ(create_hash("<>colorrednull"), "1e2nbdu");
}

// ============================================================================
// Identifier builders
// ============================================================================

TEST(HashTest, AtomicClassNameUnconditional) {
    CompilerConfig config;
    EXPECT_EQ(atomic_class_name(config, "color", "red", {}, {}), "x1e2nbdu");
}

TEST(HashTest, AtomicClassNameWithPseudo) {
    CompilerConfig config;
    EXPECT_EQ(atomic_class_name(config, "color", "red", {":hover"}, {}), "x1dgwipm");
}

TEST(HashTest, AtomicClassNameSortsPseudos) {
    CompilerConfig config;
    auto a = atomic_class_name(config, "color", "red", {":hover", ":active"}, {});
    auto b = atomic_class_name(config, "color", "red", {":active", ":hover"}, {});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, "xa2ikkt");
}

TEST(HashTest, AtomicClassNameKeepsPseudoElementPosition) {
    CompilerConfig config;
    // Hover on the element versus hover on the pseudo-element
    EXPECT_EQ(atomic_class_name(config, "color", "blue", {":hover", "::before"}, {}), "xzzpreb");
    EXPECT_EQ(atomic_class_name(config, "color", "blue", {"::before", ":hover"}, {}), "xeb2lg0");
}

TEST(HashTest, AtomicClassNameWithAtRule) {
    CompilerConfig config;
    EXPECT_EQ(atomic_class_name(config, "color", "red", {}, {"@media (max-width: 600px)"}),
              "xw8apw4");
    EXPECT_EQ(atomic_class_name(config, "color", "red", {":hover"}, {"@media (max-width: 600px)"}),
              "x99a4e0");
}

TEST(HashTest, AtomicClassNamePrefixAndDebug) {
    CompilerConfig config;
    config.class_name_prefix = "app";
    EXPECT_EQ(atomic_class_name(config, "color", "red", {}, {}), "app1e2nbdu");

    config.debug_class_names = true;
    EXPECT_EQ(atomic_class_name(config, "color", "red", {}, {}), "color-app1e2nbdu");
}

TEST(HashTest, VarAndThemeNames) {
    EXPECT_EQ(var_name("app.tokens", "primary"), "--v1oh1jh2");
    EXPECT_EQ(theme_class_name("app.tokens", "dark"), "t1k8xj4j");
}

TEST(HashTest, KeyframesName) {
    CompilerConfig config;
    EXPECT_EQ(keyframes_name(config, "from{opacity:0;}to{opacity:1;}"), "x18re5ia-B");
}

TEST(HashTest, MarkerName) {
    CompilerConfig config;
    EXPECT_EQ(marker_class_name(config, "card"), "xk6oyf8");
}

TEST(HashTest, DynamicVarName) {
    CompilerConfig config;
    EXPECT_EQ(dynamic_var_name(config, "width"), "--x-width");
}

TEST(HashTest, PositionTryAndViewTransitionNames) {
    CompilerConfig config;
    EXPECT_EQ(position_try_name(config, "hello"), "--x1a4283y");
    EXPECT_EQ(view_transition_class_name(config, "hello"), "x1a4283y");
}
