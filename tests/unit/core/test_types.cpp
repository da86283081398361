#include <gtest/gtest.h>
#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/core/diagnostic.hpp"

using namespace facet;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<int, String> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorResult) {
    Result<int, String> result = make_error(String("failed"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "failed");
}

TEST(ResultTest, SameValueAndErrorType) {
    Result<String, String> ok = String("value");
    Result<String, String> err = make_error(String("error"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ValueOr) {
    Result<int, String> ok = 42;
    Result<int, String> err = make_error(String("error"));

    EXPECT_EQ(ok.value_or(0), 42);
    EXPECT_EQ(err.value_or(0), 0);
}

TEST(ResultTest, MoveValue) {
    Result<String, int> result = String("moved");
    String value = std::move(result).value();

    EXPECT_EQ(value, "moved");
}

TEST(ResultTest, Map) {
    Result<int, String> result = 21;
    auto doubled = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(doubled.is_ok());
    EXPECT_EQ(doubled.value(), 42);
}

TEST(ResultTest, MapPassesErrorThrough) {
    Result<int, String> result = make_error(String("bad"));
    auto doubled = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(doubled.is_err());
    EXPECT_EQ(doubled.error(), "bad");
}

TEST(ResultTest, MapErr) {
    Result<int, int> result = make_error(7);
    auto mapped = result.map_err([](int code) { return String("code ") + String(std::to_string(code)); });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "code 7");
}

TEST(ResultTest, AndThen) {
    auto half = [](int value) -> Result<int, String> {
        if (value % 2 != 0) {
            return make_error(String("odd"));
        }
        return value / 2;
    };

    Result<int, String> even = 8;
    auto chained = even.and_then(half).and_then(half);
    ASSERT_TRUE(chained.is_ok());
    EXPECT_EQ(chained.value(), 2);

    Result<int, String> odd = 6;
    auto failed = odd.and_then(half).and_then(half);
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error(), "odd");
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok;
    Result<void, String> err = make_error(String("failed"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "failed");
}

TEST(ResultTest, VoidResultFromBraces) {
    auto define = [](bool fail) -> Result<void, String> {
        if (fail) {
            return make_error(String("nope"));
        }
        return {};
    };

    EXPECT_TRUE(define(false).is_ok());
    EXPECT_TRUE(define(true).is_err());
}

// ============================================================================
// CompileError Tests
// ============================================================================

TEST(CompileErrorTest, ToString) {
    CompileError error(ErrorKind::RejectedShorthand, "'border' is not supported",
                       "Use border-width, border-style and border-color instead");

    EXPECT_EQ(error.to_string(),
              "RejectedShorthandError: 'border' is not supported\n"
              "Use border-width, border-style and border-color instead");
}

TEST(CompileErrorTest, WithContext) {
    CompileError error(ErrorKind::InvalidValue, "bad value");
    CompileError located = error.with_context("app.Button.base");

    EXPECT_TRUE(error.context.empty());
    EXPECT_EQ(located.context, "app.Button.base");
    EXPECT_EQ(located.to_string(), "InvalidValueError in app.Button.base: bad value");
}

TEST(DiagnosticSinkTest, CollectsErrors) {
    DiagnosticSink sink;
    EXPECT_FALSE(sink.has_errors());

    sink.add(DiagnosticStage::Loader, DiagnosticLevel::Warning, "unused key");
    EXPECT_FALSE(sink.has_errors());

    sink.add_error(DiagnosticStage::Compiler,
                   CompileError(ErrorKind::Input, "Expected an object").with_context("modules[0]"));
    EXPECT_TRUE(sink.has_errors());
    ASSERT_EQ(sink.diagnostics().size(), 2u);
    EXPECT_EQ(sink.diagnostics()[1].context, "modules[0]");
    EXPECT_EQ(sink.diagnostics()[1].message, "InputError in modules[0]: Expected an object");

    sink.clear();
    EXPECT_TRUE(sink.diagnostics().empty());
}
