#include <gtest/gtest.h>
#include "facet/core/logger.hpp"
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace facet;

namespace {

struct CapturedRecord {
    LogLevel level;
    std::string logger;
    std::string message;
};

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<CapturedRecord>> records)
        : m_records(std::move(records)) {}

    void write(const LogRecord& record) override {
        m_records->push_back({record.level, std::string(record.logger_name),
                              std::string(record.message)});
    }

    void flush() override {}

private:
    std::shared_ptr<std::vector<CapturedRecord>> m_records;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        records = std::make_shared<std::vector<CapturedRecord>>();
        std::vector<std::unique_ptr<LogSink>> sinks;
        sinks.push_back(std::make_unique<CaptureSink>(records));
        logging::shutdown();
        logging::init(std::move(sinks));
        logging::set_level(LogLevel::Trace);
    }

    void TearDown() override {
        logging::shutdown();
        logging::set_level(LogLevel::Warn);
    }

    std::shared_ptr<std::vector<CapturedRecord>> records;
};

} // anonymous namespace

// ============================================================================
// Level parsing
// ============================================================================

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("fatal"), LogLevel::Fatal);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseUnknown) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::Off), "OFF");
}

// ============================================================================
// Loggers
// ============================================================================

TEST_F(LoggerTest, NamedLoggerIsShared) {
    Logger& a = logging::get("facet.test");
    Logger& b = logging::get("facet.test");

    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.name(), "facet.test");
}

TEST_F(LoggerTest, WritesToSinks) {
    Logger& log = logging::get("facet.test");
    log.set_level(LogLevel::Trace);
    log.info_fmt("compiled {} rules", 3);

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].level, LogLevel::Info);
    EXPECT_EQ((*records)[0].logger, "facet.test");
    EXPECT_EQ((*records)[0].message, "compiled 3 rules");
}

TEST_F(LoggerTest, LoggerLevelFilters) {
    Logger& log = logging::get("facet.filtered");
    log.set_level(LogLevel::Warn);

    log.debug("hidden");
    log.error("shown");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].message, "shown");
    log.set_level(LogLevel::Trace);
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Error);
    Logger& log = logging::get("facet.test");
    log.set_level(LogLevel::Trace);

    EXPECT_FALSE(log.is_enabled(LogLevel::Warn));
    EXPECT_TRUE(log.is_enabled(LogLevel::Error));

    log.warn("hidden");
    EXPECT_TRUE(records->empty());
}

TEST_F(LoggerTest, OffIsNeverEnabled) {
    Logger& log = logging::get("facet.test");
    EXPECT_FALSE(log.is_enabled(LogLevel::Off));
}

TEST_F(LoggerTest, DefaultLoggerMacros) {
    FACET_LOG_WARN_FMT("unknown rule {}", "app.x");

    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].logger, "facet");
    EXPECT_EQ((*records)[0].message, "unknown rule app.x");
}

TEST(FileSinkTest, AppendsRecords) {
    String path = String(::testing::TempDir()) + "facet_logger_test.log"_s;
    std::remove(path.c_str());
    {
        FileSink sink(path);
        ASSERT_TRUE(sink.is_open());
        sink.write(LogRecord{LogLevel::Warn, "facet.loader", "missing module id",
                             std::chrono::system_clock::now()});
        sink.flush();
    }

    std::ifstream in(path.c_str());
    std::string line;
    ASSERT_TRUE(static_cast<bool>(std::getline(in, line)));
    EXPECT_NE(line.find("WARN facet.loader: missing module id"), std::string::npos);
}
