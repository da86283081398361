#pragma once

#include "types.hpp"
#include "string.hpp"
#include <chrono>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace facet {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Parses "trace", "debug", "info", "warn", "error", "fatal" or "off" (any case)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view logger_name;
    std::string_view message;
    std::chrono::system_clock::time_point timestamp;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/**
 * Writes "[time] LEVEL facet.style: message" lines to stderr. Standard
 * output is reserved for generated stylesheets.
 */
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true) : m_use_colors(use_colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends records to a file; nothing is written when the file cannot be opened
class FileSink : public LogSink {
public:
    explicit FileSink(const String& path);

    [[nodiscard]] bool is_open() const { return m_out.is_open(); }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ofstream m_out;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * A named channel ("facet.style", "facet.loader"). A record passes when
 * its level reaches both the logger's own level and the global level.
 */
class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view message);

    template<typename... Args>
    void log_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            log(level, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    void trace(std::string_view message) { log(LogLevel::Trace, message); }
    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warn(std::string_view message) { log(LogLevel::Warn, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }
    void fatal(std::string_view message) { log(LogLevel::Fatal, message); }

    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Fatal, fmt, std::forward<Args>(args)...);
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Registry
// ============================================================================

namespace logging {

// Installs a ConsoleSink; no effect when already initialized
void init();

// Installs the given sinks instead of the console; no effect when already initialized
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops the sinks. Named loggers stay valid.
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

// Global threshold, Warn unless configured
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Logger registered under a name, created on first use
[[nodiscard]] Logger& get(std::string_view name);

// The "facet" logger behind the FACET_LOG_* macros; initializes on first use
[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

#define FACET_LOG_TRACE(msg) ::facet::logging::default_logger().trace(msg)
#define FACET_LOG_DEBUG(msg) ::facet::logging::default_logger().debug(msg)
#define FACET_LOG_INFO(msg)  ::facet::logging::default_logger().info(msg)
#define FACET_LOG_WARN(msg)  ::facet::logging::default_logger().warn(msg)
#define FACET_LOG_ERROR(msg) ::facet::logging::default_logger().error(msg)
#define FACET_LOG_FATAL(msg) ::facet::logging::default_logger().fatal(msg)

#define FACET_LOG_TRACE_FMT(fmt, ...) ::facet::logging::default_logger().trace_fmt(fmt, ##__VA_ARGS__)
#define FACET_LOG_DEBUG_FMT(fmt, ...) ::facet::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define FACET_LOG_INFO_FMT(fmt, ...)  ::facet::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define FACET_LOG_WARN_FMT(fmt, ...)  ::facet::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define FACET_LOG_ERROR_FMT(fmt, ...) ::facet::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)
#define FACET_LOG_FATAL_FMT(fmt, ...) ::facet::logging::default_logger().fatal_fmt(fmt, ##__VA_ARGS__)

} // namespace facet
