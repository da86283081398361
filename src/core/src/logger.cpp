/**
 * Logging registry, console and file sinks
 */

#include "facet/core/logger.hpp"
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace facet {

namespace {

struct Registry {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    Logger* default_logger{nullptr};
    LogLevel threshold{LogLevel::Warn};
    bool initialized{false};
};

Registry& registry() {
    static Registry r;
    return r;
}

// "HH:MM:SS.mmm" in UTC
String clock_time(std::chrono::system_clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    auto day_ms = since_epoch.count() % (24LL * 60 * 60 * 1000);
    StringBuilder sb;
    sb.append_format("{:02}:{:02}:{:02}.{:03}", day_ms / 3600000, day_ms / 60000 % 60,
                     day_ms / 1000 % 60, day_ms % 1000);
    return sb.build();
}

std::string_view level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return "";
}

void install(Registry& r, std::vector<std::unique_ptr<LogSink>> sinks) {
    r.sinks = std::move(sinks);
    if (!r.default_logger) {
        auto [it, inserted] = r.loggers.try_emplace("facet");
        if (inserted) {
            it->second = std::make_unique<Logger>("facet");
        }
        r.default_logger = it->second.get();
    }
    r.initialized = true;
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    String lowered = String(name).to_lowercase();
    if (lowered == "trace"_s) return LogLevel::Trace;
    if (lowered == "debug"_s) return LogLevel::Debug;
    if (lowered == "info"_s) return LogLevel::Info;
    if (lowered == "warn"_s || lowered == "warning"_s) return LogLevel::Warn;
    if (lowered == "error"_s) return LogLevel::Error;
    if (lowered == "fatal"_s) return LogLevel::Fatal;
    if (lowered == "off"_s) return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << '[' << clock_time(record.timestamp) << "] ";
    if (m_use_colors) {
        std::cerr << level_color(record.level) << log_level_name(record.level) << "\033[0m";
    } else {
        std::cerr << log_level_name(record.level);
    }
    std::cerr << ' ' << record.logger_name << ": " << record.message << '\n';
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const String& path) : m_out(path.c_str(), std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!m_out) {
        return;
    }
    m_out << '[' << clock_time(record.timestamp) << "] " << log_level_name(record.level) << ' '
          << record.logger_name << ": " << record.message << '\n';
}

void FileSink::flush() {
    if (m_out) {
        m_out.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= m_level && level >= logging::level();
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record{level, m_name, message, std::chrono::system_clock::now()};

    auto& r = registry();
    std::lock_guard lock(r.mutex);
    for (auto& sink : r.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Registry
// ============================================================================

namespace logging {

void init() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    init(std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    if (!r.initialized) {
        install(r, std::move(sinks));
    }
}

void shutdown() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    for (auto& sink : r.sinks) {
        sink->flush();
    }
    r.sinks.clear();
    r.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    r.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    r.threshold = level;
}

LogLevel level() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    return r.threshold;
}

Logger& get(std::string_view name) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);

    auto [it, inserted] = r.loggers.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<Logger>(name);
    }
    return *it->second;
}

Logger& default_logger() {
    auto& r = registry();
    {
        std::lock_guard lock(r.mutex);
        if (r.initialized) {
            return *r.default_logger;
        }
    }
    init();
    return *r.default_logger;
}

void flush() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    for (auto& sink : r.sinks) {
        sink->flush();
    }
}

} // namespace logging

} // namespace facet
