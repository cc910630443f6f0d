//! # Logger Implementation

#include "log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

#include <unistd.h>

namespace carp::log {

namespace {

auto stderr_is_color_terminal() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

auto ansi_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\033[31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Writes `HH:MM:SS.mmm LEVEL` in local time, optionally coloring the level.
void write_prefix(std::ostream& out, const LogRecord& record, bool colors) {
    auto secs = static_cast<std::time_t>(record.timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&secs, &local);
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (record.timestamp_ms % 1000) << std::setfill(' ') << ' ';
    if (colors) {
        out << ansi_color(record.level);
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << "\033[0m";
    }
}

auto split_once(std::string_view text, char sep)
    -> std::pair<std::string_view, std::optional<std::string_view>> {
    size_t at = text.find(sep);
    if (at == std::string_view::npos) {
        return {text, std::nullopt};
    }
    return {text.substr(0, at), text.substr(at + 1)};
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "OFF";
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lowered(name);
    for (char& c : lowered) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    for (int i = static_cast<int>(LogLevel::Trace); i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string candidate = level_name(level);
        for (char& c : candidate) {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (lowered == candidate) {
            return level;
        }
    }
    if (lowered == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

auto component_index(std::string_view tag) -> std::optional<size_t> {
    for (size_t i = 0; i < COMPONENTS.size(); ++i) {
        if (COMPONENTS[i] == tag) {
            return i;
        }
    }
    return std::nullopt;
}

auto format_text(const LogRecord& record) -> std::string {
    std::ostringstream out;
    write_prefix(out, record, false);
    out << " [" << record.component << "] " << record.message;
    return out.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool colors) : colors_(colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::ostringstream line;
    write_prefix(line, record, colors_);
    line << " [" << record.component << "] " << record.message << '\n';
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

auto LogFilter::parse(std::string_view spec, LogLevel fallback)
    -> Result<LogFilter, std::string> {
    LogFilter filter(fallback);
    while (!spec.empty()) {
        auto [entry, rest] = split_once(spec, ',');
        spec = rest.value_or(std::string_view{});
        if (entry.empty()) {
            continue;
        }

        auto [tag, level_text] = split_once(entry, '=');
        LogLevel level = LogLevel::Trace;
        if (level_text) {
            auto parsed = parse_level(*level_text);
            if (!parsed) {
                return std::string("unknown log level \"") + std::string(*level_text) + "\"";
            }
            level = *parsed;
        }

        if (tag == "*") {
            filter.fallback_ = level;
            continue;
        }
        auto index = component_index(tag);
        if (!index) {
            return std::string("unknown log component \"") + std::string(tag) + "\"";
        }
        filter.levels_[*index] = level;
    }
    return filter;
}

auto LogFilter::threshold(std::string_view component) const -> LogLevel {
    if (auto index = component_index(component)) {
        return levels_[*index].value_or(fallback_);
    }
    return fallback_;
}

auto LogFilter::lowest() const -> LogLevel {
    LogLevel lowest = fallback_;
    for (const auto& level : levels_) {
        if (level && *level < lowest) {
            lowest = *level;
        }
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::init(const LogConfig& config) -> Result<bool, std::string> {
    auto filter = LogFilter::parse(config.filter, config.level);
    if (is_err(filter)) {
        return unwrap_err(filter);
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = unwrap(filter);
    logger.floor_ = logger.filter_.lowest();
    logger.sinks_.clear();
    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors));
    }
    return true;
}

auto Logger::should_log(LogLevel level, std::string_view component) const -> bool {
    if (level < floor_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, component);
}

void Logger::log(LogLevel level, std::string_view component, const std::string& message,
                 const char* file, int line) {
    LogRecord record{level, component, message, file, line, now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter(level);
    floor_ = level;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace carp::log
