//! # CARP Logging
//!
//! Component-tagged logging for the client runtime. Every message names the
//! component that produced it:
//!
//! | Tag | Emitted by |
//! |-----|------------|
//! | `client` | client presence, call translation and transport outcomes |
//! | `proxy` | proxy elaboration and the proxy cache |
//! | `reclaim` | the reclamation thread and failing cleanup actions |
//! | `resolver` | module loading and type resolution |
//! | `wire` | request and response bodies |
//!
//! Log calls arrive from caller threads and from the reclamation thread at
//! the same time, so dispatch is serialized. Levels below
//! `CARP_MIN_LOG_LEVEL` are compiled out.
//!
//! ## Usage
//!
//! ```cpp
//! carp::log::LogConfig config;
//! config.filter = "resolver=debug,wire=trace";
//! auto ok = carp::log::Logger::init(config);
//!
//! CARP_LOG_DEBUG("client", "POST " << endpoint << " call " << call);
//! ```

#ifndef CARP_LOG_HPP
#define CARP_LOG_HPP

#include "common.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace carp::log {

// ============================================================================
// Levels and Components
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Wire bodies and cache traffic
    Debug = 1, ///< Resolution and call progress
    Info = 2,
    Warn = 3,  ///< Recoverable anomalies, such as a failing cleanup action
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Upper-case name of a level ("DEBUG").
auto level_name(LogLevel level) -> const char*;

/// Level for a name in any case, or nothing for an unknown name.
auto parse_level(std::string_view name) -> std::optional<LogLevel>;

/// Tags the runtime logs under, in the order `LogFilter` indexes them.
inline constexpr std::array<std::string_view, 5> COMPONENTS = {"client", "proxy", "reclaim",
                                                               "resolver", "wire"};

/// Index of `tag` in `COMPONENTS`, if it is one.
auto component_index(std::string_view tag) -> std::optional<size_t>;

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

/// `HH:MM:SS.mmm LEVEL [component] message`, without a newline.
auto format_text(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, coloring the level when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-component thresholds over a common fallback.
class LogFilter {
public:
    explicit LogFilter(LogLevel fallback = LogLevel::Warn) : fallback_(fallback) {}

    /// Parses a list such as `client=debug,wire=trace,*=error`. A bare tag
    /// enables Trace for it; `*` sets the fallback.
    ///
    /// # Returns
    ///
    /// The filter, or a message naming the first unknown tag or level.
    static auto parse(std::string_view spec, LogLevel fallback) -> Result<LogFilter, std::string>;

    [[nodiscard]] auto threshold(std::string_view component) const -> LogLevel;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view component) const -> bool {
        return level >= threshold(component);
    }

    /// Most verbose threshold of any component.
    [[nodiscard]] auto lowest() const -> LogLevel;

private:
    LogLevel fallback_;
    std::array<std::optional<LogLevel>, COMPONENTS.size()> levels_{};
};

// ============================================================================
// Logger
// ============================================================================

/// Settings an embedding application hands to `Logger::init`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter; ///< per-component overrides, see `LogFilter::parse`
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Until `init` it writes Warn and above to stderr.
class Logger {
public:
    static auto instance() -> Logger&;

    /// Replaces the filter and sinks.
    ///
    /// # Returns
    ///
    /// An error for a malformed filter, in which case nothing changes.
    static auto init(const LogConfig& config) -> Result<bool, std::string>;

    /// Checked by the macros before a message is formatted.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view component) const -> bool;

    void log(LogLevel level, std::string_view component, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets one threshold for every component.
    void set_level(LogLevel level);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> floor_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Macros
// ============================================================================

#ifndef CARP_MIN_LOG_LEVEL
#define CARP_MIN_LOG_LEVEL 0
#endif

#define CARP_LOG_IMPL(level, component, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= CARP_MIN_LOG_LEVEL) {                                       \
            auto& carp_logger_ = ::carp::log::Logger::instance();                                  \
            if (carp_logger_.should_log(level, component)) {                                       \
                std::ostringstream carp_oss_;                                                      \
                carp_oss_ << msg;                                                                  \
                carp_logger_.log(level, component, carp_oss_.str(), __FILE__, __LINE__);          \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define CARP_LOG_TRACE(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Trace, component, msg)
#define CARP_LOG_DEBUG(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Debug, component, msg)
#define CARP_LOG_INFO(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Info, component, msg)
#define CARP_LOG_WARN(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Warn, component, msg)
#define CARP_LOG_ERROR(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Error, component, msg)
#define CARP_LOG_FATAL(component, msg) CARP_LOG_IMPL(::carp::log::LogLevel::Fatal, component, msg)

} // namespace carp::log

#endif // CARP_LOG_HPP
