//! # Logger Unit Tests
//!
//! Component filters, record formatting, logger initialization and
//! concurrent dispatch.

#include "log/log.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace carp;
using namespace carp::log;

namespace {

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back(std::string(record.component) + ":" + record.message);
    }
    void flush() override {}

    std::mutex mutex;
    std::vector<std::string> records;
};

/// Restores the default logger after a test replaced its sinks.
class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<ConsoleSink>());
        logger.set_level(LogLevel::Warn);
    }

    auto capture() -> CaptureSink* {
        auto sink = std::make_unique<CaptureSink>();
        auto* raw = sink.get();
        Logger::instance().add_sink(std::move(sink));
        return raw;
    }
};

} // namespace

// ============================================================================
// Filters
// ============================================================================

TEST(LogFilterTest, ComponentLevelsOverFallback) {
    auto parsed = LogFilter::parse("client=debug,*=info", LogLevel::Warn);
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed);
    const auto& filter = unwrap(parsed);

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "client"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "client"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "resolver"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "resolver"));
}

TEST(LogFilterTest, BareTagEnablesTrace) {
    auto parsed = LogFilter::parse("wire", LogLevel::Error);
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).threshold("wire"), LogLevel::Trace);
    EXPECT_EQ(unwrap(parsed).threshold("proxy"), LogLevel::Error);
    EXPECT_EQ(unwrap(parsed).lowest(), LogLevel::Trace);
}

TEST(LogFilterTest, ReclaimCanBeSilenced) {
    auto parsed = LogFilter::parse("reclaim=off,", LogLevel::Info);
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_FALSE(unwrap(parsed).should_log(LogLevel::Fatal, "reclaim"));
    EXPECT_TRUE(unwrap(parsed).should_log(LogLevel::Info, "wire"));
}

TEST(LogFilterTest, RejectsUnknownTagsAndLevels) {
    auto tag = LogFilter::parse("client=debug,compiler=trace", LogLevel::Warn);
    ASSERT_TRUE(is_err(tag));
    EXPECT_NE(unwrap_err(tag).find("compiler"), std::string::npos);

    auto level = LogFilter::parse("wire=loud", LogLevel::Warn);
    ASSERT_TRUE(is_err(level));
    EXPECT_NE(unwrap_err(level).find("loud"), std::string::npos);
}

TEST(LogLevelTest, NamesParseInAnyCase) {
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_TRUE(parse_level("debug") == LogLevel::Debug);
    EXPECT_TRUE(parse_level("TRACE") == LogLevel::Trace);
    EXPECT_TRUE(parse_level("Warning") == LogLevel::Warn);
    EXPECT_FALSE(parse_level("nonsense").has_value());
}

TEST(LogLevelTest, EveryComponentHasAnIndex) {
    for (size_t i = 0; i < COMPONENTS.size(); ++i) {
        auto index = component_index(COMPONENTS[i]);
        ASSERT_TRUE(index.has_value());
        EXPECT_EQ(*index, i);
    }
    EXPECT_FALSE(component_index("lexer").has_value());
}

TEST(LogFormatTest, TextNamesLevelAndComponent) {
    LogRecord record{LogLevel::Warn, "reclaim", "cleanup failed", __FILE__, __LINE__, 0};
    auto text = format_text(record);
    EXPECT_NE(text.find("WARN "), std::string::npos);
    EXPECT_NE(text.find("[reclaim] cleanup failed"), std::string::npos);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggerTest, InitAppliesComponentFilter) {
    LogConfig config;
    config.filter = "resolver=debug";
    config.console = false;
    ASSERT_TRUE(is_ok(Logger::init(config)));
    auto* sink = capture();

    CARP_LOG_DEBUG("resolver", "loaded module m");
    CARP_LOG_DEBUG("client", "hidden");
    CARP_LOG_WARN("client", "shown");

    std::lock_guard<std::mutex> lock(sink->mutex);
    ASSERT_EQ(sink->records.size(), 2u);
    EXPECT_EQ(sink->records[0], "resolver:loaded module m");
    EXPECT_EQ(sink->records[1], "client:shown");
}

TEST_F(LoggerTest, MalformedInitChangesNothing) {
    auto* sink = capture();
    LogConfig config;
    config.filter = "nowhere=trace";
    auto result = Logger::init(config);
    ASSERT_TRUE(is_err(result));

    CARP_LOG_WARN("proxy", "still captured");
    std::lock_guard<std::mutex> lock(sink->mutex);
    EXPECT_EQ(sink->records.size(), 1u);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto* sink = capture();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                CARP_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Tags outside the runtime's components follow the fallback level
    std::lock_guard<std::mutex> lock(sink->mutex);
    int ours = 0;
    for (const auto& record : sink->records) {
        if (record.rfind("test:", 0) == 0) {
            ++ours;
        }
    }
    EXPECT_EQ(ours, num_threads * messages_per_thread);
}
