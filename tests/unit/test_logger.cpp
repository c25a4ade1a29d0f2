/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and NDJSON formatting.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace fleet_coordinator;

namespace {

struct LoggerFixture {
    MemorySink* sink;
    Logger logger;

    explicit LoggerFixture(LogLevel level = LogLevel::Info)
        : LoggerFixture(std::make_unique<MemorySink>(), level) {}

private:
    LoggerFixture(std::unique_ptr<MemorySink> owned, LogLevel level)
        : sink(owned.get()), logger(std::move(owned), level, "registry") {}
};

}  // namespace

TEST(LoggerTest, WritesOneJsonObjectPerLine) {
    LoggerFixture f;
    f.logger.info("node-1 registered");

    auto lines = f.sink->lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines.front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("logger":"registry")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"node-1 registered")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    LoggerFixture f(LogLevel::Warn);
    f.logger.debug("hidden");
    f.logger.info("hidden");
    f.logger.warn("shown");
    f.logger.error("shown");

    EXPECT_EQ(f.sink->lines().size(), 2u);
    EXPECT_EQ(f.sink->count_containing("hidden"), 0u);
}

TEST(LoggerTest, LevelCanChangeAtRuntime) {
    LoggerFixture f(LogLevel::Error);
    EXPECT_FALSE(f.logger.enabled(LogLevel::Info));

    f.logger.set_level(LogLevel::Debug);
    EXPECT_TRUE(f.logger.enabled(LogLevel::Debug));
    f.logger.debug("now visible");
    EXPECT_EQ(f.sink->count_containing("now visible"), 1u);
}

TEST(LoggerTest, MessagesAreEscaped) {
    LoggerFixture f;
    f.logger.warn("bad \"tag\"\nnext");
    EXPECT_EQ(f.sink->count_containing(R"(bad \"tag\"\nnext)"), 1u);
}

TEST(LoggerTest, NullSinkIsTolerated) {
    Logger logger(nullptr);
    logger.error("dropped");
    logger.flush();
    SUCCEED();
}

TEST(JsonEscapeTest, ControlCharacters) {
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("\t"), "\\t");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}
