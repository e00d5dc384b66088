#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "chronicle/logging.hpp"

using namespace chronicle;

// =============================================================================
// Log Entry Tests
// =============================================================================

TEST(LoggingTest, MakeLogEntry_ShouldCarryStandardFields) {
    auto entry = make_log_entry(LogLevel::Warn, "event-store", "append_conflict", {});

    EXPECT_EQ(entry["level"], "warn");
    EXPECT_EQ(entry["component"], "event-store");
    EXPECT_EQ(entry["message"], "append_conflict");
    ASSERT_TRUE(entry.contains("timestamp"));
    EXPECT_EQ(entry["timestamp"].get<std::string>().back(), 'Z');
}

TEST(LoggingTest, MakeLogEntry_ShouldMergeFields) {
    nlohmann::json fields = {{"stream_id", "acc-1"}, {"expected_version", 2}};
    auto entry = make_log_entry(LogLevel::Info, "account", "aggregate_saved", fields);

    EXPECT_EQ(entry["stream_id"], "acc-1");
    EXPECT_EQ(entry["expected_version"], 2);
}

TEST(LoggingTest, MakeLogEntry_ShouldSerializeToSingleLine) {
    auto line = make_log_entry(LogLevel::Error, "c", "m", {{"k", "v"}}).dump();
    EXPECT_EQ(line.find('\n'), std::string::npos);
    auto parsed = nlohmann::json::parse(line);
    EXPECT_EQ(parsed["k"], "v");
}

// =============================================================================
// Threshold Tests
// =============================================================================

class LogThresholdTest : public ::testing::Test {
protected:
    void TearDown() override { set_log_level(LogLevel::Info); }
};

TEST_F(LogThresholdTest, DefaultThreshold_ShouldDropDebug) {
    set_log_level(LogLevel::Info);
    EXPECT_FALSE(log_enabled(LogLevel::Debug));
    EXPECT_TRUE(log_enabled(LogLevel::Info));
    EXPECT_TRUE(log_enabled(LogLevel::Error));
}

TEST_F(LogThresholdTest, Off_ShouldDropEverything) {
    set_log_level(LogLevel::Off);
    EXPECT_FALSE(log_enabled(LogLevel::Error));
}

TEST_F(LogThresholdTest, OffLevelRecord_ShouldNeverBeEnabled) {
    set_log_level(LogLevel::Debug);
    EXPECT_FALSE(log_enabled(LogLevel::Off));
}

TEST(LoggingTest, LogLevelName_ShouldMatchConfigSpelling) {
    EXPECT_STREQ(log_level_name(LogLevel::Debug), "debug");
    EXPECT_STREQ(log_level_name(LogLevel::Info), "info");
    EXPECT_STREQ(log_level_name(LogLevel::Warn), "warn");
    EXPECT_STREQ(log_level_name(LogLevel::Error), "error");
    EXPECT_STREQ(log_level_name(LogLevel::Off), "off");
}
