#include <gtest/gtest.h>
#include <cstdlib>
#include "chronicle/config.hpp"
#include "chronicle/errors.hpp"

using namespace chronicle;

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(ENV_LOG_LEVEL);
        unsetenv(ENV_UNKNOWN_EVENTS);
    }

    void TearDown() override {
        unsetenv(ENV_LOG_LEVEL);
        unsetenv(ENV_UNKNOWN_EVENTS);
        set_log_level(LogLevel::Info);
    }
};

TEST_F(ConfigTest, FromEnv_WithNothingSet_ShouldUseDefaults) {
    // When I load config from an empty environment
    auto config = Config::from_env();

    // Then info logging and the ignore policy apply
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.unknown_events, UnknownEventPolicy::Ignore);
}

TEST_F(ConfigTest, FromEnv_ShouldReadBothVariables) {
    // Given both variables are set
    setenv(ENV_LOG_LEVEL, "debug", 1);
    setenv(ENV_UNKNOWN_EVENTS, "reject", 1);

    // When I load config
    auto config = Config::from_env();

    // Then both are honored
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.unknown_events, UnknownEventPolicy::Reject);
}

TEST_F(ConfigTest, FromEnv_WithEmptyValue_ShouldKeepDefault) {
    setenv(ENV_LOG_LEVEL, "", 1);
    auto config = Config::from_env();
    EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, FromEnv_WithBadLogLevel_ShouldThrowConfigError) {
    setenv(ENV_LOG_LEVEL, "loud", 1);
    EXPECT_THROW(Config::from_env(), ConfigError);
}

TEST_F(ConfigTest, FromEnv_WithBadPolicy_ShouldThrowConfigError) {
    setenv(ENV_UNKNOWN_EVENTS, "skip", 1);
    EXPECT_THROW(Config::from_env(), ConfigError);
}

TEST_F(ConfigTest, Apply_ShouldInstallLogLevel) {
    Config config;
    config.log_level = LogLevel::Error;
    config.apply();
    EXPECT_EQ(log_level(), LogLevel::Error);
}

// =============================================================================
// Parsing Tests
// =============================================================================

TEST(ConfigParseTest, ParseLogLevel_ShouldBeCaseInsensitive) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("OFF"), LogLevel::Off);
}

TEST(ConfigParseTest, ParseUnknownEventPolicy_ShouldAcceptBothValues) {
    EXPECT_EQ(parse_unknown_event_policy("ignore"), UnknownEventPolicy::Ignore);
    EXPECT_EQ(parse_unknown_event_policy("Reject"), UnknownEventPolicy::Reject);
    EXPECT_THROW(parse_unknown_event_policy(""), ConfigError);
}
