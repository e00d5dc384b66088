#include "chronicle/config.hpp"
#include "chronicle/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace chronicle {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& value) {
    auto v = to_lower(value);
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off") return LogLevel::Off;
    throw ConfigError("Invalid log level: " + value);
}

UnknownEventPolicy parse_unknown_event_policy(const std::string& value) {
    auto v = to_lower(value);
    if (v == "ignore") return UnknownEventPolicy::Ignore;
    if (v == "reject") return UnknownEventPolicy::Reject;
    throw ConfigError("Invalid unknown event policy: " + value);
}

Config Config::from_env() {
    Config config;

    const char* level_env = std::getenv(ENV_LOG_LEVEL);
    if (level_env && *level_env) {
        config.log_level = parse_log_level(level_env);
    }

    const char* policy_env = std::getenv(ENV_UNKNOWN_EVENTS);
    if (policy_env && *policy_env) {
        config.unknown_events = parse_unknown_event_policy(policy_env);
    }

    return config;
}

void Config::apply() const {
    set_log_level(log_level);
}

} // namespace chronicle
