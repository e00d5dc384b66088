#pragma once

#include <string>
#include "logging.hpp"

namespace chronicle {

/**
 * What replay does with an event kind the aggregate does not recognize.
 */
enum class UnknownEventPolicy {
    /// Leave business state untouched, still advance the version.
    Ignore,
    /// Throw UnknownEventError.
    Reject
};

constexpr const char* ENV_LOG_LEVEL = "CHRONICLE_LOG_LEVEL";
constexpr const char* ENV_UNKNOWN_EVENTS = "CHRONICLE_UNKNOWN_EVENTS";

LogLevel parse_log_level(const std::string& value);
UnknownEventPolicy parse_unknown_event_policy(const std::string& value);

/**
 * Runtime configuration.
 *
 * Production deployments configure through environment variables so the
 * same binary runs unchanged in every environment.
 */
struct Config {
    LogLevel log_level = LogLevel::Info;
    UnknownEventPolicy unknown_events = UnknownEventPolicy::Ignore;

    /**
     * Read CHRONICLE_LOG_LEVEL and CHRONICLE_UNKNOWN_EVENTS.
     * Unset variables keep their defaults.
     *
     * @throws ConfigError on unrecognized values
     */
    static Config from_env();

    /**
     * Install process-wide settings (the log threshold).
     */
    void apply() const;
};

} // namespace chronicle
