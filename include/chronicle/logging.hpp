#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace chronicle {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Name used in the "level" field of a log record.
const char* log_level_name(LogLevel level);

/// Process-wide threshold; records below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && level >= log_level();
}

/// Build the JSON record written for a log call.
nlohmann::json make_log_entry(LogLevel level, const std::string& component,
                              const std::string& message, const nlohmann::json& fields);

/// Write one JSON line to stdout.
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

}  // namespace chronicle
