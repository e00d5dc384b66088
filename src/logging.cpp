#include "chronicle/logging.hpp"
#include "chronicle/helpers.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace chronicle {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

void set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

nlohmann::json make_log_entry(LogLevel level, const std::string& component,
                              const std::string& message, const nlohmann::json& fields) {
    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", helpers::to_iso8601(helpers::now())}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    return log_entry;
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) {
    if (!log_enabled(level)) return;

    auto line = make_log_entry(level, component, message, fields).dump();
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << line << std::endl;
}

}  // namespace chronicle
