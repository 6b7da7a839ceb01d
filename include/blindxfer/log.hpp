#pragma once

#include <string>
#include <string_view>

namespace blindxfer::log {

enum class Level {
    kDebug = 0,
    kInfo = 1,
    kWarn = 2,
    kError = 3,
    kOff = 4,
};

// Threshold starts from BLINDXFER_LOG_LEVEL (debug|info|warn|error|off), default info.
Level Threshold();
void SetThreshold(Level level);
Level ParseLevel(std::string_view name, Level fallback);

bool Enabled(Level level);

// Writes "<TAG>: [component] message" to stderr. Thread-safe.
void Write(Level level, std::string_view component, const std::string& message);

inline void Debug(std::string_view component, const std::string& message) {
    Write(Level::kDebug, component, message);
}
inline void Info(std::string_view component, const std::string& message) {
    Write(Level::kInfo, component, message);
}
inline void Warn(std::string_view component, const std::string& message) {
    Write(Level::kWarn, component, message);
}
inline void Error(std::string_view component, const std::string& message) {
    Write(Level::kError, component, message);
}

}  // namespace blindxfer::log
