#include "blindxfer/log.hpp"

#include "blindxfer/cli_colors.hpp"
#include "blindxfer/env.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace blindxfer::log {

namespace {

std::mutex g_write_mutex;

Level InitialThreshold() {
    return ParseLevel(env::Get("BLINDXFER_LOG_LEVEL"), Level::kInfo);
}

std::atomic<int>& ThresholdSlot() {
    static std::atomic<int> slot{static_cast<int>(InitialThreshold())};
    return slot;
}

const char* Tag(Level level) {
    switch (level) {
        case Level::kDebug:
            return "DEBUG";
        case Level::kInfo:
            return "INFO";
        case Level::kWarn:
            return "WARN";
        case Level::kError:
            return "ERROR";
        case Level::kOff:
            break;
    }
    return "";
}

const char* TagColor(Level level) {
    switch (level) {
        case Level::kDebug:
            return cli::color::BRIGHT_BLACK;
        case Level::kInfo:
            return cli::color::CYAN;
        case Level::kWarn:
            return cli::color::YELLOW;
        case Level::kError:
            return cli::color::BOLD_RED;
        case Level::kOff:
            break;
    }
    return cli::color::RESET;
}

}  // namespace

Level ParseLevel(std::string_view name, Level fallback) {
    std::string value(name);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "debug" || value == "trace") {
        return Level::kDebug;
    }
    if (value == "info") {
        return Level::kInfo;
    }
    if (value == "warn" || value == "warning") {
        return Level::kWarn;
    }
    if (value == "error") {
        return Level::kError;
    }
    if (value == "off" || value == "none") {
        return Level::kOff;
    }
    return fallback;
}

Level Threshold() {
    return static_cast<Level>(ThresholdSlot().load());
}

void SetThreshold(Level level) {
    ThresholdSlot().store(static_cast<int>(level));
}

bool Enabled(Level level) {
    return level != Level::kOff && static_cast<int>(level) >= ThresholdSlot().load();
}

void Write(Level level, std::string_view component, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    std::string tag = cli::Colorize(std::string(Tag(level)) + ":", TagColor(level), stderr);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << tag << " [" << component << "] " << message << "\n";
}

}  // namespace blindxfer::log
