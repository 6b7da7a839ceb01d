#pragma once

#include <cstdio>
#include <string>

namespace blindxfer::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when the stream is a TTY and colors were not disabled (NO_COLOR, --no-color).
bool ColorsEnabled(std::FILE* stream = stdout);

void SetColorsEnabled(bool enabled);

// Wraps text in the color code when ColorsEnabled(stream); plain text otherwise.
std::string Colorize(const std::string& text, const char* color, std::FILE* stream = stdout);

}  // namespace blindxfer::cli
