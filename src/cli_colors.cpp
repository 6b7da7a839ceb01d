#include "blindxfer/cli_colors.hpp"

#include "blindxfer/env.hpp"

#include <atomic>

#include <unistd.h>

namespace blindxfer::cli {

namespace {

// -1 = auto-detect per stream, 0 = forced off, 1 = forced on
std::atomic<int> g_color_override{-1};

}  // namespace

bool ColorsEnabled(std::FILE* stream) {
    int forced = g_color_override.load();
    if (forced >= 0) {
        return forced == 1;
    }
    if (!env::Get("NO_COLOR").empty()) {
        return false;
    }
    if (stream == nullptr) {
        return false;
    }
    return isatty(fileno(stream)) != 0;
}

void SetColorsEnabled(bool enabled) {
    g_color_override.store(enabled ? 1 : 0);
}

std::string Colorize(const std::string& text, const char* color, std::FILE* stream) {
    if (!ColorsEnabled(stream)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace blindxfer::cli
