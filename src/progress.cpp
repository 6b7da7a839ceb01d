#include "blindxfer/progress.hpp"

#include "blindxfer/cli_colors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace blindxfer::progress {

void ThroughputMeter::Record(std::uint64_t bytes, Clock::time_point now) {
    if (started_ == Clock::time_point::min()) {
        started_ = now;
    }
    samples_.push_back(Sample{now, bytes});
    Expire(now);
}

void ThroughputMeter::Expire(Clock::time_point now) {
    while (!samples_.empty() && now - samples_.front().at > window_) {
        samples_.pop_front();
    }
}

double ThroughputMeter::BytesPerSecond(Clock::time_point now) const {
    if (started_ == Clock::time_point::min()) {
        return 0.0;
    }
    std::uint64_t bytes = 0;
    for (const Sample& sample : samples_) {
        if (now - sample.at <= window_) {
            bytes += sample.bytes;
        }
    }
    // A window that has not filled yet is measured from the first sample.
    auto span = std::min<Clock::duration>(now - started_, window_);
    double seconds = std::chrono::duration<double>(span).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / seconds;
}

std::string FormatBytes(std::uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buffer[32];
    if (unit == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, kUnits[unit]);
    }
    return buffer;
}

std::string FormatSpeed(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return FormatBytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string FormatTimeRemaining(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    std::ostringstream out;
    if (seconds < 60.0) {
        out << static_cast<long long>(std::ceil(seconds)) << "s";
    } else if (seconds < 3600.0) {
        out << static_cast<long long>(std::ceil(seconds / 60.0)) << "m";
    } else {
        auto hours = static_cast<long long>(seconds / 3600.0);
        auto minutes = static_cast<long long>(std::ceil(std::fmod(seconds, 3600.0) / 60.0));
        out << hours << "h " << minutes << "m";
    }
    return out.str();
}

ConsoleReporter::ConsoleReporter(std::string label)
    : label_(std::move(label)), use_ansi_(cli::ColorsEnabled(stderr)) {
    last_tick_ = std::chrono::steady_clock::now();
}

std::string ConsoleReporter::RenderBar(double fraction, int width) {
    if (fraction < 0.0) {
        fraction = 0.0;
    } else if (fraction > 1.0) {
        fraction = 1.0;
    }
    int filled = static_cast<int>(std::round(fraction * width));
    std::string bar;
    bar.reserve(static_cast<std::size_t>(width + 2));
    bar.push_back('(');
    bar.append(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar.push_back(')');
    return bar;
}

void ConsoleReporter::Update(const Snapshot& snapshot) {
    double fraction = snapshot.Fraction();
    auto now = std::chrono::steady_clock::now();
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
    if (printed_ && delta.count() < 120 && fraction < 1.0 && std::abs(fraction - last_fraction_) < 0.005) {
        return;
    }
    last_tick_ = now;
    last_fraction_ = fraction;
    int pct = static_cast<int>(std::round(fraction * 100.0));
    std::string line = label_ + " " + RenderBar(fraction) + " " + std::to_string(pct) + "% "
                       + std::to_string(snapshot.completed_parts) + "/" + std::to_string(snapshot.total_parts)
                       + " parts, " + FormatSpeed(snapshot.bytes_per_second);
    if (snapshot.bytes_per_second > 0.0 && fraction < 1.0) {
        line += ", " + FormatTimeRemaining(snapshot.seconds_remaining) + " left";
    }
    if (use_ansi_) {
        std::cerr << "\r\033[2K" << line << std::flush;
    } else {
        std::cerr << line << std::endl;
    }
    printed_ = true;
}

void ConsoleReporter::Finish() {
    if (printed_ && use_ansi_) {
        std::cerr << std::endl;
    }
    printed_ = false;
}

}  // namespace blindxfer::progress
