#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace blindxfer::progress {

struct Snapshot {
    std::uint64_t completed_parts = 0;
    std::uint64_t total_parts = 0;
    std::uint64_t completed_bytes = 0;
    std::uint64_t total_bytes = 0;
    double bytes_per_second = 0.0;
    double seconds_remaining = 0.0;

    double Fraction() const {
        if (total_bytes == 0) {
            return total_parts == 0 ? 1.0 : static_cast<double>(completed_parts) / static_cast<double>(total_parts);
        }
        return static_cast<double>(completed_bytes) / static_cast<double>(total_bytes);
    }
};

using Callback = std::function<void(const Snapshot&)>;

// Throughput over a sliding time window. Advisory only.
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ThroughputMeter(std::chrono::milliseconds window) : window_(window) {}

    void Record(std::uint64_t bytes, Clock::time_point now = Clock::now());
    double BytesPerSecond(Clock::time_point now = Clock::now()) const;

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t bytes;
    };

    void Expire(Clock::time_point now);

    std::chrono::milliseconds window_;
    std::deque<Sample> samples_;
    Clock::time_point started_ = Clock::time_point::min();
};

std::string FormatBytes(std::uint64_t bytes);
std::string FormatSpeed(double bytes_per_second);
std::string FormatTimeRemaining(double seconds);

// Single-line progress bar on stderr, redrawn in place on a TTY.
class ConsoleReporter {
public:
    explicit ConsoleReporter(std::string label);

    void Update(const Snapshot& snapshot);
    void Finish();

private:
    static std::string RenderBar(double fraction, int width = 30);

    std::string label_;
    bool use_ansi_ = false;
    bool printed_ = false;
    std::chrono::steady_clock::time_point last_tick_{};
    double last_fraction_ = -1.0;
};

}  // namespace blindxfer::progress
