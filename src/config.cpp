#include "blindxfer/config.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/env.hpp"

#include <algorithm>
#include <limits>

namespace blindxfer::config {

TransferConfig FromEnvironment() {
    TransferConfig config;
    config.api_base = env::Get("BLINDXFER_API_BASE");
    if (config.api_base.empty()) {
        config.api_base = std::string(constants::kDefaultApiBase);
    }
    config.api_token = env::Get("BLINDXFER_API_TOKEN");
    config.share_base = env::Get("BLINDXFER_SHARE_BASE");
    if (config.share_base.empty()) {
        config.share_base = std::string(constants::kDefaultShareBase);
    }
    config.max_in_flight = static_cast<std::size_t>(
        env::GetUnsigned("BLINDXFER_MAX_IN_FLIGHT", constants::kDefaultMaxInFlight));
    config.max_attempts = static_cast<std::size_t>(
        env::GetUnsigned("BLINDXFER_MAX_ATTEMPTS", constants::kDefaultMaxAttempts));
    config.retry_base_delay = std::chrono::milliseconds(
        env::GetUnsigned("BLINDXFER_RETRY_DELAY_MS", constants::kDefaultRetryDelayMs));
    config.throughput_window = std::chrono::milliseconds(
        env::GetUnsigned("BLINDXFER_THROUGHPUT_WINDOW_MS", constants::kDefaultThroughputWindowMs));
    config.http_timeout = std::chrono::seconds(
        env::GetUnsigned("BLINDXFER_HTTP_TIMEOUT_S", constants::kDefaultHttpTimeoutS));
    std::uint64_t port = env::GetUnsigned("BLINDXFER_PROXY_PORT", 0);
    if (port <= std::numeric_limits<std::uint16_t>::max()) {
        config.proxy_port = static_cast<std::uint16_t>(port);
    }
    config.handshake_timeout = std::chrono::milliseconds(
        env::GetUnsigned("BLINDXFER_HANDSHAKE_TIMEOUT_MS", constants::kDefaultHandshakeTimeoutMs));
    config.optimistic_handshake = env::IsEnabled("BLINDXFER_OPTIMISTIC_HANDSHAKE", false);
    Normalize(config);
    return config;
}

void Normalize(TransferConfig& config) {
    config.max_in_flight = std::clamp<std::size_t>(config.max_in_flight, 1, constants::kMaxInFlightCeiling);
    config.max_attempts = std::clamp<std::size_t>(config.max_attempts, 1, constants::kMaxAttemptsCeiling);
    if (config.throughput_window.count() <= 0) {
        config.throughput_window = std::chrono::milliseconds(constants::kDefaultThroughputWindowMs);
    }
    if (config.http_timeout.count() <= 0) {
        config.http_timeout = std::chrono::seconds(constants::kDefaultHttpTimeoutS);
    }
    while (!config.api_base.empty() && config.api_base.back() == '/') {
        config.api_base.pop_back();
    }
    while (!config.share_base.empty() && config.share_base.back() == '/') {
        config.share_base.pop_back();
    }
}

}  // namespace blindxfer::config
