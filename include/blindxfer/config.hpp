#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace blindxfer::config {

struct TransferConfig {
    std::string api_base;
    std::string api_token;
    std::string share_base;
    std::size_t max_in_flight = 3;
    std::size_t max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds throughput_window{5000};
    std::chrono::seconds http_timeout{300};
    std::uint16_t proxy_port = 0;
    std::chrono::milliseconds handshake_timeout{3000};
    bool optimistic_handshake = false;
};

// Defaults overridden by BLINDXFER_* environment variables.
TransferConfig FromEnvironment();

// Clamps tunables into supported ranges.
void Normalize(TransferConfig& config);

}  // namespace blindxfer::config
