#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace blindxfer::constants {

inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kIvLen = 12;
inline constexpr std::size_t kTagLen = 16;
inline constexpr std::size_t kFrameOverhead = kIvLen + kTagLen;

// Passphrase-wrapped share keys.
inline constexpr std::size_t kPassphraseSaltLen = 16;
inline constexpr std::size_t kPassphraseIterations = 100000;

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;
inline constexpr std::uint64_t kGiB = 1024ull * kMiB;

// Part sizing policy of the storage service.
inline constexpr std::uint64_t kTargetPartSize = 10 * kMiB;
inline constexpr std::uint64_t kMaxPartSize = 500 * kMiB;
inline constexpr std::uint64_t kMaxParts = 10000;
inline constexpr std::uint64_t kMaxFileSize = 500 * kGiB;
inline constexpr std::int64_t kExpiryHours = 12;

inline constexpr std::size_t kDefaultMaxInFlight = 3;
inline constexpr std::size_t kMaxInFlightCeiling = 16;
inline constexpr std::size_t kDefaultMaxAttempts = 3;
inline constexpr std::size_t kMaxAttemptsCeiling = 10;
inline constexpr std::uint32_t kDefaultRetryDelayMs = 1000;
inline constexpr std::uint32_t kDefaultThroughputWindowMs = 5000;
inline constexpr std::uint32_t kDefaultHttpTimeoutS = 300;
inline constexpr std::uint32_t kDefaultHandshakeTimeoutMs = 3000;

// Read granularity for network/file sources feeding the coalescer.
inline constexpr std::size_t kSourceReadSize = 64 * 1024;
inline constexpr std::size_t kHttpSourceHighWater = 1024 * 1024;

inline constexpr std::string_view kDefaultApiBase = "http://127.0.0.1:8787/api";
inline constexpr std::string_view kDefaultShareBase = "http://127.0.0.1:8787";
inline constexpr std::string_view kNeutralObjectName = "encrypted-payload.bin";
inline constexpr std::string_view kDefaultContentType = "application/octet-stream";
inline constexpr std::string_view kReadyReply = "ready";
inline constexpr std::string_view kRegisterType = "register";
inline constexpr std::string_view kVirtualPrefix = "/stream-download/";

}  // namespace blindxfer::constants
