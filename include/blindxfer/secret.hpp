#pragma once

#include "blindxfer/constants.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace blindxfer {

// 256-bit transfer key. Lives only in process memory and is wiped on destruction.
class Secret {
public:
    Secret();
    ~Secret();

    Secret(const Secret& other);
    Secret& operator=(const Secret& other);

    static Secret Generate();
    // Throws ProtocolError unless the input decodes to exactly kKeyLen bytes.
    static Secret FromBase64Url(std::string_view encoded);
    static Secret FromBytes(const std::uint8_t* data, std::size_t len);

    std::string ToBase64Url() const;

    const std::uint8_t* data() const noexcept { return key_.data(); }
    static constexpr std::size_t size() noexcept { return constants::kKeyLen; }

    bool operator==(const Secret& other) const noexcept;
    bool operator!=(const Secret& other) const noexcept { return !(*this == other); }

private:
    std::array<std::uint8_t, constants::kKeyLen> key_{};
};

}  // namespace blindxfer
