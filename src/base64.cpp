#include "blindxfer/base64.hpp"

#include <array>

namespace blindxfer::base64 {

namespace {

constexpr char kUrlTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kUrlTable[i])] = static_cast<std::uint8_t>(i);
    }
    table[static_cast<std::uint8_t>('+')] = 62;
    table[static_cast<std::uint8_t>('/')] = 63;
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

}  // namespace

std::string EncodeUrl(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < len) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kUrlTable[(triple >> 18) & 0x3F]);
        out.push_back(kUrlTable[(triple >> 12) & 0x3F]);
        out.push_back(kUrlTable[(triple >> 6) & 0x3F]);
        out.push_back(kUrlTable[triple & 0x3F]);
        i += 3;
    }
    if (i < len) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < len) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kUrlTable[(triple >> 18) & 0x3F]);
        out.push_back(kUrlTable[(triple >> 12) & 0x3F]);
        if (i + 1 < len) {
            out.push_back(kUrlTable[(triple >> 6) & 0x3F]);
        }
    }
    return out;
}

std::string EncodeUrl(const std::vector<std::uint8_t>& data) {
    return EncodeUrl(data.data(), data.size());
}

std::vector<std::uint8_t> DecodeUrl(std::string_view input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3 + 3);

    std::uint32_t val = 0;
    int valb = -8;
    std::size_t symbols = 0;
    for (unsigned char c : input) {
        if (c == '=') {
            break;
        }
        std::uint8_t decoded = kDecTable[c];
        if (decoded == 0xFF) {
            success = false;
            break;
        }
        ++symbols;
        val = ((val << 6) | decoded) & 0xFFFFFFu;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // A single dangling symbol cannot encode a whole byte.
    if (success && symbols % 4 == 1) {
        success = false;
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace blindxfer::base64
