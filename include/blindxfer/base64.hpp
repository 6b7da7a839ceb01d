#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blindxfer::base64 {

// RFC 4648 section 5 alphabet ('-' and '_'), no '=' padding.
std::string EncodeUrl(const std::uint8_t* data, std::size_t len);
std::string EncodeUrl(const std::vector<std::uint8_t>& data);

// Accepts the URL-safe and the standard alphabet; trailing '=' is ignored.
std::vector<std::uint8_t> DecodeUrl(std::string_view input, bool* ok = nullptr);

}  // namespace blindxfer::base64
