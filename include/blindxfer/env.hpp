#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blindxfer::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Unset, empty, zero or unparsable values yield the fallback.
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t fallback);

}  // namespace blindxfer::env
