#pragma once

#include "blindxfer/constants.hpp"
#include "blindxfer/secret.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace blindxfer::passphrase {

// A share key sealed under a passphrase: "<salt>.<frame>", both base64url.
// The frame is an AES-256-GCM frame of the 32 key bytes under
// PBKDF2-HMAC-SHA256(passphrase, salt).
std::string WrapKey(const Secret& key,
                    const std::string& passphrase,
                    std::size_t iterations = constants::kPassphraseIterations);

// Throws AuthenticationError for a wrong passphrase and ProtocolError for a
// malformed token.
Secret UnwrapKey(std::string_view wrapped,
                 const std::string& passphrase,
                 std::size_t iterations = constants::kPassphraseIterations);

// True when `fragment` has the wrapped shape rather than a bare key.
bool IsWrapped(std::string_view fragment) noexcept;

}  // namespace blindxfer::passphrase
