#include "blindxfer/passphrase.hpp"

#include "blindxfer/base64.hpp"
#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/errors.hpp"

#include <vector>

namespace blindxfer::passphrase {

namespace {

constexpr char kSeparator = '.';

Secret DeriveWrappingKey(const std::string& passphrase, const crypto::Bytes& salt, std::size_t iterations) {
    if (passphrase.empty()) {
        throw ProtocolError("Passphrase must not be empty");
    }
    if (iterations == 0) {
        throw ProtocolError("Passphrase iteration count must be positive");
    }
    crypto::Bytes derived = crypto::Pbkdf2HmacSha256(passphrase, salt, iterations, constants::kKeyLen);
    Secret wrapping = Secret::FromBytes(derived.data(), derived.size());
    crypto::SecureWipe(derived.data(), derived.size());
    return wrapping;
}

}  // namespace

std::string WrapKey(const Secret& key, const std::string& passphrase, std::size_t iterations) {
    crypto::Bytes salt = crypto::RandomBytes(constants::kPassphraseSaltLen);
    Secret wrapping = DeriveWrappingKey(passphrase, salt, iterations);
    crypto::Bytes frame = chunkcipher::Encode(wrapping, key.data(), key.size());
    return base64::EncodeUrl(salt) + kSeparator + base64::EncodeUrl(frame);
}

Secret UnwrapKey(std::string_view wrapped, const std::string& passphrase, std::size_t iterations) {
    std::size_t dot = wrapped.find(kSeparator);
    if (dot == std::string_view::npos || wrapped.find(kSeparator, dot + 1) != std::string_view::npos) {
        throw ProtocolError("Wrapped key must have the form <salt>.<key>");
    }
    bool salt_ok = false;
    bool frame_ok = false;
    crypto::Bytes salt = base64::DecodeUrl(wrapped.substr(0, dot), &salt_ok);
    crypto::Bytes frame = base64::DecodeUrl(wrapped.substr(dot + 1), &frame_ok);
    if (!salt_ok || salt.size() != constants::kPassphraseSaltLen) {
        throw ProtocolError("Wrapped key has an invalid salt");
    }
    if (!frame_ok || frame.size() != constants::kKeyLen + constants::kFrameOverhead) {
        throw ProtocolError("Wrapped key has an invalid length");
    }
    Secret wrapping = DeriveWrappingKey(passphrase, salt, iterations);
    crypto::Bytes raw;
    try {
        chunkcipher::DecodeInto(wrapping, frame.data(), frame.size(), raw);
    } catch (const AuthenticationError&) {
        throw AuthenticationError("Wrong passphrase for this share link");
    }
    Secret key = Secret::FromBytes(raw.data(), raw.size());
    crypto::SecureWipe(raw.data(), raw.size());
    return key;
}

bool IsWrapped(std::string_view fragment) noexcept {
    return fragment.find(kSeparator) != std::string_view::npos;
}

}  // namespace blindxfer::passphrase
