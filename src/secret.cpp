#include "blindxfer/secret.hpp"

#include "blindxfer/base64.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/errors.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <vector>

namespace blindxfer {

Secret::Secret() = default;

Secret::~Secret() {
    crypto::SecureWipe(key_.data(), key_.size());
}

Secret::Secret(const Secret& other) : key_(other.key_) {}

Secret& Secret::operator=(const Secret& other) {
    if (this != &other) {
        key_ = other.key_;
    }
    return *this;
}

Secret Secret::Generate() {
    Secret secret;
    crypto::RandomFill(secret.key_.data(), secret.key_.size());
    return secret;
}

Secret Secret::FromBytes(const std::uint8_t* data, std::size_t len) {
    if (data == nullptr || len != constants::kKeyLen) {
        throw ProtocolError("Secret must be exactly 32 bytes");
    }
    Secret secret;
    std::copy(data, data + len, secret.key_.begin());
    return secret;
}

Secret Secret::FromBase64Url(std::string_view encoded) {
    bool ok = false;
    std::vector<std::uint8_t> raw = base64::DecodeUrl(encoded, &ok);
    if (!ok || raw.size() != constants::kKeyLen) {
        crypto::SecureWipe(raw.data(), raw.size());
        throw ProtocolError("Invalid key: expected base64url encoding of 32 bytes");
    }
    Secret secret = FromBytes(raw.data(), raw.size());
    crypto::SecureWipe(raw.data(), raw.size());
    return secret;
}

std::string Secret::ToBase64Url() const {
    return base64::EncodeUrl(key_.data(), key_.size());
}

bool Secret::operator==(const Secret& other) const noexcept {
    return CRYPTO_memcmp(key_.data(), other.key_.data(), key_.size()) == 0;
}

}  // namespace blindxfer
