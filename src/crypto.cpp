#include "blindxfer/crypto.hpp"

#include "blindxfer/constants.hpp"
#include "blindxfer/crypto_utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace blindxfer::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedLen(std::size_t len) {
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Input too large for OpenSSL");
    }
    return static_cast<int>(len);
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    RandomFill(out.data(), out.size());
    return out;
}

void RandomFill(std::uint8_t* out, std::size_t size) {
    if (size == 0) {
        return;
    }
    Ensure(RAND_bytes(out, CheckedLen(size)) == 1, "RAND_bytes failed");
}

std::size_t AesGcmSealInto(const std::uint8_t* key,
                           const std::uint8_t* iv,
                           const std::uint8_t* plaintext,
                           std::size_t plaintext_len,
                           std::uint8_t* out,
                           std::size_t out_len) {
    if (out_len < plaintext_len + constants::kTagLen) {
        throw std::runtime_error("AES-GCM output buffer too small");
    }
    auto ctx = detail::MakeCipherCtx();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_part = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(constants::kIvLen), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, iv) == 1,
           "AES-GCM set key failed");
    if (plaintext_len > 0) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out, &out_part, plaintext, CheckedLen(plaintext_len)) == 1,
               "AES-GCM encrypt failed");
        total_len += out_part;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out + total_len, &out_part) == 1,
           "AES-GCM final failed");
    total_len += out_part;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kTagLen),
                               out + total_len) == 1,
           "AES-GCM get tag failed");
    return static_cast<std::size_t>(total_len) + constants::kTagLen;
}

bool AesGcmOpenInto(const std::uint8_t* key,
                    const std::uint8_t* iv,
                    const std::uint8_t* sealed,
                    std::size_t sealed_len,
                    std::uint8_t* out,
                    std::size_t out_len) {
    if (sealed_len < constants::kTagLen) {
        return false;
    }
    std::size_t ct_len = sealed_len - constants::kTagLen;
    if (out_len < ct_len) {
        throw std::runtime_error("AES-GCM output buffer too small");
    }
    auto ctx = detail::MakeCipherCtx();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_part = 0;
    int total_len = 0;
    std::array<std::uint8_t, constants::kTagLen> tag{};
    std::copy(sealed + ct_len, sealed + sealed_len, tag.begin());

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(constants::kIvLen), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, iv) == 1,
           "AES-GCM set key failed");
    if (ct_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), out, &out_part, sealed, CheckedLen(ct_len)) == 1,
               "AES-GCM decrypt failed");
        total_len += out_part;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), out + total_len, &out_part) != 1) {
        return false;
    }
    return true;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), CheckedLen(password.size()), salt.data(),
                             CheckedLen(salt.size()), CheckedLen(iterations), EVP_sha256(),
                             CheckedLen(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

std::string Sha256Hex(const std::uint8_t* data, std::size_t len) {
    auto ctx = detail::MakeMDCtx();
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
    if (len > 0) {
        Ensure(EVP_DigestUpdate(ctx.get(), data, len) == 1, "SHA-256 update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) == 1, "SHA-256 final failed");

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

void SecureWipe(void* data, std::size_t len) {
    if (data != nullptr && len > 0) {
        OPENSSL_cleanse(data, len);
    }
}

}  // namespace blindxfer::crypto
