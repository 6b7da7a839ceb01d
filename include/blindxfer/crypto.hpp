#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blindxfer::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
void RandomFill(std::uint8_t* out, std::size_t size);

// AES-256-GCM without associated data. `out` receives ciphertext || tag and
// must hold plaintext_len + kTagLen bytes. Returns bytes written.
std::size_t AesGcmSealInto(const std::uint8_t* key,
                           const std::uint8_t* iv,
                           const std::uint8_t* plaintext,
                           std::size_t plaintext_len,
                           std::uint8_t* out,
                           std::size_t out_len);

// Inverse of AesGcmSealInto. `sealed` is ciphertext || tag. Returns false on
// tag mismatch; `out` contents are unspecified in that case and must be discarded.
bool AesGcmOpenInto(const std::uint8_t* key,
                    const std::uint8_t* iv,
                    const std::uint8_t* sealed,
                    std::size_t sealed_len,
                    std::uint8_t* out,
                    std::size_t out_len);

// PKCS#5 PBKDF2 with HMAC-SHA256.
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

std::string Sha256Hex(const std::uint8_t* data, std::size_t len);

void SecureWipe(void* data, std::size_t len);

}  // namespace blindxfer::crypto
