#pragma once

#include "blindxfer/secret.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace blindxfer::chunkcipher {

using Bytes = std::vector<std::uint8_t>;

// Frame layout: IV(12) || ciphertext(N) || tag(16). Stateless; Encode may be
// called concurrently from several threads.
Bytes Encode(const Secret& key, const std::uint8_t* plaintext, std::size_t len);
Bytes Encode(const Secret& key, const Bytes& plaintext);

// Throws AuthenticationError on a tag mismatch or a frame shorter than the
// overhead. Nothing is returned for a frame that fails to authenticate.
Bytes Decode(const Secret& key, const std::uint8_t* frame, std::size_t len);
Bytes Decode(const Secret& key, const Bytes& frame);

// Decodes into `out`, which is resized to the plaintext length. `out` is
// cleared before an AuthenticationError is thrown.
void DecodeInto(const Secret& key, const std::uint8_t* frame, std::size_t len, Bytes& out);

struct FileMetadata {
    std::string name;
    std::string type;
};

// {"name","type"} sealed as one frame and encoded as base64url.
std::string EncryptMetadata(const Secret& key, const FileMetadata& meta);
// Throws AuthenticationError or ProtocolError.
FileMetadata DecryptMetadata(const Secret& key, const std::string& blob);

}  // namespace blindxfer::chunkcipher
