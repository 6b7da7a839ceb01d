#include "blindxfer/chunk_cipher.hpp"

#include "blindxfer/base64.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/json.hpp"

namespace blindxfer::chunkcipher {

Bytes Encode(const Secret& key, const std::uint8_t* plaintext, std::size_t len) {
    Bytes frame(constants::kIvLen + len + constants::kTagLen);
    crypto::RandomFill(frame.data(), constants::kIvLen);
    std::size_t written = crypto::AesGcmSealInto(key.data(),
                                                 frame.data(),
                                                 plaintext,
                                                 len,
                                                 frame.data() + constants::kIvLen,
                                                 frame.size() - constants::kIvLen);
    frame.resize(constants::kIvLen + written);
    return frame;
}

Bytes Encode(const Secret& key, const Bytes& plaintext) {
    return Encode(key, plaintext.data(), plaintext.size());
}

void DecodeInto(const Secret& key, const std::uint8_t* frame, std::size_t len, Bytes& out) {
    if (len < constants::kFrameOverhead) {
        out.clear();
        throw AuthenticationError("Frame truncated: " + std::to_string(len) + " bytes");
    }
    out.resize(len - constants::kFrameOverhead);
    bool ok = crypto::AesGcmOpenInto(key.data(),
                                     frame,
                                     frame + constants::kIvLen,
                                     len - constants::kIvLen,
                                     out.data(),
                                     out.size());
    if (!ok) {
        crypto::SecureWipe(out.data(), out.size());
        out.clear();
        throw AuthenticationError("Frame authentication failed");
    }
}

Bytes Decode(const Secret& key, const std::uint8_t* frame, std::size_t len) {
    Bytes out;
    DecodeInto(key, frame, len, out);
    return out;
}

Bytes Decode(const Secret& key, const Bytes& frame) {
    return Decode(key, frame.data(), frame.size());
}

std::string EncryptMetadata(const Secret& key, const FileMetadata& meta) {
    std::string text = json::ObjectWriter()
                           .Add("name", meta.name)
                           .Add("type", meta.type)
                           .Finish();
    Bytes frame = Encode(key, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    return base64::EncodeUrl(frame);
}

FileMetadata DecryptMetadata(const Secret& key, const std::string& blob) {
    bool ok = false;
    Bytes frame = base64::DecodeUrl(blob, &ok);
    if (!ok) {
        throw ProtocolError("Encrypted metadata is not base64url");
    }
    Bytes plain = Decode(key, frame);
    json::FlatObject fields = json::ParseFlatObject(
        std::string_view(reinterpret_cast<const char*>(plain.data()), plain.size()));
    FileMetadata meta;
    meta.name = json::GetString(fields, "name").value_or("");
    meta.type = json::GetString(fields, "type").value_or("");
    return meta;
}

}  // namespace blindxfer::chunkcipher
