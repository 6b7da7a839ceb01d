#include "blindxfer/chunk_cipher.hpp"
#include "blindxfer/constants.hpp"
#include "blindxfer/errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using blindxfer::testing::Bytes;
using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;
using blindxfer::testing::PatternBytes;

namespace chunkcipher = blindxfer::chunkcipher;

int main() {
    blindxfer::testing::Suite suite("chunk_cipher");
    const blindxfer::Secret key = blindxfer::Secret::Generate();

    suite.Run("round_trip_sizes", [&] {
        for (std::size_t size : {std::size_t{0}, std::size_t{1}, std::size_t{1000}, std::size_t{65539}}) {
            Bytes plain = PatternBytes(size, static_cast<std::uint32_t>(size));
            Bytes frame = chunkcipher::Encode(key, plain);
            CheckEq(frame.size(), size + blindxfer::constants::kFrameOverhead, "frame overhead is 28 bytes");
            CheckEq(chunkcipher::Decode(key, frame), plain, "decoded plaintext");
        }
    });

    suite.Run("fresh_iv_per_frame", [&] {
        Bytes plain = PatternBytes(256);
        Bytes a = chunkcipher::Encode(key, plain);
        Bytes b = chunkcipher::Encode(key, plain);
        Check(!std::equal(a.begin(), a.begin() + 12, b.begin()), "IVs differ");
        Check(a != b, "frames differ");
    });

    suite.Run("tamper_any_region_fails", [&] {
        Bytes plain = PatternBytes(4096, 7);
        Bytes frame = chunkcipher::Encode(key, plain);
        for (std::size_t pos : {std::size_t{0}, std::size_t{11}, std::size_t{12}, std::size_t{2000},
                                frame.size() - 17, frame.size() - 1}) {
            Bytes bad = frame;
            bad[pos] ^= 0x01;
            CheckThrows<blindxfer::AuthenticationError>([&] { chunkcipher::Decode(key, bad); },
                                                        "flip at " + std::to_string(pos));
        }
    });

    suite.Run("failed_decode_emits_nothing", [&] {
        Bytes frame = chunkcipher::Encode(key, PatternBytes(512, 3));
        frame[100] ^= 0x80;
        Bytes out = PatternBytes(10, 9);
        CheckThrows<blindxfer::AuthenticationError>(
            [&] { chunkcipher::DecodeInto(key, frame.data(), frame.size(), out); }, "tampered");
        Check(out.empty(), "output cleared");
    });

    suite.Run("truncated_frame_fails", [&] {
        Bytes frame = chunkcipher::Encode(key, PatternBytes(64));
        CheckThrows<blindxfer::AuthenticationError>([&] { chunkcipher::Decode(key, frame.data(), 27); },
                                                    "shorter than overhead");
        CheckThrows<blindxfer::AuthenticationError>([&] { chunkcipher::Decode(key, frame.data(), frame.size() - 1); },
                                                    "missing last tag byte");
    });

    suite.Run("wrong_key_fails", [&] {
        Bytes frame = chunkcipher::Encode(key, PatternBytes(128));
        blindxfer::Secret other = blindxfer::Secret::Generate();
        CheckThrows<blindxfer::AuthenticationError>([&] { chunkcipher::Decode(other, frame); }, "other key");
    });

    suite.Run("concurrent_encode", [&] {
        std::vector<Bytes> frames(8);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < frames.size(); ++i) {
            threads.emplace_back([&, i] {
                frames[i] = chunkcipher::Encode(key, PatternBytes(10000, static_cast<std::uint32_t>(i)));
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (std::size_t i = 0; i < frames.size(); ++i) {
            CheckEq(chunkcipher::Decode(key, frames[i]), PatternBytes(10000, static_cast<std::uint32_t>(i)),
                    "frame " + std::to_string(i));
        }
    });

    suite.Run("metadata_round_trip", [&] {
        chunkcipher::FileMetadata meta;
        meta.name = "report \"final\".pdf";
        meta.type = "application/pdf";
        std::string blob = chunkcipher::EncryptMetadata(key, meta);
        Check(blob.find("report") == std::string::npos, "name is not visible");
        chunkcipher::FileMetadata back = chunkcipher::DecryptMetadata(key, blob);
        CheckEq(back.name, meta.name, "name");
        CheckEq(back.type, meta.type, "type");
        CheckThrows<blindxfer::AuthenticationError>(
            [&] { chunkcipher::DecryptMetadata(blindxfer::Secret::Generate(), blob); }, "wrong key");
    });

    return suite.Finish();
}
