#include "blindxfer/constants.hpp"
#include "blindxfer/crypto.hpp"
#include "blindxfer/download_session.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/passphrase.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <string>

using blindxfer::testing::Bytes;
using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;

namespace passphrase = blindxfer::passphrase;

namespace {

constexpr std::size_t kFastIterations = 1000;

std::string Hex(const Bytes& data) {
    std::string out;
    char buf[3];
    for (std::uint8_t b : data) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        out += buf;
    }
    return out;
}

}  // namespace

int main() {
    blindxfer::testing::Suite suite("passphrase");
    const blindxfer::Secret key = blindxfer::Secret::Generate();

    suite.Run("pbkdf2_known_answer", [&] {
        // RFC 7914 section 11, first 32 bytes.
        Bytes salt{'s', 'a', 'l', 't'};
        Bytes derived = blindxfer::crypto::Pbkdf2HmacSha256("passwd", salt, 1, 32);
        CheckEq(Hex(derived), std::string("55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"),
                "derived key");
    });

    suite.Run("wrap_then_unwrap", [&] {
        std::string wrapped = passphrase::WrapKey(key, "correct horse", kFastIterations);
        Check(passphrase::IsWrapped(wrapped), "wrapped shape");
        Check(wrapped.find(key.ToBase64Url()) == std::string::npos, "raw key does not appear");
        Check(passphrase::UnwrapKey(wrapped, "correct horse", kFastIterations) == key, "same key");
    });

    suite.Run("fresh_salt_per_wrap", [&] {
        std::string a = passphrase::WrapKey(key, "pw", kFastIterations);
        std::string b = passphrase::WrapKey(key, "pw", kFastIterations);
        Check(a.substr(0, a.find('.')) != b.substr(0, b.find('.')), "salts differ");
    });

    suite.Run("wrong_passphrase_fails", [&] {
        std::string wrapped = passphrase::WrapKey(key, "right", kFastIterations);
        CheckThrows<blindxfer::AuthenticationError>(
            [&] { passphrase::UnwrapKey(wrapped, "wrong", kFastIterations); }, "wrong passphrase");
        CheckThrows<blindxfer::AuthenticationError>(
            [&] { passphrase::UnwrapKey(wrapped, "right", kFastIterations + 1); }, "wrong iteration count");
    });

    suite.Run("malformed_tokens_are_rejected", [&] {
        std::string wrapped = passphrase::WrapKey(key, "pw", kFastIterations);
        std::string salt = wrapped.substr(0, wrapped.find('.'));
        std::string frame = wrapped.substr(wrapped.find('.') + 1);
        CheckThrows<blindxfer::ProtocolError>([&] { passphrase::UnwrapKey(frame, "pw", kFastIterations); },
                                              "no separator");
        CheckThrows<blindxfer::ProtocolError>(
            [&] { passphrase::UnwrapKey(wrapped + ".x", "pw", kFastIterations); }, "two separators");
        CheckThrows<blindxfer::ProtocolError>(
            [&] { passphrase::UnwrapKey("AAAA." + frame, "pw", kFastIterations); }, "short salt");
        CheckThrows<blindxfer::ProtocolError>(
            [&] { passphrase::UnwrapKey(salt + "." + frame.substr(4), "pw", kFastIterations); }, "short frame");
        CheckThrows<blindxfer::ProtocolError>([&] { passphrase::WrapKey(key, "", kFastIterations); },
                                              "empty passphrase");
    });

    suite.Run("share_link_with_wrapped_key", [&] {
        std::string link = "https://x.example/download/abc-123#" + passphrase::WrapKey(key, "open sesame");
        auto parsed = blindxfer::download::ParseShareLink(link, "open sesame");
        CheckEq(parsed.id, std::string("abc-123"), "id");
        Check(parsed.key == key, "unwrapped key");
        CheckThrows<blindxfer::ProtocolError>([&] { blindxfer::download::ParseShareLink(link); },
                                              "passphrase required");
        CheckThrows<blindxfer::AuthenticationError>(
            [&] { blindxfer::download::ParseShareLink(link, "close sesame"); }, "wrong passphrase");
    });

    suite.Run("plain_link_ignores_passphrase", [&] {
        auto parsed = blindxfer::download::ParseShareLink("abc#" + key.ToBase64Url(), "unused");
        Check(parsed.key == key, "plain key");
    });

    return suite.Finish();
}
