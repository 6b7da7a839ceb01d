#include "blindxfer/base64.hpp"
#include "blindxfer/errors.hpp"
#include "blindxfer/json.hpp"
#include "blindxfer/secret.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using blindxfer::testing::Check;
using blindxfer::testing::CheckEq;
using blindxfer::testing::CheckThrows;

namespace {

std::vector<std::uint8_t> ToBytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

int main() {
    blindxfer::testing::Suite suite("json_base64");

    suite.Run("base64url_known_vectors", [] {
        CheckEq(blindxfer::base64::EncodeUrl(ToBytes("")), std::string(""), "empty");
        CheckEq(blindxfer::base64::EncodeUrl(ToBytes("f")), std::string("Zg"), "f");
        CheckEq(blindxfer::base64::EncodeUrl(ToBytes("fo")), std::string("Zm8"), "fo");
        CheckEq(blindxfer::base64::EncodeUrl(ToBytes("foo")), std::string("Zm9v"), "foo");
        std::vector<std::uint8_t> url_only = {0xfb, 0xff};
        CheckEq(blindxfer::base64::EncodeUrl(url_only), std::string("-_8"), "url alphabet");
    });

    suite.Run("base64url_decode_accepts_both_alphabets", [] {
        bool ok = false;
        auto a = blindxfer::base64::DecodeUrl("-_8", &ok);
        Check(ok, "url form decodes");
        auto b = blindxfer::base64::DecodeUrl("+/8=", &ok);
        Check(ok, "standard form decodes");
        CheckEq(a, b, "same bytes");
        CheckEq(a, std::vector<std::uint8_t>({0xfb, 0xff}), "expected bytes");
    });

    suite.Run("base64url_rejects_garbage", [] {
        bool ok = true;
        blindxfer::base64::DecodeUrl("Z", &ok);
        Check(!ok, "single symbol is not a valid encoding");
        ok = true;
        blindxfer::base64::DecodeUrl("ab$d", &ok);
        Check(!ok, "invalid symbol");
    });

    suite.Run("secret_export_import", [] {
        blindxfer::Secret key = blindxfer::Secret::Generate();
        std::string text = key.ToBase64Url();
        CheckEq(text.size(), std::size_t{43}, "32 bytes encode to 43 symbols");
        Check(text.find('=') == std::string::npos, "no padding");
        blindxfer::Secret back = blindxfer::Secret::FromBase64Url(text);
        Check(back == key, "round trip");
        Check(blindxfer::Secret::Generate() != key, "fresh keys differ");
    });

    suite.Run("secret_rejects_wrong_length", [] {
        std::vector<std::uint8_t> short_key(16, 0x11);
        std::string encoded = blindxfer::base64::EncodeUrl(short_key);
        CheckThrows<blindxfer::ProtocolError>([&] { blindxfer::Secret::FromBase64Url(encoded); }, "16-byte key");
        CheckThrows<blindxfer::ProtocolError>([] { blindxfer::Secret::FromBase64Url("not base64 !"); },
                                              "invalid symbols");
    });

    suite.Run("json_writer_and_parser", [] {
        std::string text = blindxfer::json::ObjectWriter()
                               .Add("name", "quote \" and \\ slash\nnewline")
                               .AddNumber("size", 26214400)
                               .AddBool("success", true)
                               .AddRaw("parts", "[{\"partNumber\":1,\"etag\":\"a\"}]")
                               .Finish();
        auto fields = blindxfer::json::ParseFlatObject(text);
        CheckEq(blindxfer::json::GetString(fields, "name").value_or(""), std::string("quote \" and \\ slash\nnewline"),
                "escaped string");
        CheckEq(blindxfer::json::GetUnsigned(fields, "size").value_or(0), std::uint64_t{26214400}, "number");
        Check(blindxfer::json::GetBool(fields, "success"), "bool");
        CheckEq(fields.at("parts"), std::string("[{\"partNumber\":1,\"etag\":\"a\"}]"), "nested kept raw");
    });

    suite.Run("json_parser_details", [] {
        auto fields = blindxfer::json::ParseFlatObject(
            " { \"a\" : \"caf\\u00e9\", \"n\" : \"42\", \"z\" : null, \"o\" : {\"k\":\"}\"} } ");
        CheckEq(blindxfer::json::GetString(fields, "a").value_or(""), std::string("caf\xc3\xa9"), "unicode escape");
        CheckEq(blindxfer::json::GetUnsigned(fields, "n").value_or(0), std::uint64_t{42}, "numeric string");
        Check(!blindxfer::json::GetString(fields, "z").has_value(), "null is absent");
        Check(!blindxfer::json::GetString(fields, "missing").has_value(), "missing key");
        CheckEq(fields.at("o"), std::string("{\"k\":\"}\"}"), "brace inside nested string");
    });

    suite.Run("json_rejects_malformed", [] {
        CheckThrows<blindxfer::ProtocolError>([] { blindxfer::json::ParseFlatObject("{\"a\":"); }, "truncated");
        CheckThrows<blindxfer::ProtocolError>([] { blindxfer::json::ParseFlatObject("[1,2]"); }, "not an object");
        CheckThrows<blindxfer::ProtocolError>([] { blindxfer::json::ParseFlatObject("{\"a\":\"\\q\"}"); },
                                              "bad escape");
    });

    return suite.Finish();
}
