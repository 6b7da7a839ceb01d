#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace blindxfer::json {

// Flat JSON objects: string, number, boolean and null members. Nested arrays
// or objects are kept as their raw text.
using FlatObject = std::map<std::string, std::string>;

std::string Escape(std::string_view input);

class ObjectWriter {
public:
    ObjectWriter& Add(std::string_view key, std::string_view value);
    ObjectWriter& AddNumber(std::string_view key, std::uint64_t value);
    ObjectWriter& AddBool(std::string_view key, bool value);
    // `raw` must already be valid JSON (array or object).
    ObjectWriter& AddRaw(std::string_view key, std::string_view raw);

    std::string Finish() const;

private:
    void Key(std::string_view key);

    std::string body_;
};

// Throws ProtocolError on malformed input.
FlatObject ParseFlatObject(std::string_view text);

std::optional<std::string> GetString(const FlatObject& object, std::string_view key);
// Accepts JSON numbers and numeric strings.
std::optional<std::uint64_t> GetUnsigned(const FlatObject& object, std::string_view key);
bool GetBool(const FlatObject& object, std::string_view key, bool fallback = false);

}  // namespace blindxfer::json
