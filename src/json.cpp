#include "blindxfer/json.hpp"

#include "blindxfer/errors.hpp"

#include <cctype>
#include <cstdio>

namespace blindxfer::json {

namespace {

class Scanner {
public:
    explicit Scanner(std::string_view text) : text_(text) {}

    void SkipSpace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool AtEnd() const { return pos_ >= text_.size(); }

    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    void Expect(char ch) {
        SkipSpace();
        if (Peek() != ch) {
            Fail(std::string("expected '") + ch + "'");
        }
        ++pos_;
    }

    bool Consume(char ch) {
        SkipSpace();
        if (Peek() == ch) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string String() {
        Expect('"');
        std::string out;
        while (true) {
            if (AtEnd()) {
                Fail("unterminated string");
            }
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (AtEnd()) {
                Fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u':
                    AppendUtf8(out, HexCodeUnit());
                    break;
                default:
                    Fail("invalid escape");
            }
        }
    }

    // Returns the raw text of a scalar, array or object value.
    std::string Value() {
        SkipSpace();
        char ch = Peek();
        if (ch == '"') {
            return String();
        }
        if (ch == '[' || ch == '{') {
            return Nested();
        }
        std::size_t start = pos_;
        while (!AtEnd()) {
            char c = text_[pos_];
            if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            ++pos_;
        }
        if (start == pos_) {
            Fail("missing value");
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    [[noreturn]] void Fail(const std::string& what) const {
        throw ProtocolError("Malformed JSON at offset " + std::to_string(pos_) + ": " + what);
    }

private:
    std::string Nested() {
        std::size_t start = pos_;
        int depth = 0;
        bool in_string = false;
        while (!AtEnd()) {
            char c = text_[pos_++];
            if (in_string) {
                if (c == '\\') {
                    ++pos_;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            if (c == '"') {
                in_string = true;
            } else if (c == '[' || c == '{') {
                ++depth;
            } else if (c == ']' || c == '}') {
                if (--depth == 0) {
                    return std::string(text_.substr(start, pos_ - start));
                }
            }
        }
        Fail("unterminated nested value");
    }

    unsigned HexCodeUnit() {
        if (pos_ + 4 > text_.size()) {
            Fail("short unicode escape");
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<unsigned>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<unsigned>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<unsigned>(c - 'A' + 10);
            } else {
                Fail("bad unicode escape");
            }
        }
        return value;
    }

    static void AppendUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::string Escape(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char ch : input) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void ObjectWriter::Key(std::string_view key) {
    if (!body_.empty()) {
        body_.push_back(',');
    }
    body_.push_back('"');
    body_ += Escape(key);
    body_ += "\":";
}

ObjectWriter& ObjectWriter::Add(std::string_view key, std::string_view value) {
    Key(key);
    body_.push_back('"');
    body_ += Escape(value);
    body_.push_back('"');
    return *this;
}

ObjectWriter& ObjectWriter::AddNumber(std::string_view key, std::uint64_t value) {
    Key(key);
    body_ += std::to_string(value);
    return *this;
}

ObjectWriter& ObjectWriter::AddBool(std::string_view key, bool value) {
    Key(key);
    body_ += value ? "true" : "false";
    return *this;
}

ObjectWriter& ObjectWriter::AddRaw(std::string_view key, std::string_view raw) {
    Key(key);
    body_ += raw;
    return *this;
}

std::string ObjectWriter::Finish() const {
    return "{" + body_ + "}";
}

FlatObject ParseFlatObject(std::string_view text) {
    Scanner scanner(text);
    FlatObject result;
    scanner.Expect('{');
    if (!scanner.Consume('}')) {
        do {
            scanner.SkipSpace();
            std::string key = scanner.String();
            scanner.Expect(':');
            result[key] = scanner.Value();
        } while (scanner.Consume(','));
        scanner.Expect('}');
    }
    scanner.SkipSpace();
    if (!scanner.AtEnd()) {
        scanner.Fail("trailing characters");
    }
    return result;
}

std::optional<std::string> GetString(const FlatObject& object, std::string_view key) {
    auto it = object.find(std::string(key));
    if (it == object.end() || it->second == "null") {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> GetUnsigned(const FlatObject& object, std::string_view key) {
    auto value = GetString(object, key);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    std::uint64_t out = 0;
    for (char ch : *value) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (out > (UINT64_MAX - digit) / 10) {
            return std::nullopt;
        }
        out = out * 10 + digit;
    }
    return out;
}

bool GetBool(const FlatObject& object, std::string_view key, bool fallback) {
    auto value = GetString(object, key);
    if (!value) {
        return fallback;
    }
    return *value == "true";
}

}  // namespace blindxfer::json
