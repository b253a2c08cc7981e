/**
 * @file json_reader.cpp
 * @brief Strict JSON reader used by the metadata carrier
 */

#include "../include/rainbow_json.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_text_codec.hpp"

#include <cctype>
#include <cstdio>

namespace rainbow {
namespace json {

static constexpr int MAX_DEPTH = 32;

std::optional<uint64_t> Value::as_uint() const {
    if (type_ != Type::NUMBER) return std::nullopt;
    return text::parse_decimal(text_, UINT64_MAX);
}

const Value* Value::find(const std::string& key) const {
    if (type_ != Type::OBJECT) return nullptr;
    for (const auto& m : members_) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

class Reader {
public:
    explicit Reader(std::string_view in) : in_(in) {}

    Value run() {
        skip_ws();
        Value v = parse_value(0);
        skip_ws();
        if (pos_ != in_.size()) fail("trailing characters");
        return v;
    }

private:
    [[noreturn]] void fail(const std::string& why) const {
        throw FormatError("json: " + why + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool consume_literal(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    Value parse_value(int depth) {
        if (depth > MAX_DEPTH) fail("nesting too deep");
        if (pos_ >= in_.size()) fail("unexpected end of input");
        Value v;
        char c = in_[pos_];
        if (c == '{') {
            parse_object(v, depth);
        } else if (c == '[') {
            parse_array(v, depth);
        } else if (c == '"') {
            v.type_ = Value::Type::STRING;
            v.text_ = parse_string();
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            v.type_ = Value::Type::NUMBER;
            v.text_ = parse_number();
        } else if (consume_literal("true")) {
            v.type_ = Value::Type::BOOL;
            v.flag_ = true;
        } else if (consume_literal("false")) {
            v.type_ = Value::Type::BOOL;
        } else if (consume_literal("null")) {
            v.type_ = Value::Type::NUL;
        } else {
            fail("unexpected character");
        }
        return v;
    }

    void parse_object(Value& v, int depth) {
        v.type_ = Value::Type::OBJECT;
        ++pos_;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '}') {
            ++pos_;
            return;
        }
        for (;;) {
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != '"') fail("expected member name");
            std::string key = parse_string();
            if (v.find(key)) fail("duplicate key \"" + key + "\"");
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != ':') fail("expected ':'");
            ++pos_;
            skip_ws();
            Value member = parse_value(depth + 1);
            v.members_.emplace_back(std::move(key), std::move(member));
            skip_ws();
            if (pos_ >= in_.size()) fail("unterminated object");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == '}') { ++pos_; return; }
            fail("expected ',' or '}'");
        }
    }

    void parse_array(Value& v, int depth) {
        v.type_ = Value::Type::ARRAY;
        ++pos_;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == ']') {
            ++pos_;
            return;
        }
        for (;;) {
            skip_ws();
            v.items_.push_back(parse_value(depth + 1));
            skip_ws();
            if (pos_ >= in_.size()) fail("unterminated array");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == ']') { ++pos_; return; }
            fail("expected ',' or ']'");
        }
    }

    std::string parse_number() {
        size_t start = pos_;
        if (in_[pos_] == '-') ++pos_;
        if (pos_ >= in_.size()) fail("truncated number");
        if (in_[pos_] == '0') {
            ++pos_;
        } else if (in_[pos_] >= '1' && in_[pos_] <= '9') {
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
        } else {
            fail("bad number");
        }
        if (pos_ < in_.size() && in_[pos_] == '.') {
            ++pos_;
            size_t digits = pos_;
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
            if (pos_ == digits) fail("bad fraction");
        }
        if (pos_ < in_.size() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < in_.size() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            size_t digits = pos_;
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
            if (pos_ == digits) fail("bad exponent");
        }
        return std::string(in_.substr(start, pos_ - start));
    }

    uint32_t parse_hex4() {
        if (pos_ + 4 > in_.size()) fail("truncated \\u escape");
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = in_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("bad \\u escape");
        }
        return cp;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string() {
        ++pos_;  // opening quote
        std::string out;
        for (;;) {
            if (pos_ >= in_.size()) fail("unterminated string");
            char c = in_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= in_.size()) fail("truncated escape");
            char e = in_[pos_++];
            switch (e) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) fail("lone high surrogate");
                        uint32_t lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("bad low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("lone low surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("unknown escape");
            }
        }
    }

    std::string_view in_;
    size_t pos_ = 0;
};

Value parse(std::string_view input) {
    return Reader(input).run();
}

std::string quote(std::string_view raw) {
    std::string out;
    out.reserve(raw.size() + 2);
    out += '"';
    for (char c : raw) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

} // namespace json
} // namespace rainbow
