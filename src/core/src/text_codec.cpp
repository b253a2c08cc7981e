/**
 * @file text_codec.cpp
 * @brief Base64 / hex / decimal helpers over libsodium primitives
 */

#include "../include/rainbow_text_codec.hpp"
#include "../include/rainbow_csprng.hpp"

#include <sodium.h>

namespace rainbow {
namespace text {

static std::string b64_encode(const uint8_t* data, size_t len, int variant) {
    CSPRNG::init();
    const size_t enc_len = sodium_base64_ENCODED_LEN(len, variant);
    std::string out(enc_len, '\0');
    sodium_bin2base64(&out[0], enc_len, data, len, variant);
    out.resize(enc_len - 1);  // drop the terminating NUL
    return out;
}

static std::optional<ByteVector> b64_decode(std::string_view encoded, int variant) {
    CSPRNG::init();
    ByteVector out(encoded.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                          nullptr, &bin_len, &end, variant) != 0) {
        return std::nullopt;
    }
    if (end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

std::string base64_encode(const uint8_t* data, size_t len) {
    return b64_encode(data, len, sodium_base64_VARIANT_ORIGINAL);
}

std::optional<ByteVector> base64_decode(std::string_view encoded) {
    return b64_decode(encoded, sodium_base64_VARIANT_ORIGINAL);
}

std::string base64url_encode(const uint8_t* data, size_t len) {
    return b64_encode(data, len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::optional<ByteVector> base64url_decode(std::string_view encoded) {
    return b64_decode(encoded, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string hex_encode(const uint8_t* data, size_t len) {
    CSPRNG::init();
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(&out[0], out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::optional<ByteVector> hex_decode(std::string_view encoded) {
    if (encoded.size() % 2 != 0) return std::nullopt;
    for (char c : encoded) {
        if (c >= 'A' && c <= 'F') return std::nullopt;
    }
    CSPRNG::init();
    ByteVector out(encoded.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), encoded.data(), encoded.size(),
                       nullptr, &bin_len, &end) != 0) {
        return std::nullopt;
    }
    if (end != encoded.data() + encoded.size() || bin_len != out.size()) {
        return std::nullopt;
    }
    return out;
}

std::string hex_byte(uint8_t b) {
    static const char digits[] = "0123456789abcdef";
    std::string s(2, '0');
    s[0] = digits[b >> 4];
    s[1] = digits[b & 0x0F];
    return s;
}

static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<uint8_t> parse_hex_byte(std::string_view s) {
    if (s.size() != 2) return std::nullopt;
    int hi = nibble(s[0]);
    int lo = nibble(s[1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    return static_cast<uint8_t>((hi << 4) | lo);
}

std::optional<uint64_t> parse_decimal(std::string_view s, uint64_t max_value) {
    if (s.empty() || s.size() > 20) return std::nullopt;
    if (s.size() > 1 && s[0] == '0') return std::nullopt;
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (digit > max_value || value > (max_value - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::string digest32(const uint8_t* data, size_t len) {
    CSPRNG::init();
    uint8_t hash[crypto_generichash_BYTES_MIN];
    crypto_generichash(hash, sizeof(hash), data, len, nullptr, 0);
    return hex_encode(hash, 4);
}

} // namespace text
} // namespace rainbow
