#pragma once

/**
 * @file rainbow_text_codec.hpp
 * @brief Text-safe byte encodings and integrity digest (libsodium)
 *
 * All decoders are strict: any character outside the alphabet, missing
 * or superfluous padding, or trailing garbage yields nullopt.
 */

#include "rainbow_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rainbow {
namespace text {

// Base64, standard alphabet, '=' padded
std::string base64_encode(const uint8_t* data, size_t len);
inline std::string base64_encode(const ByteVector& data) {
    return base64_encode(data.data(), data.size());
}
std::optional<ByteVector> base64_decode(std::string_view encoded);

// Base64 URL-safe alphabet, no padding (cookie values)
std::string base64url_encode(const uint8_t* data, size_t len);
std::optional<ByteVector> base64url_decode(std::string_view encoded);

// Lowercase hex
std::string hex_encode(const uint8_t* data, size_t len);
std::optional<ByteVector> hex_decode(std::string_view encoded);

/// Two lowercase hex digits for one byte.
std::string hex_byte(uint8_t b);

/// Inverse of hex_byte(); rejects uppercase so each byte has one spelling.
std::optional<uint8_t> parse_hex_byte(std::string_view s);

/**
 * @brief Canonical unsigned decimal: digits only, no sign, no leading zero
 *        (except "0" itself), value <= max_value.
 */
std::optional<uint64_t> parse_decimal(std::string_view s, uint64_t max_value);

/// First 4 bytes of BLAKE2b over the data, as 8 lowercase hex chars.
std::string digest32(const uint8_t* data, size_t len);
inline std::string digest32(const ByteVector& data) {
    return digest32(data.data(), data.size());
}

} // namespace text
} // namespace rainbow
