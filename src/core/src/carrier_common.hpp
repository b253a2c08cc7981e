#pragma once

// Decoration helpers shared by the carrier codecs and the HTTP synthesizer.

#include "../include/rainbow_csprng.hpp"
#include "../include/rainbow_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace rainbow {
namespace carrier {

inline std::string as_text(const ByteVector& body) {
    return std::string(body.begin(), body.end());
}

inline ByteVector as_bytes(const std::string& text) {
    return ByteVector(text.begin(), text.end());
}

/// Lowercase filler word.
const char* word(RandomSource& rng);

/// "Lorem ipsum"-style sentence with a capital and a full stop.
std::string sentence(RandomSource& rng, int min_words, int max_words);

/// Capitalised words, no punctuation.
std::string title(RandomSource& rng, int min_words, int max_words);

/// Words joined with '-'.
std::string slug(RandomSource& rng, int words);

/// @p chars lowercase hex characters.
std::string random_hex(RandomSource& rng, size_t chars);

/// Plausible publication time between 2023 and 2025 (unix seconds).
int64_t random_epoch(RandomSource& rng);

/// "Sun, 06 Nov 1994 08:49:37 GMT"
std::string http_date(int64_t epoch);

/// "1994-11-06T08:49:37Z"
std::string iso8601(int64_t epoch);

/// Throws FormatError unless @p s is a canonical decimal <= @p max.
uint64_t require_decimal(std::string_view s, uint64_t max, const char* what);

/// Decimal with a fixed unit suffix ("12px", "350ms").
uint64_t require_unit(std::string_view s, std::string_view unit, uint64_t max, const char* what);

} // namespace carrier
} // namespace rainbow
