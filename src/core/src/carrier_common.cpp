#include "carrier_common.hpp"

#include "../include/rainbow_error.hpp"
#include "../include/rainbow_text_codec.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <cstdio>

namespace rainbow {
namespace carrier {

static const std::array<const char*, 40> WORDS = {{
    "lorem", "ipsum", "dolor", "sit", "amet", "consectetur", "adipiscing", "elit",
    "sed", "do", "eiusmod", "tempor", "incididunt", "labore", "dolore", "magna",
    "aliqua", "enim", "minim", "veniam", "quis", "nostrud", "exercitation", "ullamco",
    "laboris", "nisi", "aliquip", "commodo", "consequat", "duis", "aute", "irure",
    "reprehenderit", "voluptate", "velit", "esse", "cillum", "fugiat", "nulla", "pariatur"
}};

static const std::array<const char*, 7> DAY_NAMES = {{
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
}};

static const std::array<const char*, 12> MONTH_NAMES = {{
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
}};

// 2023-01-01T00:00:00Z and the span up to 2025-12-31
static constexpr int64_t EPOCH_FLOOR = 1672531200;
static constexpr uint32_t EPOCH_SPAN = 94608000;

const char* word(RandomSource& rng) {
    return rng.choose(WORDS);
}

std::string sentence(RandomSource& rng, int min_words, int max_words) {
    int n = rng.range(min_words, max_words);
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i > 0) out += ' ';
        out += word(rng);
    }
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
        out += '.';
    }
    return out;
}

std::string title(RandomSource& rng, int min_words, int max_words) {
    int n = rng.range(min_words, max_words);
    std::string out;
    for (int i = 0; i < n; ++i) {
        std::string w = word(rng);
        w[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(w[0])));
        if (i > 0) out += ' ';
        out += w;
    }
    return out;
}

std::string slug(RandomSource& rng, int words) {
    std::string out;
    for (int i = 0; i < words; ++i) {
        if (i > 0) out += '-';
        out += word(rng);
    }
    return out;
}

std::string random_hex(RandomSource& rng, size_t chars) {
    ByteVector raw((chars + 1) / 2);
    rng.fill(raw.data(), raw.size());
    std::string hex = text::hex_encode(raw.data(), raw.size());
    hex.resize(chars);
    return hex;
}

int64_t random_epoch(RandomSource& rng) {
    return EPOCH_FLOOR + static_cast<int64_t>(rng.uniform(EPOCH_SPAN));
}

static std::tm to_utc(int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

std::string http_date(int64_t epoch) {
    std::tm tm = to_utc(epoch);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  DAY_NAMES[static_cast<size_t>(tm.tm_wday) % 7], tm.tm_mday,
                  MONTH_NAMES[static_cast<size_t>(tm.tm_mon) % 12], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string iso8601(int64_t epoch) {
    std::tm tm = to_utc(epoch);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

uint64_t require_decimal(std::string_view s, uint64_t max, const char* what) {
    auto v = text::parse_decimal(s, max);
    if (!v) {
        throw FormatError(std::string("bad ") + what + " '" + std::string(s) + "'");
    }
    return *v;
}

uint64_t require_unit(std::string_view s, std::string_view unit, uint64_t max, const char* what) {
    if (s.size() <= unit.size() || s.substr(s.size() - unit.size()) != unit) {
        throw FormatError(std::string("bad ") + what + " '" + std::string(s) + "'");
    }
    return require_decimal(s.substr(0, s.size() - unit.size()), max, what);
}

} // namespace carrier
} // namespace rainbow
