/**
 * @file carrier_wav.cpp
 * @brief audio/wav carrier: payload bits in the LSB of PCM16 samples
 *
 * Layout: canonical 44-byte RIFF/WAVE header (PCM, mono, 8 kHz, 16 bit),
 * then samples.  Sample k carries bit k of the stream
 *   [32-bit big-endian payload length][payload bytes]
 * most significant bit first.  Remaining samples are plain tone + noise.
 */

#include "../include/rainbow_carriers.hpp"
#include "../include/rainbow_error.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace rainbow {

namespace {

constexpr double TWO_PI = 6.283185307179586;

void put_u16(ByteVector& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(ByteVector& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void put_tag(ByteVector& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t get_u16(const ByteVector& in, size_t off) {
    return static_cast<uint16_t>(in[off] | (in[off + 1] << 8));
}

uint32_t get_u32(const ByteVector& in, size_t off) {
    return static_cast<uint32_t>(in[off]) | (static_cast<uint32_t>(in[off + 1]) << 8) |
           (static_cast<uint32_t>(in[off + 2]) << 16) | (static_cast<uint32_t>(in[off + 3]) << 24);
}

bool has_tag(const ByteVector& in, size_t off, const char* tag) {
    return std::memcmp(in.data() + off, tag, 4) == 0;
}

} // namespace

ByteVector WavAudioCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    // Bit stream: length prefix then payload
    std::vector<uint8_t> bits;
    bits.reserve(LENGTH_BITS + chunk.size() * 8);
    uint32_t len = static_cast<uint32_t>(chunk.size());
    for (int i = 31; i >= 0; --i) bits.push_back(static_cast<uint8_t>((len >> i) & 1));
    for (uint8_t b : chunk) {
        for (int i = 7; i >= 0; --i) bits.push_back(static_cast<uint8_t>((b >> i) & 1));
    }

    size_t samples = std::max(MIN_SAMPLES, bits.size()) + static_cast<size_t>(rng.range(0, 199));
    double freq = rng.range(220, 880);
    double amplitude = rng.range(2000, 8000);
    ByteVector noise(samples);
    rng.fill(noise.data(), noise.size());

    uint32_t data_bytes = static_cast<uint32_t>(samples * 2);
    ByteVector out;
    out.reserve(HEADER_BYTES + data_bytes);
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_bytes);
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);                    // PCM
    put_u16(out, 1);                    // mono
    put_u32(out, SAMPLE_RATE);
    put_u32(out, SAMPLE_RATE * 2);      // byte rate
    put_u16(out, 2);                    // block align
    put_u16(out, 16);                   // bits per sample
    put_tag(out, "data");
    put_u32(out, data_bytes);

    for (size_t k = 0; k < samples; ++k) {
        double tone = amplitude * std::sin(TWO_PI * freq * static_cast<double>(k) / SAMPLE_RATE);
        long v = std::lround(tone) + (static_cast<int8_t>(noise[k]) / 2);
        v = std::clamp(v, -32768L, 32767L);
        uint16_t s = static_cast<uint16_t>(static_cast<int16_t>(v));
        if (k < bits.size()) s = static_cast<uint16_t>((s & 0xFFFE) | bits[k]);
        put_u16(out, s);
    }
    return out;
}

ByteVector WavAudioCodec::decode_body(const ByteVector& body, Role role) const {
    if (body.size() < HEADER_BYTES) throw FormatError("wav: truncated header");
    if (!has_tag(body, 0, "RIFF") || !has_tag(body, 8, "WAVE") ||
        !has_tag(body, 12, "fmt ") || !has_tag(body, 36, "data")) {
        throw FormatError("wav: not a canonical RIFF/WAVE file");
    }
    if (get_u32(body, 4) != body.size() - 8) throw FormatError("wav: RIFF size mismatch");
    if (get_u32(body, 16) != 16 || get_u16(body, 20) != 1 || get_u16(body, 22) != 1 ||
        get_u32(body, 24) != SAMPLE_RATE || get_u32(body, 28) != SAMPLE_RATE * 2 ||
        get_u16(body, 32) != 2 || get_u16(body, 34) != 16) {
        throw FormatError("wav: unsupported format chunk");
    }
    uint32_t data_bytes = get_u32(body, 40);
    if (data_bytes != body.size() - HEADER_BYTES || data_bytes % 2 != 0) {
        throw FormatError("wav: data chunk size mismatch");
    }

    size_t samples = data_bytes / 2;
    if (samples < LENGTH_BITS) throw FormatError("wav: too few samples");
    auto bit_at = [&](size_t k) -> uint32_t {
        return body[HEADER_BYTES + 2 * k] & 1;
    };

    uint32_t len = 0;
    for (size_t k = 0; k < LENGTH_BITS; ++k) len = (len << 1) | bit_at(k);
    if (len > capacity(role)) throw FormatError("wav: embedded length exceeds capacity");
    if (LENGTH_BITS + static_cast<size_t>(len) * 8 > samples) {
        throw FormatError("wav: embedded length exceeds sample count");
    }

    ByteVector out(len);
    for (size_t i = 0; i < len; ++i) {
        uint8_t b = 0;
        for (size_t j = 0; j < 8; ++j) {
            b = static_cast<uint8_t>((b << 1) | bit_at(LENGTH_BITS + i * 8 + j));
        }
        out[i] = b;
    }
    return out;
}

} // namespace rainbow
