/**
 * @file csprng.cpp
 * @brief CSPRNG wrapper and RandomSource implementations (libsodium)
 */

#include "../include/rainbow_csprng.hpp"

#include <sodium.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace rainbow {

// ==================== CSPRNG ====================

void CSPRNG::init() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

ByteVector CSPRNG::random_bytes(size_t n) {
    init();
    ByteVector out(n);
    if (n > 0) randombytes_buf(out.data(), n);
    return out;
}

void CSPRNG::fill_random(uint8_t* buf, size_t n) {
    init();
    if (n > 0) randombytes_buf(buf, n);
}

uint32_t CSPRNG::uniform_uint32(uint32_t upper_bound) {
    init();
    if (upper_bound < 2) return 0;
    return randombytes_uniform(upper_bound);
}

int CSPRNG::uniform_range(int lo, int hi) {
    if (hi <= lo) return lo;
    uint32_t span = static_cast<uint32_t>(static_cast<int64_t>(hi) - lo + 1);
    return lo + static_cast<int>(uniform_uint32(span));
}

double CSPRNG::uniform_double(double lo, double hi) {
    init();
    // /4294967296.0 keeps the result in [0,1)
    double unit = static_cast<double>(randombytes_random()) / 4294967296.0;
    return lo + (hi - lo) * unit;
}

// ==================== RandomSource ====================

uint32_t RandomSource::next_u32() {
    uint8_t b[4];
    fill(b, sizeof(b));
    return static_cast<uint32_t>(b[0]) |
           (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) |
           (static_cast<uint32_t>(b[3]) << 24);
}

uint32_t RandomSource::uniform(uint32_t upper_bound) {
    if (upper_bound < 2) return 0;
    // Rejection sampling: discard the biased tail of the 32-bit range
    const uint32_t limit = static_cast<uint32_t>(-upper_bound) % upper_bound;
    for (;;) {
        uint32_t r = next_u32();
        if (r >= limit) return r % upper_bound;
    }
}

int RandomSource::range(int lo, int hi) {
    if (hi <= lo) return lo;
    uint32_t span = static_cast<uint32_t>(static_cast<int64_t>(hi) - lo + 1);
    return lo + static_cast<int>(uniform(span));
}

std::unique_ptr<RandomSource> RandomSource::fork() {
    std::array<uint8_t, SeededRandomSource::SEED_BYTES> seed{};
    fill(seed.data(), seed.size());
    return std::make_unique<SeededRandomSource>(seed);
}

// ==================== SystemRandomSource ====================

SystemRandomSource::SystemRandomSource() {
    CSPRNG::init();
}

void SystemRandomSource::fill(uint8_t* buf, size_t len) {
    CSPRNG::fill_random(buf, len);
}

uint32_t SystemRandomSource::uniform(uint32_t upper_bound) {
    return CSPRNG::uniform_uint32(upper_bound);
}

// ==================== SeededRandomSource ====================

static_assert(SeededRandomSource::SEED_BYTES == randombytes_SEEDBYTES,
              "seed size must match libsodium");

SeededRandomSource::SeededRandomSource(const std::array<uint8_t, SEED_BYTES>& seed)
    : seed_(seed) {
    CSPRNG::init();
}

SeededRandomSource::SeededRandomSource(uint64_t seed) {
    CSPRNG::init();
    uint8_t raw[8];
    for (int i = 0; i < 8; ++i) raw[i] = static_cast<uint8_t>(seed >> (8 * i));
    crypto_generichash(seed_.data(), seed_.size(), raw, sizeof(raw), nullptr, 0);
}

void SeededRandomSource::refill_locked() {
    uint8_t input[SEED_BYTES + 8];
    std::memcpy(input, seed_.data(), SEED_BYTES);
    for (int i = 0; i < 8; ++i) {
        input[SEED_BYTES + i] = static_cast<uint8_t>(counter_ >> (8 * i));
    }
    ++counter_;

    uint8_t block_seed[randombytes_SEEDBYTES];
    crypto_generichash(block_seed, sizeof(block_seed), input, sizeof(input), nullptr, 0);
    randombytes_buf_deterministic(block_.data(), block_.size(), block_seed);
    sodium_memzero(block_seed, sizeof(block_seed));
    block_pos_ = 0;
}

void SeededRandomSource::fill(uint8_t* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mtx_);
    while (len > 0) {
        if (block_pos_ == BLOCK_BYTES) refill_locked();
        size_t n = std::min(len, BLOCK_BYTES - block_pos_);
        std::memcpy(buf, block_.data() + block_pos_, n);
        block_pos_ += n;
        buf += n;
        len -= n;
    }
}

} // namespace rainbow
