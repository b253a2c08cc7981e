#pragma once

/**
 * @file rainbow_csprng.hpp
 * @brief libsodium-backed randomness and the injectable RandomSource seam
 *
 * Every random choice in the engine (technique selection, carrier
 * decoration, HTTP header variety) goes through a RandomSource so tests
 * can pin it.  CSPRNG is the process-wide system generator.
 */

#include "rainbow_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace rainbow {

class CSPRNG {
public:
    /// Initialise libsodium; safe to call repeatedly. Throws on failure.
    static void init();

    static ByteVector random_bytes(size_t n);
    static void fill_random(uint8_t* buf, size_t n);

    /// Uniform in [0, upper_bound); 0 when upper_bound < 2.
    static uint32_t uniform_uint32(uint32_t upper_bound);

    /// Uniform in [lo, hi], both inclusive.
    static int uniform_range(int lo, int hi);

    /// Uniform in [lo, hi).
    static double uniform_double(double lo, double hi);

    template <class T>
    static void shuffle(std::vector<T>& v) {
        for (size_t i = v.size(); i > 1; --i) {
            size_t j = uniform_uint32(static_cast<uint32_t>(i));
            std::swap(v[i - 1], v[j]);
        }
    }
};

/**
 * @brief Source of randomness consumed by the encoder side.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual void fill(uint8_t* buf, size_t len) = 0;

    /// Uniform in [0, upper_bound), unbiased; 0 when upper_bound < 2.
    virtual uint32_t uniform(uint32_t upper_bound);

    /// Independent deterministic child seeded from this source.
    virtual std::unique_ptr<RandomSource> fork();

    uint32_t next_u32();
    int range(int lo, int hi);      // inclusive
    bool coin() { return uniform(2) == 1; }
    size_t pick(size_t n) { return static_cast<size_t>(uniform(static_cast<uint32_t>(n))); }

    template <class T, size_t N>
    const T& choose(const std::array<T, N>& items) {
        static_assert(N > 0, "choose() needs a non-empty pool");
        return items[pick(N)];
    }
};

/**
 * @brief RandomSource over CSPRNG. Thread-safe.
 */
class SystemRandomSource : public RandomSource {
public:
    SystemRandomSource();

    void fill(uint8_t* buf, size_t len) override;
    uint32_t uniform(uint32_t upper_bound) override;
};

/**
 * @brief Deterministic stream from a 32-byte seed.
 *
 * Blocks come from randombytes_buf_deterministic() keyed with
 * BLAKE2b(seed || block counter).  Guarded by a mutex so a shared
 * instance stays usable from several threads (the sequence is then
 * interleaving-dependent).
 */
class SeededRandomSource : public RandomSource {
public:
    static constexpr size_t SEED_BYTES = 32;

    explicit SeededRandomSource(const std::array<uint8_t, SEED_BYTES>& seed);
    explicit SeededRandomSource(uint64_t seed);

    void fill(uint8_t* buf, size_t len) override;

private:
    void refill_locked();

    static constexpr size_t BLOCK_BYTES = 256;

    std::array<uint8_t, SEED_BYTES> seed_;
    std::array<uint8_t, BLOCK_BYTES> block_{};
    size_t block_pos_ = BLOCK_BYTES;
    uint64_t counter_ = 0;
    std::mutex mtx_;
};

} // namespace rainbow
