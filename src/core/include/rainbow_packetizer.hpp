#pragma once

/**
 * @file rainbow_packetizer.hpp
 * @brief Payload -> ordered packet sequence
 *
 * Two phases.  plan() walks the payload choosing a codec per chunk
 * (chunk = min(capacity, remaining)), so the packet count is known before
 * any tag is written.  packetize() then encodes and wraps every chunk,
 * each with its own child random source forked in index order; the output
 * is identical whether chunks are synthesised sequentially or on the pool.
 */

#include "rainbow_http_synth.hpp"
#include "rainbow_mime_selector.hpp"
#include "rainbow_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rainbow {

struct PlannedChunk {
    size_t offset = 0;
    size_t length = 0;
    const CarrierCodec* codec = nullptr;
};

struct PacketizerOptions {
    bool parallel = false;
    size_t parallel_threshold = 8;   // minimum chunk count for the pool
    size_t threads = 0;              // 0 = hardware concurrency
};

class Packetizer {
public:
    Packetizer(std::shared_ptr<const CodecRegistry> registry,
               std::shared_ptr<const MimeSelector> selector,
               std::shared_ptr<const MessageSynthesizer> synthesizer,
               PacketizerOptions options = {});

    std::vector<PlannedChunk> plan(const ByteVector& payload, Role role,
                                   const std::optional<std::string>& mime,
                                   RandomSource& rng) const;

    std::vector<Packet> packetize(const ByteVector& payload, Role role,
                                  const std::optional<std::string>& mime,
                                  RandomSource& rng) const;

    const PacketizerOptions& options() const { return options_; }

private:
    Packet build_packet(const ByteVector& payload, const PlannedChunk& chunk, size_t index,
                        size_t total, Role role, RandomSource& rng) const;

    std::shared_ptr<const CodecRegistry> registry_;
    std::shared_ptr<const MimeSelector> selector_;
    std::shared_ptr<const MessageSynthesizer> synthesizer_;
    PacketizerOptions options_;
};

} // namespace rainbow
