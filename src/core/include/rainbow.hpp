#pragma once

/**
 * @file rainbow.hpp
 * @brief Rainbow engine entry point: payload <-> HTTP carrier packets
 *
 * Usage:
 *   rainbow::Rainbow engine;
 *   auto out = engine.encode_write(payload, true, std::nullopt);
 *   for (size_t i = 0; i < out.packets.size(); ++i) {
 *       auto r = engine.decrypt_single_read(out.packets[i].bytes, i, true);
 *       // r.data, r.index, r.is_read_end
 *   }
 *
 * No confidentiality: encrypt the payload before handing it over.
 */

#include "rainbow_config.hpp"
#include "rainbow_csprng.hpp"
#include "rainbow_dispatcher.hpp"
#include "rainbow_error.hpp"
#include "rainbow_http_synth.hpp"
#include "rainbow_mime_selector.hpp"
#include "rainbow_packetizer.hpp"
#include "rainbow_registry.hpp"
#include "rainbow_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rainbow {

#define RAINBOW_VERSION_STRING "1.0.0"

struct EngineOptions {
    TechniqueWeights weights;            // missing techniques weigh 1
    PacketizerOptions packetizer;
    SynthOptions http;

    // Reply size ranges for expected_return_lengths, by sending role.
    // A span of 2^32 - 1 or more is rejected.
    size_t client_reply_min = 200;
    size_t client_reply_max = 8000;
    size_t server_reply_min = 100;
    size_t server_reply_max = 2000;

    /**
     * @brief Read http.*, selector.weight.*, encode.*, reply.* keys.
     *
     * Unknown technique names and malformed numbers are logged and skipped.
     */
    static EngineOptions from_config(const Config& config);
};

class Rainbow {
public:
    /**
     * @p rng defaults to a SystemRandomSource.
     * @throws RainbowError(INVALID_ARGUMENT) for an inverted or oversized reply range
     */
    explicit Rainbow(EngineOptions options = EngineOptions(),
                     std::shared_ptr<RandomSource> rng = nullptr);

    /**
     * @brief Split @p data into carrier packets.
     * @param is_client requests when true, responses otherwise
     * @param mime_type force one carrier MIME type for every chunk
     * @throws RainbowError(UNSUPPORTED_MIME_TYPE)
     */
    EncodeResult encode_write(const ByteVector& data, bool is_client,
                              const std::optional<std::string>& mime_type = std::nullopt);

    /**
     * @brief Recover the chunk carried by one packet.
     * @param packet_index caller bookkeeping; the tag's index wins when present
     *
     * expected_return_length is drawn from the sender's reply range, the
     * size the sender was told to expect back.
     */
    DecodeResult decrypt_single_read(const ByteVector& packet, size_t packet_index,
                                     bool is_client) const;

    /**
     * @brief Decode a complete packet set in any order and reassemble it.
     * @throws RainbowError(INCOMPLETE_SEQUENCE) on gaps, duplicates or
     *         disagreeing totals
     */
    ByteVector decode_all(const std::vector<ByteVector>& packets, bool is_client) const;

    /// Standalone packet of exactly @p target_length bytes with random content.
    ByteVector generate_cover_packet(size_t target_length, bool is_client);

    const CodecRegistry& registry() const { return *registry_; }
    const EngineOptions& options() const { return options_; }

private:
    size_t reply_length(Role sender) const;

    EngineOptions options_;
    std::shared_ptr<RandomSource> rng_;
    std::shared_ptr<const CodecRegistry> registry_;
    std::shared_ptr<const MimeSelector> selector_;
    std::shared_ptr<const MessageSynthesizer> synthesizer_;
    std::unique_ptr<Packetizer> packetizer_;
    std::unique_ptr<DecodeDispatcher> dispatcher_;
};

} // namespace rainbow
