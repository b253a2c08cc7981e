/**
 * @file rainbow.cpp
 * @brief Engine facade: wiring, encode/decode entry points, reassembly
 */

#include "../include/rainbow.hpp"
#include "../include/rainbow_logger.hpp"
#include "../include/rainbow_text_codec.hpp"

#include <algorithm>
#include <cstdint>

namespace rainbow {

// ==================== EngineOptions ====================

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions opts;

    opts.http.host = config.get("http.host");
    opts.http.user_agent = config.get("http.user_agent");

    for (const auto& kv : config.section("selector.weight.")) {
        auto technique = technique_from_string(kv.first);
        if (!technique) {
            RAINBOW_LOG_WARN("Config: unknown technique in selector.weight." + kv.first);
            continue;
        }
        auto weight = text::parse_decimal(kv.second, 1000000);
        if (!weight) {
            RAINBOW_LOG_WARN("Config: invalid weight '" + kv.second + "' for " + kv.first);
            continue;
        }
        opts.weights[*technique] = static_cast<uint32_t>(*weight);
    }

    auto read_range = [&config](const char* key, size_t& value) {
        int v = config.getInt(key, static_cast<int>(value));
        if (v > 0) {
            value = static_cast<size_t>(v);
        } else {
            RAINBOW_LOG_WARN(std::string("Config: ") + key + " must be positive");
        }
    };
    read_range("reply.client_min", opts.client_reply_min);
    read_range("reply.client_max", opts.client_reply_max);
    read_range("reply.server_min", opts.server_reply_min);
    read_range("reply.server_max", opts.server_reply_max);

    opts.packetizer.parallel = config.getBool("encode.parallel", opts.packetizer.parallel);
    int threshold = config.getInt("encode.parallel_threshold",
                                  static_cast<int>(opts.packetizer.parallel_threshold));
    if (threshold > 0) {
        opts.packetizer.parallel_threshold = static_cast<size_t>(threshold);
    } else {
        RAINBOW_LOG_WARN("Config: encode.parallel_threshold must be positive");
    }
    int threads = config.getInt("encode.threads", 0);
    if (threads >= 0) {
        opts.packetizer.threads = static_cast<size_t>(threads);
    } else {
        RAINBOW_LOG_WARN("Config: encode.threads must not be negative");
    }
    return opts;
}

// ==================== Rainbow ====================

Rainbow::Rainbow(EngineOptions options, std::shared_ptr<RandomSource> rng)
    : options_(std::move(options))
    , rng_(rng ? std::move(rng) : std::make_shared<SystemRandomSource>())
    , registry_(CodecRegistry::create_default())
{
    if (options_.client_reply_min > options_.client_reply_max ||
        options_.server_reply_min > options_.server_reply_max) {
        throw RainbowError(ErrorCode::INVALID_ARGUMENT, "reply length range is inverted");
    }
    // uniform() draws below a 32-bit bound
    if (options_.client_reply_max - options_.client_reply_min >= UINT32_MAX ||
        options_.server_reply_max - options_.server_reply_min >= UINT32_MAX) {
        throw RainbowError(ErrorCode::INVALID_ARGUMENT, "reply length range is wider than 2^32 - 1");
    }
    selector_ = std::make_shared<const MimeSelector>(registry_, options_.weights);
    synthesizer_ = std::make_shared<const MessageSynthesizer>(registry_, options_.http);
    packetizer_ = std::make_unique<Packetizer>(registry_, selector_, synthesizer_, options_.packetizer);
    dispatcher_ = std::make_unique<DecodeDispatcher>(registry_);
}

EncodeResult Rainbow::encode_write(const ByteVector& data, bool is_client,
                                   const std::optional<std::string>& mime_type) {
    const Role role = is_client ? Role::CLIENT : Role::SERVER;

    EncodeResult result;
    result.packets = packetizer_->packetize(data, role, mime_type, *rng_);
    result.total_len = data.size();
    result.chunk_count = result.packets.size();

    result.expected_return_lengths.reserve(result.packets.size());
    for (size_t i = 0; i < result.packets.size(); ++i) {
        result.expected_return_lengths.push_back(reply_length(role));
    }

    RAINBOW_LOG_INFO("Encoded " + std::to_string(data.size()) + " bytes into " +
                     std::to_string(result.packets.size()) + " " + role_to_string(role) + " packet(s)");
    return result;
}

DecodeResult Rainbow::decrypt_single_read(const ByteVector& packet, size_t packet_index,
                                          bool is_client) const {
    const Role role = is_client ? Role::CLIENT : Role::SERVER;
    try {
        DecodeResult result = dispatcher_->decode(packet, packet_index, role);
        // The peer expects an answer sized like the ones it was promised
        result.expected_return_length = reply_length(role);
        return result;
    } catch (const RainbowError& e) {
        RAINBOW_LOG_WARN("Decode of packet " + std::to_string(packet_index) + " failed: " + e.what());
        throw;
    }
}

ByteVector Rainbow::decode_all(const std::vector<ByteVector>& packets, bool is_client) const {
    if (packets.empty()) {
        throw RainbowError(ErrorCode::INCOMPLETE_SEQUENCE, "no packets supplied");
    }

    std::vector<DecodeResult> parts;
    parts.reserve(packets.size());
    for (size_t i = 0; i < packets.size(); ++i) {
        DecodeResult r = decrypt_single_read(packets[i], i, is_client);
        // Untagged packets are taken in the order supplied
        if (r.total == 0) r.total = packets.size();
        parts.push_back(std::move(r));
    }

    const size_t total = parts.front().total;
    if (total != packets.size()) {
        throw RainbowError(ErrorCode::INCOMPLETE_SEQUENCE,
                           "expected " + std::to_string(total) + " packets, got " +
                           std::to_string(packets.size()));
    }
    std::sort(parts.begin(), parts.end(),
              [](const DecodeResult& a, const DecodeResult& b) { return a.index < b.index; });
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].total != total) {
            throw RainbowError(ErrorCode::INCOMPLETE_SEQUENCE, "packets disagree on the packet count");
        }
        if (parts[i].index != i) {
            throw RainbowError(ErrorCode::INCOMPLETE_SEQUENCE,
                               "packet index " + std::to_string(i) + " missing or duplicated");
        }
    }

    ByteVector payload;
    for (const auto& p : parts) {
        payload.insert(payload.end(), p.data.begin(), p.data.end());
    }
    return payload;
}

size_t Rainbow::reply_length(Role sender) const {
    const bool client = sender == Role::CLIENT;
    size_t lo = client ? options_.client_reply_min : options_.server_reply_min;
    size_t hi = client ? options_.client_reply_max : options_.server_reply_max;
    return lo + static_cast<size_t>(rng_->uniform(static_cast<uint32_t>(hi - lo + 1)));
}

ByteVector Rainbow::generate_cover_packet(size_t target_length, bool is_client) {
    return synthesizer_->generate_cover(target_length, is_client ? Role::CLIENT : Role::SERVER, *rng_);
}

} // namespace rainbow
