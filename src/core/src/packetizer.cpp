#include "../include/rainbow_packetizer.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_logger.hpp"
#include "../include/rainbow_text_codec.hpp"
#include "../include/rainbow_thread_pool.hpp"

#include <algorithm>

namespace rainbow {

Packetizer::Packetizer(std::shared_ptr<const CodecRegistry> registry,
                       std::shared_ptr<const MimeSelector> selector,
                       std::shared_ptr<const MessageSynthesizer> synthesizer,
                       PacketizerOptions options)
    : registry_(std::move(registry))
    , selector_(std::move(selector))
    , synthesizer_(std::move(synthesizer))
    , options_(options)
{
    if (!registry_ || !selector_ || !synthesizer_) {
        throw std::invalid_argument("Packetizer requires registry, selector and synthesizer");
    }
}

std::vector<PlannedChunk> Packetizer::plan(const ByteVector& payload, Role role,
                                           const std::optional<std::string>& mime,
                                           RandomSource& rng) const {
    std::vector<PlannedChunk> chunks;
    size_t offset = 0;
    do {
        const CarrierCodec& codec = selector_->select(mime, role, rng);
        size_t cap = codec.capacity(role);
        if (cap == 0) {
            throw std::logic_error(std::string("selector returned ") + codec.name() +
                                   " with no capacity for the role");
        }
        PlannedChunk chunk;
        chunk.offset = offset;
        chunk.length = std::min(cap, payload.size() - offset);
        chunk.codec = &codec;
        chunks.push_back(chunk);
        offset += chunk.length;
    } while (offset < payload.size());
    return chunks;
}

Packet Packetizer::build_packet(const ByteVector& payload, const PlannedChunk& chunk, size_t index,
                                size_t total, Role role, RandomSource& rng) const {
    auto first = payload.begin() + static_cast<std::ptrdiff_t>(chunk.offset);
    ByteVector data(first, first + static_cast<std::ptrdiff_t>(chunk.length));

    PacketTag tag;
    tag.technique = chunk.codec->name();
    tag.index = index;
    tag.total = total;
    tag.length = data.size();
    tag.digest = text::digest32(data);

    ByteVector body = chunk.codec->encode(data, role, rng);

    Packet packet;
    packet.bytes = synthesizer_->wrap(body, chunk.codec->mime_type(), role, tag, rng);
    packet.index = index;
    packet.technique = chunk.codec->technique();
    packet.role = role;
    return packet;
}

std::vector<Packet> Packetizer::packetize(const ByteVector& payload, Role role,
                                          const std::optional<std::string>& mime,
                                          RandomSource& rng) const {
    auto chunks = plan(payload, role, mime, rng);
    const size_t total = chunks.size();

    std::vector<std::unique_ptr<RandomSource>> streams;
    streams.reserve(total);
    for (size_t i = 0; i < total; ++i) streams.push_back(rng.fork());

    std::vector<Packet> packets(total);
    auto build = [&](size_t i) {
        packets[i] = build_packet(payload, chunks[i], i, total, role, *streams[i]);
    };

    if (options_.parallel && total >= std::max<size_t>(2, options_.parallel_threshold)) {
        ThreadPool pool(std::min(options_.threads == 0 ? size_t(std::thread::hardware_concurrency())
                                                       : options_.threads,
                                 total));
        RAINBOW_CLOG_DEBUG("packetizer", "synthesising " + std::to_string(total) + " packets on " +
                                         std::to_string(pool.total_threads()) + " threads");
        pool.run_indexed(total, build);
    } else {
        for (size_t i = 0; i < total; ++i) build(i);
    }
    return packets;
}

} // namespace rainbow
