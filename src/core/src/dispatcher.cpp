#include "../include/rainbow_dispatcher.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_logger.hpp"
#include "../include/rainbow_text_codec.hpp"

#include <algorithm>

namespace rainbow {

DecodeDispatcher::DecodeDispatcher(std::shared_ptr<const CodecRegistry> registry)
    : registry_(std::move(registry))
{
    if (!registry_) {
        throw std::invalid_argument("DecodeDispatcher requires a codec registry");
    }
}

DecodeResult DecodeDispatcher::decode(const ByteVector& packet, size_t index, Role role) const {
    HttpMessage msg = MessageSynthesizer::parse(packet);

    if (role == Role::CLIENT && !msg.is_request) {
        throw RainbowError(ErrorCode::ROLE_MISMATCH, "client packet expected, got a response");
    }
    if (role == Role::SERVER && msg.is_request) {
        throw RainbowError(ErrorCode::ROLE_MISMATCH, "server packet expected, got a request");
    }

    auto [body, media] = MessageSynthesizer::carrier_body(msg);

    auto tag = MessageSynthesizer::find_tag(msg);
    if (tag) {
        if (tag->index != index) {
            RAINBOW_CLOG_DEBUG("dispatch", "tag index " + std::to_string(tag->index) +
                                           " differs from caller index " + std::to_string(index));
        }
        return decode_tagged(body, *tag, media, role);
    }
    return sniff(body, media, index, role);
}

DecodeResult DecodeDispatcher::decode_tagged(const ByteVector& body, const PacketTag& tag,
                                             const std::string& content_type, Role role) const {
    const CarrierCodec& codec = registry_->find(tag.technique);
    if (!codec.supports(role)) {
        throw RainbowError(ErrorCode::CORRUPT_PACKET, codec.technique(),
                           std::string("technique cannot carry ") + role_to_string(role) + " packets");
    }
    if (!codec.serves_mime(content_type)) {
        throw RainbowError(ErrorCode::CORRUPT_PACKET, codec.technique(),
                           "Content-Type '" + content_type + "' does not match the tagged technique");
    }

    ByteVector data = codec.decode(body, role);
    if (data.size() != tag.length) {
        throw RainbowError(ErrorCode::CORRUPT_PACKET, codec.technique(),
                           "decoded " + std::to_string(data.size()) + " bytes, tag declares " +
                           std::to_string(tag.length));
    }
    if (text::digest32(data) != tag.digest) {
        throw RainbowError(ErrorCode::CORRUPT_PACKET, codec.technique(), "chunk digest mismatch");
    }

    DecodeResult result;
    result.data = std::move(data);
    result.index = tag.index;
    result.total = tag.total;
    result.is_read_end = tag.index + 1 >= tag.total;
    result.technique = codec.technique();
    return result;
}

DecodeResult DecodeDispatcher::sniff(const ByteVector& body, const std::string& content_type,
                                     size_t index, Role role) const {
    auto candidates = registry_->all_by_mime(content_type, role);
    for (const CarrierCodec* codec : registry_->compatible_codecs(role)) {
        if (std::find(candidates.begin(), candidates.end(), codec) == candidates.end()) {
            candidates.push_back(codec);
        }
    }

    for (const CarrierCodec* codec : candidates) {
        try {
            ByteVector data = codec->decode(body, role);
            RAINBOW_CLOG_DEBUG("dispatch", std::string("untagged packet sniffed as ") + codec->name());
            DecodeResult result;
            result.data = std::move(data);
            result.index = index;
            result.total = 0;
            result.is_read_end = true;
            result.technique = codec->technique();
            return result;
        } catch (const RainbowError& e) {
            if (e.code() != ErrorCode::CORRUPT_PACKET) throw;
            RAINBOW_CLOG_TRACE("dispatch", e.what());
        }
    }

    throw RainbowError(ErrorCode::AMBIGUOUS_OR_UNDECODABLE,
                       "no " + std::string(role_to_string(role)) + " codec accepts this '" +
                       content_type + "' body");
}

} // namespace rainbow
