/**
 * @file codec.cpp
 * @brief CarrierCodec contract checks and the codec factory
 */

#include "../include/rainbow_codec.hpp"
#include "../include/rainbow_carriers.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_logger.hpp"

#include <algorithm>
#include <cctype>

namespace rainbow {

std::string normalize_mime(std::string_view mime) {
    size_t semi = mime.find(';');
    std::string_view type = mime.substr(0, semi);
    size_t b = 0, e = type.size();
    while (b < e && std::isspace(static_cast<unsigned char>(type[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(type[e - 1]))) --e;
    std::string out(type.substr(b, e - b));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_text_mime(std::string_view mime) {
    std::string m = normalize_mime(mime);
    return m.compare(0, 5, "text/") == 0 || m == "application/json" ||
           m == "application/xml" || m == "application/rss+xml" || m == "image/svg+xml";
}

bool CarrierCodec::serves_mime(std::string_view mime) const {
    std::string m = normalize_mime(mime);
    if (m == mime_type()) return true;
    for (const auto& alias : mime_aliases()) {
        if (m == alias) return true;
    }
    return false;
}

ByteVector CarrierCodec::encode(const ByteVector& chunk, Role role, RandomSource& rng) const {
    if (!supports(role)) {
        throw RainbowError(ErrorCode::INVALID_ARGUMENT, technique_,
                           std::string("technique cannot carry ") + role_to_string(role) + " packets");
    }
    size_t cap = capacity(role);
    if (chunk.size() > cap) {
        throw CapacityExceeded(technique_, chunk.size(), cap);
    }
    ByteVector body = encode_body(chunk, role, rng);
    RAINBOW_CLOG_TRACE(name(), "encoded " + std::to_string(chunk.size()) + " bytes into " +
                               std::to_string(body.size()) + "-byte body");
    return body;
}

ByteVector CarrierCodec::decode(const ByteVector& body, Role role) const {
    if (!supports(role)) {
        throw RainbowError(ErrorCode::ROLE_MISMATCH, technique_,
                           std::string("technique cannot carry ") + role_to_string(role) + " packets");
    }
    ByteVector chunk;
    try {
        chunk = decode_body(body, role);
    } catch (const FormatError& e) {
        RAINBOW_CLOG_DEBUG(name(), std::string("rejected body: ") + e.what());
        throw RainbowError(ErrorCode::CORRUPT_PACKET, technique_, e.what());
    }
    if (chunk.size() > capacity(role)) {
        throw RainbowError(ErrorCode::CORRUPT_PACKET, technique_,
                           "embedded length " + std::to_string(chunk.size()) + " exceeds capacity");
    }
    return chunk;
}

std::unique_ptr<CarrierCodec> make_codec(Technique technique) {
    switch (technique) {
        case Technique::HTML_COMMENT:      return std::make_unique<HtmlCommentCodec>();
        case Technique::HTML_NESTED_DIV:   return std::make_unique<HtmlNestedDivCodec>();
        case Technique::CSS_GRID:          return std::make_unique<CssGridCodec>();
        case Technique::CSS_ANIMATION:     return std::make_unique<CssAnimationCodec>();
        case Technique::CSS_PAINT_WORKLET: return std::make_unique<CssPaintWorkletCodec>();
        case Technique::FONT_PROPERTY:     return std::make_unique<FontPropertyCodec>();
        case Technique::JSON_METADATA:     return std::make_unique<JsonMetadataCodec>();
        case Technique::XML_CONFIG:        return std::make_unique<XmlConfigCodec>();
        case Technique::XML_RSS:           return std::make_unique<XmlRssCodec>();
        case Technique::SVG_PATH:          return std::make_unique<SvgPathCodec>();
        case Technique::WAV_AUDIO:         return std::make_unique<WavAudioCodec>();
        case Technique::AUDIO_HTML:        return std::make_unique<AudioHtmlCodec>();
    }
    throw RainbowError(ErrorCode::UNKNOWN_TECHNIQUE, "technique id " +
                       std::to_string(static_cast<int>(technique)));
}

} // namespace rainbow
