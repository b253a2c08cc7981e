#pragma once

/**
 * @file rainbow_carriers.hpp
 * @brief The carrier codec catalogue
 *
 * Bit-level schemes:
 *   html_comment      base64 in one <!-- fp:... --> comment of an HTML5 page
 *   html_nested_div   one <div class="u-XX"> per byte inside #app, runs of 1..4 nested divs
 *   css_grid          one "Npx" track per byte, 16 tracks per .row-K rule
 *   css_animation     per byte: animation-delay: {hi*50}ms, {lo*50}ms + its @keyframes
 *   css_paint_worklet --x-colors list of #rrggbb (3 bytes each) + --x-stops byte count
 *   font_property     per byte: font-variation-settings: 'wght' 100+hi*50, 'wdth' 50+lo*5
 *   json_metadata     base64 in "metadata", "size" holds the byte count
 *   xml_config        base64 in <data encoding="base64"><![CDATA[...]]></data>
 *   xml_rss           base64 split into 48-char <guid isPermaLink="false"> values
 *   svg_path          per byte a relative segment "l {lo*4} {hi*4}", 32 per <path>
 *   wav_audio         PCM16 mono 8 kHz, 32-bit big-endian length then payload bits,
 *                     MSB first, one bit per sample LSB
 *   audio_html        a wav_audio body as a base64 data URI in an <audio> element
 */

#include "rainbow_codec.hpp"

namespace rainbow {

class HtmlCommentCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 1024;

    HtmlCommentCodec() : CarrierCodec(Technique::HTML_COMMENT) {}

    const char* mime_type() const override { return "text/html"; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class HtmlNestedDivCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 256;
    static constexpr size_t MAX_RUN = 4;

    HtmlNestedDivCodec() : CarrierCodec(Technique::HTML_NESTED_DIV) {}

    const char* mime_type() const override { return "text/html"; }
    RoleMask roles() const override { return RoleMask::SERVER_ONLY; }
    size_t capacity(Role role) const override { return role == Role::SERVER ? CAPACITY : 0; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class CssGridCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 512;
    static constexpr size_t TRACKS_PER_RULE = 16;

    CssGridCodec() : CarrierCodec(Technique::CSS_GRID) {}

    const char* mime_type() const override { return "text/css"; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class CssAnimationCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 128;
    static constexpr int DELAY_STEP_MS = 50;

    CssAnimationCodec() : CarrierCodec(Technique::CSS_ANIMATION) {}

    const char* mime_type() const override { return "text/css"; }
    RoleMask roles() const override { return RoleMask::SERVER_ONLY; }
    size_t capacity(Role role) const override { return role == Role::SERVER ? CAPACITY : 0; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class CssPaintWorkletCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 256;

    CssPaintWorkletCodec() : CarrierCodec(Technique::CSS_PAINT_WORKLET) {}

    const char* mime_type() const override { return "text/css"; }
    RoleMask roles() const override { return RoleMask::SERVER_ONLY; }
    size_t capacity(Role role) const override { return role == Role::SERVER ? CAPACITY : 0; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class FontPropertyCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 192;

    FontPropertyCodec() : CarrierCodec(Technique::FONT_PROPERTY) {}

    const char* mime_type() const override { return "text/css"; }
    RoleMask roles() const override { return RoleMask::SERVER_ONLY; }
    size_t capacity(Role role) const override { return role == Role::SERVER ? CAPACITY : 0; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class JsonMetadataCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 1024;

    JsonMetadataCodec() : CarrierCodec(Technique::JSON_METADATA) {}

    const char* mime_type() const override { return "application/json"; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class XmlConfigCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 1024;

    XmlConfigCodec() : CarrierCodec(Technique::XML_CONFIG) {}

    const char* mime_type() const override { return "application/xml"; }
    std::vector<std::string> mime_aliases() const override { return {"text/xml"}; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class XmlRssCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 768;
    static constexpr size_t GUID_CHARS = 48;

    XmlRssCodec() : CarrierCodec(Technique::XML_RSS) {}

    const char* mime_type() const override { return "application/rss+xml"; }
    RoleMask roles() const override { return RoleMask::SERVER_ONLY; }
    size_t capacity(Role role) const override { return role == Role::SERVER ? CAPACITY : 0; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class SvgPathCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 384;
    static constexpr size_t SEGMENTS_PER_PATH = 32;
    static constexpr int STEP = 4;

    SvgPathCodec() : CarrierCodec(Technique::SVG_PATH) {}

    const char* mime_type() const override { return "image/svg+xml"; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class WavAudioCodec final : public CarrierCodec {
public:
    static constexpr size_t CLIENT_CAPACITY = 512;
    static constexpr size_t SERVER_CAPACITY = 1024;
    static constexpr uint32_t SAMPLE_RATE = 8000;
    static constexpr size_t HEADER_BYTES = 44;
    static constexpr size_t LENGTH_BITS = 32;
    static constexpr size_t MIN_SAMPLES = 800;

    WavAudioCodec() : CarrierCodec(Technique::WAV_AUDIO) {}

    const char* mime_type() const override { return "audio/wav"; }
    std::vector<std::string> mime_aliases() const override { return {"audio/wave", "audio/x-wav"}; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role role) const override {
        return role == Role::CLIENT ? CLIENT_CAPACITY : SERVER_CAPACITY;
    }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;
};

class AudioHtmlCodec final : public CarrierCodec {
public:
    static constexpr size_t CAPACITY = 512;
    static constexpr const char* DATA_URI_PREFIX = "data:audio/wav;base64,";

    AudioHtmlCodec() : CarrierCodec(Technique::AUDIO_HTML) {}

    const char* mime_type() const override { return "text/html"; }
    RoleMask roles() const override { return RoleMask::BOTH; }
    size_t capacity(Role) const override { return CAPACITY; }

protected:
    ByteVector encode_body(const ByteVector& chunk, Role role, RandomSource& rng) const override;
    ByteVector decode_body(const ByteVector& body, Role role) const override;

private:
    WavAudioCodec wav_;
};

} // namespace rainbow
