/**
 * @file types.cpp
 * @brief Technique/role naming and error message composition
 */

#include "../include/rainbow_types.hpp"
#include "../include/rainbow_error.hpp"

#include <sstream>

namespace rainbow {

const char* role_to_string(Role role) noexcept {
    return role == Role::CLIENT ? "client" : "server";
}

const std::array<Technique, TECHNIQUE_COUNT>& all_techniques() noexcept {
    static const std::array<Technique, TECHNIQUE_COUNT> kAll = {{
        Technique::HTML_COMMENT,
        Technique::HTML_NESTED_DIV,
        Technique::CSS_GRID,
        Technique::CSS_ANIMATION,
        Technique::CSS_PAINT_WORKLET,
        Technique::FONT_PROPERTY,
        Technique::JSON_METADATA,
        Technique::XML_CONFIG,
        Technique::XML_RSS,
        Technique::SVG_PATH,
        Technique::WAV_AUDIO,
        Technique::AUDIO_HTML
    }};
    return kAll;
}

const char* technique_to_string(Technique t) noexcept {
    switch (t) {
        case Technique::HTML_COMMENT:      return "html_comment";
        case Technique::HTML_NESTED_DIV:   return "html_nested_div";
        case Technique::CSS_GRID:          return "css_grid";
        case Technique::CSS_ANIMATION:     return "css_animation";
        case Technique::CSS_PAINT_WORKLET: return "css_paint_worklet";
        case Technique::FONT_PROPERTY:     return "font_property";
        case Technique::JSON_METADATA:     return "json_metadata";
        case Technique::XML_CONFIG:        return "xml_config";
        case Technique::XML_RSS:           return "xml_rss";
        case Technique::SVG_PATH:          return "svg_path";
        case Technique::WAV_AUDIO:         return "wav_audio";
        case Technique::AUDIO_HTML:        return "audio_html";
    }
    return "unknown";
}

std::optional<Technique> technique_from_string(const std::string& name) noexcept {
    for (Technique t : all_techniques()) {
        if (name == technique_to_string(t)) return t;
    }
    return std::nullopt;
}

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UNSUPPORTED_MIME_TYPE:    return "UnsupportedMimeType";
        case ErrorCode::UNKNOWN_TECHNIQUE:        return "UnknownTechnique";
        case ErrorCode::AMBIGUOUS_OR_UNDECODABLE: return "AmbiguousOrUndecodable";
        case ErrorCode::CORRUPT_PACKET:           return "CorruptPacket";
        case ErrorCode::ROLE_MISMATCH:            return "RoleMismatch";
        case ErrorCode::INCOMPLETE_SEQUENCE:      return "IncompleteSequence";
        case ErrorCode::INVALID_ARGUMENT:         return "InvalidArgument";
    }
    return "Unknown";
}

std::string RainbowError::compose(ErrorCode code, std::optional<Technique> technique,
                                  const std::string& message) {
    std::ostringstream oss;
    oss << error_code_to_string(code);
    if (technique) oss << " [" << technique_to_string(*technique) << "]";
    oss << ": " << message;
    return oss.str();
}

static std::string capacity_message(Technique technique, size_t requested, size_t capacity) {
    std::ostringstream oss;
    oss << "CapacityExceeded [" << technique_to_string(technique) << "]: "
        << requested << " bytes requested, capacity is " << capacity;
    return oss.str();
}

CapacityExceeded::CapacityExceeded(Technique technique, size_t requested, size_t capacity)
    : std::logic_error(capacity_message(technique, requested, capacity))
    , technique_(technique)
    , requested_(requested)
    , capacity_(capacity) {}

} // namespace rainbow
