#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rainbow {

using ByteVector = std::vector<uint8_t>;

/**
 * @brief Encoding context: a client emits requests, a server emits responses.
 */
enum class Role {
    CLIENT,
    SERVER
};

const char* role_to_string(Role role) noexcept;

/**
 * @brief Closed catalogue of carrier techniques.
 *
 * Enumerator order is the fixed priority order used for sniffing.
 */
enum class Technique : uint8_t {
    HTML_COMMENT = 0,
    HTML_NESTED_DIV,
    CSS_GRID,
    CSS_ANIMATION,
    CSS_PAINT_WORKLET,
    FONT_PROPERTY,
    JSON_METADATA,
    XML_CONFIG,
    XML_RSS,
    SVG_PATH,
    WAV_AUDIO,
    AUDIO_HTML
};

constexpr size_t TECHNIQUE_COUNT = 12;

const std::array<Technique, TECHNIQUE_COUNT>& all_techniques() noexcept;

/// Wire identifier, e.g. "html_comment".
const char* technique_to_string(Technique t) noexcept;

/// Reverse of technique_to_string(); nullopt for unknown names.
std::optional<Technique> technique_from_string(const std::string& name) noexcept;

/**
 * @brief Bit set of roles a technique can serve.
 */
enum class RoleMask : uint8_t {
    CLIENT_ONLY = 0x01,
    SERVER_ONLY = 0x02,
    BOTH        = 0x03
};

inline bool role_allowed(RoleMask mask, Role role) noexcept {
    uint8_t bit = (role == Role::CLIENT) ? 0x01 : 0x02;
    return (static_cast<uint8_t>(mask) & bit) != 0;
}

/**
 * @brief One synthetic HTTP message carrying one encoded chunk.
 */
struct Packet {
    ByteVector bytes;
    size_t index = 0;
    Technique technique = Technique::JSON_METADATA;
    Role role = Role::CLIENT;
};

struct EncodeResult {
    std::vector<Packet> packets;
    size_t total_len = 0;                       // original payload length
    size_t chunk_count = 0;                     // == packets.size()
    std::vector<size_t> expected_return_lengths; // reply size hint per packet
};

struct DecodeResult {
    ByteVector data;
    size_t index = 0;
    size_t total = 0;            // 0 when the packet carried no tag
    bool is_read_end = true;
    std::optional<Technique> technique;
    size_t expected_return_length = 0;  // reply size hint; set by Rainbow
};

} // namespace rainbow
