#pragma once

/**
 * @file rainbow_http_synth.hpp
 * @brief HTTP/1.1 scaffolding around carrier bodies, packet tags, cover packets
 *
 * Client packets are requests, server packets are responses.  Client JSON
 * bodies travel as a GET whose X-Data header holds the base64 body; every
 * other client body is POSTed.  The packet tag rides in a cookie (Cookie / Set-Cookie) whose value is
 *   base64url("v1.<technique>.<index>.<total>.<length>.<digest>")
 * with digest = first 4 bytes of BLAKE2b over the chunk, in hex.
 */

#include "rainbow_registry.hpp"
#include "rainbow_csprng.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rainbow {

struct PacketTag {
    std::string technique;   // wire name, may be unknown to this build
    size_t index = 0;
    size_t total = 1;
    size_t length = 0;
    std::string digest;
};

/**
 * @brief Parsed packet framing.
 */
struct HttpMessage {
    bool is_request = false;
    std::string method;      // requests
    std::string target;
    int status = 0;          // responses
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    ByteVector body;

    /// First header named @p name (case-insensitive); nullptr if absent.
    const std::string* header(const std::string& name) const;
    std::vector<std::string> headers_named(const std::string& name) const;
};

struct SynthOptions {
    std::string host;          // empty: drawn from a pool per packet
    std::string user_agent;    // empty: drawn from a pool per packet
    int64_t fixed_date = 0;    // unix seconds for the Date header; 0 = now
};

class MessageSynthesizer {
public:
    static constexpr const char* TAG_VERSION = "v1";
    static constexpr const char* PADDING_HEADER = "X-Correlation-Id";
    static constexpr size_t COVER_JSON_LIMIT = 1000;
    static constexpr const char* QUERY_HEADER = "X-Data";
    static constexpr const char* QUERY_MIME = "application/json";

    /// True when @p mime goes out as a bodiless GET with an X-Data header.
    static bool sends_as_query(const std::string& mime, Role role);

    explicit MessageSynthesizer(std::shared_ptr<const CodecRegistry> registry,
                                SynthOptions options = {});

    /**
     * @brief Wrap a carrier body in a request (client) or response (server).
     * @param padding value of an extra padding header; omitted when empty
     */
    ByteVector wrap(const ByteVector& body, const std::string& mime, Role role,
                    const std::optional<PacketTag>& tag, RandomSource& rng,
                    const std::string& padding = std::string()) const;

    /**
     * @brief Tagged single-packet message of exactly @p target_length bytes
     *        carrying random data.
     * @throws RainbowError(INVALID_ARGUMENT) when the length is unreachable
     */
    ByteVector generate_cover(size_t target_length, Role role, RandomSource& rng) const;

    const SynthOptions& options() const { return options_; }

    /// Split framing. Throws RainbowError(CORRUPT_PACKET).
    static HttpMessage parse(const ByteVector& packet);

    /**
     * @brief Carrier body of a parsed packet and the MIME type it is declared as.
     *
     * For a GET this is the base64-decoded X-Data header under QUERY_MIME,
     * otherwise the message body under its Content-Type.
     * @throws RainbowError(CORRUPT_PACKET) when either part is missing or malformed
     */
    static std::pair<ByteVector, std::string> carrier_body(const HttpMessage& msg);

    static std::string encode_tag(const PacketTag& tag);

    /**
     * @brief Interpret one cookie value.
     * @return nullopt when the value is not a tag at all
     * @throws RainbowError(CORRUPT_PACKET) for a tag with broken fields
     */
    static std::optional<PacketTag> decode_tag(std::string_view cookie_value);

    /// The tag carried by @p msg, if any. More than one tag is CORRUPT_PACKET.
    static std::optional<PacketTag> find_tag(const HttpMessage& msg);

private:
    std::optional<ByteVector> cover_with(const CarrierCodec& codec, size_t target_length, Role role,
                                         RandomSource& rng, size_t& smallest_seen) const;

    std::shared_ptr<const CodecRegistry> registry_;
    SynthOptions options_;
};

} // namespace rainbow
