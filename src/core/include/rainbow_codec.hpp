#pragma once

/**
 * @file rainbow_codec.hpp
 * @brief Carrier codec interface shared by every embedding technique
 *
 * A codec turns a chunk (at most capacity(role) bytes) into a body of its
 * MIME type and back.  Public entry points check the contract; subclasses
 * implement only the format work (encode_body / decode_body).
 */

#include "rainbow_types.hpp"
#include "rainbow_csprng.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rainbow {

class CarrierCodec {
public:
    virtual ~CarrierCodec() = default;

    CarrierCodec(const CarrierCodec&) = delete;
    CarrierCodec& operator=(const CarrierCodec&) = delete;

    Technique technique() const { return technique_; }
    const char* name() const { return technique_to_string(technique_); }

    /// Canonical MIME type emitted in Content-Type.
    virtual const char* mime_type() const = 0;

    /// Extra MIME types accepted on lookup (e.g. text/xml).
    virtual std::vector<std::string> mime_aliases() const { return {}; }

    virtual RoleMask roles() const = 0;
    bool supports(Role role) const { return role_allowed(roles(), role); }

    /// Max embeddable bytes; 0 for an unsupported role.
    virtual size_t capacity(Role role) const = 0;

    /// True when @p mime (any case, parameters ignored) names this codec's type.
    bool serves_mime(std::string_view mime) const;

    /**
     * @brief Embed @p chunk in a fresh carrier body.
     *
     * @p rng only drives decoration; the bytes recovered by decode() depend
     * on @p chunk alone.
     * @throws CapacityExceeded when chunk.size() > capacity(role)
     * @throws RainbowError(INVALID_ARGUMENT) for an unsupported role
     */
    ByteVector encode(const ByteVector& chunk, Role role, RandomSource& rng) const;

    /**
     * @brief Validate @p body against the host grammar and extract the chunk.
     * @throws RainbowError(CORRUPT_PACKET) on any structural violation
     * @throws RainbowError(ROLE_MISMATCH) for an unsupported role
     */
    ByteVector decode(const ByteVector& body, Role role) const;

protected:
    explicit CarrierCodec(Technique technique) : technique_(technique) {}

    virtual ByteVector encode_body(const ByteVector& chunk, Role role,
                                   RandomSource& rng) const = 0;

    /// Throws FormatError on malformed input.
    virtual ByteVector decode_body(const ByteVector& body, Role role) const = 0;

private:
    Technique technique_;
};

/// Lowercased media type without parameters: "Text/HTML; charset=utf-8" -> "text/html".
std::string normalize_mime(std::string_view mime);

/// Carrier types whose bodies are text (Content-Type gets "; charset=utf-8").
bool is_text_mime(std::string_view mime);

std::unique_ptr<CarrierCodec> make_codec(Technique technique);

} // namespace rainbow
