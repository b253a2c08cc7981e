#pragma once

/**
 * @file rainbow_registry.hpp
 * @brief Fixed catalogue of carrier codecs, indexed by technique and MIME type
 *
 * Built once, read-only afterwards; share it as shared_ptr<const>.
 */

#include "rainbow_codec.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace rainbow {

class CodecRegistry {
public:
    CodecRegistry();

    CodecRegistry(const CodecRegistry&) = delete;
    CodecRegistry& operator=(const CodecRegistry&) = delete;

    static std::shared_ptr<const CodecRegistry> create_default();

    const CarrierCodec& by_technique(Technique technique) const;

    /// Wire-name lookup. Throws RainbowError(UNKNOWN_TECHNIQUE).
    const CarrierCodec& find(const std::string& name) const;

    /// Codecs able to carry @p role packets, in catalogue (sniffing) order.
    std::vector<const CarrierCodec*> compatible_codecs(Role role) const;

    /// First compatible codec serving @p mime. Throws RainbowError(UNSUPPORTED_MIME_TYPE).
    const CarrierCodec& by_mime(const std::string& mime, Role role) const;

    /// Every compatible codec serving @p mime, catalogue order; may be empty.
    std::vector<const CarrierCodec*> all_by_mime(const std::string& mime, Role role) const;

    /// Distinct canonical MIME types available for @p role.
    std::vector<std::string> mime_types(Role role) const;

    size_t max_capacity(Role role) const;
    size_t size() const { return codecs_.size(); }

private:
    std::array<std::unique_ptr<CarrierCodec>, TECHNIQUE_COUNT> codecs_;
};

} // namespace rainbow
