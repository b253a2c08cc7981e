#pragma once

/**
 * @file rainbow_dispatcher.hpp
 * @brief Resolves which codec produced a packet and decodes it
 *
 * Tagged packets go straight to the named codec and are checked against
 * the tag's length and digest.  Untagged packets are sniffed: codecs
 * serving the Content-Type first, then every other codec compatible with
 * the role, both in catalogue order; the first clean decode wins.
 * A GET request carries its body in the X-Data header as JSON.
 */

#include "rainbow_registry.hpp"
#include "rainbow_http_synth.hpp"

#include <memory>

namespace rainbow {

class DecodeDispatcher {
public:
    explicit DecodeDispatcher(std::shared_ptr<const CodecRegistry> registry);

    /**
     * @param index caller-side index, reported for untagged packets
     * @throws RainbowError ROLE_MISMATCH, UNKNOWN_TECHNIQUE, CORRUPT_PACKET
     *         or AMBIGUOUS_OR_UNDECODABLE
     */
    DecodeResult decode(const ByteVector& packet, size_t index, Role role) const;

private:
    DecodeResult decode_tagged(const ByteVector& body, const PacketTag& tag,
                               const std::string& content_type, Role role) const;
    DecodeResult sniff(const ByteVector& body, const std::string& content_type,
                       size_t index, Role role) const;

    std::shared_ptr<const CodecRegistry> registry_;
};

} // namespace rainbow
