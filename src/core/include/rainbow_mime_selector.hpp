#pragma once

/**
 * @file rainbow_mime_selector.hpp
 * @brief Per-chunk technique choice, content-blind
 *
 * Explicit MIME type: uniform among the codecs serving it for the role.
 * No MIME type: weighted draw over all role-compatible codecs.  A weight
 * of 0 removes a technique from automatic selection only.
 */

#include "rainbow_registry.hpp"
#include "rainbow_csprng.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace rainbow {

using TechniqueWeights = std::map<Technique, uint32_t>;

class MimeSelector {
public:
    static constexpr uint32_t DEFAULT_WEIGHT = 1;

    explicit MimeSelector(std::shared_ptr<const CodecRegistry> registry,
                          TechniqueWeights weights = {});

    /**
     * @throws RainbowError(UNSUPPORTED_MIME_TYPE) for an unknown or
     *         role-incompatible @p mime
     * @throws RainbowError(INVALID_ARGUMENT) when every compatible codec
     *         has weight 0
     */
    const CarrierCodec& select(const std::optional<std::string>& mime, Role role,
                               RandomSource& rng) const;

    uint32_t weight(Technique technique) const;

private:
    std::shared_ptr<const CodecRegistry> registry_;
    TechniqueWeights weights_;
};

} // namespace rainbow
