#include "../include/rainbow_mime_selector.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_logger.hpp"

namespace rainbow {

MimeSelector::MimeSelector(std::shared_ptr<const CodecRegistry> registry, TechniqueWeights weights)
    : registry_(std::move(registry))
    , weights_(std::move(weights))
{
    if (!registry_) {
        throw std::invalid_argument("MimeSelector requires a codec registry");
    }
}

uint32_t MimeSelector::weight(Technique technique) const {
    auto it = weights_.find(technique);
    return it != weights_.end() ? it->second : DEFAULT_WEIGHT;
}

const CarrierCodec& MimeSelector::select(const std::optional<std::string>& mime, Role role,
                                         RandomSource& rng) const {
    if (mime) {
        auto matches = registry_->all_by_mime(*mime, role);
        if (matches.empty()) {
            throw RainbowError(ErrorCode::UNSUPPORTED_MIME_TYPE,
                               "no " + std::string(role_to_string(role)) + " codec for '" + *mime + "'");
        }
        return *matches[rng.pick(matches.size())];
    }

    auto candidates = registry_->compatible_codecs(role);
    uint64_t total = 0;
    for (const auto* codec : candidates) total += weight(codec->technique());
    if (total == 0 || total > UINT32_MAX) {
        throw RainbowError(ErrorCode::INVALID_ARGUMENT,
                           "technique weights leave nothing to select for " +
                           std::string(role_to_string(role)) + " packets");
    }

    uint32_t ticket = rng.uniform(static_cast<uint32_t>(total));
    for (const auto* codec : candidates) {
        uint32_t w = weight(codec->technique());
        if (ticket < w) {
            RAINBOW_CLOG_TRACE("selector", std::string("picked ") + codec->name());
            return *codec;
        }
        ticket -= w;
    }
    // ticket < total guarantees a hit above
    return *candidates.back();
}

} // namespace rainbow
