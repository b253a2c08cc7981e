#include "../include/rainbow_registry.hpp"
#include "../include/rainbow_error.hpp"

#include <algorithm>

namespace rainbow {

CodecRegistry::CodecRegistry() {
    for (Technique t : all_techniques()) {
        codecs_[static_cast<size_t>(t)] = make_codec(t);
    }
}

std::shared_ptr<const CodecRegistry> CodecRegistry::create_default() {
    return std::make_shared<const CodecRegistry>();
}

const CarrierCodec& CodecRegistry::by_technique(Technique technique) const {
    size_t idx = static_cast<size_t>(technique);
    if (idx >= codecs_.size()) {
        throw RainbowError(ErrorCode::UNKNOWN_TECHNIQUE, "technique id " + std::to_string(idx));
    }
    return *codecs_[idx];
}

const CarrierCodec& CodecRegistry::find(const std::string& name) const {
    auto technique = technique_from_string(name);
    if (!technique) {
        throw RainbowError(ErrorCode::UNKNOWN_TECHNIQUE, "no codec named '" + name + "'");
    }
    return by_technique(*technique);
}

std::vector<const CarrierCodec*> CodecRegistry::compatible_codecs(Role role) const {
    std::vector<const CarrierCodec*> out;
    for (const auto& codec : codecs_) {
        if (codec->supports(role)) out.push_back(codec.get());
    }
    return out;
}

std::vector<const CarrierCodec*> CodecRegistry::all_by_mime(const std::string& mime, Role role) const {
    std::vector<const CarrierCodec*> out;
    for (const auto& codec : codecs_) {
        if (codec->supports(role) && codec->serves_mime(mime)) out.push_back(codec.get());
    }
    return out;
}

const CarrierCodec& CodecRegistry::by_mime(const std::string& mime, Role role) const {
    auto matches = all_by_mime(mime, role);
    if (matches.empty()) {
        throw RainbowError(ErrorCode::UNSUPPORTED_MIME_TYPE,
                           "no " + std::string(role_to_string(role)) + " codec for '" + mime + "'");
    }
    return *matches.front();
}

std::vector<std::string> CodecRegistry::mime_types(Role role) const {
    std::vector<std::string> out;
    for (const auto& codec : codecs_) {
        if (!codec->supports(role)) continue;
        std::string m = codec->mime_type();
        if (std::find(out.begin(), out.end(), m) == out.end()) out.push_back(m);
    }
    return out;
}

size_t CodecRegistry::max_capacity(Role role) const {
    size_t best = 0;
    for (const auto& codec : codecs_) {
        best = std::max(best, codec->capacity(role));
    }
    return best;
}

} // namespace rainbow
