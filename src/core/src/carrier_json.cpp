/**
 * @file carrier_json.cpp
 * @brief application/json carrier: base64 "metadata" field with a "size" check
 */

#include "../include/rainbow_carriers.hpp"
#include "../include/rainbow_error.hpp"
#include "../include/rainbow_json.hpp"
#include "../include/rainbow_text_codec.hpp"
#include "carrier_common.hpp"

#include <array>
#include <sstream>

namespace rainbow {

namespace {

const std::array<const char*, 5> LOCALES = {{ "en-US", "en-GB", "de-DE", "fr-FR", "es-ES" }};
const std::array<const char*, 4> REGIONS = {{ "us-east-1", "us-west-2", "eu-west-1", "ap-southeast-1" }};

std::string uuid_like(RandomSource& rng) {
    std::string hex = carrier::random_hex(rng, 32);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-4" + hex.substr(13, 3) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace

ByteVector JsonMetadataCodec::encode_body(const ByteVector& chunk, Role, RandomSource& rng) const {
    std::ostringstream out;
    out << "{\n"
        << "  \"version\": \"" << rng.range(1, 4) << "." << rng.range(0, 12) << "." << rng.range(0, 30) << "\",\n"
        << "  \"request_id\": \"" << uuid_like(rng) << "\",\n"
        << "  \"timestamp\": \"" << carrier::iso8601(carrier::random_epoch(rng)) << "\",\n"
        << "  \"locale\": \"" << rng.choose(LOCALES) << "\",\n"
        << "  \"metadata\": " << json::quote(text::base64_encode(chunk)) << ",\n"
        << "  \"size\": " << chunk.size();
    if (rng.coin()) {
        out << ",\n  \"flags\": {\"beta\": " << (rng.coin() ? "true" : "false")
            << ", \"region\": \"" << rng.choose(REGIONS) << "\"}";
    }
    out << "\n}\n";
    return carrier::as_bytes(out.str());
}

ByteVector JsonMetadataCodec::decode_body(const ByteVector& body, Role) const {
    json::Value doc = json::parse(carrier::as_text(body));
    if (!doc.is_object()) throw FormatError("json: document is not an object");

    const json::Value* metadata = doc.find("metadata");
    const json::Value* size = doc.find("size");
    if (!metadata || !metadata->is_string()) throw FormatError("json: \"metadata\" string missing");
    if (!size || !size->as_uint()) throw FormatError("json: \"size\" must be a non-negative integer");

    auto data = text::base64_decode(metadata->as_string());
    if (!data) throw FormatError("json: \"metadata\" is not valid base64");
    if (data->size() != *size->as_uint()) throw FormatError("json: \"size\" does not match metadata");
    return *data;
}

} // namespace rainbow
