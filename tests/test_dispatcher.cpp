/**
 * @file test_dispatcher.cpp
 * @brief Single-packet decoding: tagged lookups, untagged sniffing, rejections
 */

#include <gtest/gtest.h>
#include "rainbow_dispatcher.hpp"
#include "rainbow_error.hpp"
#include "rainbow_text_codec.hpp"

#include <functional>
#include <string>

using namespace rainbow;

namespace {

ByteVector bytes(const std::string& s) {
    return ByteVector(s.begin(), s.end());
}

} // namespace

class DecodeDispatcherTest : public ::testing::Test {
protected:
    ByteVector tagged_packet(Technique t, const ByteVector& data, Role role,
                             size_t index = 0, size_t total = 1) {
        const CarrierCodec& codec = registry_->by_technique(t);
        PacketTag tag;
        tag.technique = codec.name();
        tag.index = index;
        tag.total = total;
        tag.length = data.size();
        tag.digest = text::digest32(data);
        return synth_.wrap(codec.encode(data, role, rng_), codec.mime_type(), role, tag, rng_);
    }

    ErrorCode decode_error(const ByteVector& packet, Role role) {
        try {
            dispatcher_.decode(packet, 0, role);
        } catch (const RainbowError& e) {
            return e.code();
        }
        ADD_FAILURE() << "packet decoded";
        return ErrorCode::INVALID_ARGUMENT;
    }

    std::shared_ptr<const CodecRegistry> registry_ = CodecRegistry::create_default();
    MessageSynthesizer synth_{registry_};
    DecodeDispatcher dispatcher_{registry_};
    SeededRandomSource rng_{42u};
};

TEST_F(DecodeDispatcherTest, TaggedPacketsReportPosition) {
    ByteVector data = bytes("second of three");
    ByteVector packet = tagged_packet(Technique::XML_CONFIG, data, Role::CLIENT, 1, 3);

    DecodeResult result = dispatcher_.decode(packet, 1, Role::CLIENT);
    EXPECT_EQ(result.data, data);
    EXPECT_EQ(result.index, 1u);
    EXPECT_EQ(result.total, 3u);
    EXPECT_FALSE(result.is_read_end);
    ASSERT_TRUE(result.technique.has_value());
    EXPECT_EQ(*result.technique, Technique::XML_CONFIG);

    ByteVector last = tagged_packet(Technique::XML_CONFIG, data, Role::CLIENT, 2, 3);
    EXPECT_TRUE(dispatcher_.decode(last, 2, Role::CLIENT).is_read_end);
}

TEST_F(DecodeDispatcherTest, TagIndexWinsOverCallerIndex) {
    ByteVector packet = tagged_packet(Technique::CSS_ANIMATION, bytes("abc"), Role::SERVER, 4, 6);
    DecodeResult result = dispatcher_.decode(packet, 0, Role::SERVER);
    EXPECT_EQ(result.index, 4u);
    EXPECT_EQ(result.total, 6u);
}

TEST_F(DecodeDispatcherTest, EveryTechniqueDecodesTagged) {
    ByteVector data = bytes("payload \x01\x02\xff");
    for (Technique t : all_techniques()) {
        for (Role role : {Role::CLIENT, Role::SERVER}) {
            if (!registry_->by_technique(t).supports(role)) continue;
            DecodeResult result = dispatcher_.decode(tagged_packet(t, data, role), 0, role);
            EXPECT_EQ(result.data, data) << technique_to_string(t);
            EXPECT_EQ(result.technique, t);
        }
    }
}

TEST_F(DecodeDispatcherTest, UntaggedPacketsAreSniffed) {
    for (Technique t : {Technique::HTML_NESTED_DIV, Technique::FONT_PROPERTY, Technique::SVG_PATH}) {
        const CarrierCodec& codec = registry_->by_technique(t);
        ByteVector data = bytes("sniff me");
        ByteVector packet = synth_.wrap(codec.encode(data, Role::SERVER, rng_), codec.mime_type(),
                                        Role::SERVER, std::nullopt, rng_);

        DecodeResult result = dispatcher_.decode(packet, 7, Role::SERVER);
        EXPECT_EQ(result.data, data);
        EXPECT_EQ(result.index, 7u);
        EXPECT_EQ(result.total, 0u);
        EXPECT_TRUE(result.is_read_end);
        EXPECT_EQ(result.technique, t);
    }
}

TEST_F(DecodeDispatcherTest, UntaggedBodyUnderForeignContentType) {
    // JSON body labelled text/html still resolves by trying every codec
    const CarrierCodec& json = registry_->by_technique(Technique::JSON_METADATA);
    ByteVector data = bytes("mislabelled");
    ByteVector packet = synth_.wrap(json.encode(data, Role::CLIENT, rng_), "text/html",
                                    Role::CLIENT, std::nullopt, rng_);
    DecodeResult result = dispatcher_.decode(packet, 0, Role::CLIENT);
    EXPECT_EQ(result.data, data);
    EXPECT_EQ(result.technique, Technique::JSON_METADATA);
}

TEST_F(DecodeDispatcherTest, RoleMismatch) {
    ByteVector request = tagged_packet(Technique::CSS_GRID, bytes("x"), Role::CLIENT);
    ByteVector response = tagged_packet(Technique::CSS_GRID, bytes("x"), Role::SERVER);
    EXPECT_EQ(decode_error(request, Role::SERVER), ErrorCode::ROLE_MISMATCH);
    EXPECT_EQ(decode_error(response, Role::CLIENT), ErrorCode::ROLE_MISMATCH);
}

TEST_F(DecodeDispatcherTest, MissingContentType) {
    ByteVector packet = bytes("POST /api HTTP/1.1\r\nHost: a\r\nContent-Length: 2\r\n\r\nhi");
    EXPECT_EQ(decode_error(packet, Role::CLIENT), ErrorCode::CORRUPT_PACKET);
}

TEST_F(DecodeDispatcherTest, ContentTypeMustMatchTag) {
    const CarrierCodec& grid = registry_->by_technique(Technique::CSS_GRID);
    ByteVector data = bytes("abc");
    PacketTag tag;
    tag.technique = grid.name();
    tag.length = data.size();
    tag.digest = text::digest32(data);
    ByteVector packet = synth_.wrap(grid.encode(data, Role::CLIENT, rng_), "application/json",
                                    Role::CLIENT, tag, rng_);
    EXPECT_EQ(decode_error(packet, Role::CLIENT), ErrorCode::CORRUPT_PACKET);
}

TEST_F(DecodeDispatcherTest, TagMustMatchDecodedChunk) {
    const CarrierCodec& codec = registry_->by_technique(Technique::HTML_COMMENT);
    ByteVector data = bytes("checked");
    ByteVector body = codec.encode(data, Role::CLIENT, rng_);

    PacketTag wrong_digest;
    wrong_digest.technique = codec.name();
    wrong_digest.length = data.size();
    wrong_digest.digest = text::digest32(bytes("other"));
    EXPECT_EQ(decode_error(synth_.wrap(body, codec.mime_type(), Role::CLIENT, wrong_digest, rng_),
                           Role::CLIENT),
              ErrorCode::CORRUPT_PACKET);

    PacketTag wrong_length = wrong_digest;
    wrong_length.digest = text::digest32(data);
    wrong_length.length = data.size() + 1;
    EXPECT_EQ(decode_error(synth_.wrap(body, codec.mime_type(), Role::CLIENT, wrong_length, rng_),
                           Role::CLIENT),
              ErrorCode::CORRUPT_PACKET);
}

TEST_F(DecodeDispatcherTest, UnknownTechniqueInTag) {
    PacketTag tag;
    tag.technique = "morse_code";
    tag.length = 0;
    tag.digest = text::digest32(ByteVector());
    ByteVector packet = synth_.wrap(bytes("{}"), "application/json", Role::SERVER, tag, rng_);
    EXPECT_EQ(decode_error(packet, Role::SERVER), ErrorCode::UNKNOWN_TECHNIQUE);
}

TEST_F(DecodeDispatcherTest, ServerOnlyTechniqueTaggedOnRequest) {
    const CarrierCodec& rss = registry_->by_technique(Technique::XML_RSS);
    ByteVector data = bytes("feed");
    PacketTag tag;
    tag.technique = rss.name();
    tag.length = data.size();
    tag.digest = text::digest32(data);
    ByteVector packet = synth_.wrap(rss.encode(data, Role::SERVER, rng_), rss.mime_type(),
                                    Role::CLIENT, tag, rng_);
    EXPECT_EQ(decode_error(packet, Role::CLIENT), ErrorCode::CORRUPT_PACKET);
}

TEST_F(DecodeDispatcherTest, UndecodableUntaggedBody) {
    ByteVector packet = synth_.wrap(bytes("body { color: red; }"), "text/css", Role::SERVER,
                                    std::nullopt, rng_);
    EXPECT_EQ(decode_error(packet, Role::SERVER), ErrorCode::AMBIGUOUS_OR_UNDECODABLE);
}

TEST_F(DecodeDispatcherTest, BrokenFraming) {
    ByteVector packet = tagged_packet(Technique::JSON_METADATA, bytes("cut"), Role::CLIENT);
    packet.pop_back();
    EXPECT_EQ(decode_error(packet, Role::CLIENT), ErrorCode::CORRUPT_PACKET);
    EXPECT_EQ(decode_error(ByteVector(), Role::CLIENT), ErrorCode::CORRUPT_PACKET);
}

TEST_F(DecodeDispatcherTest, ClientJsonTravelsInDataHeader) {
    ByteVector data = bytes("query \x01\x7f\xfe");
    ByteVector packet = tagged_packet(Technique::JSON_METADATA, data, Role::CLIENT, 0, 2);
    ASSERT_EQ(std::string(packet.begin(), packet.begin() + 4), "GET ");

    DecodeResult result = dispatcher_.decode(packet, 0, Role::CLIENT);
    EXPECT_EQ(result.data, data);
    EXPECT_EQ(result.total, 2u);
    EXPECT_EQ(result.technique, Technique::JSON_METADATA);

    // Untagged, the header body is sniffed as JSON
    const CarrierCodec& json = registry_->by_technique(Technique::JSON_METADATA);
    ByteVector untagged = synth_.wrap(json.encode(data, Role::CLIENT, rng_), json.mime_type(),
                                      Role::CLIENT, std::nullopt, rng_);
    result = dispatcher_.decode(untagged, 3, Role::CLIENT);
    EXPECT_EQ(result.data, data);
    EXPECT_EQ(result.index, 3u);
    EXPECT_EQ(result.technique, Technique::JSON_METADATA);
}

TEST_F(DecodeDispatcherTest, BrokenDataHeader) {
    EXPECT_EQ(decode_error(bytes("GET /search HTTP/1.1\r\nHost: a\r\n\r\n"), Role::CLIENT),
              ErrorCode::CORRUPT_PACKET);
    EXPECT_EQ(decode_error(bytes("GET /search HTTP/1.1\r\nX-Data: %%%%\r\n\r\n"), Role::CLIENT),
              ErrorCode::CORRUPT_PACKET);
    // Valid base64 that is not a JSON carrier
    EXPECT_EQ(decode_error(bytes("GET /search HTTP/1.1\r\nX-Data: e30=\r\n\r\n"), Role::CLIENT),
              ErrorCode::AMBIGUOUS_OR_UNDECODABLE);
}
