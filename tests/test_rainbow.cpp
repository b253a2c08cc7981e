/**
 * @file test_rainbow.cpp
 * @brief Engine entry points: encode_write, decrypt_single_read, decode_all, cover packets
 */

#include <gtest/gtest.h>
#include "rainbow.hpp"
#include "rainbow_logger.hpp"
#include "rainbow_text_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>

using namespace rainbow;

namespace {

ByteVector bytes(const std::string& s) {
    return ByteVector(s.begin(), s.end());
}

ByteVector pattern(size_t n) {
    ByteVector out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>((i * 131 + 17) & 0xFF);
    return out;
}

std::vector<ByteVector> wire(const EncodeResult& result) {
    std::vector<ByteVector> out;
    for (const auto& p : result.packets) out.push_back(p.bytes);
    return out;
}

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const RainbowError& e) {
        return e.code();
    }
    ADD_FAILURE() << "no RainbowError thrown";
    return ErrorCode::INVALID_ARGUMENT;
}

} // namespace

class RainbowTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::NONE);
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::WARN);
    }

    Rainbow engine_;
};

TEST_F(RainbowTest, ClientRoundTrip) {
    ByteVector data = bytes("Hello, Steganography!");
    EncodeResult out = engine_.encode_write(data, true);
    ASSERT_EQ(out.packets.size(), 1u);
    EXPECT_EQ(out.chunk_count, 1u);
    EXPECT_EQ(out.total_len, data.size());

    DecodeResult r = engine_.decrypt_single_read(out.packets[0].bytes, 0, true);
    EXPECT_EQ(r.data, data);
    EXPECT_EQ(r.index, 0u);
    EXPECT_EQ(r.total, 1u);
    EXPECT_TRUE(r.is_read_end);
    EXPECT_EQ(r.technique, out.packets[0].technique);
}

TEST_F(RainbowTest, ServerRoundTrip) {
    ByteVector data = bytes("Hello, Steganography!");
    for (int i = 0; i < 30; ++i) {
        EncodeResult out = engine_.encode_write(data, false);
        ASSERT_EQ(out.packets.size(), 1u);
        EXPECT_EQ(engine_.decrypt_single_read(out.packets[0].bytes, 0, false).data, data);
    }
}

TEST_F(RainbowTest, EmptyPayload) {
    for (bool client : {true, false}) {
        EncodeResult out = engine_.encode_write(ByteVector(), client);
        ASSERT_EQ(out.packets.size(), 1u);
        EXPECT_EQ(out.total_len, 0u);
        DecodeResult r = engine_.decrypt_single_read(out.packets[0].bytes, 0, client);
        EXPECT_TRUE(r.data.empty());
        EXPECT_TRUE(r.is_read_end);
        EXPECT_TRUE(engine_.decode_all(wire(out), client).empty());
    }
}

TEST_F(RainbowTest, ExplicitJson) {
    ByteVector data = pattern(300);
    EncodeResult out = engine_.encode_write(data, true, std::string("application/json"));
    ASSERT_EQ(out.packets.size(), 1u);
    EXPECT_EQ(out.packets[0].technique, Technique::JSON_METADATA);

    // Client JSON goes out as a GET with the body in X-Data
    std::string text(out.packets[0].bytes.begin(), out.packets[0].bytes.end());
    EXPECT_EQ(text.compare(0, 4, "GET "), 0);
    EXPECT_NE(text.find("\r\nX-Data: "), std::string::npos);
    EXPECT_EQ(text.find("Content-Type:"), std::string::npos);
    EXPECT_EQ(engine_.decrypt_single_read(out.packets[0].bytes, 0, true).data, data);

    EncodeResult reply = engine_.encode_write(data, false, std::string("application/json"));
    std::string response(reply.packets[0].bytes.begin(), reply.packets[0].bytes.end());
    EXPECT_NE(response.find("Content-Type: application/json"), std::string::npos);
    EXPECT_EQ(engine_.decrypt_single_read(reply.packets[0].bytes, 0, false).data, data);
}

TEST_F(RainbowTest, LargePayloadReassembles) {
    ByteVector data = pattern(20000);
    for (bool client : {true, false}) {
        EncodeResult out = engine_.encode_write(data, client);
        EXPECT_GE(out.chunk_count, 20000u / 1024u);
        EXPECT_EQ(out.chunk_count, out.packets.size());

        ByteVector joined;
        for (size_t i = 0; i < out.packets.size(); ++i) {
            DecodeResult r = engine_.decrypt_single_read(out.packets[i].bytes, i, client);
            EXPECT_EQ(r.index, i);
            EXPECT_EQ(r.is_read_end, i + 1 == out.packets.size());
            joined.insert(joined.end(), r.data.begin(), r.data.end());
        }
        EXPECT_EQ(joined, data);
        EXPECT_EQ(engine_.decode_all(wire(out), client), data);
    }
}

TEST_F(RainbowTest, DecodeAllAcceptsAnyOrder) {
    ByteVector data = pattern(6000);
    EncodeResult out = engine_.encode_write(data, false);
    auto packets = wire(out);
    ASSERT_GT(packets.size(), 2u);
    std::reverse(packets.begin(), packets.end());
    std::rotate(packets.begin(), packets.begin() + 1, packets.end());
    EXPECT_EQ(engine_.decode_all(packets, false), data);
}

TEST_F(RainbowTest, DecodeAllRejectsGapsAndDuplicates) {
    EncodeResult out = engine_.encode_write(pattern(5000), true);
    auto packets = wire(out);
    ASSERT_GT(packets.size(), 2u);

    auto missing = packets;
    missing.erase(missing.begin() + 1);
    EXPECT_EQ(code_of([&] { engine_.decode_all(missing, true); }), ErrorCode::INCOMPLETE_SEQUENCE);

    auto duplicated = packets;
    duplicated[2] = duplicated[1];
    EXPECT_EQ(code_of([&] { engine_.decode_all(duplicated, true); }), ErrorCode::INCOMPLETE_SEQUENCE);

    // A packet from another sequence
    auto mixed = packets;
    mixed[0] = engine_.encode_write(bytes("other"), true).packets[0].bytes;
    EXPECT_EQ(code_of([&] { engine_.decode_all(mixed, true); }), ErrorCode::INCOMPLETE_SEQUENCE);

    EXPECT_EQ(code_of([&] { engine_.decode_all({}, true); }), ErrorCode::INCOMPLETE_SEQUENCE);
}

TEST_F(RainbowTest, SeededEnginesAreReproducible) {
    EngineOptions opts;
    opts.http.fixed_date = 1700000000;
    Rainbow a(opts, std::make_shared<SeededRandomSource>(2024u));
    Rainbow b(opts, std::make_shared<SeededRandomSource>(2024u));

    ByteVector data = pattern(4000);
    EncodeResult left = a.encode_write(data, true);
    EncodeResult right = b.encode_write(data, true);
    ASSERT_EQ(left.packets.size(), right.packets.size());
    for (size_t i = 0; i < left.packets.size(); ++i) {
        EXPECT_EQ(left.packets[i].bytes, right.packets[i].bytes);
    }
    EXPECT_EQ(left.expected_return_lengths, right.expected_return_lengths);
}

TEST_F(RainbowTest, ParallelEngineMatchesSequential) {
    EngineOptions seq;
    seq.http.fixed_date = 1700000000;
    EngineOptions par = seq;
    par.packetizer.parallel = true;
    par.packetizer.parallel_threshold = 2;
    par.packetizer.threads = 3;

    Rainbow a(seq, std::make_shared<SeededRandomSource>(5u));
    Rainbow b(par, std::make_shared<SeededRandomSource>(5u));
    ByteVector data = pattern(9000);
    EncodeResult left = a.encode_write(data, false);
    EncodeResult right = b.encode_write(data, false);
    ASSERT_EQ(left.packets.size(), right.packets.size());
    for (size_t i = 0; i < left.packets.size(); ++i) {
        EXPECT_EQ(left.packets[i].bytes, right.packets[i].bytes);
    }
    EXPECT_EQ(b.decode_all(wire(right), false), data);
}

TEST_F(RainbowTest, ZeroWeightNeverSelected) {
    EngineOptions opts;
    opts.weights[Technique::JSON_METADATA] = 0;
    opts.weights[Technique::HTML_COMMENT] = 0;
    Rainbow engine(opts);
    for (int i = 0; i < 10; ++i) {
        for (const auto& p : engine.encode_write(pattern(4000), true).packets) {
            EXPECT_NE(p.technique, Technique::JSON_METADATA);
            EXPECT_NE(p.technique, Technique::HTML_COMMENT);
        }
    }
}

TEST_F(RainbowTest, RoleMismatch) {
    EncodeResult out = engine_.encode_write(bytes("direction"), true);
    EXPECT_EQ(code_of([&] { engine_.decrypt_single_read(out.packets[0].bytes, 0, false); }),
              ErrorCode::ROLE_MISMATCH);
}

TEST_F(RainbowTest, TruncatedPacket) {
    EncodeResult out = engine_.encode_write(pattern(500), false);
    ByteVector cut = out.packets[0].bytes;
    cut.resize(cut.size() / 2);
    EXPECT_EQ(code_of([&] { engine_.decrypt_single_read(cut, 0, false); }),
              ErrorCode::CORRUPT_PACKET);
}

TEST_F(RainbowTest, ContentLengthMismatch) {
    EncodeResult out = engine_.encode_write(pattern(100), true);
    ByteVector grown = out.packets[0].bytes;
    grown.push_back(' ');
    EXPECT_EQ(code_of([&] { engine_.decrypt_single_read(grown, 0, true); }),
              ErrorCode::CORRUPT_PACKET);
}

TEST_F(RainbowTest, UnsupportedMime) {
    EXPECT_EQ(code_of([&] { engine_.encode_write(bytes("x"), true, std::string("image/png")); }),
              ErrorCode::UNSUPPORTED_MIME_TYPE);
    EXPECT_EQ(code_of([&] {
                  engine_.encode_write(bytes("x"), true, std::string("application/rss+xml"));
              }),
              ErrorCode::UNSUPPORTED_MIME_TYPE);
    EXPECT_NO_THROW(engine_.encode_write(bytes("x"), false, std::string("application/rss+xml")));
}

TEST_F(RainbowTest, ExpectedReturnLengths) {
    for (int i = 0; i < 20; ++i) {
        EncodeResult client = engine_.encode_write(pattern(3000), true);
        ASSERT_EQ(client.expected_return_lengths.size(), client.packets.size());
        for (size_t n : client.expected_return_lengths) {
            EXPECT_GE(n, 200u);
            EXPECT_LE(n, 8000u);
        }
        EncodeResult server = engine_.encode_write(pattern(3000), false);
        ASSERT_EQ(server.expected_return_lengths.size(), server.packets.size());
        for (size_t n : server.expected_return_lengths) {
            EXPECT_GE(n, 100u);
            EXPECT_LE(n, 2000u);
        }
    }
}

TEST_F(RainbowTest, InvertedReplyRange) {
    EngineOptions opts;
    opts.server_reply_min = 3000;
    EXPECT_EQ(code_of([&] { Rainbow engine(opts); }), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RainbowTest, OversizedReplyRange) {
    EngineOptions wide;
    wide.client_reply_min = 0;
    wide.client_reply_max = SIZE_MAX;
    EXPECT_EQ(code_of([&] { Rainbow engine(wide); }), ErrorCode::INVALID_ARGUMENT);

    // The widest range a 32-bit draw covers
    EngineOptions widest;
    widest.server_reply_min = 10;
    widest.server_reply_max = 10 + static_cast<size_t>(UINT32_MAX) - 1;
    Rainbow engine(widest, std::make_shared<SeededRandomSource>(8u));
    for (size_t n : engine.encode_write(pattern(5000), false).expected_return_lengths) {
        EXPECT_GE(n, widest.server_reply_min);
        EXPECT_LE(n, widest.server_reply_max);
    }
}

TEST_F(RainbowTest, DecodeReportsReplyLength) {
    for (int i = 0; i < 20; ++i) {
        EncodeResult request = engine_.encode_write(pattern(700), true);
        size_t n = engine_.decrypt_single_read(request.packets[0].bytes, 0, true).expected_return_length;
        EXPECT_GE(n, 200u);
        EXPECT_LE(n, 8000u);

        EncodeResult response = engine_.encode_write(pattern(700), false);
        n = engine_.decrypt_single_read(response.packets[0].bytes, 0, false).expected_return_length;
        EXPECT_GE(n, 100u);
        EXPECT_LE(n, 2000u);
    }

    EngineOptions fixed;
    fixed.client_reply_min = fixed.client_reply_max = 321;
    Rainbow engine(fixed);
    EncodeResult out = engine.encode_write(bytes("pinned"), true);
    EXPECT_EQ(out.expected_return_lengths, std::vector<size_t>{321});
    EXPECT_EQ(engine.decrypt_single_read(out.packets[0].bytes, 0, true).expected_return_length, 321u);
}

TEST_F(RainbowTest, CoverPacket) {
    for (bool client : {true, false}) {
        ByteVector cover = engine_.generate_cover_packet(1500, client);
        EXPECT_EQ(cover.size(), 1500u);
        DecodeResult r = engine_.decrypt_single_read(cover, 0, client);
        EXPECT_TRUE(r.is_read_end);
        EXPECT_EQ(r.total, 1u);
    }
    EXPECT_EQ(code_of([&] { engine_.generate_cover_packet(10, true); }), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(RainbowTest, RegistryIsExposed) {
    EXPECT_EQ(engine_.registry().size(), TECHNIQUE_COUNT);
    EXPECT_EQ(engine_.options().client_reply_max, 8000u);
}

// Flipping any payload-bearing byte of a tagged text carrier is caught
class TamperedBodyTest : public ::testing::TestWithParam<Technique> {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::NONE);
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::WARN);
    }
};

TEST_P(TamperedBodyTest, FlippedBodyBytesAreRejected) {
    auto registry = CodecRegistry::create_default();
    const CarrierCodec& codec = registry->by_technique(GetParam());
    MessageSynthesizer synth(registry);
    Rainbow engine;

    // Same decoration, one payload byte apart: the differing positions carry payload.
    // 0xAB and 0xDC print with equal width in every numeric scheme.
    ByteVector chunk = pattern(48);
    chunk[20] = 0xAB;
    ByteVector neighbour = chunk;
    neighbour[20] = 0xDC;
    SeededRandomSource a(31u);
    SeededRandomSource b(31u);
    ByteVector body = codec.encode(chunk, Role::SERVER, a);
    ByteVector other = codec.encode(neighbour, Role::SERVER, b);
    ASSERT_EQ(body.size(), other.size());
    std::vector<size_t> carrying;
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != other[i]) carrying.push_back(i);
    }
    ASSERT_FALSE(carrying.empty());

    PacketTag tag;
    tag.technique = codec.name();
    tag.length = chunk.size();
    tag.digest = text::digest32(chunk);
    SeededRandomSource rng(5u);
    ByteVector packet = synth.wrap(body, codec.mime_type(), Role::SERVER, tag, rng);
    ASSERT_EQ(engine.decrypt_single_read(packet, 0, false).data, chunk);

    const size_t body_start = packet.size() - body.size();
    for (size_t pos : carrying) {
        ByteVector tampered = packet;
        tampered[body_start + pos] ^= 0x01;
        try {
            engine.decrypt_single_read(tampered, 0, false);
            ADD_FAILURE() << codec.name() << " accepted a flip at body offset " << pos;
        } catch (const RainbowError& e) {
            EXPECT_TRUE(e.code() == ErrorCode::CORRUPT_PACKET ||
                        e.code() == ErrorCode::AMBIGUOUS_OR_UNDECODABLE)
                << codec.name() << ": " << e.what();
        }
    }
}

INSTANTIATE_TEST_SUITE_P(
    TextCarriers, TamperedBodyTest,
    ::testing::Values(Technique::HTML_COMMENT, Technique::HTML_NESTED_DIV, Technique::CSS_GRID,
                      Technique::CSS_ANIMATION, Technique::CSS_PAINT_WORKLET,
                      Technique::FONT_PROPERTY, Technique::JSON_METADATA, Technique::XML_CONFIG,
                      Technique::XML_RSS, Technique::SVG_PATH),
    [](const ::testing::TestParamInfo<Technique>& info) {
        return std::string(technique_to_string(info.param));
    });
