/**
 * @file test_packetizer.cpp
 * @brief Chunk planning and packet synthesis, sequential and on the pool
 */

#include <gtest/gtest.h>
#include "rainbow_dispatcher.hpp"
#include "rainbow_error.hpp"
#include "rainbow_packetizer.hpp"

using namespace rainbow;

class PacketizerTest : public ::testing::Test {
protected:
    Packetizer make(PacketizerOptions options = {}) {
        SynthOptions http;
        http.fixed_date = 1700000000;
        return Packetizer(registry_, std::make_shared<const MimeSelector>(registry_),
                          std::make_shared<const MessageSynthesizer>(registry_, http), options);
    }

    static ByteVector payload(size_t n) {
        ByteVector out(n);
        for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
        return out;
    }

    std::shared_ptr<const CodecRegistry> registry_ = CodecRegistry::create_default();
};

TEST_F(PacketizerTest, PlanCoversThePayload) {
    Packetizer packetizer = make();
    SeededRandomSource rng(1u);
    ByteVector data = payload(5000);

    auto chunks = packetizer.plan(data, Role::CLIENT, std::nullopt, rng);
    ASSERT_FALSE(chunks.empty());
    size_t offset = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].offset, offset);
        ASSERT_NE(chunks[i].codec, nullptr);
        EXPECT_TRUE(chunks[i].codec->supports(Role::CLIENT));
        EXPECT_GT(chunks[i].length, 0u);
        // Every chunk but the last is full
        if (i + 1 < chunks.size()) {
            EXPECT_EQ(chunks[i].length, chunks[i].codec->capacity(Role::CLIENT));
        }
        offset += chunks[i].length;
    }
    EXPECT_EQ(offset, data.size());
}

TEST_F(PacketizerTest, EmptyPayloadIsOneChunk) {
    Packetizer packetizer = make();
    SeededRandomSource rng(2u);
    auto chunks = packetizer.plan(ByteVector(), Role::SERVER, std::nullopt, rng);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].length, 0u);
}

TEST_F(PacketizerTest, ExplicitMimeFixesTheCodecFamily) {
    Packetizer packetizer = make();
    SeededRandomSource rng(3u);

    // html_comment (1024 bytes) and audio_html (512 bytes) serve text/html requests
    auto client = packetizer.packetize(payload(3000), Role::CLIENT, std::string("text/html"), rng);
    EXPECT_GE(client.size(), 3u);
    EXPECT_LE(client.size(), 6u);
    for (const auto& p : client) {
        EXPECT_TRUE(p.technique == Technique::HTML_COMMENT || p.technique == Technique::AUDIO_HTML);
        EXPECT_EQ(p.role, Role::CLIENT);
    }

    auto server = packetizer.packetize(payload(3000), Role::SERVER, std::string("text/html"), rng);
    EXPECT_GE(server.size(), 3u);
    for (const auto& p : server) {
        EXPECT_TRUE(p.technique == Technique::HTML_COMMENT ||
                    p.technique == Technique::HTML_NESTED_DIV ||
                    p.technique == Technique::AUDIO_HTML);
    }
}

TEST_F(PacketizerTest, PacketsCarryTagsInOrder) {
    Packetizer packetizer = make();
    SeededRandomSource rng(4u);
    ByteVector data = payload(2500);
    auto packets = packetizer.packetize(data, Role::CLIENT, std::nullopt, rng);

    DecodeDispatcher dispatcher(registry_);
    ByteVector joined;
    for (size_t i = 0; i < packets.size(); ++i) {
        EXPECT_EQ(packets[i].index, i);
        DecodeResult r = dispatcher.decode(packets[i].bytes, i, Role::CLIENT);
        EXPECT_EQ(r.index, i);
        EXPECT_EQ(r.total, packets.size());
        EXPECT_EQ(r.technique, packets[i].technique);
        joined.insert(joined.end(), r.data.begin(), r.data.end());
    }
    EXPECT_EQ(joined, data);
}

TEST_F(PacketizerTest, ParallelOutputMatchesSequential) {
    PacketizerOptions parallel;
    parallel.parallel = true;
    parallel.parallel_threshold = 2;
    parallel.threads = 4;

    Packetizer seq = make();
    Packetizer par = make(parallel);
    ByteVector data = payload(12000);

    SeededRandomSource a(99u);
    SeededRandomSource b(99u);
    auto left = seq.packetize(data, Role::SERVER, std::nullopt, a);
    auto right = par.packetize(data, Role::SERVER, std::nullopt, b);

    ASSERT_EQ(left.size(), right.size());
    ASSERT_GE(left.size(), 2u);
    for (size_t i = 0; i < left.size(); ++i) {
        EXPECT_EQ(left[i].bytes, right[i].bytes) << "packet " << i;
        EXPECT_EQ(left[i].technique, right[i].technique);
    }
}

TEST_F(PacketizerTest, UnsupportedMimePropagates) {
    Packetizer packetizer = make();
    SeededRandomSource rng(5u);
    try {
        packetizer.packetize(payload(10), Role::CLIENT, std::string("application/rss+xml"), rng);
        FAIL() << "rss packets produced for a client";
    } catch (const RainbowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_MIME_TYPE);
    }
}

TEST(PacketizerConstruction, RequiresCollaborators) {
    auto registry = CodecRegistry::create_default();
    EXPECT_THROW(Packetizer(registry, nullptr, std::make_shared<const MessageSynthesizer>(registry)),
                 std::invalid_argument);
}
