/**
 * @file test_mime_selector.cpp
 * @brief Technique selection: explicit MIME types and weighted automatic draws
 */

#include <gtest/gtest.h>
#include "rainbow_error.hpp"
#include "rainbow_mime_selector.hpp"

#include <map>
#include <set>

using namespace rainbow;

class MimeSelectorTest : public ::testing::Test {
protected:
    std::shared_ptr<const CodecRegistry> registry_ = CodecRegistry::create_default();
};

TEST_F(MimeSelectorTest, ExplicitMimeIsHonoured) {
    MimeSelector selector(registry_);
    SeededRandomSource rng(1u);
    std::set<Technique> seen;
    for (int i = 0; i < 400; ++i) {
        const CarrierCodec& codec = selector.select(std::string("text/css"), Role::SERVER, rng);
        EXPECT_EQ(std::string(codec.mime_type()), "text/css");
        seen.insert(codec.technique());
    }
    // All four stylesheet carriers take part
    EXPECT_EQ(seen.size(), 4u);

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(selector.select(std::string("text/css"), Role::CLIENT, rng).technique(),
                  Technique::CSS_GRID);
    }
}

TEST_F(MimeSelectorTest, UnsupportedMimeForRole) {
    MimeSelector selector(registry_);
    SeededRandomSource rng(2u);
    try {
        selector.select(std::string("application/rss+xml"), Role::CLIENT, rng);
        FAIL() << "rss selected for a client packet";
    } catch (const RainbowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_MIME_TYPE);
    }
    EXPECT_THROW(selector.select(std::string("video/mp4"), Role::SERVER, rng), RainbowError);
}

TEST_F(MimeSelectorTest, AutomaticSelectionCoversCompatibleCodecs) {
    MimeSelector selector(registry_);
    SeededRandomSource rng(3u);
    std::map<Technique, int> counts;
    for (int i = 0; i < 1200; ++i) {
        const CarrierCodec& codec = selector.select(std::nullopt, Role::CLIENT, rng);
        EXPECT_TRUE(codec.supports(Role::CLIENT));
        ++counts[codec.technique()];
    }
    EXPECT_EQ(counts.size(), 7u);
    for (const auto& kv : counts) {
        // ~170 expected each
        EXPECT_GT(kv.second, 100) << technique_to_string(kv.first);
    }
}

TEST_F(MimeSelectorTest, ZeroWeightExcludesTechnique) {
    TechniqueWeights weights;
    weights[Technique::JSON_METADATA] = 0;
    weights[Technique::WAV_AUDIO] = 0;
    MimeSelector selector(registry_, weights);
    SeededRandomSource rng(4u);

    EXPECT_EQ(selector.weight(Technique::JSON_METADATA), 0u);
    EXPECT_EQ(selector.weight(Technique::CSS_GRID), MimeSelector::DEFAULT_WEIGHT);

    for (int i = 0; i < 500; ++i) {
        Technique t = selector.select(std::nullopt, Role::SERVER, rng).technique();
        EXPECT_NE(t, Technique::JSON_METADATA);
        EXPECT_NE(t, Technique::WAV_AUDIO);
    }

    // Weight 0 does not block an explicit request
    EXPECT_EQ(selector.select(std::string("application/json"), Role::SERVER, rng).technique(),
              Technique::JSON_METADATA);
}

TEST_F(MimeSelectorTest, SingleNonZeroWeightAlwaysWins) {
    TechniqueWeights weights;
    for (Technique t : all_techniques()) weights[t] = 0;
    weights[Technique::SVG_PATH] = 5;
    MimeSelector selector(registry_, weights);
    SeededRandomSource rng(5u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(selector.select(std::nullopt, Role::CLIENT, rng).technique(), Technique::SVG_PATH);
    }
}

TEST_F(MimeSelectorTest, AllWeightsZeroIsInvalid) {
    TechniqueWeights weights;
    for (Technique t : all_techniques()) weights[t] = 0;
    MimeSelector selector(registry_, weights);
    SeededRandomSource rng(6u);
    try {
        selector.select(std::nullopt, Role::SERVER, rng);
        FAIL() << "selection with all weights 0";
    } catch (const RainbowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_F(MimeSelectorTest, ServerOnlyWeightsLeaveClientEmpty) {
    TechniqueWeights weights;
    for (Technique t : all_techniques()) weights[t] = 0;
    weights[Technique::XML_RSS] = 1;
    MimeSelector selector(registry_, weights);
    SeededRandomSource rng(7u);

    EXPECT_EQ(selector.select(std::nullopt, Role::SERVER, rng).technique(), Technique::XML_RSS);
    EXPECT_THROW(selector.select(std::nullopt, Role::CLIENT, rng), RainbowError);
}
