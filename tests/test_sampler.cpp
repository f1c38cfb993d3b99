#include <gtest/gtest.h>
#include <colourgen/sampler.hpp>
#include "test_helpers.hpp"
#include <algorithm>

using colourgen::Color;

namespace {

// Encodes t in the red channel so sample positions can be read back
Color encode_position(double t) {
    return Color::from_unit(t, 0.0, 0.0);
}

std::vector<Color> ascending(std::size_t n) {
    std::vector<Color> colors;
    for (std::size_t i = 0; i < n; ++i) {
        colors.emplace_back(static_cast<uint8_t>(i), 0, 0);
    }
    return colors;
}

} // namespace

TEST(SamplerTest, PositionsEvenlySpaced) {
    auto positions = colourgen::sample_positions(5);
    ASSERT_EQ(positions.size(), 5u);
    EXPECT_DOUBLE_EQ(positions[0], 0.0);
    EXPECT_DOUBLE_EQ(positions[1], 0.25);
    EXPECT_DOUBLE_EQ(positions[2], 0.5);
    EXPECT_DOUBLE_EQ(positions[3], 0.75);
    EXPECT_DOUBLE_EQ(positions[4], 1.0);
}

TEST(SamplerTest, SinglePositionIsZero) {
    EXPECT_EQ(colourgen::sample_positions(1), std::vector<double>{0.0});
}

TEST(SamplerTest, ZeroRejected) {
    EXPECT_THROW(colourgen::sample_positions(0), std::invalid_argument);
    EXPECT_THROW(colourgen::sample(encode_position, 0, false, false), std::invalid_argument);
}

TEST(SamplerTest, ExactCountForManySizes) {
    for (std::size_t n : {1u, 2u, 3u, 7u, 16u, 100u, 257u}) {
        EXPECT_EQ(colourgen::sample(encode_position, n, false, false).size(), n);
        EXPECT_EQ(colourgen::sample(encode_position, n, true, false).size(), n);
        EXPECT_EQ(colourgen::sample(encode_position, n, false, true).size(), n);
        EXPECT_EQ(colourgen::sample(encode_position, n, true, true).size(), n);
    }
}

TEST(SamplerTest, SamplesInIncreasingOrder) {
    auto colors = colourgen::sample(encode_position, 3, false, false);
    EXPECT_EQ(colors[0].hex(), "#000000");
    EXPECT_EQ(colors[1].hex(), "#800000");
    EXPECT_EQ(colors[2].hex(), "#FF0000");
}

TEST(SamplerTest, ReverseIsExactReversal) {
    auto forward = colourgen::sample(encode_position, 9, false, false);
    auto backward = colourgen::sample(encode_position, 9, true, false);
    std::reverse(forward.begin(), forward.end());
    EXPECT_EQ(forward, backward);
}

TEST(SamplerTest, ShuffleIsDeterministicPermutation) {
    auto first = colourgen::sample(encode_position, 12, false, true);
    auto second = colourgen::sample(encode_position, 12, false, true);
    EXPECT_EQ(first, second);

    auto base = colourgen::sample(encode_position, 12, false, false);
    auto sorted_first = test_utils::hex_of(first);
    auto sorted_base = test_utils::hex_of(base);
    std::sort(sorted_first.begin(), sorted_first.end());
    std::sort(sorted_base.begin(), sorted_base.end());
    EXPECT_EQ(sorted_first, sorted_base);
    EXPECT_NE(first, base);
}

TEST(SamplerTest, ShuffleOverridesReverse) {
    auto shuffled = colourgen::sample(encode_position, 10, false, true);
    auto both = colourgen::sample(encode_position, 10, true, true);
    EXPECT_EQ(shuffled, both);
}

TEST(SamplerTest, ShuffleSeedMatters) {
    auto colors = ascending(20);
    EXPECT_EQ(colourgen::shuffle_colors(colors, 333), colourgen::shuffle_colors(colors, 333));
    EXPECT_NE(colourgen::shuffle_colors(colors, 333), colourgen::shuffle_colors(colors, 334));
}

TEST(SamplerTest, ShuffleOfTrivialSequences) {
    EXPECT_TRUE(colourgen::shuffle_colors({}).empty());
    EXPECT_EQ(colourgen::shuffle_colors({Color(1, 2, 3)}), std::vector<Color>{Color(1, 2, 3)});
}
