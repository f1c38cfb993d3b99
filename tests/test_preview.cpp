#include <gtest/gtest.h>
#include <colourgen/preview.hpp>
#include "test_helpers.hpp"

using namespace colourgen;

namespace {

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(SvgSwatchRendererTest, OneBarAndLabelPerColour) {
    SvgSwatchRenderer renderer;
    std::vector<Color> colors = {Color(0xCA, 0xF6, 0x0D), Color(0x18, 0xD3, 0x3A), Color(0x42, 0x55, 0xEC)};
    Preview preview = renderer.render(colors);

    EXPECT_EQ(preview.mime_type, "image/svg+xml");
    EXPECT_EQ(preview.content.rfind("<svg", 0), 0u);
    EXPECT_NE(preview.content.find("</svg>"), std::string::npos);
    EXPECT_EQ(count_occurrences(preview.content, "class=\"bar\""), 3u);
    EXPECT_EQ(count_occurrences(preview.content, "class=\"label\""), 3u);
    for (const auto& color : colors) {
        EXPECT_EQ(count_occurrences(preview.content, "fill=\"" + color.hex() + "\""), 1u) << color.hex();
        EXPECT_EQ(count_occurrences(preview.content, ">" + color.hex() + "</text>"), 1u) << color.hex();
    }
}

TEST(SvgSwatchRendererTest, GreyBackgroundAndVerticalLabels) {
    SvgSwatchRenderer renderer;
    Preview preview = renderer.render({Color(0, 0, 0)});
    EXPECT_NE(preview.content.find("fill=\"#BFBFBF\""), std::string::npos);
    EXPECT_NE(preview.content.find("rotate(-90"), std::string::npos);
    EXPECT_NE(preview.content.find("stroke=\"none\""), std::string::npos);
}

TEST(SvgSwatchRendererTest, BarsAreAdjacent) {
    SvgSwatchRenderer::Layout layout;
    layout.bar_width = 10.0;
    SvgSwatchRenderer renderer(layout);
    Preview preview = renderer.render({Color(1, 1, 1), Color(2, 2, 2), Color(3, 3, 3)});
    EXPECT_NE(preview.content.find("x=\"0.0\" y=\"0\" width=\"10.0\""), std::string::npos);
    EXPECT_NE(preview.content.find("x=\"10.0\" y=\"0\" width=\"10.0\""), std::string::npos);
    EXPECT_NE(preview.content.find("x=\"20.0\" y=\"0\" width=\"10.0\""), std::string::npos);
    EXPECT_NE(preview.content.find("width=\"30.0\""), std::string::npos);
}
