#include <gtest/gtest.h>
#include <colourgen/named_ramps.hpp>
#include "test_helpers.hpp"

using colourgen::NamedRampRegistry;
using colourgen::RampFamily;

class NamedRampTest : public ::testing::Test {
protected:
    const NamedRampRegistry& registry = NamedRampRegistry::instance();
};

TEST_F(NamedRampTest, FamiliesAndOrder) {
    std::vector<std::string> base = {"rainbow", "heat.colors", "terrain.colors",
                                     "topo.colors", "cm.colors", "gray.colors"};
    std::vector<std::string> perceptual = {"viridis", "magma", "plasma", "inferno", "cividis"};
    EXPECT_EQ(registry.names(RampFamily::Base), base);
    EXPECT_EQ(registry.names(RampFamily::Perceptual), perceptual);
    EXPECT_EQ(registry.ramps().size(), 11u);
}

TEST_F(NamedRampTest, NamesAreCaseSensitive) {
    EXPECT_NE(registry.find("viridis"), nullptr);
    EXPECT_EQ(registry.find("Viridis"), nullptr);
    EXPECT_EQ(registry.find("RAINBOW"), nullptr);
    EXPECT_FALSE(registry.family_of("Spectral").has_value());
    EXPECT_EQ(registry.family_of("magma"), std::optional<RampFamily>(RampFamily::Perceptual));
    EXPECT_EQ(registry.family_of("cm.colors"), std::optional<RampFamily>(RampFamily::Base));
}

TEST_F(NamedRampTest, EveryRampIsDeterministic) {
    for (const auto& ramp : registry.ramps()) {
        for (double t : {0.0, 0.25, 0.5, 0.75, 1.0}) {
            EXPECT_EQ(ramp.function(t), ramp.function(t)) << ramp.name << " at " << t;
        }
        test_utils::expect_all_valid_hex({ramp.function(0.0).hex(),
                                          ramp.function(0.5).hex(),
                                          ramp.function(1.0).hex()});
    }
}

TEST_F(NamedRampTest, EveryRampVariesAlongItsLength) {
    for (const auto& ramp : registry.ramps()) {
        EXPECT_NE(ramp.function(0.0), ramp.function(1.0)) << ramp.name;
    }
}

TEST_F(NamedRampTest, ClampsOutOfRangeParameters) {
    for (const auto& ramp : registry.ramps()) {
        EXPECT_EQ(ramp.function(-0.5), ramp.function(0.0)) << ramp.name;
        EXPECT_EQ(ramp.function(1.5), ramp.function(1.0)) << ramp.name;
    }
}

TEST_F(NamedRampTest, KnownEndpoints) {
    EXPECT_EQ(colourgen::rainbow_ramp(0.0).hex(), "#FF0000");
    EXPECT_EQ(colourgen::heat_ramp(0.0).hex(), "#FF0000");
    EXPECT_EQ(colourgen::heat_ramp(1.0).hex(), "#FFFFDF");
    EXPECT_EQ(registry.find("viridis")->function(0.0).hex(), "#440154");
    EXPECT_EQ(registry.find("viridis")->function(1.0).hex(), "#FDE725");
    EXPECT_EQ(registry.find("cividis")->function(1.0).hex(), "#FFEA46");
}

TEST_F(NamedRampTest, GrayIsNeutralAndBrightening) {
    colourgen::Color dark = colourgen::gray_ramp(0.0);
    colourgen::Color light = colourgen::gray_ramp(1.0);
    EXPECT_EQ(dark.r, dark.g);
    EXPECT_EQ(dark.g, dark.b);
    EXPECT_LT(dark.r, light.r);
}

TEST_F(NamedRampTest, PerceptualRampsRunDarkToLight) {
    for (const auto& name : registry.names(RampFamily::Perceptual)) {
        const auto* ramp = registry.find(name);
        ASSERT_NE(ramp, nullptr);
        EXPECT_LT(ramp->function(0.0).luminance(), ramp->function(1.0).luminance()) << name;
    }
}
