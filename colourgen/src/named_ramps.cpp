#include <colourgen/named_ramps.hpp>
#include <algorithm>
#include <cmath>

namespace colourgen {

// The grDevices functions are defined per palette size; these are their
// continuous forms, evaluated at the same HSV control points.

Color rainbow_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    // Red through magenta, stopping before the hue wraps back to red
    return Color::from_hsv(t * 5.0 / 6.0, 1.0, 1.0);
}

Color heat_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    // First three quarters: red to yellow. Last quarter: yellow desaturating.
    if (t <= 0.75) {
        return Color::from_hsv((t / 0.75) / 6.0, 1.0, 1.0);
    }
    double u = (t - 0.75) / 0.25;
    return Color::from_hsv(1.0 / 6.0, 1.0 - u * 0.875, 1.0);
}

Color terrain_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    if (t <= 0.5) {
        double u = t / 0.5;
        return Color::from_hsv(4.0 / 12.0 + u * (2.0 / 12.0 - 4.0 / 12.0), 1.0, 0.65 + u * 0.25);
    }
    double u = (t - 0.5) / 0.5;
    return Color::from_hsv((2.0 / 12.0) * (1.0 - u), 1.0 - u, 0.9 + u * 0.05);
}

Color topo_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    if (t < 1.0 / 3.0) {
        double u = t * 3.0;
        return Color::from_hsv(43.0 / 60.0 + u * (31.0 / 60.0 - 43.0 / 60.0), 1.0, 1.0);
    }
    if (t < 2.0 / 3.0) {
        double u = t * 3.0 - 1.0;
        return Color::from_hsv(23.0 / 60.0 + u * (11.0 / 60.0 - 23.0 / 60.0), 1.0, 1.0);
    }
    double u = std::min(1.0, t * 3.0 - 2.0);
    return Color::from_hsv(10.0 / 60.0 + u * (6.0 / 60.0 - 10.0 / 60.0), 1.0 - 0.7 * u, 1.0);
}

Color cm_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    // Cyan fading to white, then white to magenta
    if (t < 0.5) {
        return Color::from_hsv(6.0 / 12.0, 0.5 * (1.0 - 2.0 * t), 1.0);
    }
    return Color::from_hsv(10.0 / 12.0, 0.5 * (2.0 * t - 1.0), 1.0);
}

Color gray_ramp(double t) {
    t = std::clamp(t, 0.0, 1.0);
    constexpr double start = 0.3;
    constexpr double end = 0.9;
    constexpr double gamma = 2.2;
    const double lo = std::pow(start, gamma);
    const double hi = std::pow(end, gamma);
    double level = std::pow(lo + t * (hi - lo), 1.0 / gamma);
    return Color::from_unit(level, level, level);
}

namespace {

ColorFunction anchors(std::initializer_list<uint32_t> rgb_values) {
    std::vector<Color> colors;
    colors.reserve(rgb_values.size());
    for (uint32_t rgb : rgb_values) {
        colors.emplace_back(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                            static_cast<uint8_t>((rgb >> 8) & 0xFF),
                            static_cast<uint8_t>(rgb & 0xFF));
    }
    return make_linear_ramp(std::move(colors));
}

} // namespace

NamedRampRegistry::NamedRampRegistry() {
    ramps_.push_back({"rainbow", RampFamily::Base, rainbow_ramp});
    ramps_.push_back({"heat.colors", RampFamily::Base, heat_ramp});
    ramps_.push_back({"terrain.colors", RampFamily::Base, terrain_ramp});
    ramps_.push_back({"topo.colors", RampFamily::Base, topo_ramp});
    ramps_.push_back({"cm.colors", RampFamily::Base, cm_ramp});
    ramps_.push_back({"gray.colors", RampFamily::Base, gray_ramp});

    // Matplotlib perceptual maps, sampled at 9 or 10 evenly spaced stops
    ramps_.push_back({"viridis", RampFamily::Perceptual,
                      anchors({0x440154, 0x472C7A, 0x3B518B, 0x2C718E, 0x21908D,
                               0x27AD81, 0x5CC863, 0xAADC32, 0xFDE725})});
    ramps_.push_back({"magma", RampFamily::Perceptual,
                      anchors({0x000004, 0x1C1044, 0x4F127B, 0x812581, 0xB5367A,
                               0xE55064, 0xFB8761, 0xFEC287, 0xFCFDBF})});
    ramps_.push_back({"plasma", RampFamily::Perceptual,
                      anchors({0x0D0887, 0x4C02A1, 0x7E03A8, 0xA92395, 0xCC4778,
                               0xE56B5D, 0xF89441, 0xFDC328, 0xF0F921})});
    ramps_.push_back({"inferno", RampFamily::Perceptual,
                      anchors({0x000004, 0x1F0C48, 0x550F6D, 0x88226A, 0xBA3655,
                               0xE35933, 0xF98C0A, 0xF9C932, 0xFCFFA4})});
    ramps_.push_back({"cividis", RampFamily::Perceptual,
                      anchors({0x00204D, 0x00336F, 0x39486B, 0x575C6D, 0x707173,
                               0x8A8779, 0xA69D75, 0xC4B56C, 0xE4CF5B, 0xFFEA46})});
}

const NamedRampRegistry& NamedRampRegistry::instance() {
    static const NamedRampRegistry registry;
    return registry;
}

const NamedRamp* NamedRampRegistry::find(std::string_view name) const {
    for (const auto& ramp : ramps_) {
        if (name == ramp.name) {
            return &ramp;
        }
    }
    return nullptr;
}

std::vector<std::string> NamedRampRegistry::names(RampFamily family) const {
    std::vector<std::string> result;
    for (const auto& ramp : ramps_) {
        if (ramp.family == family) {
            result.emplace_back(ramp.name);
        }
    }
    return result;
}

} // namespace colourgen
