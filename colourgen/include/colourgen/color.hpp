#ifndef COLOURGEN_COLOR_HPP
#define COLOURGEN_COLOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colourgen {

/**
 * An opaque 8-bit RGB colour.
 * The canonical text form is "#RRGGBB" in uppercase; two colours are equal
 * exactly when their canonical forms are equal.
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // "#RRGGBB"
    std::string hex() const;

    // Relative luminance in [0, 1] (Rec. 709 weights, no gamma)
    double luminance() const;

    /**
     * Parse a colour string. Accepts "#RRGGBB", "#RRGGBBAA" (alpha ignored),
     * "#RGB" and CSS/X11 colour names ("steelblue", "Steel Blue").
     * Returns nullopt for anything else.
     */
    static std::optional<Color> parse(std::string_view text);

    // Channels in [0, 1], rounded to the nearest 8-bit value
    static Color from_unit(double r, double g, double b);

    // R grDevices hsv(): all arguments in [0, 1]
    static Color from_hsv(double h, double s, double v);
};

// Normalises a colour string to "#RRGGBB", or nullopt if it does not parse
std::optional<std::string> normalize_hex(std::string_view text);

std::vector<std::string> to_hex_strings(const std::vector<Color>& colors);

/**
 * A continuous colour function: maps t in [0, 1] to a colour.
 * Implementations clamp t and must be deterministic.
 */
using ColorFunction = std::function<Color(double)>;

/**
 * Piecewise-linear interpolation in RGB across the anchors, first anchor at
 * t = 0 and last at t = 1. A single anchor gives a constant function.
 * Throws std::invalid_argument on an empty anchor list.
 */
ColorFunction make_linear_ramp(std::vector<Color> anchors);

/**
 * Parses every string and builds a linear ramp across them.
 * Throws MalformedSourceError naming the first string that does not parse.
 */
ColorFunction make_linear_ramp(const std::vector<std::string>& anchors);

} // namespace colourgen

namespace std {
    template<>
    struct hash<colourgen::Color> {
        std::size_t operator()(const colourgen::Color& c) const {
            return std::hash<uint32_t>{}((uint32_t(c.r) << 16) | (uint32_t(c.g) << 8) | c.b);
        }
    };
}

#endif // COLOURGEN_COLOR_HPP
