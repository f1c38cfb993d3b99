#include <colourgen/sampler.hpp>
#include <colourgen/debug_log.hpp>
#include <algorithm>
#include <random>
#include <stdexcept>

namespace colourgen {

namespace {

// Uniform integer in [0, bound] from the raw 32-bit engine output
uint32_t draw_index(std::mt19937& rng, uint32_t bound) {
    if (bound == 0) {
        return 0;
    }
    const uint64_t range = static_cast<uint64_t>(bound) + 1;
    const uint64_t limit = (uint64_t(1) << 32) - ((uint64_t(1) << 32) % range);
    uint64_t value;
    do {
        value = rng();
    } while (value >= limit);
    return static_cast<uint32_t>(value % range);
}

} // namespace

std::vector<double> sample_positions(std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("Palette size must be at least 1");
    }
    std::vector<double> positions(n, 0.0);
    if (n == 1) {
        return positions;
    }
    for (std::size_t i = 0; i < n; ++i) {
        positions[i] = static_cast<double>(i) / static_cast<double>(n - 1);
    }
    positions.back() = 1.0;
    return positions;
}

std::vector<Color> shuffle_colors(std::vector<Color> colors, uint32_t seed) {
    std::mt19937 rng(seed);
    for (std::size_t i = colors.size(); i > 1; --i) {
        uint32_t j = draw_index(rng, static_cast<uint32_t>(i - 1));
        std::swap(colors[i - 1], colors[j]);
    }
    return colors;
}

std::vector<Color> sample(const ColorFunction& fn, std::size_t n, bool reverse, bool shuffle) {
    std::vector<Color> colors;
    colors.reserve(n);
    for (double t : sample_positions(n)) {
        colors.push_back(fn(t));
    }

    if (shuffle) {
        if (reverse) {
            COLOURGEN_DEBUG_LOG("Both reverse and shuffle requested; shuffling the base order");
        }
        return shuffle_colors(std::move(colors));
    }
    if (reverse) {
        std::reverse(colors.begin(), colors.end());
    }
    return colors;
}

} // namespace colourgen
