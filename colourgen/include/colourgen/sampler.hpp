#ifndef COLOURGEN_SAMPLER_HPP
#define COLOURGEN_SAMPLER_HPP

#include <colourgen/color.hpp>
#include <colourgen/config.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace colourgen {

/**
 * Evenly spaced sample positions: i / (n - 1) for n > 1, {0} for n == 1.
 * Throws std::invalid_argument for n == 0.
 */
std::vector<double> sample_positions(std::size_t n);

/**
 * Deterministic Fisher-Yates permutation driven by std::mt19937.
 * Indices are drawn by rejection sampling on the raw engine output, so the
 * permutation does not depend on the standard library's distributions.
 */
std::vector<Color> shuffle_colors(std::vector<Color> colors, uint32_t seed = SHUFFLE_SEED);

/**
 * Sample fn into exactly n colours.
 *
 * reverse reverses the sampled order. shuffle permutes the unreversed
 * sequence with the fixed seed; when both are set the shuffle wins.
 */
std::vector<Color> sample(const ColorFunction& fn, std::size_t n, bool reverse, bool shuffle);

} // namespace colourgen

#endif // COLOURGEN_SAMPLER_HPP
