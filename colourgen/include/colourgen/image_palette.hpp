#ifndef COLOURGEN_IMAGE_PALETTE_HPP
#define COLOURGEN_IMAGE_PALETTE_HPP

#include <colourgen/color.hpp>
#include <colourgen/image_decoder.hpp>
#include <cstddef>
#include <vector>

namespace colourgen {

struct ImagePaletteConfig {
    std::size_t cluster_count = 6;      // Upper bound on representative colours
    std::size_t sample_limit = 20000;   // Pixels considered, taken with a fixed stride
    std::size_t max_iterations = 25;
    uint8_t alpha_threshold = 128;      // Pixels below this alpha are ignored
};

/**
 * Representative colours of an image by k-means clustering in RGB.
 *
 * Sampling is a fixed stride over opaque pixels and the initial centres are
 * luminance quantiles, so the result is deterministic. Empty clusters are
 * dropped; the returned centres are ordered dark to light. Throws
 * MalformedSourceError when the image has no opaque pixels.
 */
std::vector<Color> extract_representative_colors(const PixelImage& image,
                                                  const ImagePaletteConfig& config = {});

} // namespace colourgen

#endif // COLOURGEN_IMAGE_PALETTE_HPP
