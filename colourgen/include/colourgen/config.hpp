#ifndef COLOURGEN_CONFIG_HPP
#define COLOURGEN_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace colourgen {

constexpr std::size_t DEFAULT_MAX_IMAGE_PIXELS = 40'000'000;

/**
 * Resolver-wide settings. Defaults reproduce the public make_palette().
 */
struct ResolverConfig {
    // Remote palette service: GET http://<service_host>:<service_port>/api/palette/<id>
    std::string service_host = "www.colourlovers.com";
    uint16_t service_port = 80;

    // Bound on every remote palette or image fetch
    std::chrono::milliseconds fetch_timeout{5000};

    // viridis, magma, plasma, inferno, cividis
    bool enable_perceptual_ramps = true;

    // Image sources
    std::size_t image_cluster_count = 6;
    std::size_t image_sample_limit = 20000;
    // Larger images are rejected before any pixel buffer is allocated
    std::size_t image_max_pixels = DEFAULT_MAX_IMAGE_PIXELS;
};

/**
 * Per-call options.
 */
struct PaletteOptions {
    std::size_t n = 7;
    bool reverse = false;
    bool shuffle = false;
    bool orange_blue_default = true;  // false selects the earth->emerald default
    bool render_preview = false;
};

// Fixed seed for the shuffle permutation
constexpr uint32_t SHUFFLE_SEED = 333;

} // namespace colourgen

#endif // COLOURGEN_CONFIG_HPP
