#include <colourgen/image_palette.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/errors.hpp>
#include <algorithm>
#include <array>
#include <limits>

namespace colourgen {

namespace {

using Point = std::array<double, 3>;

double distance_sq(const Point& a, const Point& b) {
    double dr = a[0] - b[0];
    double dg = a[1] - b[1];
    double db = a[2] - b[2];
    return dr * dr + dg * dg + db * db;
}

double luminance(const Point& p) {
    return 0.2126 * p[0] + 0.7152 * p[1] + 0.0722 * p[2];
}

std::vector<Point> sample_opaque_pixels(const PixelImage& image, const ImagePaletteConfig& config) {
    std::vector<Point> opaque;
    const std::size_t total = image.pixel_count();
    if (image.rgba.size() < total * 4) {
        throw MalformedSourceError("Pixel buffer smaller than image dimensions");
    }

    std::size_t opaque_total = 0;
    for (std::size_t i = 0; i < total; ++i) {
        if (image.rgba[i * 4 + 3] >= config.alpha_threshold) {
            ++opaque_total;
        }
    }
    if (opaque_total == 0) {
        return opaque;
    }

    const std::size_t limit = std::max<std::size_t>(1, config.sample_limit);
    const std::size_t stride = std::max<std::size_t>(1, (opaque_total + limit - 1) / limit);
    opaque.reserve(std::min(opaque_total, limit));

    std::size_t seen = 0;
    for (std::size_t i = 0; i < total; ++i) {
        const uint8_t* px = &image.rgba[i * 4];
        if (px[3] < config.alpha_threshold) {
            continue;
        }
        if (seen++ % stride == 0) {
            opaque.push_back({double(px[0]), double(px[1]), double(px[2])});
        }
    }
    return opaque;
}

} // namespace

std::vector<Color> extract_representative_colors(const PixelImage& image,
                                                  const ImagePaletteConfig& config) {
    std::vector<Point> points = sample_opaque_pixels(image, config);
    if (points.empty()) {
        throw MalformedSourceError("Image has no opaque pixels");
    }

    // Initial centres: luminance quantiles of the sample
    std::vector<Point> by_luminance = points;
    std::stable_sort(by_luminance.begin(), by_luminance.end(),
                     [](const Point& a, const Point& b) { return luminance(a) < luminance(b); });

    const std::size_t k = std::max<std::size_t>(1, std::min(config.cluster_count, points.size()));
    std::vector<Point> centres;
    centres.reserve(k);
    for (std::size_t i = 0; i < k; ++i) {
        std::size_t index = static_cast<std::size_t>((i + 0.5) * by_luminance.size() / k);
        centres.push_back(by_luminance[std::min(index, by_luminance.size() - 1)]);
    }

    std::vector<std::size_t> assignment(points.size(), std::numeric_limits<std::size_t>::max());
    std::vector<std::size_t> counts(k, 0);

    for (std::size_t iteration = 0; iteration < config.max_iterations; ++iteration) {
        bool changed = false;
        for (std::size_t p = 0; p < points.size(); ++p) {
            std::size_t best = 0;
            double best_distance = std::numeric_limits<double>::max();
            for (std::size_t c = 0; c < k; ++c) {
                double d = distance_sq(points[p], centres[c]);
                if (d < best_distance) {
                    best_distance = d;
                    best = c;
                }
            }
            if (assignment[p] != best) {
                assignment[p] = best;
                changed = true;
            }
        }

        std::vector<Point> sums(k, Point{0.0, 0.0, 0.0});
        std::fill(counts.begin(), counts.end(), 0);
        for (std::size_t p = 0; p < points.size(); ++p) {
            Point& sum = sums[assignment[p]];
            sum[0] += points[p][0];
            sum[1] += points[p][1];
            sum[2] += points[p][2];
            ++counts[assignment[p]];
        }
        for (std::size_t c = 0; c < k; ++c) {
            if (counts[c] > 0) {
                centres[c] = {sums[c][0] / counts[c], sums[c][1] / counts[c], sums[c][2] / counts[c]};
            }
        }

        if (!changed) {
            COLOURGEN_DEBUG_LOG("k-means converged after %zu iterations", iteration + 1);
            break;
        }
    }

    std::vector<Point> kept;
    for (std::size_t c = 0; c < k; ++c) {
        if (counts[c] > 0) {
            kept.push_back(centres[c]);
        }
    }
    std::stable_sort(kept.begin(), kept.end(),
                     [](const Point& a, const Point& b) { return luminance(a) < luminance(b); });

    std::vector<Color> colors;
    colors.reserve(kept.size());
    for (const auto& centre : kept) {
        Color color = Color::from_unit(centre[0] / 255.0, centre[1] / 255.0, centre[2] / 255.0);
        // Identical centres collapse into one anchor
        if (colors.empty() || colors.back() != color) {
            colors.push_back(color);
        }
    }
    return colors;
}

} // namespace colourgen
