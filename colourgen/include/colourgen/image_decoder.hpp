#ifndef COLOURGEN_IMAGE_DECODER_HPP
#define COLOURGEN_IMAGE_DECODER_HPP

#include <colourgen/config.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace colourgen {

enum class ImageFormat {
    Unknown,
    Png,
    Jpeg
};

// Sniffs the format from the leading magic bytes
ImageFormat detect_image_format(const std::vector<uint8_t>& bytes);

/**
 * Decoded image: 8-bit RGBA, row-major, no padding.
 */
struct PixelImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;

    std::size_t pixel_count() const { return static_cast<std::size_t>(width) * height; }
};

/**
 * Decodes encoded image bytes. Throws MalformedSourceError for corrupt or
 * unsupported data.
 */
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual PixelImage decode(const std::vector<uint8_t>& bytes) const = 0;
};

/**
 * PNG through libpng, JPEG through libjpeg. Header dimensions above
 * max_pixels are rejected with MalformedSourceError before decoding.
 */
class LibImageDecoder : public ImageDecoder {
private:
    std::size_t max_pixels_;

public:
    explicit LibImageDecoder(std::size_t max_pixels = DEFAULT_MAX_IMAGE_PIXELS)
        : max_pixels_(max_pixels) {}

    PixelImage decode(const std::vector<uint8_t>& bytes) const override;

    PixelImage decode_png(const std::vector<uint8_t>& bytes) const;
    PixelImage decode_jpeg(const std::vector<uint8_t>& bytes) const;

    std::size_t max_pixels() const { return max_pixels_; }
};

/**
 * Reads a whole file. Throws SourceUnavailableError if it cannot be opened.
 */
std::vector<uint8_t> read_file_bytes(const std::string& path);

} // namespace colourgen

#endif // COLOURGEN_IMAGE_DECODER_HPP
