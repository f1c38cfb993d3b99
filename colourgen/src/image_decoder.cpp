#include <colourgen/image_decoder.hpp>
#include <colourgen/debug_log.hpp>
#include <colourgen/errors.hpp>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

#include <png.h>
#include <jpeglib.h>

namespace colourgen {

namespace {

void check_dimensions(uint64_t width, uint64_t height, std::size_t max_pixels, const char* format) {
    if (width == 0 || height == 0) {
        throw MalformedSourceError(std::string(format) + " image has no pixels");
    }
    if (width * height > max_pixels) {
        throw MalformedSourceError(std::string(format) + " image " + std::to_string(width) + "x" +
                                   std::to_string(height) + " exceeds the limit of " +
                                   std::to_string(max_pixels) + " pixels");
    }
}

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

// Replaces libjpeg's default handler, which would exit the process
void jpeg_error_exit(j_common_ptr cinfo) {
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

void jpeg_silent_output(j_common_ptr) {}

// Owns the decompressor; destroyed on every exit path
class JpegDecompressor {
public:
    jpeg_decompress_struct cinfo{};
    JpegErrorManager error{};

    JpegDecompressor() {
        cinfo.err = jpeg_std_error(&error.pub);
        error.pub.error_exit = jpeg_error_exit;
        error.pub.output_message = jpeg_silent_output;
        error.message[0] = '\0';
    }
    ~JpegDecompressor() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompressor(const JpegDecompressor&) = delete;
    JpegDecompressor& operator=(const JpegDecompressor&) = delete;

    [[noreturn]] void fail() const {
        throw MalformedSourceError(std::string("JPEG decode failed: ") + error.message);
    }
};

// The jpeg_* steps below each own a setjmp frame and return false after a
// libjpeg error. They keep no locals with destructors across the jump.

bool jpeg_open(JpegDecompressor& jpeg, const std::vector<uint8_t>& bytes) {
    if (setjmp(jpeg.error.jump)) {
        return false;
    }
    jpeg_create_decompress(&jpeg.cinfo);
    jpeg_mem_src(&jpeg.cinfo, const_cast<unsigned char*>(bytes.data()), static_cast<unsigned long>(bytes.size()));
    jpeg_read_header(&jpeg.cinfo, TRUE);
    jpeg.cinfo.out_color_space = jpeg.cinfo.jpeg_color_space == JCS_GRAYSCALE ? JCS_GRAYSCALE : JCS_RGB;
    return true;
}

bool jpeg_start(JpegDecompressor& jpeg) {
    if (setjmp(jpeg.error.jump)) {
        return false;
    }
    jpeg_start_decompress(&jpeg.cinfo);
    return true;
}

// rgba holds output_width * output_height * 4 bytes, row one scanline
bool jpeg_read_rgba(JpegDecompressor& jpeg, uint8_t* rgba, uint8_t* row) {
    if (setjmp(jpeg.error.jump)) {
        return false;
    }
    jpeg_decompress_struct& cinfo = jpeg.cinfo;
    while (cinfo.output_scanline < cinfo.output_height) {
        std::size_t y = cinfo.output_scanline;
        JSAMPROW rows[1] = {row};
        jpeg_read_scanlines(&cinfo, rows, 1);
        uint8_t* out = rgba + y * cinfo.output_width * 4;
        const int components = cinfo.output_components;
        for (uint32_t x = 0; x < cinfo.output_width; ++x) {
            const uint8_t* in = row + static_cast<std::size_t>(x) * components;
            out[x * 4 + 0] = in[0];
            out[x * 4 + 1] = components >= 3 ? in[1] : in[0];
            out[x * 4 + 2] = components >= 3 ? in[2] : in[0];
            out[x * 4 + 3] = 255;
        }
    }
    jpeg_finish_decompress(&cinfo);
    return true;
}

} // namespace

ImageFormat detect_image_format(const std::vector<uint8_t>& bytes) {
    static const uint8_t png_signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (bytes.size() >= 8 && std::memcmp(bytes.data(), png_signature, 8) == 0) {
        return ImageFormat::Png;
    }
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}

PixelImage LibImageDecoder::decode(const std::vector<uint8_t>& bytes) const {
    switch (detect_image_format(bytes)) {
        case ImageFormat::Png:
            return decode_png(bytes);
        case ImageFormat::Jpeg:
            return decode_jpeg(bytes);
        default:
            throw MalformedSourceError("Unsupported image format (expected PNG or JPEG)");
    }
}

PixelImage LibImageDecoder::decode_png(const std::vector<uint8_t>& bytes) const {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
        throw MalformedSourceError(std::string("PNG decode failed: ") + image.message);
    }
    try {
        check_dimensions(image.width, image.height, max_pixels_, "PNG");
    } catch (const MalformedSourceError&) {
        png_image_free(&image);
        throw;
    }

    image.format = PNG_FORMAT_RGBA;
    PixelImage result;
    result.width = image.width;
    result.height = image.height;
    result.rgba.resize(PNG_IMAGE_SIZE(image));

    if (!png_image_finish_read(&image, nullptr, result.rgba.data(), 0, nullptr)) {
        std::string message = image.message;
        png_image_free(&image);
        throw MalformedSourceError("PNG decode failed: " + message);
    }

    COLOURGEN_DEBUG_LOG("Decoded PNG %ux%u", result.width, result.height);
    return result;
}

PixelImage LibImageDecoder::decode_jpeg(const std::vector<uint8_t>& bytes) const {
    JpegDecompressor jpeg;
    if (!jpeg_open(jpeg, bytes)) {
        jpeg.fail();
    }
    check_dimensions(jpeg.cinfo.image_width, jpeg.cinfo.image_height, max_pixels_, "JPEG");
    if (!jpeg_start(jpeg)) {
        jpeg.fail();
    }
    check_dimensions(jpeg.cinfo.output_width, jpeg.cinfo.output_height, max_pixels_, "JPEG");

    PixelImage result;
    result.width = jpeg.cinfo.output_width;
    result.height = jpeg.cinfo.output_height;
    result.rgba.resize(result.pixel_count() * 4);
    std::vector<uint8_t> row(static_cast<std::size_t>(jpeg.cinfo.output_width) * jpeg.cinfo.output_components);
    if (!jpeg_read_rgba(jpeg, result.rgba.data(), row.data())) {
        jpeg.fail();
    }

    COLOURGEN_DEBUG_LOG("Decoded JPEG %ux%u", result.width, result.height);
    return result;
}

std::vector<uint8_t> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SourceUnavailableError("Failed to open file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw SourceUnavailableError("Failed to read file: " + path);
    }
    return bytes;
}

} // namespace colourgen
