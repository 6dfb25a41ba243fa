//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring> // IDE may say it's unused, but it's lying to you
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

/**
 * @brief libpng warning handler.
 * @param msg The warning message from libpng.
 */
void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 * Ensures png_destroy_read_struct is called even if exceptions occur.
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngRead() = default;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

// cursor over the in-memory PNG
struct MemoryReader {
    const unsigned char* data;
    std::size_t size;
    std::size_t offset;
};

void png_read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
    auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (reader->offset + length > reader->size) {
        png_error(png, "Read past end of PNG data");
    }
    std::memcpy(out, reader->data + reader->offset, length);
    reader->offset += length;
}

/**
 * @brief Composites RGBA8 rows over white into an RGB8 buffer.
 */
std::vector<unsigned char> flatten_rgba(const std::vector<unsigned char>& rgba,
                                        const png_uint_32 width, const png_uint_32 height) {
    std::vector<unsigned char> rgb(static_cast<std::size_t>(width) * height * 3);
    const unsigned char* src = rgba.data();
    unsigned char* dst = rgb.data();
    for (std::size_t i = 0, n = static_cast<std::size_t>(width) * height; i < n; ++i) {
        const unsigned a = src[3];
        for (int c = 0; c < 3; ++c) {
            dst[c] = static_cast<unsigned char>((src[c] * a + 255 * (255 - a) + 127) / 255);
        }
        src += 4;
        dst += 3;
    }
    return rgb;
}

} // namespace

namespace archivist {

DecodedImage decode_png(const std::span<const unsigned char> data, const bool header_only) {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        throw std::runtime_error("Not a PNG signature");
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
    if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error");

    MemoryReader reader{data.data(), data.size(), 0};
    png_set_read_fn(rd.png, &reader, png_read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
    check_image_limits(width, height);

    DecodedImage out;
    out.width = static_cast<int>(width);
    out.height = static_cast<int>(height);
    if (header_only) return out;

    // normalize every color type to rgba8
    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);

    png_read_update_info(rd.png, rd.info);

    const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    if (rowbytes != static_cast<std::size_t>(width) * 4) {
        throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
    }

    std::vector<unsigned char> rgba(rowbytes * height);
    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = rgba.data() + y * rowbytes;
    }

    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, nullptr);

    out.rgb = flatten_rgba(rgba, width, height);
    return out;
}

} // namespace archivist
