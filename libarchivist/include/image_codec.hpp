//
// Created by Giuseppe Francione on 04/12/25.
//

/**
 * @file image_codec.hpp
 * @brief Thin decode / encode layer over libjpeg, libpng and libwebp.
 *
 * Decoders work on in-memory buffers, because archive entries never touch
 * the disk. Every decoder converts the library's error callback into a
 * std::runtime_error and rejects images larger than the configured pixel
 * limits before allocating the pixel buffer.
 */

#ifndef ARCHIVIST_IMAGE_CODEC_HPP
#define ARCHIVIST_IMAGE_CODEC_HPP

#include "media_types.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace archivist {

///< Largest accepted width or height of a decoded image.
inline constexpr int kMaxImageDimension = 50000;
///< Largest accepted pixel count of a decoded image (256 MP).
inline constexpr std::uint64_t kMaxImagePixels = 256ULL * 1024 * 1024;

/**
 * @brief 8-bit interleaved RGB pixels plus the raw EXIF block when present.
 */
struct DecodedImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgb;  ///< width * height * 3 bytes, may be empty for header-only reads
    std::vector<unsigned char> exif; ///< APP1 payload after the "Exif\0\0" signature (JPEG only)
};

/**
 * @brief Throws if the dimensions fall outside the accepted limits.
 */
void check_image_limits(std::uint64_t width, std::uint64_t height);

/**
 * @brief Decodes a JPEG buffer.
 *
 * @param data Compressed bytes.
 * @param min_dimension When > 0, libjpeg's DCT scaling is used to decode at
 * the smallest 1/1, 1/2, 1/4 or 1/8 scale that keeps both sides at least
 * this large.
 * @param header_only Only read the header (dimensions and EXIF), no pixels.
 * @throws std::runtime_error on any libjpeg error.
 */
DecodedImage decode_jpeg(std::span<const unsigned char> data, int min_dimension = 0, bool header_only = false);

/**
 * @brief Decodes a PNG buffer; alpha is composited over white.
 * @throws std::runtime_error on any libpng error.
 */
DecodedImage decode_png(std::span<const unsigned char> data, bool header_only = false);

/**
 * @brief Decodes a WebP buffer (first frame).
 * @throws std::runtime_error if the bitstream is invalid.
 */
DecodedImage decode_webp(std::span<const unsigned char> data, bool header_only = false);

/**
 * @brief Dispatches to the decoder for @p format.
 * @throws std::runtime_error for formats without a full decoder (BMP, GIF).
 */
DecodedImage decode_image(std::span<const unsigned char> data, ImageFormat format, int min_dimension = 0);

/**
 * @brief Box-filter downscale so that the longer side is at most @p max_dimension.
 *
 * Images already small enough are returned unchanged (no upscaling).
 */
DecodedImage scale_to_fit(DecodedImage image, int max_dimension);

/**
 * @brief Writes RGB pixels as a baseline JPEG file.
 * @throws std::runtime_error if the file cannot be written.
 */
void write_jpeg(const DecodedImage& image, const std::filesystem::path& output, int quality);

} // namespace archivist

#endif // ARCHIVIST_IMAGE_CODEC_HPP
