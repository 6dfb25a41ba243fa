//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/image_codec.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace archivist {

void check_image_limits(const std::uint64_t width, const std::uint64_t height) {
    if (width == 0 || height == 0) {
        throw std::runtime_error("Image has an empty dimension");
    }
    if (width > kMaxImageDimension || height > kMaxImageDimension || width * height > kMaxImagePixels) {
        throw std::runtime_error("Image too large: " + std::to_string(width) + "x" + std::to_string(height));
    }
}

DecodedImage decode_image(const std::span<const unsigned char> data, const ImageFormat format, const int min_dimension) {
    switch (format) {
        case ImageFormat::Jpeg: return decode_jpeg(data, min_dimension);
        case ImageFormat::Png:  return decode_png(data);
        case ImageFormat::Webp: return decode_webp(data);
        case ImageFormat::Bmp:
        case ImageFormat::Gif:
        case ImageFormat::Unknown:
            break;
    }
    throw std::runtime_error("No decoder for " + image_format_to_string(format));
}

DecodedImage scale_to_fit(DecodedImage image, const int max_dimension) {
    if (max_dimension <= 0) return image;
    const int longest = std::max(image.width, image.height);
    if (longest <= max_dimension) return image;

    const double ratio = static_cast<double>(max_dimension) / longest;
    const int dst_w = std::max(1, static_cast<int>(image.width * ratio + 0.5));
    const int dst_h = std::max(1, static_cast<int>(image.height * ratio + 0.5));

    DecodedImage out;
    out.width = dst_w;
    out.height = dst_h;
    out.exif = std::move(image.exif);
    out.rgb.resize(static_cast<std::size_t>(dst_w) * dst_h * 3);

    const std::size_t src_stride = static_cast<std::size_t>(image.width) * 3;

    // box filter: every destination pixel averages its source rectangle
    for (int dy = 0; dy < dst_h; ++dy) {
        const int sy0 = static_cast<int>(static_cast<long long>(dy) * image.height / dst_h);
        const int sy1 = std::max(sy0 + 1, static_cast<int>(static_cast<long long>(dy + 1) * image.height / dst_h));
        for (int dx = 0; dx < dst_w; ++dx) {
            const int sx0 = static_cast<int>(static_cast<long long>(dx) * image.width / dst_w);
            const int sx1 = std::max(sx0 + 1, static_cast<int>(static_cast<long long>(dx + 1) * image.width / dst_w));

            unsigned long long sum[3] = {0, 0, 0};
            for (int sy = sy0; sy < sy1; ++sy) {
                const unsigned char* row = image.rgb.data() + sy * src_stride;
                for (int sx = sx0; sx < sx1; ++sx) {
                    sum[0] += row[sx * 3];
                    sum[1] += row[sx * 3 + 1];
                    sum[2] += row[sx * 3 + 2];
                }
            }
            const unsigned long long count = static_cast<unsigned long long>(sy1 - sy0) * (sx1 - sx0);
            unsigned char* dst = out.rgb.data() + (static_cast<std::size_t>(dy) * dst_w + dx) * 3;
            for (int c = 0; c < 3; ++c) {
                dst[c] = static_cast<unsigned char>((sum[c] + count / 2) / count);
            }
        }
    }
    return out;
}

} // namespace archivist
