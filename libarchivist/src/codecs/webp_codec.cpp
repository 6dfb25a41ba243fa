//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <cstring>
#include <stdexcept>

namespace archivist {

DecodedImage decode_webp(const std::span<const unsigned char> data, const bool header_only) {
    // inspect bitstream features
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        Logger::log(LogLevel::Warning, "WebP feature detection failed", "webp_codec");
        throw std::runtime_error("WebP feature detection failed");
    }
    if (features.width <= 0 || features.height <= 0) {
        throw std::runtime_error("WebP reports empty canvas");
    }
    check_image_limits(static_cast<std::uint64_t>(features.width), static_cast<std::uint64_t>(features.height));

    DecodedImage out;
    out.width = features.width;
    out.height = features.height;
    if (header_only) return out;

    // first frame of an animation needs libwebpdemux, not linked
    if (features.has_animation) {
        throw std::runtime_error("Animated WebP is not decoded");
    }

    int width = 0, height = 0;
    uint8_t* decoded = WebPDecodeRGB(data.data(), data.size(), &width, &height);
    if (!decoded) {
        Logger::log(LogLevel::Warning, "WebP decode failed (RGB)", "webp_codec");
        throw std::runtime_error("WebP decode failed");
    }

    out.width = width;
    out.height = height;
    out.rgb.resize(static_cast<std::size_t>(width) * height * 3);
    std::memcpy(out.rgb.data(), decoded, out.rgb.size());
    WebPFree(decoded);
    return out;
}

} // namespace archivist
