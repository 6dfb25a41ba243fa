//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/metadata_extractor.hpp"
#include "../../include/exif_reader.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_types.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using archivist::ImageMetadata;
using Bytes = std::span<const unsigned char>;

constexpr int kMaxFastDimension = 50000;

std::uint32_t be16(const Bytes b, const std::size_t off) {
    return static_cast<std::uint32_t>(b[off]) << 8 | b[off + 1];
}

std::uint32_t be32(const Bytes b, const std::size_t off) {
    return static_cast<std::uint32_t>(b[off]) << 24 | static_cast<std::uint32_t>(b[off + 1]) << 16 |
           static_cast<std::uint32_t>(b[off + 2]) << 8 | b[off + 3];
}

std::uint32_t le16(const Bytes b, const std::size_t off) {
    return static_cast<std::uint32_t>(b[off]) | static_cast<std::uint32_t>(b[off + 1]) << 8;
}

std::uint32_t le24(const Bytes b, const std::size_t off) {
    return le16(b, off) | static_cast<std::uint32_t>(b[off + 2]) << 16;
}

std::uint32_t le32(const Bytes b, const std::size_t off) {
    return le24(b, off) | static_cast<std::uint32_t>(b[off + 3]) << 24;
}

bool starts_with(const Bytes b, const char* sig, const std::size_t offset = 0) {
    const std::size_t n = std::strlen(sig);
    return b.size() >= offset + n && std::memcmp(b.data() + offset, sig, n) == 0;
}

std::optional<ImageMetadata> make_result(const std::int64_t width, const std::int64_t height, const char* format) {
    if (width <= 0 || height <= 0 || width > kMaxFastDimension || height > kMaxFastDimension) {
        return std::nullopt;
    }
    ImageMetadata m;
    m.width = static_cast<int>(width);
    m.height = static_cast<int>(height);
    m.format = format;
    return m;
}

// applies an EXIF date read from an APP1 segment to the result
void apply_exif(ImageMetadata& m, const Bytes tiff) {
    if (const auto date = archivist::read_exif_date(tiff)) {
        m.has_exif_data = true;
        m.date_taken = date->date_taken;
    }
}

std::optional<ImageMetadata> fast_jpeg(const Bytes b) {
    std::vector<unsigned char> exif;
    std::size_t pos = 2;
    while (pos + 4 <= b.size()) {
        if (b[pos] != 0xFF) { ++pos; continue; }
        const unsigned char marker = b[pos + 1];
        if (marker == 0xFF) { ++pos; continue; }
        // standalone markers carry no length
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) { pos += 2; continue; }
        if (marker == 0xDA || marker == 0xD9) break;

        const std::size_t length = be16(b, pos + 2);
        if (length < 2) break;

        if (marker == 0xC0 || marker == 0xC1 || marker == 0xC2) {
            if (pos + 9 > b.size()) break;
            auto result = make_result(be16(b, pos + 7), be16(b, pos + 5), "JPEG");
            if (result && !exif.empty()) apply_exif(*result, exif);
            return result;
        }

        if (marker == 0xE1 && exif.empty() && pos + 2 + length <= b.size() && starts_with(b, "Exif", pos + 4)) {
            // skip the "Exif\0\0" signature
            const std::size_t tiff = pos + 10;
            if (tiff < pos + 2 + length) exif.assign(b.begin() + static_cast<std::ptrdiff_t>(tiff),
                                                     b.begin() + static_cast<std::ptrdiff_t>(pos + 2 + length));
        }
        pos += 2 + length;
    }
    return std::nullopt;
}

std::optional<ImageMetadata> fast_png(const Bytes b) {
    static constexpr unsigned char kSig[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (b.size() < 24 || std::memcmp(b.data(), kSig, sizeof(kSig)) != 0) return std::nullopt;
    if (!starts_with(b, "IHDR", 12)) return std::nullopt;
    return make_result(be32(b, 16), be32(b, 20), "PNG");
}

std::optional<ImageMetadata> fast_gif(const Bytes b) {
    if (b.size() < 10) return std::nullopt;
    return make_result(le16(b, 6), le16(b, 8), "GIF");
}

std::optional<ImageMetadata> fast_bmp(const Bytes b) {
    if (b.size() < 26) return std::nullopt;
    const std::uint32_t dib = le32(b, 14);
    if (dib == 12) {
        return make_result(le16(b, 18), le16(b, 20), "BMP");
    }
    if (dib < 40) return std::nullopt;
    const auto width = static_cast<std::int32_t>(le32(b, 18));
    // negative height means top-down rows
    const auto height = static_cast<std::int32_t>(le32(b, 22));
    return make_result(width, height < 0 ? -static_cast<std::int64_t>(height) : height, "BMP");
}

std::optional<ImageMetadata> fast_webp(const Bytes b) {
    if (b.size() < 30 || !starts_with(b, "WEBP", 8)) return std::nullopt;
    if (starts_with(b, "VP8 ", 12)) {
        if (b[23] != 0x9D || b[24] != 0x01 || b[25] != 0x2A) return std::nullopt;
        return make_result(le16(b, 26) & 0x3FFF, le16(b, 28) & 0x3FFF, "WEBP");
    }
    if (starts_with(b, "VP8L", 12)) {
        if (b[20] != 0x2F) return std::nullopt;
        const std::uint32_t bits = le32(b, 21);
        return make_result((bits & 0x3FFF) + 1, ((bits >> 14) & 0x3FFF) + 1, "WEBP");
    }
    if (starts_with(b, "VP8X", 12)) {
        return make_result(le24(b, 24) + 1, le24(b, 27) + 1, "WEBP");
    }
    return std::nullopt;
}

} // namespace

namespace archivist {

std::optional<ImageMetadata> MetadataExtractor::read_header_fast(const std::span<const unsigned char> head) {
    const Bytes b = head.first(std::min(head.size(), kHeaderSize));
    if (b.size() >= 3 && b[0] == 0xFF && b[1] == 0xD8) return fast_jpeg(b);
    if (starts_with(b, "\x89PNG")) return fast_png(b);
    if (starts_with(b, "GIF87a") || starts_with(b, "GIF89a")) return fast_gif(b);
    if (starts_with(b, "BM")) return fast_bmp(b);
    if (starts_with(b, "RIFF")) return fast_webp(b);
    return std::nullopt;
}

ImageMetadata MetadataExtractor::defaults_for(const std::string_view file_name_hint) {
    ImageMetadata m;
    const std::string ext = lower_extension(file_name_hint);
    m.format = ext.empty() ? std::string{} : ext.substr(1);
    return m;
}

ImageMetadata MetadataExtractor::decode_full(const std::span<const unsigned char> data,
                                             const std::string_view file_name_hint) {
    if (data.size() < kMinDecodableSize) {
        throw std::invalid_argument("Too small to be a valid image (" + std::to_string(data.size()) + " bytes)");
    }

    const ImageFormat format = MimeDetector::detect_image_format(data, file_name_hint);
    DecodedImage decoded;
    switch (format) {
        case ImageFormat::Jpeg: decoded = decode_jpeg(data, 0, true); break;
        case ImageFormat::Png:  decoded = decode_png(data, true); break;
        case ImageFormat::Webp: decoded = decode_webp(data, true); break;
        default:
            throw std::runtime_error("No decoder for " + image_format_to_string(format));
    }

    if (decoded.width <= 0 || decoded.height <= 0 ||
        decoded.width > kMaxImageDimension || decoded.height > kMaxImageDimension) {
        throw std::invalid_argument("Invalid image dimensions");
    }

    ImageMetadata m;
    m.width = decoded.width;
    m.height = decoded.height;
    m.format = image_format_to_string(format);
    if (!decoded.exif.empty()) apply_exif(m, decoded.exif);
    return m;
}

ImageMetadata MetadataExtractor::extract(const std::span<const unsigned char> data,
                                         const std::string_view file_name_hint) const noexcept {
    try {
        if (data.empty()) throw std::invalid_argument("Empty stream");
        if (auto fast = read_header_fast(data)) return *fast;
        return decode_full(data, file_name_hint);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning,
                    "Failed to read image metadata from stream: " + std::string(file_name_hint) + ": " + e.what(),
                    "metadata");
    }
    return defaults_for(file_name_hint);
}

ImageMetadata MetadataExtractor::extract_file(const std::filesystem::path& path) const noexcept {
    try {
        const auto st = stat_file(path);
        if (!st) throw std::runtime_error("cannot stat file");
        if (st->size < kMinDecodableSize) throw std::invalid_argument("File too small to be a valid image");

        const std::string key = MetadataCache::make_key(path, st->size, st->modified_at);
        if (cache_) {
            if (auto hit = cache_->get(key)) return *hit;
        }

        const std::string name = path.filename().string();
        const std::vector<unsigned char> head = read_file_head(path, kHeaderSize);
        std::optional<ImageMetadata> result = read_header_fast(head);
        if (!result) {
            const std::vector<unsigned char> bytes = read_file_bytes(path);
            result = decode_full(bytes, name);
        }

        if (cache_) cache_->put(key, *result);
        return *result;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Failed to read image metadata: " + path.string() + ": " + e.what(), "metadata");
    }
    return defaults_for(path.filename().string());
}

} // namespace archivist
