//
// Created by Giuseppe Francione on 05/12/25.
//

/**
 * @file metadata_extractor.hpp
 * @brief Dimensions, format and capture date of an image buffer or file.
 *
 * Extraction first parses the container header found in the first 8 KB
 * (no pixel decoding), then falls back to the real decoders. Failures
 * never escape: the caller always receives a usable record.
 */

#ifndef ARCHIVIST_METADATA_EXTRACTOR_HPP
#define ARCHIVIST_METADATA_EXTRACTOR_HPP

#include "metadata_cache.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace archivist {

    class MetadataExtractor {
    public:
        ///< Bytes examined by the header fast path.
        static constexpr std::size_t kHeaderSize = 8192;
        ///< Buffers shorter than this are not handed to a decoder.
        static constexpr std::size_t kMinDecodableSize = 100;

        /**
         * @param cache Optional cache consulted by extract_file(); not owned.
         */
        explicit MetadataExtractor(MetadataCache* cache = nullptr) : cache_(cache) {}

        virtual ~MetadataExtractor() = default;

        /**
         * @brief Extract metadata from a complete in-memory image.
         * @param data The image bytes (the fast path only looks at the head).
         * @param file_name_hint Name used for the format fallback and in logs.
         */
        [[nodiscard]] virtual ImageMetadata extract(std::span<const unsigned char> data,
                                                    std::string_view file_name_hint) const noexcept;

        /**
         * @brief Extract metadata from a file, consulting the cache first.
         *
         * The header is read first; the whole file is loaded only when the
         * fast path fails.
         */
        [[nodiscard]] ImageMetadata extract_file(const std::filesystem::path& path) const noexcept;

        /**
         * @brief Header-only parse (JPEG SOF0/1/2, PNG IHDR, GIF, BMP, WebP).
         * @return std::nullopt if the signature is unknown or the header is
         * truncated or carries out-of-range dimensions.
         */
        [[nodiscard]] static std::optional<ImageMetadata> read_header_fast(std::span<const unsigned char> head);

        /**
         * @brief Record used when nothing could be parsed.
         */
        [[nodiscard]] static ImageMetadata defaults_for(std::string_view file_name_hint);

    private:
        [[nodiscard]] static ImageMetadata decode_full(std::span<const unsigned char> data,
                                                       std::string_view file_name_hint);

        MetadataCache* cache_;
    };

} // namespace archivist

#endif // ARCHIVIST_METADATA_EXTRACTOR_HPP
