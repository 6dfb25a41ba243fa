//
// Created by Giuseppe Francione on 05/12/25.
//

/**
 * @file metadata_cache.hpp
 * @brief Bounded, thread-safe map from (path, size, mtime) to image metadata.
 */

#ifndef ARCHIVIST_METADATA_CACHE_HPP
#define ARCHIVIST_METADATA_CACHE_HPP

#include "file_utils.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace archivist {

    /**
     * @brief Result of a metadata extraction.
     *
     * A width or height of 0 means "unknown". @ref format is the decoder's
     * name ("JPEG", "PNG", ...) when the image was parsed, otherwise the
     * lower-case extension without the dot.
     */
    struct ImageMetadata {
        int width = 0;
        int height = 0;
        std::string format;
        bool has_exif_data = false;
        std::optional<Timestamp> date_taken;
    };

    class MetadataCache {
    public:
        static constexpr std::size_t kDefaultCapacity = 1000;
        ///< Extra entries dropped on each eviction so the next inserts do not evict again.
        static constexpr std::size_t kEvictionSlack = 100;

        explicit MetadataCache(std::size_t capacity = kDefaultCapacity);

        /**
         * @brief Looks up a key and refreshes its last-access time on a hit.
         */
        [[nodiscard]] std::optional<ImageMetadata> get(const std::string& key);

        /**
         * @brief Inserts or replaces an entry.
         *
         * When the map is at capacity, the `size - capacity + 100` least
         * recently accessed entries are evicted first.
         */
        void put(const std::string& key, ImageMetadata metadata);

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
        void clear();

        /**
         * @brief Cache key "path|size|yyyyMMddHHmmss" (mtime in local time).
         */
        static std::string make_key(const std::filesystem::path& path, std::uintmax_t size, Timestamp modified_at);

    private:
        struct Entry {
            ImageMetadata metadata;
            std::chrono::steady_clock::time_point last_access;
        };

        void evict_locked();

        const std::size_t capacity_;
        mutable std::mutex mtx_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace archivist

#endif // ARCHIVIST_METADATA_CACHE_HPP
