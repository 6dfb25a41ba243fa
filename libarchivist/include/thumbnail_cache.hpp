//
// Created by Giuseppe Francione on 06/12/25.
//

/**
 * @file thumbnail_cache.hpp
 * @brief Deterministic on-disk JPEG thumbnail cache.
 *
 * Layout: `<root>/size_<N>/<hash>_<N>[_archive].jpg`, where `hash` is the
 * first 16 hex digits of MD5(lower-cased source path). A thumbnail is
 * valid while its mtime is not older than the source's mtime.
 *
 * Concurrent requests for the same (source, size, kind) share a single
 * generation; a counting semaphore bounds how many generations decode at
 * once across all keys.
 */

#ifndef ARCHIVIST_THUMBNAIL_CACHE_HPP
#define ARCHIVIST_THUMBNAIL_CACHE_HPP

#include "image_codec.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <unordered_map>
#include <vector>

namespace archivist {

    class ThumbnailCache {
    public:
        static constexpr unsigned kDefaultGenerationLimit = 4;
        static constexpr int kJpegQuality = 95;
        ///< Decoded thumbnails are at least this large, whatever the requested size.
        static constexpr int kMinBaseSize = 512;
        ///< Sorted archive entries tried before giving up.
        static constexpr std::size_t kMaxArchiveAttempts = 5;

        /**
         * @param root Cache directory (created on demand).
         * @param generation_limit Concurrent generations allowed (1..64).
         */
        explicit ThumbnailCache(std::filesystem::path root, unsigned generation_limit = kDefaultGenerationLimit);

        ThumbnailCache(const ThumbnailCache&) = delete;
        ThumbnailCache& operator=(const ThumbnailCache&) = delete;

        /**
         * @brief Returns a valid thumbnail for @p source, generating it if needed.
         *
         * For an archive, the first decodable image among the five
         * case-insensitively smallest qualifying entries is used.
         *
         * @return The thumbnail path, or std::nullopt when nothing could be decoded.
         */
        std::optional<std::filesystem::path> get_or_create(const std::filesystem::path& source, int size, bool is_archive);

        /**
         * @brief Where the thumbnail of @p source lives (no I/O).
         */
        [[nodiscard]] std::filesystem::path thumbnail_path(const std::filesystem::path& source, int size, bool is_archive) const;

        /**
         * @brief True if the thumbnail exists and is not older than its source.
         */
        [[nodiscard]] bool exists(const std::filesystem::path& source, int size, bool is_archive) const;

        /**
         * @brief Deletes the whole cache directory and recreates it empty.
         * @return false if the directory could not be removed.
         */
        bool clear();

        [[nodiscard]] std::uintmax_t cache_size_bytes() const;

        /**
         * @brief Removes thumbnails last written more than @p days ago.
         * @return Number of files removed.
         */
        std::size_t cleanup_older_than(int days = 30);

        /**
         * @brief Removes every thumbnail of @p source, in every size directory and for both kinds.
         */
        std::size_t remove_for_source(const std::filesystem::path& source);

        /**
         * @brief Removes thumbnails whose source is not in @p live_sources, plus leftover temp files.
         */
        std::size_t cleanup_orphans(const std::vector<std::filesystem::path>& live_sources);

        /**
         * @brief Number of thumbnails actually generated by this instance.
         */
        [[nodiscard]] std::uint64_t generation_count() const noexcept { return generations_.load(); }

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

        /**
         * @brief First 16 hex digits of MD5 of the lower-cased path.
         */
        static std::string source_hash(const std::filesystem::path& source);

    private:
        using Result = std::optional<std::filesystem::path>;

        Result generate_limited(const std::filesystem::path& source, const std::filesystem::path& target,
                                int size, bool is_archive);
        Result generate(const std::filesystem::path& source, const std::filesystem::path& target,
                        int size, bool is_archive);
        static std::optional<DecodedImage> decode_standalone(const std::filesystem::path& source, int base_size);
        static std::optional<DecodedImage> decode_from_archive(const std::filesystem::path& source, int base_size);
        static bool is_fresh(const std::filesystem::path& target, const std::filesystem::path& source);

        std::filesystem::path root_;
        std::counting_semaphore<64> generation_slots_;
        std::mutex inflight_mtx_;
        std::unordered_map<std::string, std::shared_future<Result>> inflight_;
        std::atomic<std::uint64_t> generations_{0};
    };

} // namespace archivist

#endif // ARCHIVIST_THUMBNAIL_CACHE_HPP
