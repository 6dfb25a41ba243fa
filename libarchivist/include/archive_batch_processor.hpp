//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file archive_batch_processor.hpp
 * @brief Indexes one archive (or one stand-alone image) end to end.
 *
 * The archive is opened once and its headers streamed; entries passing
 * EntryValidator are kept and sorted case-insensitively. Archives whose
 * image ratio is below the configured threshold are dropped without any
 * further work. The rest get entry records, one thumbnail, and an upsert.
 */

#ifndef ARCHIVIST_ARCHIVE_BATCH_PROCESSOR_HPP
#define ARCHIVIST_ARCHIVE_BATCH_PROCESSOR_HPP

#include "metadata_extractor.hpp"
#include "persistence_gateway.hpp"
#include "pipeline_config.hpp"
#include "records.hpp"
#include "thumbnail_cache.hpp"
#include "thread_pool.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace archivist {

    enum class ArchiveOutcome {
        Indexed,
        BelowRatio,
        TooManyEntries,
        Cancelled,
        Unreadable
    };

    struct ArchiveResult {
        ArchiveOutcome outcome = ArchiveOutcome::Unreadable;
        std::optional<ArchiveRecord> record; ///< Set only when outcome is Indexed
        bool upserted_new = false;           ///< The record's id was not stored before
    };

    /**
     * Entry metadata runs on a pool created per archive. An entry that
     * outlives `entry_timeout` keeps default metadata; its pool is handed
     * over to this object instead of being joined, so the archive finishes
     * on time. Destruction waits for those abandoned entries.
     */
    class ArchiveBatchProcessor {
    public:
        /**
         * @param thumbnails May be null; no thumbnails are produced then.
         */
        ArchiveBatchProcessor(const PipelineConfig& config,
                              IPersistenceGateway& gateway,
                              const MetadataExtractor& extractor,
                              ThumbnailCache* thumbnails);

        /**
         * @brief Scans, filters and persists one archive.
         *
         * @throws ArchiveOpenError if the container cannot be opened or its headers are corrupt.
         * @throws StorageError if the upsert fails.
         */
        ArchiveResult process_archive(const std::filesystem::path& path, std::stop_token stop);

        /**
         * @brief Metadata and thumbnail of a stand-alone image. Nothing is persisted here.
         * @return std::nullopt if the file is missing or outside the size bounds.
         */
        std::optional<ImageRecord> process_image_file(const std::filesystem::path& path);

        /**
         * @brief Entry workers for an archive of @p entry_count entries and @p archive_size bytes.
         * @return A value in [2, 16].
         */
        [[nodiscard]] static unsigned entry_concurrency(std::size_t entry_count, std::uintmax_t archive_size,
                                                        unsigned cpu_count);

    private:
        void read_dimensions(std::vector<ArchiveEntryRecord>& entries,
                             std::vector<std::vector<unsigned char>>& payloads,
                             std::uintmax_t archive_size,
                             const std::filesystem::path& archive_path);

        // keeps a pool whose timed-out tasks are still running; drops pools that went idle
        void retire_pool(std::unique_ptr<ThreadPool> pool);

        const PipelineConfig& config_;
        IPersistenceGateway& gateway_;
        const MetadataExtractor& extractor_;
        ThumbnailCache* thumbnails_;

        std::mutex retired_mtx_;
        std::vector<std::unique_ptr<ThreadPool>> retired_pools_;
    };

} // namespace archivist

#endif // ARCHIVIST_ARCHIVE_BATCH_PROCESSOR_HPP
