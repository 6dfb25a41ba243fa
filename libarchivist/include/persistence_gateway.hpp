//
// Created by Giuseppe Francione on 07/12/25.
//

/**
 * @file persistence_gateway.hpp
 * @brief Storage seam of the scan pipeline.
 *
 * The pipeline only talks to this interface. SqliteGateway is the shipped
 * implementation; tests may substitute their own.
 */

#ifndef ARCHIVIST_PERSISTENCE_GATEWAY_HPP
#define ARCHIVIST_PERSISTENCE_GATEWAY_HPP

#include "bounded_channel.hpp"
#include "records.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace archivist {

    /**
     * @brief A storage operation failed (open, statement, transaction).
     */
    class StorageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class IPersistenceGateway {
    public:
        ///< Images committed per transaction by bulk_insert_images().
        static constexpr std::size_t kBulkBatchSize = 250;
        ///< Images committed per transaction by stream_insert_images().
        static constexpr std::size_t kStreamBatchSize = 50;

        virtual ~IPersistenceGateway() = default;

        /**
         * @brief Inserts or replaces an archive and its entries.
         * @return true if the id was not stored before.
         */
        virtual bool upsert_archive(const ArchiveRecord& record) = 0;

        /**
         * @brief Inserts images whose id is not stored yet, in batches of 250.
         * @return Number of rows inserted (duplicates are skipped).
         */
        virtual std::size_t bulk_insert_images(const std::vector<ImageRecord>& records) = 0;

        /**
         * @brief Consumes @p channel until it is closed and drained, committing batches of 50.
         * @return Number of rows inserted.
         */
        virtual std::size_t stream_insert_images(BoundedChannel<ImageRecord>& channel) = 0;

        /**
         * @brief Distinct parent directories of stored stand-alone images.
         */
        virtual std::vector<std::string> image_directories() = 0;

        /**
         * @brief Distinct parent directories of stored archives.
         */
        virtual std::vector<std::string> archive_directories() = 0;

        virtual std::optional<ScanHistoryRecord> last_scan_history(const std::filesystem::path& directory) = 0;
        virtual void insert_scan_history(const ScanHistoryRecord& record) = 0;

        /**
         * @brief Deletes every image and archive stored at or below @p directory,
         * except those at or below one of the @p keep roots. Paths match ignoring case.
         * @return Number of records deleted.
         */
        virtual std::size_t cleanup_items_by_directory(const std::filesystem::path& directory,
                                                       const std::vector<std::filesystem::path>& keep) = 0;

        /**
         * @brief True if an image or archive with this id is stored.
         */
        virtual bool exists_by_id(const std::string& id) = 0;

        // maintenance and reporting

        /**
         * @brief Latest @p limit scans of @p directory, newest first.
         */
        virtual std::vector<ScanHistoryRecord> scan_history(const std::filesystem::path& directory, int limit = 10) = 0;
        virtual std::vector<std::string> scanned_directories() = 0;
        virtual std::int64_t archive_count() = 0;
        virtual std::int64_t image_count() = 0;

        /**
         * @brief Paths of every stored archive and image at or below @p directory, ignoring case.
         */
        virtual std::vector<std::filesystem::path> indexed_sources_under(const std::filesystem::path& directory) = 0;
        virtual std::vector<std::filesystem::path> all_indexed_sources() = 0;
        virtual std::optional<ArchiveRecord> get_archive_by_path(const std::filesystem::path& path) = 0;

        /**
         * @brief VACUUM and ANALYZE.
         */
        virtual void optimize() = 0;
        virtual std::uintmax_t database_size() = 0;
    };

} // namespace archivist

#endif // ARCHIVIST_PERSISTENCE_GATEWAY_HPP
