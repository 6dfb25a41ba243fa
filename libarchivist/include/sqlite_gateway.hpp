//
// Created by Giuseppe Francione on 07/12/25.
//

/**
 * @file sqlite_gateway.hpp
 * @brief SQLite implementation of IPersistenceGateway.
 *
 * The database runs in WAL mode with two connections: writes are
 * serialized through one connection under a mutex, reads use the other
 * so that planning queries do not wait behind a long insert batch.
 * Timestamps are stored as milliseconds since the Unix epoch.
 */

#ifndef ARCHIVIST_SQLITE_GATEWAY_HPP
#define ARCHIVIST_SQLITE_GATEWAY_HPP

#include "persistence_gateway.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>

struct sqlite3;

namespace archivist {

    class SqliteGateway final : public IPersistenceGateway {
    public:
        /**
         * @brief Opens (or creates) the database and its schema.
         * @throws StorageError if the file cannot be opened or the schema created.
         */
        explicit SqliteGateway(std::filesystem::path db_path);
        ~SqliteGateway() override;

        SqliteGateway(const SqliteGateway&) = delete;
        SqliteGateway& operator=(const SqliteGateway&) = delete;

        bool upsert_archive(const ArchiveRecord& record) override;
        std::size_t bulk_insert_images(const std::vector<ImageRecord>& records) override;

        /**
         * @copydoc IPersistenceGateway::stream_insert_images
         * @note On a storage failure the channel is closed before the
         * StorageError propagates, so blocked producers are released.
         */
        std::size_t stream_insert_images(BoundedChannel<ImageRecord>& channel) override;

        std::vector<std::string> image_directories() override;
        std::vector<std::string> archive_directories() override;
        std::optional<ScanHistoryRecord> last_scan_history(const std::filesystem::path& directory) override;
        void insert_scan_history(const ScanHistoryRecord& record) override;
        std::size_t cleanup_items_by_directory(const std::filesystem::path& directory,
                                               const std::vector<std::filesystem::path>& keep) override;
        bool exists_by_id(const std::string& id) override;

        std::vector<ScanHistoryRecord> scan_history(const std::filesystem::path& directory, int limit = 10) override;
        std::vector<std::string> scanned_directories() override;
        std::int64_t archive_count() override;
        std::int64_t image_count() override;
        std::vector<std::filesystem::path> indexed_sources_under(const std::filesystem::path& directory) override;
        std::vector<std::filesystem::path> all_indexed_sources() override;
        std::optional<ArchiveRecord> get_archive_by_path(const std::filesystem::path& path) override;
        void optimize() override;
        std::uintmax_t database_size() override;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        struct DbCloser {
            void operator()(sqlite3* db) const;
        };
        using unique_db = std::unique_ptr<sqlite3, DbCloser>;

        static unique_db open_connection(const std::filesystem::path& path, bool read_only);
        void create_schema();
        std::size_t insert_image_batch_locked(std::span<const ImageRecord> batch);
        std::vector<std::string> distinct_parents(const char* sql);

        std::filesystem::path path_;
        unique_db write_db_;
        unique_db read_db_;
        std::mutex write_mtx_;
        std::mutex read_mtx_;
    };

} // namespace archivist

#endif // ARCHIVIST_SQLITE_GATEWAY_HPP
