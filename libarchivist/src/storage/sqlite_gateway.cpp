//
// Created by Giuseppe Francione on 07/12/25.
//

#include "../../include/sqlite_gateway.hpp"
#include "../../include/hash_utils.hpp"
#include "../../include/logger.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace archivist {

namespace {

const char* gateway_tag() {
    return "sqlite_gateway";
}

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "no connection");
    Logger::log(LogLevel::Error, msg, gateway_tag());
    throw StorageError(msg);
}

void exec(sqlite3* db, const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        const std::string msg = std::string("sqlite3_exec failed (") + sql + "): " + (err_msg ? err_msg : "?");
        sqlite3_free(err_msg);
        Logger::log(LogLevel::Error, msg, gateway_tag());
        throw StorageError(msg);
    }
}

std::int64_t to_millis(const Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_millis(const std::int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief RAII prepared statement with 1-based binds and 0-based columns.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            fail(db, std::string("prepare failed (") + sql + ")");
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(const int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind(const int idx, const std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
        return *this;
    }
    Statement& bind(const int idx, const int value) {
        check(sqlite3_bind_int(stmt_, idx, value));
        return *this;
    }
    Statement& bind(const int idx, const double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
        return *this;
    }
    Statement& bind(const int idx, const bool value) {
        return bind(idx, value ? 1 : 0);
    }
    Statement& bind(const int idx, const Timestamp value) {
        return bind(idx, to_millis(value));
    }
    template <typename T>
    Statement& bind(const int idx, const std::optional<T>& value) {
        if (value) return bind(idx, *value);
        check(sqlite3_bind_null(stmt_, idx));
        return *this;
    }

    /**
     * @return true while a row is available, false when done.
     */
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step failed");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] std::string text(const int col) const {
        const auto* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    [[nodiscard]] std::optional<std::string> optional_text(const int col) const {
        if (is_null(col)) return std::nullopt;
        return text(col);
    }
    [[nodiscard]] std::int64_t int64(const int col) const { return sqlite3_column_int64(stmt_, col); }
    [[nodiscard]] int integer(const int col) const { return sqlite3_column_int(stmt_, col); }
    [[nodiscard]] double real(const int col) const { return sqlite3_column_double(stmt_, col); }
    [[nodiscard]] bool is_null(const int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

private:
    void check(const int rc) const {
        if (rc != SQLITE_OK) fail(db_, "bind failed");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (committed_) return;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            Logger::log(LogLevel::Error, std::string("ROLLBACK failed: ") + sqlite3_errmsg(db_), gateway_tag());
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

// "dir" and "dir/", lower-cased, as bound parameters for "at or below dir" matching
std::pair<std::string, std::string> directory_bounds(const fs::path& directory) {
    std::string dir = normalize_path(directory).string();
    // ASCII only, the same folding as SQLite's lower()
    for (auto& c : dir) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    std::string prefix = dir;
    if (prefix.empty() || prefix.back() != static_cast<char>(fs::path::preferred_separator)) {
        prefix += static_cast<char>(fs::path::preferred_separator);
    }
    return {dir, prefix};
}

// file_path at or below the directory bound to ?first and ?first+1, ignoring case
std::string under_clause(const int first) {
    const std::string dir = "?" + std::to_string(first);
    const std::string prefix = "?" + std::to_string(first + 1);
    return "(lower(file_path) = " + dir + " OR substr(lower(file_path), 1, length(" + prefix + ")) = " + prefix + ")";
}

// rows at or below ?1/?2 and outside each kept root bound from ?3 on
std::string purge_scope(const std::size_t keep_count) {
    std::string sql = under_clause(1);
    for (std::size_t i = 0; i < keep_count; ++i) {
        sql += " AND NOT " + under_clause(3 + 2 * static_cast<int>(i));
    }
    return sql;
}

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS archives (
    id             TEXT PRIMARY KEY,
    file_path      TEXT NOT NULL,
    file_name      TEXT NOT NULL,
    file_size      INTEGER NOT NULL,
    created_at     INTEGER NOT NULL,
    modified_at    INTEGER NOT NULL,
    scan_date      INTEGER NOT NULL,
    archive_type   TEXT NOT NULL,
    total_files    INTEGER NOT NULL,
    image_files    INTEGER NOT NULL,
    image_ratio    REAL NOT NULL,
    thumbnail_path TEXT,
    is_deleted     INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_archives_path ON archives(file_path);

CREATE TABLE IF NOT EXISTS archive_entries (
    archive_id    TEXT NOT NULL REFERENCES archives(id) ON DELETE CASCADE,
    position      INTEGER NOT NULL,
    internal_path TEXT NOT NULL,
    file_name     TEXT NOT NULL,
    file_size     INTEGER NOT NULL,
    width         INTEGER NOT NULL,
    height        INTEGER NOT NULL,
    format        TEXT NOT NULL,
    thumbnail_path TEXT,
    image_ratio   REAL NOT NULL DEFAULT 0,
    PRIMARY KEY (archive_id, position)
);

CREATE TABLE IF NOT EXISTS images (
    id                  TEXT PRIMARY KEY,
    file_path           TEXT NOT NULL,
    file_name           TEXT NOT NULL,
    file_size           INTEGER NOT NULL,
    width               INTEGER NOT NULL,
    height              INTEGER NOT NULL,
    thumbnail_path      TEXT,
    created_at          INTEGER NOT NULL,
    modified_at         INTEGER NOT NULL,
    scan_date           INTEGER NOT NULL,
    is_deleted          INTEGER NOT NULL DEFAULT 0,
    is_archived         INTEGER NOT NULL DEFAULT 0,
    archive_path        TEXT,
    internal_path       TEXT,
    archive_image_ratio REAL,
    image_format        TEXT NOT NULL,
    has_exif_data       INTEGER NOT NULL DEFAULT 0,
    date_taken          INTEGER
);
CREATE INDEX IF NOT EXISTS idx_images_path ON images(file_path);

CREATE TABLE IF NOT EXISTS scan_history (
    id              TEXT PRIMARY KEY,
    directory_path  TEXT NOT NULL,
    scan_date       INTEGER NOT NULL,
    file_count      INTEGER NOT NULL,
    processed_count INTEGER NOT NULL,
    elapsed_ms      INTEGER NOT NULL,
    scan_type       TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_scan_history_dir ON scan_history(directory_path, scan_date DESC);
)SQL";

constexpr const char* kHistoryColumns =
    "SELECT id, directory_path, scan_date, file_count, processed_count, elapsed_ms, scan_type FROM scan_history ";

ScanHistoryRecord read_history(const Statement& st) {
    ScanHistoryRecord r;
    r.id = st.text(0);
    r.directory_path = st.text(1);
    r.scan_date = from_millis(st.int64(2));
    r.file_count = st.integer(3);
    r.processed_count = st.integer(4);
    r.elapsed_ms = st.int64(5);
    r.scan_type = scan_type_from_string(st.text(6));
    return r;
}

} // namespace

void SqliteGateway::DbCloser::operator()(sqlite3* db) const {
    if (db && sqlite3_close(db) != SQLITE_OK) {
        Logger::log(LogLevel::Warning, std::string("sqlite3_close: ") + sqlite3_errmsg(db), gateway_tag());
    }
}

SqliteGateway::unique_db SqliteGateway::open_connection(const fs::path& path, const bool read_only) {
    sqlite3* raw = nullptr;
    const int flags = (read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) |
                      SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw, flags, nullptr);
    unique_db db(raw);
    if (rc != SQLITE_OK) {
        fail(raw, "Cannot open database " + path.string());
    }
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

SqliteGateway::SqliteGateway(fs::path db_path) : path_(std::move(db_path)) {
    std::error_code ec;
    if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

    write_db_ = open_connection(path_, false);
    exec(write_db_.get(), "PRAGMA journal_mode=WAL;");
    exec(write_db_.get(), "PRAGMA synchronous=NORMAL;");
    exec(write_db_.get(), "PRAGMA foreign_keys=ON;");
    create_schema();

    read_db_ = open_connection(path_, true);
    Logger::log(LogLevel::Info, "Database opened: " + path_.string(), gateway_tag());
}

SqliteGateway::~SqliteGateway() = default;

void SqliteGateway::create_schema() {
    std::lock_guard lock(write_mtx_);
    exec(write_db_.get(), kSchema);
}

bool SqliteGateway::upsert_archive(const ArchiveRecord& record) {
    const std::string id = record.id.empty() ? file_id(record.file_path) : record.id;

    std::lock_guard lock(write_mtx_);
    sqlite3* db = write_db_.get();
    Transaction tx(db);

    Statement exists(db, "SELECT 1 FROM archives WHERE id = ?1;");
    exists.bind(1, id);
    const bool existed = exists.step();

    Statement upsert(db,
        "INSERT OR REPLACE INTO archives (id, file_path, file_name, file_size, created_at, modified_at, scan_date, "
        "archive_type, total_files, image_files, image_ratio, thumbnail_path, is_deleted) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13);");
    upsert.bind(1, id)
          .bind(2, record.file_path)
          .bind(3, record.file_name)
          .bind(4, record.file_size)
          .bind(5, record.created_at)
          .bind(6, record.modified_at)
          .bind(7, record.scan_date)
          .bind(8, record.archive_type)
          .bind(9, record.total_files)
          .bind(10, record.image_files)
          .bind(11, record.image_ratio)
          .bind(12, record.thumbnail_path)
          .bind(13, record.is_deleted);
    upsert.step();

    Statement clear(db, "DELETE FROM archive_entries WHERE archive_id = ?1;");
    clear.bind(1, id);
    clear.step();

    Statement entry(db,
        "INSERT INTO archive_entries (archive_id, position, internal_path, file_name, file_size, width, height, format, "
        "thumbnail_path, image_ratio) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10);");
    int position = 0;
    for (const auto& e : record.entries) {
        entry.bind(1, id)
             .bind(2, position++)
             .bind(3, e.internal_path)
             .bind(4, e.file_name)
             .bind(5, e.file_size)
             .bind(6, e.width)
             .bind(7, e.height)
             .bind(8, e.format)
             .bind(9, e.thumbnail_path)
             .bind(10, e.image_ratio);
        entry.step();
        entry.reset();
    }

    tx.commit();
    Logger::log(LogLevel::Debug, "Upserted archive: " + record.file_path, gateway_tag());
    return !existed;
}

std::size_t SqliteGateway::insert_image_batch_locked(const std::span<const ImageRecord> batch) {
    sqlite3* db = write_db_.get();
    Transaction tx(db);
    Statement insert(db,
        "INSERT OR IGNORE INTO images (id, file_path, file_name, file_size, width, height, thumbnail_path, "
        "created_at, modified_at, scan_date, is_deleted, is_archived, archive_path, internal_path, "
        "archive_image_ratio, image_format, has_exif_data, date_taken) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18);");

    std::size_t inserted = 0;
    for (const auto& r : batch) {
        std::string id = r.id;
        if (id.empty()) {
            id = r.internal_path && r.archive_path ? entry_id(*r.archive_path, *r.internal_path) : file_id(r.file_path);
        }
        insert.bind(1, id)
              .bind(2, r.file_path)
              .bind(3, r.file_name)
              .bind(4, r.file_size)
              .bind(5, r.width)
              .bind(6, r.height)
              .bind(7, r.thumbnail_path)
              .bind(8, r.created_at)
              .bind(9, r.modified_at)
              .bind(10, r.scan_date)
              .bind(11, r.is_deleted)
              .bind(12, r.is_archived)
              .bind(13, r.archive_path)
              .bind(14, r.internal_path)
              .bind(15, r.archive_image_ratio)
              .bind(16, r.image_format)
              .bind(17, r.has_exif_data)
              .bind(18, r.date_taken);
        insert.step();
        // INSERT OR IGNORE reports 0 changes for an existing id
        inserted += static_cast<std::size_t>(sqlite3_changes(db));
        insert.reset();
    }
    tx.commit();
    return inserted;
}

std::size_t SqliteGateway::bulk_insert_images(const std::vector<ImageRecord>& records) {
    const auto start = std::chrono::steady_clock::now();
    std::size_t inserted = 0;
    const std::span<const ImageRecord> all(records);

    std::lock_guard lock(write_mtx_);
    for (std::size_t offset = 0; offset < all.size(); offset += kBulkBatchSize) {
        const auto batch = all.subspan(offset, std::min(kBulkBatchSize, all.size() - offset));
        inserted += insert_image_batch_locked(batch);
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Logger::log(LogLevel::Info,
                "Bulk insert completed: " + std::to_string(inserted) + "/" + std::to_string(records.size()) +
                " items in " + std::to_string(ms) + "ms",
                gateway_tag());
    return inserted;
}

std::size_t SqliteGateway::stream_insert_images(BoundedChannel<ImageRecord>& channel) {
    std::size_t inserted = 0;
    std::vector<ImageRecord> batch;
    batch.reserve(kStreamBatchSize);

    const auto flush = [&] {
        if (batch.empty()) return;
        std::lock_guard lock(write_mtx_);
        const std::size_t n = insert_image_batch_locked(batch);
        inserted += n;
        Logger::log(LogLevel::Debug,
                    "Stream batch inserted " + std::to_string(n) + " items (total: " + std::to_string(inserted) + ")",
                    gateway_tag());
        batch.clear();
    };

    try {
        while (auto item = channel.pop()) {
            batch.push_back(std::move(*item));
            if (batch.size() >= kStreamBatchSize) flush();
        }
        flush();
    } catch (const StorageError&) {
        channel.close();
        throw;
    }

    Logger::log(LogLevel::Info, "Streaming insert completed: " + std::to_string(inserted) + " items", gateway_tag());
    return inserted;
}

std::vector<std::string> SqliteGateway::distinct_parents(const char* sql) {
    std::set<std::string> dirs;
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), sql);
    while (st.step()) {
        const fs::path parent = fs::path(st.text(0)).parent_path();
        if (!parent.empty()) dirs.insert(parent.string());
    }
    return {dirs.begin(), dirs.end()};
}

std::vector<std::string> SqliteGateway::image_directories() {
    return distinct_parents("SELECT DISTINCT file_path FROM images WHERE is_archived = 0;");
}

std::vector<std::string> SqliteGateway::archive_directories() {
    return distinct_parents("SELECT DISTINCT file_path FROM archives;");
}

std::optional<ScanHistoryRecord> SqliteGateway::last_scan_history(const fs::path& directory) {
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(),
                 (std::string(kHistoryColumns) + "WHERE directory_path = ?1 ORDER BY scan_date DESC LIMIT 1;").c_str());
    st.bind(1, normalize_path(directory).string());
    if (!st.step()) return std::nullopt;
    return read_history(st);
}

void SqliteGateway::insert_scan_history(const ScanHistoryRecord& record) {
    const std::string dir = normalize_path(record.directory_path).string();
    const std::string id = record.id.empty() ? scan_history_id(dir, record.scan_date) : record.id;

    std::lock_guard lock(write_mtx_);
    Statement st(write_db_.get(),
        "INSERT OR REPLACE INTO scan_history (id, directory_path, scan_date, file_count, processed_count, "
        "elapsed_ms, scan_type) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);");
    st.bind(1, id)
      .bind(2, dir)
      .bind(3, record.scan_date)
      .bind(4, record.file_count)
      .bind(5, record.processed_count)
      .bind(6, record.elapsed_ms)
      .bind(7, std::string(scan_type_to_string(record.scan_type)));
    st.step();
    Logger::log(LogLevel::Debug, "Scan history recorded for " + dir, gateway_tag());
}

std::size_t SqliteGateway::cleanup_items_by_directory(const fs::path& directory, const std::vector<fs::path>& keep) {
    const std::string scope = purge_scope(keep.size());
    const auto bounds = directory_bounds(directory);
    const auto bind_scope = [&](Statement& st) {
        st.bind(1, bounds.first).bind(2, bounds.second);
        int idx = 3;
        for (const auto& root : keep) {
            const auto [keep_dir, keep_prefix] = directory_bounds(root);
            st.bind(idx, keep_dir).bind(idx + 1, keep_prefix);
            idx += 2;
        }
    };

    std::lock_guard lock(write_mtx_);
    sqlite3* db = write_db_.get();
    Transaction tx(db);

    Statement entries(db, ("DELETE FROM archive_entries WHERE archive_id IN (SELECT id FROM archives WHERE " +
                           scope + ");").c_str());
    bind_scope(entries);
    entries.step();

    Statement archives(db, ("DELETE FROM archives WHERE " + scope + ";").c_str());
    bind_scope(archives);
    archives.step();
    const auto archive_count = static_cast<std::size_t>(sqlite3_changes(db));

    Statement images(db, ("DELETE FROM images WHERE " + scope + ";").c_str());
    bind_scope(images);
    images.step();
    const auto image_count = static_cast<std::size_t>(sqlite3_changes(db));

    tx.commit();
    Logger::log(LogLevel::Info,
                "Cleaned up " + std::to_string(archive_count + image_count) + " items from directory: " +
                normalize_path(directory).string() + " (" + std::to_string(image_count) + " images, " +
                std::to_string(archive_count) + " archives)",
                gateway_tag());
    return archive_count + image_count;
}

bool SqliteGateway::exists_by_id(const std::string& id) {
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(),
                 "SELECT 1 FROM archives WHERE id = ?1 UNION ALL SELECT 1 FROM images WHERE id = ?1 LIMIT 1;");
    st.bind(1, id);
    return st.step();
}

std::vector<ScanHistoryRecord> SqliteGateway::scan_history(const fs::path& directory, const int limit) {
    std::vector<ScanHistoryRecord> out;
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(),
                 (std::string(kHistoryColumns) + "WHERE directory_path = ?1 ORDER BY scan_date DESC LIMIT ?2;").c_str());
    st.bind(1, normalize_path(directory).string()).bind(2, limit);
    while (st.step()) out.push_back(read_history(st));
    return out;
}

std::vector<std::string> SqliteGateway::scanned_directories() {
    std::vector<std::string> out;
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), "SELECT DISTINCT directory_path FROM scan_history ORDER BY directory_path;");
    while (st.step()) out.push_back(st.text(0));
    return out;
}

std::int64_t SqliteGateway::archive_count() {
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), "SELECT COUNT(*) FROM archives WHERE is_deleted = 0;");
    return st.step() ? st.int64(0) : 0;
}

std::int64_t SqliteGateway::image_count() {
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), "SELECT COUNT(*) FROM images WHERE is_deleted = 0;");
    return st.step() ? st.int64(0) : 0;
}

std::vector<fs::path> SqliteGateway::indexed_sources_under(const fs::path& directory) {
    const auto [dir, prefix] = directory_bounds(directory);
    const std::string scope = under_clause(1);
    std::vector<fs::path> out;
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), ("SELECT file_path FROM archives WHERE " + scope +
                                  " UNION SELECT file_path FROM images WHERE " + scope + ";").c_str());
    st.bind(1, dir).bind(2, prefix);
    while (st.step()) out.emplace_back(st.text(0));
    return out;
}

std::vector<fs::path> SqliteGateway::all_indexed_sources() {
    std::vector<fs::path> out;
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(), "SELECT file_path FROM archives UNION SELECT file_path FROM images;");
    while (st.step()) out.emplace_back(st.text(0));
    return out;
}

std::optional<ArchiveRecord> SqliteGateway::get_archive_by_path(const fs::path& path) {
    std::lock_guard lock(read_mtx_);
    Statement st(read_db_.get(),
        "SELECT id, file_path, file_name, file_size, created_at, modified_at, scan_date, archive_type, "
        "total_files, image_files, image_ratio, thumbnail_path, is_deleted FROM archives WHERE file_path = ?1;");
    st.bind(1, normalize_path(path).string());
    if (!st.step()) return std::nullopt;

    ArchiveRecord r;
    r.id = st.text(0);
    r.file_path = st.text(1);
    r.file_name = st.text(2);
    r.file_size = st.int64(3);
    r.created_at = from_millis(st.int64(4));
    r.modified_at = from_millis(st.int64(5));
    r.scan_date = from_millis(st.int64(6));
    r.archive_type = st.text(7);
    r.total_files = st.integer(8);
    r.image_files = st.integer(9);
    r.image_ratio = st.real(10);
    r.thumbnail_path = st.optional_text(11);
    r.is_deleted = st.integer(12) != 0;

    Statement entries(read_db_.get(),
        "SELECT internal_path, file_name, file_size, width, height, format, thumbnail_path, image_ratio "
        "FROM archive_entries WHERE archive_id = ?1 ORDER BY position;");
    entries.bind(1, r.id);
    while (entries.step()) {
        r.entries.push_back(ArchiveEntryRecord{
            entries.text(0), entries.text(1), entries.int64(2), entries.integer(3), entries.integer(4), entries.text(5),
            entries.optional_text(6), entries.real(7)
        });
    }
    return r;
}

void SqliteGateway::optimize() {
    std::lock_guard lock(write_mtx_);
    exec(write_db_.get(), "VACUUM;");
    Logger::log(LogLevel::Info, "VACUUM completed", gateway_tag());
    exec(write_db_.get(), "ANALYZE;");
    Logger::log(LogLevel::Info, "ANALYZE completed", gateway_tag());
}

std::uintmax_t SqliteGateway::database_size() {
    std::uintmax_t total = 0;
    for (const auto& p : {path_, fs::path(path_.string() + "-wal")}) {
        std::error_code ec;
        const auto size = fs::file_size(p, ec);
        if (!ec) total += size;
    }
    return total;
}

} // namespace archivist
