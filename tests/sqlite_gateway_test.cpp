//
// Created by Giuseppe Francione on 10/12/25.
//

#include "test_helpers.hpp"
#include "hash_utils.hpp"
#include "sqlite_gateway.hpp"
#include <algorithm>
#include <future>
#include <thread>

using namespace archivist;
using namespace archivist::test;
namespace fs = std::filesystem;

namespace {

ArchiveRecord make_archive(const fs::path& path, const int images = 2) {
    ArchiveRecord r;
    r.file_path = path.string();
    r.id = file_id(r.file_path);
    r.file_name = path.filename().string();
    r.file_size = 4096;
    r.created_at = std::chrono::system_clock::now();
    r.modified_at = r.created_at;
    r.scan_date = r.created_at;
    r.archive_type = ".zip";
    r.total_files = images;
    r.image_files = images;
    r.image_ratio = 1.0;
    for (int i = 0; i < images; ++i) {
        ArchiveEntryRecord e;
        e.internal_path = "pages/" + std::to_string(i) + ".jpg";
        e.file_name = std::to_string(i) + ".jpg";
        e.file_size = 1000 + i;
        e.width = 800;
        e.height = 1200;
        e.format = "JPEG";
        r.entries.push_back(e);
    }
    return r;
}

ImageRecord make_image(const fs::path& path) {
    ImageRecord r;
    r.file_path = path.string();
    r.id = file_id(r.file_path);
    r.file_name = path.filename().string();
    r.file_size = 2048;
    r.width = 64;
    r.height = 48;
    r.image_format = "PNG";
    r.created_at = std::chrono::system_clock::now();
    r.modified_at = r.created_at;
    r.scan_date = r.created_at;
    return r;
}

ScanHistoryRecord make_history(const fs::path& dir, const Timestamp when, const int files = 3) {
    ScanHistoryRecord h;
    h.directory_path = dir.string();
    h.scan_date = when;
    h.id = scan_history_id(h.directory_path, when);
    h.file_count = files;
    h.processed_count = files;
    h.elapsed_ms = 42;
    h.scan_type = ScanType::Full;
    return h;
}

} // namespace

class SqliteGatewayTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        gateway_ = std::make_unique<SqliteGateway>(dir_ / "db" / "library.db");
    }

    void TearDown() override {
        gateway_.reset();
        TempDirTest::TearDown();
    }

    std::unique_ptr<SqliteGateway> gateway_;
};

TEST_F(SqliteGatewayTest, CreatesDatabaseFile) {
    EXPECT_TRUE(fs::exists(dir_ / "db" / "library.db"));
    EXPECT_EQ(gateway_->archive_count(), 0);
    EXPECT_EQ(gateway_->image_count(), 0);
    EXPECT_GT(gateway_->database_size(), 0u);
}

TEST_F(SqliteGatewayTest, UpsertArchiveReportsNewThenExisting) {
    const auto rec = make_archive(dir_ / "comics" / "a.zip");
    EXPECT_TRUE(gateway_->upsert_archive(rec));
    EXPECT_FALSE(gateway_->upsert_archive(rec));
    EXPECT_EQ(gateway_->archive_count(), 1);
    EXPECT_TRUE(gateway_->exists_by_id(rec.id));
    EXPECT_FALSE(gateway_->exists_by_id("0000000000000000"));
}

TEST_F(SqliteGatewayTest, ArchiveEntriesRoundTripInOrder) {
    auto rec = make_archive(dir_ / "comics" / "a.zip", 5);
    rec.thumbnail_path = "/thumbs/size_128/x_128_archive.jpg";
    ASSERT_TRUE(gateway_->upsert_archive(rec));

    const auto stored = gateway_->get_archive_by_path(rec.file_path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->id, rec.id);
    EXPECT_EQ(stored->image_files, 5);
    EXPECT_DOUBLE_EQ(stored->image_ratio, 1.0);
    EXPECT_EQ(stored->thumbnail_path, rec.thumbnail_path);
    ASSERT_EQ(stored->entries.size(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(stored->entries[i].internal_path, rec.entries[i].internal_path);
        EXPECT_EQ(stored->entries[i].width, 800);
    }
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(stored->scan_date.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(rec.scan_date.time_since_epoch()));
}

TEST_F(SqliteGatewayTest, UpsertReplacesEntries) {
    auto rec = make_archive(dir_ / "a.zip", 4);
    ASSERT_TRUE(gateway_->upsert_archive(rec));

    rec.entries.resize(2);
    rec.image_files = 2;
    EXPECT_FALSE(gateway_->upsert_archive(rec));

    const auto stored = gateway_->get_archive_by_path(rec.file_path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->entries.size(), 2u);
    EXPECT_EQ(stored->image_files, 2);
}

TEST_F(SqliteGatewayTest, BulkInsertSkipsDuplicates) {
    std::vector<ImageRecord> images;
    for (int i = 0; i < 600; ++i) images.push_back(make_image(dir_ / ("img" + std::to_string(i) + ".png")));

    EXPECT_EQ(gateway_->bulk_insert_images(images), 600u);
    EXPECT_EQ(gateway_->bulk_insert_images(images), 0u);
    EXPECT_EQ(gateway_->image_count(), 600);
}

TEST_F(SqliteGatewayTest, MissingIdIsDerivedFromPath) {
    auto img = make_image(dir_ / "noid.png");
    img.id.clear();
    EXPECT_EQ(gateway_->bulk_insert_images({img}), 1u);
    EXPECT_TRUE(gateway_->exists_by_id(file_id(img.file_path)));
}

TEST_F(SqliteGatewayTest, StreamInsertDrainsClosedChannel) {
    BoundedChannel<ImageRecord> channel(16);
    auto consumer = std::async(std::launch::async, [&] { return gateway_->stream_insert_images(channel); });

    for (int i = 0; i < 120; ++i) ASSERT_TRUE(channel.push(make_image(dir_ / ("s" + std::to_string(i) + ".png"))));
    ASSERT_TRUE(channel.push(make_image(dir_ / "s0.png"))); // duplicate
    channel.close();

    EXPECT_EQ(consumer.get(), 120u);
    EXPECT_EQ(gateway_->image_count(), 120);
}

TEST_F(SqliteGatewayTest, DirectoriesAreDistinctParents) {
    gateway_->bulk_insert_images({make_image(dir_ / "x" / "1.png"), make_image(dir_ / "x" / "2.png"),
                                  make_image(dir_ / "y" / "3.png")});
    gateway_->upsert_archive(make_archive(dir_ / "z" / "a.zip"));

    const auto images = gateway_->image_directories();
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0], (dir_ / "x").string());
    EXPECT_EQ(images[1], (dir_ / "y").string());

    const auto archives = gateway_->archive_directories();
    ASSERT_EQ(archives.size(), 1u);
    EXPECT_EQ(archives[0], (dir_ / "z").string());
}

TEST_F(SqliteGatewayTest, HistoryReturnsLatestFirst) {
    const auto lib = dir_ / "lib";
    const auto now = std::chrono::system_clock::now();
    EXPECT_FALSE(gateway_->last_scan_history(lib).has_value());

    gateway_->insert_scan_history(make_history(lib, now - std::chrono::hours(48), 1));
    gateway_->insert_scan_history(make_history(lib, now - std::chrono::hours(1), 2));
    gateway_->insert_scan_history(make_history(lib, now - std::chrono::hours(24), 3));
    gateway_->insert_scan_history(make_history(dir_ / "other", now, 9));

    const auto last = gateway_->last_scan_history(lib);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->file_count, 2);
    EXPECT_EQ(last->scan_type, ScanType::Full);

    // trailing separator and "." segments do not matter
    EXPECT_TRUE(gateway_->last_scan_history(dir_ / "lib" / ".").has_value());

    const auto two = gateway_->scan_history(lib, 2);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_EQ(two[0].file_count, 2);
    EXPECT_EQ(two[1].file_count, 3);

    EXPECT_EQ(gateway_->scanned_directories().size(), 2u);
}

TEST_F(SqliteGatewayTest, HistoryInTheSameInstantIsAppended) {
    const auto lib = dir_ / "lib";
    const auto when = std::chrono::system_clock::now();
    gateway_->insert_scan_history(make_history(lib, when, 1));
    gateway_->insert_scan_history(make_history(lib, when, 2));

    ScanHistoryRecord no_id = make_history(lib, when, 3);
    no_id.id.clear();
    gateway_->insert_scan_history(no_id);
    gateway_->insert_scan_history(no_id);

    EXPECT_EQ(gateway_->scan_history(lib, 10).size(), 4u);
    EXPECT_NE(scan_history_id(lib, when), scan_history_id(lib, when));
}

TEST_F(SqliteGatewayTest, CleanupRespectsDirectoryBoundary) {
    const auto a = dir_ / "a";
    const auto ab = dir_ / "ab";
    gateway_->bulk_insert_images({make_image(a / "1.png"), make_image(a / "deep" / "2.png"),
                                  make_image(ab / "3.png")});
    gateway_->upsert_archive(make_archive(a / "c.zip"));
    gateway_->upsert_archive(make_archive(ab / "d.zip"));

    const auto under_a = gateway_->indexed_sources_under(a);
    EXPECT_EQ(under_a.size(), 3u);

    EXPECT_EQ(gateway_->cleanup_items_by_directory(a, {}), 3u);
    EXPECT_EQ(gateway_->image_count(), 1);
    EXPECT_EQ(gateway_->archive_count(), 1);
    EXPECT_TRUE(gateway_->get_archive_by_path(ab / "d.zip").has_value());
    EXPECT_FALSE(gateway_->get_archive_by_path(a / "c.zip").has_value());
    EXPECT_EQ(gateway_->all_indexed_sources().size(), 2u);
}

TEST_F(SqliteGatewayTest, CleanupSparesKeptRoots) {
    const auto top = dir_ / "top";
    const auto keep = top / "keep";
    gateway_->bulk_insert_images({make_image(top / "1.png"), make_image(keep / "2.png"),
                                  make_image(keep / "deep" / "3.png"), make_image(top / "keeper" / "4.png")});
    gateway_->upsert_archive(make_archive(keep / "c.zip"));
    gateway_->upsert_archive(make_archive(top / "d.zip"));

    // 1.png, keeper/4.png and d.zip go; keep/ is untouched
    EXPECT_EQ(gateway_->cleanup_items_by_directory(top, {keep}), 3u);
    EXPECT_EQ(gateway_->image_count(), 2);
    EXPECT_EQ(gateway_->archive_count(), 1);
    const auto c = gateway_->get_archive_by_path(keep / "c.zip");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->entries.size(), 2u);
    EXPECT_EQ(gateway_->indexed_sources_under(keep).size(), 3u);
}

TEST_F(SqliteGatewayTest, DirectoryMatchingIgnoresCase) {
    const auto mixed = dir_ / "Comics";
    gateway_->bulk_insert_images({make_image(mixed / "1.png")});
    gateway_->upsert_archive(make_archive(mixed / "Series" / "c.zip"));
    gateway_->upsert_archive(make_archive(dir_ / "ComicsOld" / "d.zip"));

    EXPECT_EQ(gateway_->indexed_sources_under(dir_ / "comics").size(), 2u);
    EXPECT_EQ(gateway_->cleanup_items_by_directory(dir_ / "COMICS", {}), 2u);
    EXPECT_EQ(gateway_->archive_count(), 1);
    EXPECT_EQ(gateway_->image_count(), 0);
}

TEST_F(SqliteGatewayTest, ReopenKeepsData) {
    gateway_->upsert_archive(make_archive(dir_ / "a.zip"));
    gateway_.reset();
    gateway_ = std::make_unique<SqliteGateway>(dir_ / "db" / "library.db");
    EXPECT_EQ(gateway_->archive_count(), 1);
}

TEST_F(SqliteGatewayTest, OptimizeKeepsData) {
    gateway_->bulk_insert_images({make_image(dir_ / "1.png")});
    EXPECT_NO_THROW(gateway_->optimize());
    EXPECT_EQ(gateway_->image_count(), 1);
}

TEST_F(SqliteGatewayTest, ConcurrentWritersDoNotLoseRows) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t] {
            std::vector<ImageRecord> batch;
            for (int i = 0; i < 50; ++i) {
                batch.push_back(make_image(dir_ / ("t" + std::to_string(t)) / (std::to_string(i) + ".png")));
            }
            gateway_->bulk_insert_images(batch);
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(gateway_->image_count(), 200);
}

TEST(SqliteGatewayOpenTest, UnopenablePathThrows) {
    const fs::path bad = fs::temp_directory_path() / "archivist_tests" / "not_a_dir_file";
    fs::create_directories(bad.parent_path());
    write_file(bad, make_text(16));
    EXPECT_THROW(SqliteGateway(bad / "db.sqlite"), StorageError);
    std::error_code ec;
    fs::remove(bad, ec);
}
