//
// Created by Giuseppe Francione on 10/12/25.
//

#include "test_helpers.hpp"
#include "hash_utils.hpp"
#include "incremental_scan_controller.hpp"
#include "sqlite_gateway.hpp"
#include <algorithm>

using namespace archivist;
using namespace archivist::test;
namespace fs = std::filesystem;

namespace {

ImageRecord stored_image(const fs::path& path) {
    ImageRecord r;
    r.file_path = path.string();
    r.id = file_id(r.file_path);
    r.file_name = path.filename().string();
    r.file_size = 1000;
    r.image_format = "PNG";
    r.scan_date = std::chrono::system_clock::now();
    return r;
}

bool contains(const std::vector<fs::path>& v, const fs::path& p) {
    return std::ranges::find(v, p) != v.end();
}

} // namespace

class IncrementalScanControllerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        library_ = dir_ / "library";
        fs::create_directories(library_);
        gateway_ = std::make_unique<SqliteGateway>(dir_ / "library.db");
        thumbnails_ = std::make_unique<ThumbnailCache>(dir_ / "thumbs");
        processor_ = std::make_unique<ArchiveBatchProcessor>(config_, *gateway_, extractor_, thumbnails_.get());
        orchestrator_ = std::make_unique<ScanOrchestrator>(config_, *gateway_, *processor_);
        controller_ = std::make_unique<IncrementalScanController>(config_, *gateway_, *orchestrator_,
                                                                  thumbnails_.get());
    }

    void TearDown() override {
        controller_.reset();
        orchestrator_.reset();
        processor_.reset();
        gateway_.reset();
        TempDirTest::TearDown();
    }

    void record_scan(const fs::path& dir, const std::chrono::system_clock::duration age) {
        ScanHistoryRecord h;
        h.directory_path = dir.string();
        h.scan_date = std::chrono::system_clock::now() - age;
        h.id = scan_history_id(h.directory_path, h.scan_date);
        h.scan_type = ScanType::Full;
        gateway_->insert_scan_history(h);
    }

    void add_comic(const std::string& name) {
        write_zip(library_ / name, {{"1.png", make_png(24, 24)}, {"2.png", make_png(24, 24)}});
    }

    fs::path library_;
    PipelineConfig config_;
    MetadataExtractor extractor_;
    std::unique_ptr<SqliteGateway> gateway_;
    std::unique_ptr<ThumbnailCache> thumbnails_;
    std::unique_ptr<ArchiveBatchProcessor> processor_;
    std::unique_ptr<ScanOrchestrator> orchestrator_;
    std::unique_ptr<IncrementalScanController> controller_;
};

TEST_F(IncrementalScanControllerTest, NeverScannedDirectoryIsDue) {
    const ScanPlan plan = controller_->plan_scan({library_});
    ASSERT_EQ(plan.to_scan.size(), 1u);
    EXPECT_EQ(plan.to_scan[0], library_);
    EXPECT_TRUE(plan.to_purge.empty());
}

TEST_F(IncrementalScanControllerTest, FreshDirectoryIsNotDue) {
    record_scan(library_, std::chrono::hours(1));
    EXPECT_TRUE(controller_->plan_scan({library_}).to_scan.empty());
}

TEST_F(IncrementalScanControllerTest, StaleDirectoryIsDue) {
    record_scan(library_, std::chrono::hours(48));
    EXPECT_EQ(controller_->plan_scan({library_}).to_scan.size(), 1u);

    config_.freshness = std::chrono::hours(72);
    EXPECT_TRUE(controller_->plan_scan({library_}).to_scan.empty());
}

TEST_F(IncrementalScanControllerTest, MissingConfiguredDirectoryIsIgnored) {
    const ScanPlan plan = controller_->plan_scan({dir_ / "nowhere", library_});
    ASSERT_EQ(plan.to_scan.size(), 1u);
    EXPECT_EQ(plan.to_scan[0], library_);
}

TEST_F(IncrementalScanControllerTest, VanishedAndUnconfiguredDirectoriesArePurged) {
    const auto gone = dir_ / "gone";
    const auto elsewhere = dir_ / "elsewhere";
    fs::create_directories(elsewhere);
    gateway_->bulk_insert_images({stored_image(gone / "a.png"), stored_image(elsewhere / "b.png"),
                                  stored_image(library_ / "sub" / "c.png")});

    const ScanPlan plan = controller_->plan_scan({library_});
    EXPECT_EQ(plan.to_purge.size(), 2u);
    EXPECT_TRUE(contains(plan.to_purge, gone));
    EXPECT_TRUE(contains(plan.to_purge, elsewhere));

    // planning alone changes nothing
    EXPECT_EQ(gateway_->image_count(), 3);
}

TEST_F(IncrementalScanControllerTest, PurgeRemovesRecordsAndThumbnails) {
    const auto elsewhere = dir_ / "elsewhere";
    const auto image = elsewhere / "b.png";
    write_file(image, make_png(32, 32));
    gateway_->bulk_insert_images({stored_image(image)});
    ASSERT_TRUE(thumbnails_->get_or_create(image, config_.thumbnail_size, false).has_value());

    EXPECT_EQ(controller_->purge({elsewhere}), 1u);
    EXPECT_EQ(gateway_->image_count(), 0);
    EXPECT_FALSE(fs::exists(thumbnails_->thumbnail_path(image, config_.thumbnail_size, false)));
}

TEST_F(IncrementalScanControllerTest, PurgingParentKeepsConfiguredSubdirectory) {
    const auto top = dir_ / "top";
    const auto keep = top / "keep";
    fs::create_directories(keep);
    write_file(top / "a.png", make_png(32, 32));
    write_file(keep / "b.png", make_png(32, 32));
    gateway_->bulk_insert_images({stored_image(top / "a.png"), stored_image(keep / "b.png")});
    ASSERT_TRUE(thumbnails_->get_or_create(top / "a.png", config_.thumbnail_size, false).has_value());
    ASSERT_TRUE(thumbnails_->get_or_create(keep / "b.png", config_.thumbnail_size, false).has_value());
    record_scan(keep, std::chrono::hours(1));

    const ScanPlan plan = controller_->plan_scan({keep});
    EXPECT_TRUE(plan.to_scan.empty());
    ASSERT_EQ(plan.to_purge.size(), 1u);
    EXPECT_EQ(plan.to_purge[0], top);

    EXPECT_EQ(controller_->purge(plan.to_purge, plan.roots), 1u);
    const auto remaining = gateway_->all_indexed_sources();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0], keep / "b.png");
    EXPECT_TRUE(fs::exists(thumbnails_->thumbnail_path(keep / "b.png", config_.thumbnail_size, false)));
    EXPECT_FALSE(fs::exists(thumbnails_->thumbnail_path(top / "a.png", config_.thumbnail_size, false)));

    // the same through a whole incremental run
    controller_->run_incremental({keep}, {}, {});
    EXPECT_EQ(gateway_->image_count(), 1);
}

TEST_F(IncrementalScanControllerTest, IncrementalRunRecordsHistoryOnce) {
    add_comic("one.zip");

    const ScanSummary first = controller_->run_incremental({library_}, {}, {});
    EXPECT_EQ(first.directories, 1u);
    EXPECT_EQ(first.archives_indexed, 1u);

    const auto last = gateway_->last_scan_history(library_);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->scan_type, ScanType::Incremental);
    EXPECT_EQ(last->file_count, 1);
    EXPECT_EQ(last->processed_count, 1);

    // inside the freshness window nothing runs
    const ScanSummary second = controller_->run_incremental({library_}, {}, {});
    EXPECT_EQ(second.directories, 0u);
    EXPECT_EQ(gateway_->scan_history(library_).size(), 1u);
}

TEST_F(IncrementalScanControllerTest, IncrementalRunPurgesRemovedFolder) {
    const auto old_root = dir_ / "old";
    fs::create_directories(old_root);
    write_zip(old_root / "legacy.zip", {{"1.png", make_png(24, 24)}, {"2.png", make_png(24, 24)}});
    ASSERT_EQ(controller_->run_full({old_root}, {}, {}).archives_indexed, 1u);
    ASSERT_EQ(gateway_->archive_count(), 1);

    fs::remove_all(old_root);
    add_comic("new.zip");
    controller_->run_incremental({library_}, {}, {});

    EXPECT_EQ(gateway_->archive_count(), 1);
    EXPECT_TRUE(gateway_->get_archive_by_path(library_ / "new.zip").has_value());
    EXPECT_TRUE(gateway_->indexed_sources_under(old_root).empty());
}

TEST_F(IncrementalScanControllerTest, FullRunIgnoresFreshness) {
    add_comic("one.zip");
    record_scan(library_, std::chrono::minutes(5));

    const ScanSummary s = controller_->run_full({library_}, {}, {});
    EXPECT_EQ(s.directories, 1u);
    EXPECT_EQ(s.archives_indexed, 1u);
    const auto last = gateway_->last_scan_history(library_);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->scan_type, ScanType::Full);
    EXPECT_EQ(gateway_->scan_history(library_).size(), 2u);
}

TEST_F(IncrementalScanControllerTest, CancelledRunLeavesDirectoryDue) {
    add_comic("one.zip");
    std::stop_source stop;
    stop.request_stop();

    const ScanSummary s = controller_->run_incremental({library_}, {}, stop.get_token());
    EXPECT_TRUE(s.cancelled);
    EXPECT_FALSE(gateway_->last_scan_history(library_).has_value());
    EXPECT_EQ(controller_->plan_scan({library_}).to_scan.size(), 1u);
}
