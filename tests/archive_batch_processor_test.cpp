//
// Created by Giuseppe Francione on 10/12/25.
//

#include "test_helpers.hpp"
#include "archive_batch_processor.hpp"
#include "archive_reader.hpp"
#include "file_utils.hpp"
#include "hash_utils.hpp"
#include "sqlite_gateway.hpp"
#include <chrono>
#include <future>

using namespace archivist;
using namespace archivist::test;
namespace fs = std::filesystem;

namespace {

// blocks on one entry until released, the others go through the real extractor
class StallingExtractor final : public MetadataExtractor {
public:
    StallingExtractor(std::string stalled_name, std::shared_future<void> release)
        : stalled_name_(std::move(stalled_name)), release_(std::move(release)) {}

    ImageMetadata extract(const std::span<const unsigned char> data,
                          const std::string_view file_name_hint) const noexcept override {
        if (file_name_hint == stalled_name_) {
            release_.wait_for(std::chrono::seconds(10));
            return defaults_for(file_name_hint);
        }
        return MetadataExtractor::extract(data, file_name_hint);
    }

private:
    std::string stalled_name_;
    std::shared_future<void> release_;
};

} // namespace

class ArchiveBatchProcessorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        gateway_ = std::make_unique<SqliteGateway>(dir_ / "library.db");
        thumbnails_ = std::make_unique<ThumbnailCache>(dir_ / "thumbs");
    }

    void TearDown() override {
        gateway_.reset();
        TempDirTest::TearDown();
    }

    ArchiveBatchProcessor processor(ThumbnailCache* thumbs = nullptr) {
        return ArchiveBatchProcessor(config_, *gateway_, extractor_, thumbs);
    }

    // @p images image entries followed by @p others text entries
    fs::path zip_with(const std::string& name, const int images, const int others) {
        std::vector<std::pair<std::string, Bytes>> entries;
        for (int i = 0; i < images; ++i) entries.emplace_back("img" + std::to_string(i) + ".png", make_png(24, 24));
        for (int i = 0; i < others; ++i) entries.emplace_back("note" + std::to_string(i) + ".txt", make_text(400));
        const auto path = dir_ / name;
        write_zip(path, entries);
        return path;
    }

    PipelineConfig config_;
    MetadataExtractor extractor_;
    std::unique_ptr<SqliteGateway> gateway_;
    std::unique_ptr<ThumbnailCache> thumbnails_;
};

TEST_F(ArchiveBatchProcessorTest, BelowRatioIsNotPersisted) {
    auto p = processor();
    const ArchiveResult r = p.process_archive(zip_with("low.zip", 3, 7), {});
    EXPECT_EQ(r.outcome, ArchiveOutcome::BelowRatio);
    EXPECT_FALSE(r.record.has_value());
    EXPECT_EQ(gateway_->archive_count(), 0);
}

TEST_F(ArchiveBatchProcessorTest, AboveRatioIsPersisted) {
    auto p = processor();
    const auto path = zip_with("high.zip", 6, 4);
    const ArchiveResult r = p.process_archive(path, {});
    ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
    ASSERT_TRUE(r.record.has_value());
    EXPECT_TRUE(r.upserted_new);
    EXPECT_EQ(r.record->total_files, 10);
    EXPECT_EQ(r.record->image_files, 6);
    EXPECT_DOUBLE_EQ(r.record->image_ratio, 0.6);
    EXPECT_EQ(r.record->archive_type, ".zip");
    EXPECT_EQ(r.record->id, file_id(normalize_path(path)));
    EXPECT_FALSE(r.record->thumbnail_path.has_value());

    const auto stored = gateway_->get_archive_by_path(path);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->entries.size(), 6u);
}

TEST_F(ArchiveBatchProcessorTest, RatioAtThresholdIsIndexed) {
    auto p = processor();
    EXPECT_EQ(p.process_archive(zip_with("half.zip", 5, 5), {}).outcome, ArchiveOutcome::Indexed);
}

TEST_F(ArchiveBatchProcessorTest, EntriesAreSortedIgnoringCase) {
    const auto path = dir_ / "mixed.zip";
    write_zip(path, {
        {"b.png", make_png(20, 20)},
        {"A.png", make_png(20, 20)},
        {"sub/", {}},
        {"c.PNG", make_png(20, 20)},
        {"__MACOSX/._a.png", make_png(20, 20)},
    });

    auto p = processor();
    const ArchiveResult r = p.process_archive(path, {});
    ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
    ASSERT_EQ(r.record->entries.size(), 3u);
    EXPECT_EQ(r.record->entries[0].internal_path, "A.png");
    EXPECT_EQ(r.record->entries[1].internal_path, "b.png");
    EXPECT_EQ(r.record->entries[2].internal_path, "c.PNG");
    EXPECT_EQ(r.record->entries[2].format, "png");
    // no dimensions unless asked for
    EXPECT_EQ(r.record->entries[0].width, 0);
}

TEST_F(ArchiveBatchProcessorTest, SecondRunUpdatesInPlace) {
    auto p = processor();
    const auto path = zip_with("again.zip", 4, 0);
    EXPECT_TRUE(p.process_archive(path, {}).upserted_new);
    const ArchiveResult second = p.process_archive(path, {});
    EXPECT_EQ(second.outcome, ArchiveOutcome::Indexed);
    EXPECT_FALSE(second.upserted_new);
    EXPECT_EQ(gateway_->archive_count(), 1);
}

TEST_F(ArchiveBatchProcessorTest, TooManyEntriesIsSkipped) {
    config_.max_archive_entries = 5;
    auto p = processor();
    EXPECT_EQ(p.process_archive(zip_with("huge.zip", 8, 0), {}).outcome, ArchiveOutcome::TooManyEntries);
    EXPECT_EQ(gateway_->archive_count(), 0);
}

TEST_F(ArchiveBatchProcessorTest, ReadsDimensionsWhenAsked) {
    config_.read_archive_dimensions = true;
    const auto path = dir_ / "dims.zip";
    write_zip(path, {{"1.png", make_png(30, 20)}, {"2.jpg", make_jpeg(16, 40)}});

    auto p = processor();
    const ArchiveResult r = p.process_archive(path, {});
    ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
    ASSERT_EQ(r.record->entries.size(), 2u);
    EXPECT_EQ(r.record->entries[0].width, 30);
    EXPECT_EQ(r.record->entries[0].height, 20);
    EXPECT_EQ(r.record->entries[0].format, "PNG");
    EXPECT_EQ(r.record->entries[1].width, 16);
    EXPECT_EQ(r.record->entries[1].height, 40);
    EXPECT_EQ(r.record->entries[1].format, "JPEG");
}

TEST_F(ArchiveBatchProcessorTest, HungEntryKeepsDefaultsWithinTimeout) {
    config_.read_archive_dimensions = true;
    config_.entry_timeout = std::chrono::milliseconds(100);
    const auto path = dir_ / "stall.zip";
    write_zip(path, {{"a.png", make_png(30, 20)}, {"b.png", make_png(12, 18)}, {"c.png", make_png(40, 10)}});

    std::promise<void> release;
    const StallingExtractor stalling("b.png", release.get_future().share());
    {
        ArchiveBatchProcessor p(config_, *gateway_, stalling, nullptr);

        const auto start = std::chrono::steady_clock::now();
        const ArchiveResult r = p.process_archive(path, {});
        const auto elapsed = std::chrono::steady_clock::now() - start;
        release.set_value();

        EXPECT_LT(elapsed, std::chrono::seconds(3));
        ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
        ASSERT_EQ(r.record->entries.size(), 3u);
        EXPECT_EQ(r.record->entries[0].width, 30);
        EXPECT_EQ(r.record->entries[1].internal_path, "b.png");
        EXPECT_EQ(r.record->entries[1].width, 0);
        EXPECT_EQ(r.record->entries[1].height, 0);
        EXPECT_EQ(r.record->entries[1].format, "png");
        EXPECT_EQ(r.record->entries[2].width, 40);
        EXPECT_EQ(r.record->entries[2].height, 10);
        EXPECT_EQ(gateway_->archive_count(), 1);
    }
}

TEST_F(ArchiveBatchProcessorTest, ProducesArchiveThumbnail) {
    auto p = processor(thumbnails_.get());
    const auto path = zip_with("thumb.zip", 2, 0);
    const ArchiveResult r = p.process_archive(path, {});
    ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
    ASSERT_TRUE(r.record->thumbnail_path.has_value());
    EXPECT_TRUE(fs::exists(*r.record->thumbnail_path));
    EXPECT_TRUE(thumbnails_->exists(normalize_path(path), config_.thumbnail_size, true));
}

TEST_F(ArchiveBatchProcessorTest, EntriesCarryArchiveThumbnailAndRatio) {
    auto p = processor(thumbnails_.get());
    const auto path = zip_with("stamped.zip", 3, 1);
    const ArchiveResult r = p.process_archive(path, {});
    ASSERT_EQ(r.outcome, ArchiveOutcome::Indexed);
    ASSERT_TRUE(r.record->thumbnail_path.has_value());

    const auto stored = gateway_->get_archive_by_path(path);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->entries.size(), 3u);
    for (const auto& e : stored->entries) {
        EXPECT_EQ(e.thumbnail_path, r.record->thumbnail_path);
        EXPECT_DOUBLE_EQ(e.image_ratio, 0.75);
    }
}

TEST_F(ArchiveBatchProcessorTest, ArchiveThumbnailsCanBeDisabled) {
    config_.generate_archive_thumbnails = false;
    auto p = processor(thumbnails_.get());
    const ArchiveResult r = p.process_archive(zip_with("nothumb.zip", 2, 0), {});
    EXPECT_FALSE(r.record->thumbnail_path.has_value());
    EXPECT_EQ(thumbnails_->generation_count(), 0u);
}

TEST_F(ArchiveBatchProcessorTest, CorruptArchiveThrows) {
    const auto path = dir_ / "broken.zip";
    write_file(path, make_text(4096));
    auto p = processor();
    EXPECT_THROW(p.process_archive(path, {}), ArchiveOpenError);
}

TEST_F(ArchiveBatchProcessorTest, StoppedTokenCancels) {
    std::stop_source stop;
    stop.request_stop();
    auto p = processor();
    EXPECT_EQ(p.process_archive(zip_with("stop.zip", 3, 0), stop.get_token()).outcome, ArchiveOutcome::Cancelled);
    EXPECT_EQ(gateway_->archive_count(), 0);
}

TEST_F(ArchiveBatchProcessorTest, MissingArchiveIsUnreadable) {
    auto p = processor();
    EXPECT_EQ(p.process_archive(dir_ / "gone.zip", {}).outcome, ArchiveOutcome::Unreadable);
}

TEST_F(ArchiveBatchProcessorTest, StandaloneImageRecord) {
    const auto path = dir_ / "photo.png";
    write_file(path, make_png(50, 25));

    auto p = processor(thumbnails_.get());
    const auto rec = p.process_image_file(path);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->width, 50);
    EXPECT_EQ(rec->height, 25);
    EXPECT_EQ(rec->image_format, "PNG");
    EXPECT_EQ(rec->id, file_id(normalize_path(path)));
    EXPECT_FALSE(rec->is_archived);
    ASSERT_TRUE(rec->thumbnail_path.has_value());
    EXPECT_TRUE(fs::exists(*rec->thumbnail_path));
}

TEST_F(ArchiveBatchProcessorTest, StandaloneImageTooSmallIsRejected) {
    const auto path = dir_ / "tiny.png";
    write_file(path, Bytes(50, 0x89));
    auto p = processor();
    EXPECT_FALSE(p.process_image_file(path).has_value());
    EXPECT_FALSE(p.process_image_file(dir_ / "missing.png").has_value());
}

TEST(EntryConcurrencyTest, ScalesWithEntryCount) {
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(10, 0, 8), 16u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(100, 0, 8), 8u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(300, 0, 8), 4u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(1000, 0, 8), 2u);
}

TEST(EntryConcurrencyTest, ShrinksForLargeArchives) {
    constexpr std::uintmax_t mib = 1024 * 1024;
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(10, 600 * mib, 8), 8u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(10, 200 * mib, 8), 12u);
}

TEST(EntryConcurrencyTest, StaysWithinBounds) {
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(10, 0, 1), 2u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(10, 0, 0), 2u);
    EXPECT_EQ(ArchiveBatchProcessor::entry_concurrency(100, 0, 64), 16u);
}
