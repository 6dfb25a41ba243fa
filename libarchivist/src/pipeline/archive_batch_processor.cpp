//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/archive_batch_processor.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/entry_validator.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/hash_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_types.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace archivist {

namespace {

const char* batch_tag() {
    return "archive_batch";
}

constexpr std::uintmax_t kMiB = 1024 * 1024;

std::string entry_file_name(const std::string& internal_path) {
    const auto pos = internal_path.find_last_of("/\\");
    return pos == std::string::npos ? internal_path : internal_path.substr(pos + 1);
}

std::string extension_format(const std::string& name) {
    const std::string ext = lower_extension(name);
    return ext.empty() ? std::string{} : ext.substr(1);
}

struct KeptEntry {
    ArchiveEntryHeader header;
    std::vector<unsigned char> payload; ///< filled only when dimensions are read
};

} // namespace

ArchiveBatchProcessor::ArchiveBatchProcessor(const PipelineConfig& config,
                                             IPersistenceGateway& gateway,
                                             const MetadataExtractor& extractor,
                                             ThumbnailCache* thumbnails)
    : config_(config), gateway_(gateway), extractor_(extractor), thumbnails_(thumbnails) {}

unsigned ArchiveBatchProcessor::entry_concurrency(const std::size_t entry_count,
                                                  const std::uintmax_t archive_size,
                                                  unsigned cpu_count) {
    if (cpu_count == 0) cpu_count = 1;

    unsigned c;
    if (entry_count < 50) {
        c = std::min(2 * cpu_count, 16u);
    } else if (entry_count < 200) {
        c = cpu_count;
    } else if (entry_count < 500) {
        c = std::max(cpu_count / 2, 4u);
    } else {
        c = std::max(cpu_count / 4, 2u);
    }

    if (archive_size > 500 * kMiB) {
        c = std::max(c / 2, 2u);
    } else if (archive_size > 100 * kMiB) {
        c = std::max(3 * c / 4, 3u);
    }
    return std::clamp(c, 2u, 16u);
}

ArchiveResult ArchiveBatchProcessor::process_archive(const fs::path& path, const std::stop_token stop) {
    ArchiveResult result;
    const auto st = stat_file(path);
    if (!st) {
        Logger::log(LogLevel::Warning, "Archive vanished before processing: " + path.string(), batch_tag());
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    auto reader = make_archive_reader(path);

    // single pass over the headers
    std::vector<KeptEntry> kept;
    std::size_t total_files = 0;
    while (auto header = reader->next_entry()) {
        if (stop.stop_requested()) {
            Logger::log(LogLevel::Info, "Archive scan cancelled: " + path.string(), batch_tag());
            result.outcome = ArchiveOutcome::Cancelled;
            return result;
        }
        if (header->is_directory) continue;

        if (++total_files > config_.max_archive_entries) {
            Logger::log(LogLevel::Warning,
                        "Skipping " + path.filename().string() + ": more than " +
                        std::to_string(config_.max_archive_entries) + " entries",
                        batch_tag());
            result.outcome = ArchiveOutcome::TooManyEntries;
            return result;
        }
        if (!EntryValidator::is_valid_entry(header->path, header->size)) continue;

        KeptEntry entry{std::move(*header), {}};
        if (config_.read_archive_dimensions) {
            try {
                entry.payload = reader->read_entry_data(static_cast<std::size_t>(kMaxEntrySize));
            } catch (const ArchiveOpenError&) {
                throw;
            } catch (const std::runtime_error& e) {
                Logger::log(LogLevel::Warning,
                            "Cannot read entry " + entry.header.path + " in " + path.filename().string() + ": " + e.what(),
                            batch_tag());
            }
        }
        kept.push_back(std::move(entry));
    }
    reader.reset();

    const double ratio = total_files == 0 ? 0.0 : static_cast<double>(kept.size()) / static_cast<double>(total_files);
    if (kept.empty() || ratio < config_.archive_image_ratio_threshold) {
        Logger::log(LogLevel::Debug,
                    "Below image ratio (" + std::to_string(kept.size()) + "/" + std::to_string(total_files) + "): " +
                    path.string(),
                    batch_tag());
        result.outcome = ArchiveOutcome::BelowRatio;
        return result;
    }

    std::ranges::sort(kept, [](const KeptEntry& a, const KeptEntry& b) {
        return iless(a.header.path, b.header.path);
    });

    std::vector<ArchiveEntryRecord> entries;
    std::vector<std::vector<unsigned char>> payloads;
    entries.reserve(kept.size());
    payloads.reserve(kept.size());
    for (auto& k : kept) {
        ArchiveEntryRecord e;
        e.file_name = entry_file_name(k.header.path);
        e.format = extension_format(e.file_name);
        e.file_size = k.header.size;
        e.internal_path = std::move(k.header.path);
        entries.push_back(std::move(e));
        payloads.push_back(std::move(k.payload));
    }
    kept.clear();

    if (config_.read_archive_dimensions && !stop.stop_requested()) {
        read_dimensions(entries, payloads, st->size, path);
    }
    payloads.clear();

    ArchiveRecord record;
    record.file_path = normalize_path(path).string();
    record.id = file_id(record.file_path);
    record.file_name = path.filename().string();
    record.file_size = static_cast<std::int64_t>(st->size);
    record.created_at = st->created_at;
    record.modified_at = st->modified_at;
    record.scan_date = std::chrono::system_clock::now();
    record.archive_type = archive_kind_to_extension(archive_kind_from_extension(lower_extension(record.file_name)));
    record.total_files = static_cast<int>(total_files);
    record.image_files = static_cast<int>(entries.size());
    record.image_ratio = ratio;
    record.entries = std::move(entries);

    if (thumbnails_ && config_.generate_thumbnails && config_.generate_archive_thumbnails) {
        if (const auto thumb = thumbnails_->get_or_create(record.file_path, config_.thumbnail_size, true)) {
            record.thumbnail_path = thumb->string();
        }
    }
    for (auto& e : record.entries) {
        e.thumbnail_path = record.thumbnail_path;
        e.image_ratio = ratio;
    }

    result.upserted_new = gateway_.upsert_archive(record);
    result.outcome = ArchiveOutcome::Indexed;

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::log(LogLevel::Info,
                "Indexed " + record.file_name + ": " + std::to_string(record.image_files) + "/" +
                std::to_string(record.total_files) + " images in " + std::to_string(ms.count()) + "ms",
                batch_tag());
    result.record = std::move(record);
    return result;
}

void ArchiveBatchProcessor::read_dimensions(std::vector<ArchiveEntryRecord>& entries,
                                            std::vector<std::vector<unsigned char>>& payloads,
                                            const std::uintmax_t archive_size,
                                            const fs::path& archive_path) {
    const unsigned workers = entry_concurrency(entries.size(), archive_size, std::thread::hardware_concurrency());
    auto pool = std::make_unique<ThreadPool>(workers, "archive_entries");

    std::vector<std::future<ImageMetadata>> pending;
    pending.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        pending.push_back(pool->enqueue(
            [extractor = &extractor_, data = std::move(payloads[i]), name = entries[i].file_name](std::stop_token) {
                return extractor->extract(data, name);
            }));
    }

    const auto deadline_per_entry = config_.entry_timeout;
    std::size_t timed_out = 0;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (pending[i].wait_for(deadline_per_entry) != std::future_status::ready) {
            ++timed_out;
            continue;
        }
        const ImageMetadata md = pending[i].get();
        if (md.width > 0 && md.height > 0) {
            entries[i].width = md.width;
            entries[i].height = md.height;
            if (!md.format.empty()) entries[i].format = md.format;
        }
    }

    if (timed_out > 0) {
        Logger::log(LogLevel::Warning,
                    std::to_string(timed_out) + " entries of " + archive_path.filename().string() +
                    " timed out; keeping default metadata",
                    batch_tag());
        pool->request_stop();
        retire_pool(std::move(pool));
    }
}

void ArchiveBatchProcessor::retire_pool(std::unique_ptr<ThreadPool> pool) {
    std::lock_guard lock(retired_mtx_);
    std::erase_if(retired_pools_, [](const std::unique_ptr<ThreadPool>& p) { return p->idle(); });
    retired_pools_.push_back(std::move(pool));
    Logger::log(LogLevel::Debug,
                std::to_string(retired_pools_.size()) + " entry pools still finishing abandoned work",
                batch_tag());
}

std::optional<ImageRecord> ArchiveBatchProcessor::process_image_file(const fs::path& path) {
    const auto st = stat_file(path);
    if (!st) {
        Logger::log(LogLevel::Warning, "Image vanished before processing: " + path.string(), batch_tag());
        return std::nullopt;
    }
    if (!EntryValidator::is_valid_image_file(path, static_cast<std::int64_t>(st->size))) {
        return std::nullopt;
    }

    const ImageMetadata md = extractor_.extract_file(path);

    ImageRecord record;
    record.file_path = normalize_path(path).string();
    record.id = file_id(record.file_path);
    record.file_name = path.filename().string();
    record.file_size = static_cast<std::int64_t>(st->size);
    record.width = md.width;
    record.height = md.height;
    record.created_at = st->created_at;
    record.modified_at = st->modified_at;
    record.scan_date = std::chrono::system_clock::now();
    record.image_format = md.format;
    record.has_exif_data = md.has_exif_data;
    record.date_taken = md.date_taken;

    if (thumbnails_ && config_.generate_thumbnails) {
        if (const auto thumb = thumbnails_->get_or_create(record.file_path, config_.thumbnail_size, false)) {
            record.thumbnail_path = thumb->string();
        }
    }
    return record;
}

} // namespace archivist
