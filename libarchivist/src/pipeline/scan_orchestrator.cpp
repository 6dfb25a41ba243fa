//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/scan_orchestrator.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/bounded_channel.hpp"
#include "../../include/entry_validator.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace archivist {

namespace {

const char* scanner_tag() {
    return "scanner";
}

constexpr std::uintmax_t kMiB = 1024 * 1024;

unsigned cpu_count() {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

/**
 * @brief Shared counters of one directory scan; serializes the user callback.
 */
class ProgressReporter {
public:
    ProgressReporter(const ProgressCallback& callback, const std::size_t total)
        : callback_(callback), total_(total), start_(std::chrono::steady_clock::now()) {}

    void file_done(const fs::path& file, const std::string& message) {
        const std::size_t done = ++processed_;
        emit(file, done, message, false);
    }

    void skipped(const std::size_t n, const std::string& message) {
        const std::size_t done = processed_ += n;
        emit({}, done, message, false);
    }

    void completed(const std::string& message) {
        emit({}, processed_.load(), message, true);
    }

    [[nodiscard]] std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    }

    [[nodiscard]] std::size_t processed() const { return processed_.load(); }

    std::atomic<std::size_t> items_found{0};
    std::atomic<std::size_t> items_inserted{0};

private:
    void emit(const fs::path& file, const std::size_t done, const std::string& message, const bool is_completed) {
        if (!callback_) return;
        ScanProgress p;
        p.current_file = file;
        p.processed_files = done;
        p.total_files = total_;
        p.message = message;
        p.is_completed = is_completed;
        p.items_found = items_found.load();
        p.items_inserted = items_inserted.load();
        p.elapsed = elapsed();

        std::lock_guard lock(mtx_);
        callback_(p);
    }

    const ProgressCallback& callback_;
    const std::size_t total_;
    const std::chrono::steady_clock::time_point start_;
    std::atomic<std::size_t> processed_{0};
    std::mutex mtx_;
};

// closes the channel on every exit path so the consumer always returns
struct ChannelCloser {
    BoundedChannel<ImageRecord>& channel;
    ~ChannelCloser() { channel.close(); }
};

// sleeps for @p d unless a stop is requested first
void interruptible_pause(const std::chrono::milliseconds d, const std::stop_token& stop) {
    if (d.count() <= 0) return;
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, d, [] { return false; });
}

} // namespace

ScanOrchestrator::ScanOrchestrator(const PipelineConfig& config,
                                   IPersistenceGateway& gateway,
                                   ArchiveBatchProcessor& processor)
    : config_(config), gateway_(gateway), processor_(processor) {}

std::size_t ScanOrchestrator::archive_batch_size(const std::uintmax_t total_bytes, const std::size_t count,
                                                 const unsigned cpu) {
    if (count == 0) return 1;
    const std::uintmax_t total_mb = total_bytes / kMiB;

    std::size_t batch;
    if (total_mb < 50) {
        batch = count;
    } else if (total_mb < 200) {
        batch = std::max<std::size_t>(cpu / 2, 2);
    } else if (total_mb < 1000) {
        batch = 2;
    } else {
        batch = 1;
    }
    if (count <= 3) batch = 1;
    return std::clamp<std::size_t>(batch, 1, count);
}

std::size_t ScanOrchestrator::archive_open_limit(const std::size_t batch_size, const unsigned cpu) {
    return std::max<std::size_t>(1, std::min({batch_size, static_cast<std::size_t>(cpu / 2), std::size_t{2}}));
}

std::chrono::milliseconds ScanOrchestrator::batch_pause(const std::uintmax_t total_bytes) {
    const std::uintmax_t total_mb = total_bytes / kMiB;
    if (total_mb > 1000) return std::chrono::milliseconds(200);
    if (total_mb > 500) return std::chrono::milliseconds(100);
    if (total_mb > 100) return std::chrono::milliseconds(50);
    return std::chrono::milliseconds(0);
}

DiscoveredFiles ScanOrchestrator::discover(const fs::path& directory, const std::stop_token stop) {
    DiscoveredFiles found;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Cannot enumerate " + directory.string() + ": " + ec.message(), scanner_tag());
        return found;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory walk error under " + directory.string() + ": " + ec.message(),
                        scanner_tag());
            break;
        }
        if (stop.stop_requested()) break;

        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        const fs::path& p = it->path();
        if (EntryValidator::is_junk_file(p.filename().string())) continue;

        const CandidateKind kind = EntryValidator::classify(p);
        if (kind == CandidateKind::Unsupported) continue;

        const auto size = it->file_size(fec);
        if (fec) continue;

        const auto ssize = static_cast<std::int64_t>(size);
        if (kind == CandidateKind::Image) {
            if (EntryValidator::is_valid_image_file(p, ssize)) found.images.push_back({p, size, kind});
            else ++found.invalid;
        } else {
            if (EntryValidator::is_valid_archive_file(p, ssize)) found.archives.push_back({p, size, kind});
            else ++found.invalid;
        }
    }

    std::ranges::stable_sort(found.archives, {}, &CandidateFile::size);
    return found;
}

ScanSummary ScanOrchestrator::scan(const std::vector<fs::path>& directories,
                                   const ProgressCallback& progress,
                                   const std::stop_token stop) {
    ScanSummary total;
    for (const auto& dir : directories) {
        if (stop.stop_requested()) {
            total.cancelled = true;
            break;
        }
        total += scan_directory(dir, progress, stop);
    }
    return total;
}

ScanSummary ScanOrchestrator::scan_directory(const fs::path& directory,
                                             const ProgressCallback& progress,
                                             const std::stop_token stop) {
    ScanSummary summary;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        Logger::log(LogLevel::Warning, "Not a directory, skipping: " + directory.string(), scanner_tag());
        return summary;
    }
    summary.directories = 1;

    Logger::log(LogLevel::Info, "Scanning " + directory.string(), scanner_tag());
    DiscoveredFiles found = discover(directory, stop);
    summary.total_files = found.images.size() + found.archives.size();
    summary.invalid_files = found.invalid;

    ProgressReporter reporter(progress, summary.total_files);
    Logger::log(LogLevel::Info,
                "Found " + std::to_string(found.archives.size()) + " archives and " +
                std::to_string(found.images.size()) + " images under " + directory.string(),
                scanner_tag());

    BoundedChannel<ImageRecord> channel(kChannelCapacity);
    auto consumer = std::async(std::launch::async, [this, &channel] {
        return gateway_.stream_insert_images(channel);
    });

    std::exception_ptr failure;
    std::atomic<std::size_t> images_indexed{0};
    std::atomic<std::size_t> images_unreadable{0};
    {
        ChannelCloser closer{channel};

        // stand-alone images
        if (config_.index_standalone_images && !found.images.empty()) {
            ThreadPool pool(config_.max_concurrent_scans, "scanner");
            std::vector<std::future<void>> pending;
            pending.reserve(found.images.size());
            for (const auto& image : found.images) {
                pending.push_back(pool.enqueue([&, path = image.path](const std::stop_token&) {
                    if (stop.stop_requested()) return;
                    if (auto record = processor_.process_image_file(path)) {
                        ++images_indexed;
                        ++reporter.items_found;
                        if (!channel.push(std::move(*record))) {
                            Logger::log(LogLevel::Warning, "Image record dropped, store closed: " + path.string(),
                                        scanner_tag());
                        }
                    } else {
                        ++images_unreadable;
                    }
                    reporter.file_done(path, "image");
                }));
            }
            for (auto& f : pending) {
                try {
                    f.get();
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Image task failed: ") + e.what(), scanner_tag());
                    if (!failure) failure = std::current_exception();
                }
            }
        } else if (!found.images.empty()) {
            summary.images_skipped = found.images.size();
            reporter.skipped(found.images.size(), "stand-alone images not indexed");
        }

        // archives, in size-ordered batches
        const auto& archives = found.archives;
        std::uintmax_t total_bytes = 0;
        for (const auto& a : archives) total_bytes += a.size;

        const unsigned cpu = cpu_count();
        const std::size_t batch_size = archive_batch_size(total_bytes, archives.size(), cpu);
        if (!archives.empty()) {
            Logger::log(LogLevel::Info,
                        "Processing " + std::to_string(archives.size()) + " archives in batches of " +
                        std::to_string(batch_size) + " (" + std::to_string(total_bytes / kMiB) + " MB)",
                        scanner_tag());
        }

        std::mutex counters_mtx;
        for (std::size_t i = 0; i < archives.size() && !failure; i += batch_size) {
            if (stop.stop_requested()) break;

            const std::size_t end = std::min(archives.size(), i + batch_size);
            ThreadPool batch_pool(static_cast<unsigned>(archive_open_limit(end - i, cpu)), "archive_batch");
            std::vector<std::future<void>> pending;
            pending.reserve(end - i);

            for (std::size_t j = i; j < end; ++j) {
                pending.push_back(batch_pool.enqueue([&, path = archives[j].path](const std::stop_token&) {
                    if (stop.stop_requested()) return;
                    std::string status;
                    try {
                        const ArchiveResult r = processor_.process_archive(path, stop);
                        std::lock_guard lock(counters_mtx);
                        switch (r.outcome) {
                            case ArchiveOutcome::Indexed:
                                ++summary.archives_indexed;
                                ++reporter.items_found;
                                if (r.upserted_new) {
                                    ++summary.archives_new;
                                    ++reporter.items_inserted;
                                }
                                status = "indexed";
                                break;
                            case ArchiveOutcome::BelowRatio:
                            case ArchiveOutcome::TooManyEntries:
                                ++summary.archives_below_ratio;
                                status = "skipped";
                                break;
                            case ArchiveOutcome::Cancelled:
                                status = "cancelled";
                                break;
                            case ArchiveOutcome::Unreadable:
                                ++summary.archives_failed;
                                status = "unreadable";
                                break;
                        }
                    } catch (const ArchiveOpenError& e) {
                        Logger::log(LogLevel::Warning, "Failed to process archive " + path.string() + ": " + e.what(),
                                    scanner_tag());
                        std::lock_guard lock(counters_mtx);
                        ++summary.archives_failed;
                        status = "failed";
                    }
                    reporter.file_done(path, "archive " + status);
                }));
            }

            for (auto& f : pending) {
                try {
                    f.get();
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Archive task failed: ") + e.what(), scanner_tag());
                    if (!failure) failure = std::current_exception();
                }
            }

            if (end < archives.size()) {
                interruptible_pause(batch_pause(total_bytes), stop);
            }
        }
    }

    // the channel is closed here; the consumer drains what is left
    std::size_t inserted = 0;
    try {
        inserted = consumer.get();
    } catch (const StorageError&) {
        if (!failure) failure = std::current_exception();
    }
    if (failure) std::rethrow_exception(failure);

    summary.images_indexed = images_indexed.load();
    summary.images_skipped += images_unreadable.load();
    summary.items_inserted = summary.archives_new + inserted;
    reporter.items_inserted += inserted;
    summary.processed_files = reporter.processed();
    summary.cancelled = stop.stop_requested();
    summary.elapsed = reporter.elapsed();

    reporter.completed(summary.cancelled ? "cancelled" : "completed");
    Logger::log(LogLevel::Info,
                "Scan of " + directory.string() + (summary.cancelled ? " cancelled" : " completed") + ": " +
                std::to_string(summary.archives_indexed) + " archives, " + std::to_string(summary.images_indexed) +
                " images, " + std::to_string(summary.items_inserted) + " inserted in " +
                std::to_string(summary.elapsed.count()) + "ms",
                scanner_tag());
    return summary;
}

} // namespace archivist
