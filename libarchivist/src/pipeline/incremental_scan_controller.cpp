//
// Created by Giuseppe Francione on 09/12/25.
//

#include "../../include/incremental_scan_controller.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/hash_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace archivist {

namespace {

const char* incremental_tag() {
    return "incremental";
}

// normalized, existing directories; the rest is logged and dropped
std::vector<fs::path> existing_directories(const std::vector<fs::path>& configured) {
    std::vector<fs::path> out;
    std::set<std::string> seen;
    for (const auto& dir : configured) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            Logger::log(LogLevel::Warning, "Configured directory not found, skipping: " + dir.string(),
                        incremental_tag());
            continue;
        }
        fs::path norm = normalize_path(dir);
        if (seen.insert(norm.string()).second) out.push_back(std::move(norm));
    }
    return out;
}

} // namespace

IncrementalScanController::IncrementalScanController(const PipelineConfig& config,
                                                     IPersistenceGateway& gateway,
                                                     ScanOrchestrator& orchestrator,
                                                     ThumbnailCache* thumbnails)
    : config_(config), gateway_(gateway), orchestrator_(orchestrator), thumbnails_(thumbnails) {}

ScanPlan IncrementalScanController::plan_scan(const std::vector<fs::path>& configured) {
    ScanPlan plan;

    std::set<std::string> stored;
    for (auto& d : gateway_.image_directories()) stored.insert(std::move(d));
    for (auto& d : gateway_.archive_directories()) stored.insert(std::move(d));

    for (const auto& dir : stored) {
        std::error_code ec;
        const bool missing = !fs::exists(dir, ec);
        const bool outside = std::ranges::none_of(configured, [&](const fs::path& root) {
            return is_same_or_under(dir, root);
        });
        if (missing || outside) {
            Logger::log(LogLevel::Debug,
                        "Purge candidate (" + std::string(missing ? "missing" : "unconfigured") + "): " + dir,
                        incremental_tag());
            plan.to_purge.emplace_back(dir);
        }
    }

    plan.roots = existing_directories(configured);
    const auto now = std::chrono::system_clock::now();
    for (const auto& dir : plan.roots) {
        const auto last = gateway_.last_scan_history(dir);
        if (!last || now - last->scan_date > config_.freshness) {
            plan.to_scan.push_back(dir);
        } else {
            Logger::log(LogLevel::Debug, "Up to date, last scanned " + format_local_time(last->scan_date, "%F %T") +
                        ": " + dir.string(), incremental_tag());
        }
    }

    Logger::log(LogLevel::Info,
                "Plan: " + std::to_string(plan.to_scan.size()) + " to scan, " +
                std::to_string(plan.to_purge.size()) + " to purge",
                incremental_tag());
    return plan;
}

std::size_t IncrementalScanController::purge(const std::vector<fs::path>& directories,
                                             const std::vector<fs::path>& keep) {
    std::size_t deleted = 0;
    for (const auto& dir : directories) {
        if (thumbnails_) {
            std::size_t thumbs = 0;
            for (const auto& source : gateway_.indexed_sources_under(dir)) {
                const bool kept = std::ranges::any_of(keep, [&](const fs::path& root) {
                    return is_same_or_under(source, root);
                });
                if (!kept) thumbs += thumbnails_->remove_for_source(source);
            }
            if (thumbs > 0) {
                Logger::log(LogLevel::Debug, "Removed " + std::to_string(thumbs) + " thumbnails under " + dir.string(),
                            incremental_tag());
            }
        }
        deleted += gateway_.cleanup_items_by_directory(dir, keep);
    }
    if (!directories.empty()) {
        Logger::log(LogLevel::Info,
                    "Purged " + std::to_string(deleted) + " records from " + std::to_string(directories.size()) +
                    " directories",
                    incremental_tag());
    }
    return deleted;
}

ScanSummary IncrementalScanController::scan_and_record(const std::vector<fs::path>& directories,
                                                       const ScanType type,
                                                       const ProgressCallback& progress,
                                                       const std::stop_token stop) {
    ScanSummary total;
    for (const auto& dir : directories) {
        if (stop.stop_requested()) {
            total.cancelled = true;
            break;
        }

        const auto scan_date = std::chrono::system_clock::now();
        const ScanSummary s = orchestrator_.scan_directory(dir, progress, stop);
        total += s;

        // an interrupted scan leaves the directory due
        if (s.cancelled) {
            Logger::log(LogLevel::Info, "Scan interrupted, history not recorded: " + dir.string(), incremental_tag());
            continue;
        }

        ScanHistoryRecord h;
        h.directory_path = normalize_path(dir).string();
        h.scan_date = scan_date;
        h.id = scan_history_id(h.directory_path, scan_date);
        h.file_count = static_cast<int>(s.total_files);
        h.processed_count = static_cast<int>(s.processed_files);
        h.elapsed_ms = s.elapsed.count();
        h.scan_type = type;
        gateway_.insert_scan_history(h);
    }
    return total;
}

ScanSummary IncrementalScanController::run_incremental(const std::vector<fs::path>& configured,
                                                       const ProgressCallback& progress,
                                                       const std::stop_token stop) {
    const ScanPlan plan = plan_scan(configured);
    purge(plan.to_purge, plan.roots);
    if (plan.to_scan.empty()) {
        Logger::log(LogLevel::Info, "Every configured directory is up to date", incremental_tag());
        return {};
    }
    return scan_and_record(plan.to_scan, ScanType::Incremental, progress, stop);
}

ScanSummary IncrementalScanController::run_full(const std::vector<fs::path>& configured,
                                                const ProgressCallback& progress,
                                                const std::stop_token stop) {
    const ScanPlan plan = plan_scan(configured);
    purge(plan.to_purge, plan.roots);
    return scan_and_record(plan.roots, ScanType::Full, progress, stop);
}

} // namespace archivist
