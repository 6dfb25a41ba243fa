//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file incremental_scan_controller.hpp
 * @brief Decides what to rescan and what to forget, then runs the scans.
 *
 * A directory is rescanned when it has no history or its last scan is
 * older than the freshness window. Stored items whose parent directory
 * vanished, or no longer lies under any configured root, are purged along
 * with their thumbnails.
 */

#ifndef ARCHIVIST_INCREMENTAL_SCAN_CONTROLLER_HPP
#define ARCHIVIST_INCREMENTAL_SCAN_CONTROLLER_HPP

#include "persistence_gateway.hpp"
#include "pipeline_config.hpp"
#include "scan_events.hpp"
#include "scan_orchestrator.hpp"
#include "thumbnail_cache.hpp"
#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace archivist {

    struct ScanPlan {
        std::vector<std::filesystem::path> to_scan;  ///< Configured directories that are due
        std::vector<std::filesystem::path> to_purge; ///< Stored directories to forget
        std::vector<std::filesystem::path> roots;    ///< Configured directories present on disk, normalized
    };

    class IncrementalScanController {
    public:
        /**
         * @param thumbnails May be null; purges then only touch the store.
         */
        IncrementalScanController(const PipelineConfig& config,
                                  IPersistenceGateway& gateway,
                                  ScanOrchestrator& orchestrator,
                                  ThumbnailCache* thumbnails);

        /**
         * @brief Computes the plan without touching the store or the disk.
         */
        [[nodiscard]] ScanPlan plan_scan(const std::vector<std::filesystem::path>& configured);

        /**
         * @brief Removes the thumbnails, then the records, stored under each directory.
         *
         * Records at or below one of the @p keep roots survive even when a
         * purged directory is their ancestor.
         * @return Number of records deleted.
         */
        std::size_t purge(const std::vector<std::filesystem::path>& directories,
                          const std::vector<std::filesystem::path>& keep = {});

        /**
         * @brief Plan, purge, scan the due directories, and record an Incremental history entry for each.
         */
        ScanSummary run_incremental(const std::vector<std::filesystem::path>& configured,
                                    const ProgressCallback& progress,
                                    std::stop_token stop);

        /**
         * @brief Purge, then scan every existing configured directory regardless of freshness.
         */
        ScanSummary run_full(const std::vector<std::filesystem::path>& configured,
                             const ProgressCallback& progress,
                             std::stop_token stop);

    private:
        ScanSummary scan_and_record(const std::vector<std::filesystem::path>& directories,
                                    ScanType type,
                                    const ProgressCallback& progress,
                                    std::stop_token stop);

        const PipelineConfig& config_;
        IPersistenceGateway& gateway_;
        ScanOrchestrator& orchestrator_;
        ThumbnailCache* thumbnails_;
    };

} // namespace archivist

#endif // ARCHIVIST_INCREMENTAL_SCAN_CONTROLLER_HPP
