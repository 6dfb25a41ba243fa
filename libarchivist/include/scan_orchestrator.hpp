//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file scan_orchestrator.hpp
 * @brief Walks directory trees and drives the per-file pipeline.
 *
 * Archives are processed in size-ordered batches whose width depends on
 * the total amount of data, with short pauses between heavy batches so a
 * spinning disk is not saturated. Stand-alone images, when the policy
 * allows indexing them, run on a fixed worker pool and stream into the
 * gateway through a bounded channel.
 */

#ifndef ARCHIVIST_SCAN_ORCHESTRATOR_HPP
#define ARCHIVIST_SCAN_ORCHESTRATOR_HPP

#include "archive_batch_processor.hpp"
#include "persistence_gateway.hpp"
#include "pipeline_config.hpp"
#include "scan_events.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace archivist {

    /**
     * @brief A discovered file and its size.
     */
    struct CandidateFile {
        std::filesystem::path path;
        std::uintmax_t size = 0;
        CandidateKind kind = CandidateKind::Unsupported;
    };

    /**
     * @brief Result of walking one directory tree.
     */
    struct DiscoveredFiles {
        std::vector<CandidateFile> images;
        std::vector<CandidateFile> archives;
        std::size_t invalid = 0; ///< Supported extension but outside the size bounds
    };

    class ScanOrchestrator {
    public:
        ///< Image records buffered between the workers and the gateway.
        static constexpr std::size_t kChannelCapacity = 500;

        ScanOrchestrator(const PipelineConfig& config,
                         IPersistenceGateway& gateway,
                         ArchiveBatchProcessor& processor);

        /**
         * @brief Scans each directory in turn and adds up the summaries.
         */
        ScanSummary scan(const std::vector<std::filesystem::path>& directories,
                         const ProgressCallback& progress,
                         std::stop_token stop);

        /**
         * @brief Scans one directory tree.
         * @throws StorageError if the gateway fails; units in flight finish first.
         */
        ScanSummary scan_directory(const std::filesystem::path& directory,
                                   const ProgressCallback& progress,
                                   std::stop_token stop);

        /**
         * @brief Recursively lists images and archives under @p directory, junk and
         * unreadable subtrees excluded. Archives come back sorted by size.
         */
        static DiscoveredFiles discover(const std::filesystem::path& directory, std::stop_token stop = {});

        /**
         * @brief Archives per batch for @p count archives totalling @p total_bytes.
         */
        [[nodiscard]] static std::size_t archive_batch_size(std::uintmax_t total_bytes, std::size_t count,
                                                            unsigned cpu_count);

        /**
         * @brief Archives of one batch opened at the same time.
         */
        [[nodiscard]] static std::size_t archive_open_limit(std::size_t batch_size, unsigned cpu_count);

        /**
         * @brief Pause between two batches when the directory holds @p total_bytes of archives.
         */
        [[nodiscard]] static std::chrono::milliseconds batch_pause(std::uintmax_t total_bytes);

    private:
        const PipelineConfig& config_;
        IPersistenceGateway& gateway_;
        ArchiveBatchProcessor& processor_;
    };

} // namespace archivist

#endif // ARCHIVIST_SCAN_ORCHESTRATOR_HPP
