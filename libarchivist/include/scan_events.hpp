//
// Created by Giuseppe Francione on 08/12/25.
//

#ifndef ARCHIVIST_SCAN_EVENTS_HPP
#define ARCHIVIST_SCAN_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace archivist {

/**
 * @brief Progress snapshot delivered after each file or archive of a scan.
 *
 * A plain data carrier; the orchestrator serializes calls to the
 * callback, so subscribers need no locking of their own.
 */
struct ScanProgress {
    std::filesystem::path current_file; ///< File just finished (empty for summary updates)
    std::size_t processed_files = 0;    ///< Files handled so far in this directory
    std::size_t total_files = 0;        ///< Candidates discovered in this directory
    std::string message;                ///< Short human-readable status
    bool is_completed = false;          ///< True for the last update of the directory
    std::size_t items_found = 0;        ///< Archives indexed plus images extracted
    std::size_t items_inserted = 0;     ///< Records stored as new so far
    std::chrono::milliseconds elapsed{0};
};

using ProgressCallback = std::function<void(const ScanProgress&)>;

/**
 * @brief Totals of one or more directory scans.
 */
struct ScanSummary {
    std::size_t directories = 0;
    std::size_t total_files = 0;          ///< Image and archive candidates discovered
    std::size_t processed_files = 0;
    std::size_t archives_indexed = 0;     ///< Archives that passed the ratio threshold
    std::size_t archives_new = 0;         ///< Of those, ids not stored before
    std::size_t archives_below_ratio = 0;
    std::size_t archives_failed = 0;      ///< Open errors
    std::size_t images_indexed = 0;
    std::size_t images_skipped = 0;       ///< Stand-alone images not extracted (policy) or unreadable
    std::size_t invalid_files = 0;        ///< Candidates outside the size bounds
    std::size_t items_inserted = 0;
    std::chrono::milliseconds elapsed{0};
    bool cancelled = false;

    ScanSummary& operator+=(const ScanSummary& o) {
        directories += o.directories;
        total_files += o.total_files;
        processed_files += o.processed_files;
        archives_indexed += o.archives_indexed;
        archives_new += o.archives_new;
        archives_below_ratio += o.archives_below_ratio;
        archives_failed += o.archives_failed;
        images_indexed += o.images_indexed;
        images_skipped += o.images_skipped;
        invalid_files += o.invalid_files;
        items_inserted += o.items_inserted;
        elapsed += o.elapsed;
        cancelled = cancelled || o.cancelled;
        return *this;
    }
};

} // namespace archivist

#endif // ARCHIVIST_SCAN_EVENTS_HPP
