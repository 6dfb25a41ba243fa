//
// Created by Giuseppe Francione on 07/12/25.
//

/**
 * @file records.hpp
 * @brief Value types produced by the scan pipeline and stored by the gateway.
 */

#ifndef ARCHIVIST_RECORDS_HPP
#define ARCHIVIST_RECORDS_HPP

#include "file_utils.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace archivist {

/**
 * @brief One image inside an archive.
 */
struct ArchiveEntryRecord {
    std::string internal_path;
    std::string file_name;
    std::int64_t file_size = 0;
    int width = 0;  ///< 0 when unknown
    int height = 0; ///< 0 when unknown
    std::string format;
    std::optional<std::string> thumbnail_path; ///< The archive's thumbnail, shared by every entry
    double image_ratio = 0.0;                  ///< The archive's image ratio
};

/**
 * @brief An archive that passed the image-ratio threshold.
 */
struct ArchiveRecord {
    std::string id; ///< file_id() of the absolute path
    std::string file_path;
    std::string file_name;
    std::int64_t file_size = 0;
    Timestamp created_at{};
    Timestamp modified_at{};
    Timestamp scan_date{};
    std::string archive_type; ///< ".zip" or ".rar"
    int total_files = 0;      ///< non-directory entries
    int image_files = 0;
    double image_ratio = 0.0;
    std::optional<std::string> thumbnail_path;
    std::vector<ArchiveEntryRecord> entries; ///< sorted case-insensitively by internal path
    bool is_deleted = false;
};

/**
 * @brief A stand-alone image file, or an archive entry when flattened.
 */
struct ImageRecord {
    std::string id;
    std::string file_path;
    std::string file_name;
    std::int64_t file_size = 0;
    int width = 0;
    int height = 0;
    std::optional<std::string> thumbnail_path;
    Timestamp created_at{};
    Timestamp modified_at{};
    Timestamp scan_date{};
    bool is_deleted = false;
    bool is_archived = false;
    std::optional<std::string> archive_path;
    std::optional<std::string> internal_path;
    std::optional<double> archive_image_ratio;
    std::string image_format;
    bool has_exif_data = false;
    std::optional<Timestamp> date_taken;
};

enum class ScanType {
    Full,
    Incremental
};

[[nodiscard]] inline const char* scan_type_to_string(const ScanType type) {
    return type == ScanType::Full ? "Full" : "Incremental";
}

[[nodiscard]] inline ScanType scan_type_from_string(const std::string& s) {
    return s == "Full" ? ScanType::Full : ScanType::Incremental;
}

/**
 * @brief One completed scan of one directory. Append-only.
 */
struct ScanHistoryRecord {
    std::string id; ///< scan_history_id(directory, scan_date)
    std::string directory_path;
    Timestamp scan_date{};
    int file_count = 0;
    int processed_count = 0;
    std::int64_t elapsed_ms = 0;
    ScanType scan_type = ScanType::Incremental;
};

} // namespace archivist

#endif // ARCHIVIST_RECORDS_HPP
