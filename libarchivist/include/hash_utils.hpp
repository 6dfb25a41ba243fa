//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file hash_utils.hpp
 * @brief Stable identifiers for records and thumbnail file names.
 *
 * Identities must survive process restarts (re-scans upsert instead of
 * duplicating, thumbnails are found again on the next run), so they are
 * derived from MD5 digests of path strings and never from std::hash.
 */

#ifndef ARCHIVIST_HASH_UTILS_HPP
#define ARCHIVIST_HASH_UTILS_HPP

#include "file_utils.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace archivist {

    /**
     * @brief Lower-case hexadecimal MD5 digest of a byte string (32 chars).
     * @throws std::runtime_error if the OpenSSL digest fails.
     */
    std::string md5_hex(std::string_view data);

    /**
     * @brief Record id of a file: 16 hex digits of MD5(absolute path).
     */
    std::string file_id(const std::filesystem::path& path);

    /**
     * @brief Record id of an archive entry, keyed by container and internal path.
     */
    std::string entry_id(const std::filesystem::path& archive_path, std::string_view internal_path);

    /**
     * @brief Id of a scan history row: MD5(directory + "_" + yyyyMMddHHmmssSSS + "_" + random suffix).
     *
     * Never repeats, so appending history cannot replace an earlier row.
     */
    std::string scan_history_id(const std::filesystem::path& directory, Timestamp scan_date);

} // namespace archivist

#endif // ARCHIVIST_HASH_UTILS_HPP
