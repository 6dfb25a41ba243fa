//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file entry_validator.hpp
 * @brief Cheap filters applied before any expensive I/O.
 *
 * These checks run once per archive entry, potentially tens of thousands
 * of times per archive, so they only look at strings and integers.
 */

#ifndef ARCHIVIST_ENTRY_VALIDATOR_HPP
#define ARCHIVIST_ENTRY_VALIDATOR_HPP

#include "media_types.hpp"
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace archivist {

///< Size bounds of an image entry inside an archive.
inline constexpr std::int64_t kMinEntrySize = 100;
inline constexpr std::int64_t kMaxEntrySize = 50LL * 1024 * 1024;

///< Size bounds of a stand-alone image file.
inline constexpr std::int64_t kMinImageFileSize = 100;
inline constexpr std::int64_t kMaxImageFileSize = 100LL * 1024 * 1024;

///< Size bounds of an archive file.
inline constexpr std::int64_t kMinArchiveFileSize = 1024;
inline constexpr std::int64_t kMaxArchiveFileSize = 2LL * 1024 * 1024 * 1024;

/**
 * @brief Static predicates over paths and sizes.
 */
class EntryValidator {
public:
    /**
     * @brief Validate an archive entry before it is counted as an image.
     *
     * Rejects empty names, non-positive sizes, unsupported extensions,
     * sizes outside [100 B, 50 MB], traversal sequences ("..", a leading
     * '/' or '\\', embedded NUL) and OS metadata names (".xxx",
     * "__MACOSX", "Thumbs.db").
     *
     * @param path Internal path as stored in the archive.
     * @param size Uncompressed size in bytes.
     */
    [[nodiscard]] static bool is_valid_entry(std::string_view path, std::int64_t size) noexcept;

    /**
     * @brief Validate a stand-alone image file found on disk.
     */
    [[nodiscard]] static bool is_valid_image_file(const std::filesystem::path& path, std::int64_t size) noexcept;

    /**
     * @brief Validate an archive file found on disk.
     */
    [[nodiscard]] static bool is_valid_archive_file(const std::filesystem::path& path, std::int64_t size) noexcept;

    /**
     * @brief OS and tool litter (".DS_Store", "desktop.ini", "Thumbs.db", "._*").
     */
    [[nodiscard]] static bool is_junk_file(std::string_view file_name) noexcept;

    /**
     * @brief Image, Archive or Unsupported, by case-insensitive extension.
     */
    [[nodiscard]] static CandidateKind classify(const std::filesystem::path& path);
};

} // namespace archivist

#endif // ARCHIVIST_ENTRY_VALIDATOR_HPP
