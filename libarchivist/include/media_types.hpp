//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file media_types.hpp
 * @brief Image and archive format enumerations and their lookup tables.
 *
 * Extension sets in this file define what the scanner considers an image
 * or an archive. All lookups are case-insensitive.
 */

#ifndef ARCHIVIST_MEDIA_TYPES_HPP
#define ARCHIVIST_MEDIA_TYPES_HPP

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace archivist {

/**
 * @brief Image formats the indexer recognises.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Bmp,
    Gif,
    Webp,
    Unknown
};

/**
 * @brief Archive containers the indexer opens.
 */
enum class ArchiveKind {
    Zip,
    Rar,
    Unknown
};

/**
 * @brief Classification of a discovered file.
 */
enum class CandidateKind {
    Image,
    Archive,
    Unsupported
};

///< Supported stand-alone and in-archive image extensions.
inline constexpr std::array<std::string_view, 6> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".webp"
};

///< Supported archive extensions.
inline constexpr std::array<std::string_view, 2> kArchiveExtensions = {
    ".zip", ".rar"
};

///< Map linking MIME types reported by libmagic to image formats.
inline const std::unordered_map<std::string, ImageFormat> mime_to_image_format = {
    { "image/jpeg",       ImageFormat::Jpeg },
    { "image/pjpeg",      ImageFormat::Jpeg },
    { "image/png",        ImageFormat::Png },
    { "image/bmp",        ImageFormat::Bmp },
    { "image/x-ms-bmp",   ImageFormat::Bmp },
    { "image/gif",        ImageFormat::Gif },
    { "image/webp",       ImageFormat::Webp },
};

///< Map linking MIME types reported by libmagic to archive kinds.
inline const std::unordered_map<std::string, ArchiveKind> mime_to_archive_kind = {
    { "application/zip",              ArchiveKind::Zip },
    { "application/x-zip-compressed", ArchiveKind::Zip },
    { "application/vnd.rar",          ArchiveKind::Rar },
    { "application/x-rar",            ArchiveKind::Rar },
    { "application/x-rar-compressed", ArchiveKind::Rar },
};

/**
 * @brief Lower-cased extension of a path or entry name, dot included.
 */
std::string lower_extension(std::string_view name);

[[nodiscard]] bool is_image_extension(std::string_view ext);
[[nodiscard]] bool is_archive_extension(std::string_view ext);

/**
 * @brief Classify a path by extension.
 */
CandidateKind classify_path(const std::filesystem::path& path);

/**
 * @brief Image format for an extension (".jpeg" -> Jpeg).
 */
ImageFormat image_format_from_extension(std::string_view ext);

/**
 * @brief Archive kind for an extension (".zip" -> Zip).
 */
ArchiveKind archive_kind_from_extension(std::string_view ext);

/**
 * @brief Canonical upper-case name ("JPEG", "PNG", ...).
 */
std::string image_format_to_string(ImageFormat fmt);

/**
 * @brief ".zip" / ".rar" string stored in archive records.
 */
std::string archive_kind_to_extension(ArchiveKind kind);

} // namespace archivist

#endif // ARCHIVIST_MEDIA_TYPES_HPP
