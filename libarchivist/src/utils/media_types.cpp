//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/media_types.hpp"
#include "../../include/file_utils.hpp"
#include <algorithm>

namespace archivist {

std::string lower_extension(const std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    const auto base = slash == std::string_view::npos ? name : name.substr(slash + 1);
    const auto dot = base.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) return {};
    return to_lower_copy(std::string(base.substr(dot)));
}

bool is_image_extension(const std::string_view ext) {
    const std::string lower = to_lower_copy(std::string(ext));
    return std::ranges::find(kImageExtensions, lower) != kImageExtensions.end();
}

bool is_archive_extension(const std::string_view ext) {
    const std::string lower = to_lower_copy(std::string(ext));
    return std::ranges::find(kArchiveExtensions, lower) != kArchiveExtensions.end();
}

CandidateKind classify_path(const std::filesystem::path& path) {
    const std::string ext = lower_extension(path.filename().string());
    if (ext.empty()) return CandidateKind::Unsupported;
    if (is_image_extension(ext)) return CandidateKind::Image;
    if (is_archive_extension(ext)) return CandidateKind::Archive;
    return CandidateKind::Unsupported;
}

ImageFormat image_format_from_extension(const std::string_view ext) {
    const std::string lower = to_lower_copy(std::string(ext));
    if (lower == ".jpg" || lower == ".jpeg") return ImageFormat::Jpeg;
    if (lower == ".png")  return ImageFormat::Png;
    if (lower == ".bmp")  return ImageFormat::Bmp;
    if (lower == ".gif")  return ImageFormat::Gif;
    if (lower == ".webp") return ImageFormat::Webp;
    return ImageFormat::Unknown;
}

ArchiveKind archive_kind_from_extension(const std::string_view ext) {
    const std::string lower = to_lower_copy(std::string(ext));
    if (lower == ".zip") return ArchiveKind::Zip;
    if (lower == ".rar") return ArchiveKind::Rar;
    return ArchiveKind::Unknown;
}

std::string image_format_to_string(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Png:  return "PNG";
        case ImageFormat::Bmp:  return "BMP";
        case ImageFormat::Gif:  return "GIF";
        case ImageFormat::Webp: return "WEBP";
        case ImageFormat::Unknown: break;
    }
    return "UNKNOWN";
}

std::string archive_kind_to_extension(const ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::Zip: return ".zip";
        case ArchiveKind::Rar: return ".rar";
        case ArchiveKind::Unknown: break;
    }
    return {};
}

} // namespace archivist
