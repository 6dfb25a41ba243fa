//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/entry_validator.hpp"
#include "../../include/file_utils.hpp"
#include <algorithm>

namespace archivist {

namespace {

// extension check without allocating
bool has_extension_in(const std::string_view name, const auto& extensions) {
    const auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos) return false;
    const std::string_view ext = name.substr(dot);
    return std::ranges::any_of(extensions, [ext](const std::string_view candidate) {
        return iequals(ext, candidate);
    });
}

std::string_view file_name_of(const std::string_view path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

bool EntryValidator::is_valid_entry(const std::string_view path, const std::int64_t size) noexcept {
    if (path.empty() || size <= 0) return false;

    const std::string_view name = file_name_of(path);
    if (!has_extension_in(name, kImageExtensions)) return false;

    if (size < kMinEntrySize || size > kMaxEntrySize) return false;

    // zip-slip and friends
    if (path.find("..") != std::string_view::npos) return false;
    if (path.front() == '/' || path.front() == '\\') return false;
    if (path.find('\0') != std::string_view::npos) return false;

    if (name.starts_with(".") || name.starts_with("__MACOSX") || name.starts_with("Thumbs.db")) return false;
    if (path.starts_with("__MACOSX/") || path.find("/__MACOSX/") != std::string_view::npos) return false;

    return true;
}

bool EntryValidator::is_valid_image_file(const std::filesystem::path& path, const std::int64_t size) noexcept {
    if (size < kMinImageFileSize || size > kMaxImageFileSize) return false;
    const std::string name = path.filename().string();
    return !is_junk_file(name) && has_extension_in(name, kImageExtensions);
}

bool EntryValidator::is_valid_archive_file(const std::filesystem::path& path, const std::int64_t size) noexcept {
    if (size < kMinArchiveFileSize || size > kMaxArchiveFileSize) return false;
    const std::string name = path.filename().string();
    return !is_junk_file(name) && has_extension_in(name, kArchiveExtensions);
}

bool EntryValidator::is_junk_file(const std::string_view file_name) noexcept {
    if (file_name.starts_with("._")) return true;
    return iequals(file_name, ".ds_store") ||
           iequals(file_name, "desktop.ini") ||
           iequals(file_name, "thumbs.db");
}

CandidateKind EntryValidator::classify(const std::filesystem::path& path) {
    return classify_path(path);
}

} // namespace archivist
