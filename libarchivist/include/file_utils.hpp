//
// Created by Giuseppe Francione on 02/12/25.
//

#ifndef ARCHIVIST_FILE_UTILS_HPP
#define ARCHIVIST_FILE_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archivist {

    ///< Wall-clock instant used by every record and by the scan history.
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @brief Basic attributes of a file, read with one stat call.
     */
    struct FileStat {
        std::uintmax_t size = 0;
        Timestamp modified_at{};
        Timestamp created_at{};
    };

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };

    /**
     * @brief Reads a whole file into memory.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<unsigned char> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Reads at most @p max_bytes from the start of a file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    std::vector<unsigned char> read_file_head(const std::filesystem::path &path, std::size_t max_bytes);

    /**
     * @brief Size and timestamps of a regular file, std::nullopt if it cannot be stat'ed.
     */
    std::optional<FileStat> stat_file(const std::filesystem::path &path);

    /**
     * @brief Lower-case ASCII copy of a string.
     */
    std::string to_lower_copy(std::string s);

    /**
     * @brief Case-insensitive ASCII equality.
     */
    bool iequals(std::string_view a, std::string_view b);

    /**
     * @brief Case-insensitive ASCII ordering (ordinal, ignore case).
     */
    bool iless(std::string_view a, std::string_view b);

    /**
     * @brief Case-insensitive "is @p path equal to or below @p root".
     *
     * Both arguments are compared as lexically normalized generic strings,
     * so "/a/b" is under "/a" but "/ab" is not.
     */
    bool is_same_or_under(const std::filesystem::path &path, const std::filesystem::path &root);

    /**
     * @brief Absolute, lexically normalized form of a path (no I/O on failure).
     */
    std::filesystem::path normalize_path(const std::filesystem::path &path);

    /**
     * @brief Formats a timestamp in local time with a strftime pattern.
     */
    std::string format_local_time(Timestamp ts, const char *pattern = "%Y%m%d%H%M%S");

    /**
     * @brief Temporary sibling name for @p target, for write-then-rename.
     */
    std::filesystem::path make_temp_sibling(const std::filesystem::path &target);

    /**
     * @brief Total bytes of regular files under a directory (0 if missing).
     */
    std::uintmax_t directory_size(const std::filesystem::path &dir);

} // namespace archivist

#endif // ARCHIVIST_FILE_UTILS_HPP
