//
// Created by Giuseppe Francione on 06/12/25.
//

/**
 * @file archive_reader.hpp
 * @brief Streaming, read-only access to ZIP and RAR containers via libarchive.
 *
 * A reader walks the entry headers once, front to back. The data of the
 * current entry can be read or skipped before moving on; there is no
 * random access, so callers that need several entries collect what they
 * need during the single pass.
 */

#ifndef ARCHIVIST_ARCHIVE_READER_HPP
#define ARCHIVIST_ARCHIVE_READER_HPP

#include "media_types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct archive;

namespace archivist {

    /**
     * @brief The container could not be opened or its headers are unreadable.
     */
    class ArchiveOpenError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Header of one entry as reported by the container.
     */
    struct ArchiveEntryHeader {
        std::string path;          ///< Internal path, '/' separated
        std::int64_t size = -1;    ///< Uncompressed size, -1 when the container does not record it
        bool is_directory = false;
    };

    /**
     * @brief Base reader; subclasses pick the libarchive format modules.
     */
    class ArchiveReader {
    public:
        explicit ArchiveReader(std::filesystem::path path);
        virtual ~ArchiveReader();

        ArchiveReader(const ArchiveReader&) = delete;
        ArchiveReader& operator=(const ArchiveReader&) = delete;

        /**
         * @brief Opens the container.
         * @throws ArchiveOpenError if libarchive rejects the file.
         */
        void open();

        /**
         * @brief Advances to the next entry header.
         * @return std::nullopt at the end of the archive.
         * @throws ArchiveOpenError if the header stream is corrupt.
         */
        std::optional<ArchiveEntryHeader> next_entry();

        /**
         * @brief Reads the data of the current entry.
         * @param max_bytes Entries larger than this are rejected.
         * @throws std::runtime_error on a data error or when the limit is exceeded.
         */
        std::vector<unsigned char> read_entry_data(std::size_t max_bytes);

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
        [[nodiscard]] virtual ArchiveKind kind() const noexcept = 0;

    protected:
        /**
         * @brief Registers the format readers of this container type.
         */
        virtual void enable_formats(archive* a) = 0;

    private:
        struct ArchiveReadCloser {
            void operator()(archive* a) const;
        };

        std::filesystem::path path_;
        std::unique_ptr<archive, ArchiveReadCloser> handle_;
    };

    class ZipArchiveReader final : public ArchiveReader {
    public:
        using ArchiveReader::ArchiveReader;
        [[nodiscard]] ArchiveKind kind() const noexcept override { return ArchiveKind::Zip; }

    protected:
        void enable_formats(archive* a) override;
    };

    class RarArchiveReader final : public ArchiveReader {
    public:
        using ArchiveReader::ArchiveReader;
        [[nodiscard]] ArchiveKind kind() const noexcept override { return ArchiveKind::Rar; }

    protected:
        void enable_formats(archive* a) override;
    };

    /**
     * @brief Picks the reader for the archive's extension and opens it.
     * @throws ArchiveOpenError for unsupported extensions or open failures.
     */
    std::unique_ptr<ArchiveReader> make_archive_reader(const std::filesystem::path& path);

} // namespace archivist

#endif // ARCHIVIST_ARCHIVE_READER_HPP
