//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/archive_reader.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <string>

namespace archivist {

namespace {

const char* reader_tag() {
    return "archive_reader";
}

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

} // namespace

void ArchiveReader::ArchiveReadCloser::operator()(archive* a) const {
    if (a) archive_read_free(a);
}

ArchiveReader::ArchiveReader(std::filesystem::path path)
    : path_(std::move(path)) {}

ArchiveReader::~ArchiveReader() = default;

void ArchiveReader::open() {
    handle_.reset(archive_read_new());
    if (!handle_) {
        throw ArchiveOpenError("archive_read_new failed");
    }
    enable_formats(handle_.get());

    const int r = archive_read_open_filename(handle_.get(), path_.string().c_str(), 64 * 1024);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(handle_.get()), reader_tag());
    } else if (r != ARCHIVE_OK) {
        const std::string msg = "archive_read_open_filename: " + error_of(handle_.get()) + " (" + path_.string() + ")";
        Logger::log(LogLevel::Error, msg, reader_tag());
        handle_.reset();
        throw ArchiveOpenError(msg);
    }
}

std::optional<ArchiveEntryHeader> ArchiveReader::next_entry() {
    if (!handle_) throw ArchiveOpenError("archive not open: " + path_.string());

    archive_entry* entry = nullptr;
    const int r = archive_read_next_header(handle_.get(), &entry);
    if (r == ARCHIVE_EOF) return std::nullopt;
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Debug, "LIBARCHIVE WARN: " + error_of(handle_.get()), reader_tag());
    } else if (r != ARCHIVE_OK) {
        const std::string msg = "Error during iteration: " + error_of(handle_.get()) + " (" + path_.string() + ")";
        Logger::log(LogLevel::Error, msg, reader_tag());
        throw ArchiveOpenError(msg);
    }

    ArchiveEntryHeader header;
    const char* name = archive_entry_pathname_utf8(entry);
    if (!name) name = archive_entry_pathname(entry);
    header.path = name ? name : "";
    header.size = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : -1;
    header.is_directory = archive_entry_filetype(entry) == AE_IFDIR ||
                          (!header.path.empty() && (header.path.back() == '/' || header.path.back() == '\\'));
    return header;
}

std::vector<unsigned char> ArchiveReader::read_entry_data(const std::size_t max_bytes) {
    if (!handle_) throw ArchiveOpenError("archive not open: " + path_.string());

    std::vector<unsigned char> data;
    std::vector<unsigned char> buffer(64 * 1024);
    la_ssize_t size_read = 0;
    while ((size_read = archive_read_data(handle_.get(), buffer.data(), buffer.size())) > 0) {
        if (data.size() + static_cast<std::size_t>(size_read) > max_bytes) {
            throw std::runtime_error("Entry exceeds " + std::to_string(max_bytes) + " bytes");
        }
        data.insert(data.end(), buffer.begin(), buffer.begin() + size_read);
    }
    if (size_read < 0) {
        throw std::runtime_error("Error reading data: " + error_of(handle_.get()));
    }
    return data;
}

void ZipArchiveReader::enable_formats(archive* a) {
    archive_read_support_format_zip(a);
    if (archive_read_set_options(a, "hdrcharset=UTF-8") != ARCHIVE_OK) {
        Logger::log(LogLevel::Debug, "hdrcharset option rejected: " + error_of(a), reader_tag());
    }
}

void RarArchiveReader::enable_formats(archive* a) {
    archive_read_support_format_rar(a);
    archive_read_support_format_rar5(a);
}

std::unique_ptr<ArchiveReader> make_archive_reader(const std::filesystem::path& path) {
    std::unique_ptr<ArchiveReader> reader;
    switch (archive_kind_from_extension(path.extension().string())) {
        case ArchiveKind::Zip: reader = std::make_unique<ZipArchiveReader>(path); break;
        case ArchiveKind::Rar: reader = std::make_unique<RarArchiveReader>(path); break;
        case ArchiveKind::Unknown:
            throw ArchiveOpenError("Unsupported archive type: " + path.string());
    }
    reader->open();
    return reader;
}

} // namespace archivist
