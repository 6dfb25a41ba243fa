//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/thumbnail_cache.hpp"
#include "../../include/archive_reader.hpp"
#include "../../include/entry_validator.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/hash_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <algorithm>
#include <chrono>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace archivist {

namespace {

const char* thumbs_tag() {
    return "thumbnails";
}

// releases the slot on every exit path
class SlotGuard {
public:
    explicit SlotGuard(std::counting_semaphore<64>& sem) : sem_(sem) { sem_.acquire(); }
    ~SlotGuard() { sem_.release(); }
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;
private:
    std::counting_semaphore<64>& sem_;
};

struct Candidate {
    std::string name;
    std::vector<unsigned char> data;
};

bool is_size_dir(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec) && entry.path().filename().string().starts_with("size_");
}

bool is_temp_name(const std::string& name) {
    return name.starts_with(".") && name.find(".tmp_") != std::string::npos;
}

} // namespace

ThumbnailCache::ThumbnailCache(fs::path root, const unsigned generation_limit)
    : root_(std::move(root)),
      generation_slots_(static_cast<std::ptrdiff_t>(std::clamp(generation_limit, 1u, 64u))) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Cannot create thumbnail directory " + root_.string() + ": " + ec.message(),
                    thumbs_tag());
    }
}

std::string ThumbnailCache::source_hash(const fs::path& source) {
    return md5_hex(to_lower_copy(source.string())).substr(0, 16);
}

fs::path ThumbnailCache::thumbnail_path(const fs::path& source, const int size, const bool is_archive) const {
    const std::string n = std::to_string(size);
    return root_ / ("size_" + n) / (source_hash(source) + "_" + n + (is_archive ? "_archive" : "") + ".jpg");
}

bool ThumbnailCache::is_fresh(const fs::path& target, const fs::path& source) {
    std::error_code ec;
    const auto thumb_time = fs::last_write_time(target, ec);
    if (ec) return false;
    const auto source_time = fs::last_write_time(source, ec);
    if (ec) return false;
    return thumb_time >= source_time;
}

bool ThumbnailCache::exists(const fs::path& source, const int size, const bool is_archive) const {
    return is_fresh(thumbnail_path(source, size, is_archive), source);
}

std::optional<fs::path> ThumbnailCache::get_or_create(const fs::path& source, const int size, const bool is_archive) {
    std::error_code ec;
    if (source.empty() || !fs::is_regular_file(source, ec)) {
        Logger::log(LogLevel::Warning, "Thumbnail source not found: " + source.string(), thumbs_tag());
        return std::nullopt;
    }
    if (size <= 0) return std::nullopt;

    const fs::path target = thumbnail_path(source, size, is_archive);
    if (is_fresh(target, source)) {
        Logger::log(LogLevel::Debug, "Using existing thumbnail: " + target.string(), thumbs_tag());
        return target;
    }

    // the artifact path already folds spelling, size and kind of the source
    const std::string key = target.string();

    std::promise<Result> promise;
    std::shared_future<Result> pending;
    bool owner = false;
    {
        std::lock_guard lock(inflight_mtx_);
        if (const auto it = inflight_.find(key); it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(key, pending);
            owner = true;
        }
    }

    if (!owner) {
        Logger::log(LogLevel::Debug, "Waiting for pending thumbnail generation: " + source.string(), thumbs_tag());
        return pending.get();
    }

    Result result;
    try {
        result = generate_limited(source, target, size, is_archive);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Thumbnail generation failed for " + source.string() + ": " + e.what(),
                    thumbs_tag());
        result = std::nullopt;
    }

    promise.set_value(result);
    {
        std::lock_guard lock(inflight_mtx_);
        inflight_.erase(key);
    }
    return result;
}

ThumbnailCache::Result ThumbnailCache::generate_limited(const fs::path& source, const fs::path& target,
                                                        const int size, const bool is_archive) {
    SlotGuard slot(generation_slots_);

    // another caller may have finished while this one waited for a slot
    if (is_fresh(target, source)) return target;

    return generate(source, target, size, is_archive);
}

ThumbnailCache::Result ThumbnailCache::generate(const fs::path& source, const fs::path& target,
                                                const int size, const bool is_archive) {
    const auto start = std::chrono::steady_clock::now();
    const int base_size = std::max(kMinBaseSize, size * 2);

    std::optional<DecodedImage> decoded = is_archive ? decode_from_archive(source, base_size)
                                                     : decode_standalone(source, base_size);
    if (!decoded) return std::nullopt;

    DecodedImage thumb = scale_to_fit(std::move(*decoded), base_size);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Cannot create " + target.parent_path().string() + ": " + ec.message(), thumbs_tag());
        return std::nullopt;
    }

    const fs::path temp = make_temp_sibling(target);
    try {
        write_jpeg(thumb, temp, kJpegQuality);
    } catch (const std::exception& e) {
        fs::remove(temp, ec);
        Logger::log(LogLevel::Warning, "Cannot write thumbnail " + target.string() + ": " + e.what(), thumbs_tag());
        return std::nullopt;
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        Logger::log(LogLevel::Error, "Cannot move thumbnail into place " + target.string() + ": " + ec.message(),
                    thumbs_tag());
        return std::nullopt;
    }

    ++generations_;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Logger::log(LogLevel::Debug,
                "Generated thumbnail " + target.string() + " (" + std::to_string(thumb.width) + "x" +
                std::to_string(thumb.height) + ") in " + std::to_string(ms) + "ms",
                thumbs_tag());
    return target;
}

std::optional<DecodedImage> ThumbnailCache::decode_standalone(const fs::path& source, const int base_size) {
    try {
        const std::vector<unsigned char> bytes = read_file_bytes(source);
        const std::string name = source.filename().string();
        return decode_image(bytes, MimeDetector::detect_image_format(bytes, name), base_size);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Failed to decode " + source.string() + ": " + e.what(), thumbs_tag());
    }
    return std::nullopt;
}

std::optional<DecodedImage> ThumbnailCache::decode_from_archive(const fs::path& source, const int base_size) {
    // keep the bytes of the smallest names seen so far; the archive is read once
    std::vector<Candidate> kept;
    try {
        const auto reader = make_archive_reader(source);
        while (const auto header = reader->next_entry()) {
            if (header->is_directory || !EntryValidator::is_valid_entry(header->path, header->size)) continue;
            if (kept.size() >= kMaxArchiveAttempts && !iless(header->path, kept.back().name)) continue;

            Candidate c{header->path, reader->read_entry_data(static_cast<std::size_t>(kMaxEntrySize))};
            const auto pos = std::ranges::upper_bound(kept, c.name, iless, &Candidate::name);
            kept.insert(pos, std::move(c));
            if (kept.size() > kMaxArchiveAttempts) kept.pop_back();
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Failed to read archive for thumbnail " + source.string() + ": " + e.what(),
                    thumbs_tag());
        if (kept.empty()) return std::nullopt;
    }

    if (kept.empty()) {
        Logger::log(LogLevel::Debug, "No image files found in archive: " + source.string(), thumbs_tag());
        return std::nullopt;
    }

    for (std::size_t i = 0; i < kept.size(); ++i) {
        try {
            return decode_image(kept[i].data, MimeDetector::detect_image_format(kept[i].data, kept[i].name), base_size);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Debug,
                        "Failed to generate thumbnail from image " + std::to_string(i + 1) + ": " + kept[i].name +
                        " (" + e.what() + "), trying next image",
                        thumbs_tag());
        }
    }
    Logger::log(LogLevel::Warning,
                "Failed to generate thumbnail from any of " + std::to_string(kept.size()) + " images in archive: " +
                source.string(),
                thumbs_tag());
    return std::nullopt;
}

bool ThumbnailCache::clear() {
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Failed to clear thumbnail cache: " + ec.message(), thumbs_tag());
        return false;
    }
    fs::create_directories(root_, ec);
    Logger::log(LogLevel::Info, "Thumbnail cache cleared", thumbs_tag());
    return true;
}

std::uintmax_t ThumbnailCache::cache_size_bytes() const {
    return directory_size(root_);
}

std::size_t ThumbnailCache::cleanup_older_than(const int days) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return 0;

    const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24) * days;
    std::size_t deleted = 0;
    for (auto it = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        const auto written = it->last_write_time(fec);
        if (fec || written >= cutoff) continue;
        if (fs::remove(it->path(), fec)) {
            ++deleted;
        } else {
            Logger::log(LogLevel::Warning, "Failed to delete old thumbnail: " + it->path().string(), thumbs_tag());
        }
    }
    Logger::log(LogLevel::Info, "Cleaned up " + std::to_string(deleted) + " old thumbnails", thumbs_tag());
    return deleted;
}

std::size_t ThumbnailCache::remove_for_source(const fs::path& source) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return 0;

    const std::string prefix = source_hash(source) + "_";
    std::size_t removed = 0;
    for (const auto& dir : fs::directory_iterator(root_, ec)) {
        if (!is_size_dir(dir)) continue;
        const std::string n = dir.path().filename().string().substr(5);
        for (const char* suffix : {"", "_archive"}) {
            const fs::path file = dir.path() / (prefix + n + suffix + ".jpg");
            if (fs::remove(file, ec)) ++removed;
        }
    }
    return removed;
}

std::size_t ThumbnailCache::cleanup_orphans(const std::vector<fs::path>& live_sources) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return 0;

    std::unordered_set<std::string> live;
    live.reserve(live_sources.size());
    for (const auto& src : live_sources) live.insert(source_hash(src));

    std::size_t removed = 0;
    for (const auto& dir : fs::directory_iterator(root_, ec)) {
        if (!is_size_dir(dir)) continue;
        std::vector<fs::path> doomed;
        for (const auto& file : fs::directory_iterator(dir.path(), ec)) {
            const std::string name = file.path().filename().string();
            if (is_temp_name(name)) {
                doomed.push_back(file.path());
                continue;
            }
            const auto underscore = name.find('_');
            if (file.path().extension() != ".jpg" || underscore == std::string::npos) continue;
            if (!live.contains(name.substr(0, underscore))) doomed.push_back(file.path());
        }
        for (const auto& p : doomed) {
            if (fs::remove(p, ec)) ++removed;
        }
    }
    Logger::log(LogLevel::Info, "Removed " + std::to_string(removed) + " orphaned thumbnails", thumbs_tag());
    return removed;
}

} // namespace archivist
