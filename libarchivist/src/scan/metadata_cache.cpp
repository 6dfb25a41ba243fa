//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/metadata_cache.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <vector>

namespace archivist {

MetadataCache::MetadataCache(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<ImageMetadata> MetadataCache::get(const std::string& key) {
    std::lock_guard lock(mtx_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    it->second.last_access = std::chrono::steady_clock::now();
    return it->second.metadata;
}

void MetadataCache::put(const std::string& key, ImageMetadata metadata) {
    std::lock_guard lock(mtx_);
    if (entries_.size() >= capacity_ && !entries_.contains(key)) {
        evict_locked();
    }
    entries_.insert_or_assign(key, Entry{std::move(metadata), std::chrono::steady_clock::now()});
}

std::size_t MetadataCache::size() const {
    std::lock_guard lock(mtx_);
    return entries_.size();
}

void MetadataCache::clear() {
    std::lock_guard lock(mtx_);
    entries_.clear();
}

std::string MetadataCache::make_key(const std::filesystem::path& path, const std::uintmax_t size, const Timestamp modified_at) {
    return path.string() + "|" + std::to_string(size) + "|" + format_local_time(modified_at);
}

void MetadataCache::evict_locked() {
    const std::size_t to_remove = std::min(entries_.size(), entries_.size() - capacity_ + kEvictionSlack);

    std::vector<std::pair<std::chrono::steady_clock::time_point, const std::string*>> by_age;
    by_age.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        by_age.emplace_back(entry.last_access, &key);
    }
    std::ranges::nth_element(by_age, by_age.begin() + static_cast<std::ptrdiff_t>(to_remove),
                             [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> victims;
    victims.reserve(to_remove);
    for (std::size_t i = 0; i < to_remove; ++i) victims.push_back(*by_age[i].second);
    for (const auto& key : victims) entries_.erase(key);

    Logger::log(LogLevel::Debug, "Metadata cache evicted " + std::to_string(victims.size()) + " entries",
                "metadata_cache");
}

} // namespace archivist
