//
// Created by Giuseppe Francione on 08/12/25.
//

#include "../../include/pipeline_config.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

namespace archivist {

namespace {

void reject(const std::string& msg) {
    Logger::log(LogLevel::Error, msg, "config");
    throw std::invalid_argument(msg);
}

} // namespace

void PipelineConfig::validate() const {
    if (thumbnail_size <= 0 || thumbnail_size > 4096) {
        reject("thumbnail_size must be in [1, 4096], got " + std::to_string(thumbnail_size));
    }
    if (!(archive_image_ratio_threshold > 0.0 && archive_image_ratio_threshold <= 1.0)) {
        reject("archive_image_ratio_threshold must be in (0, 1], got " +
               std::to_string(archive_image_ratio_threshold));
    }
    if (max_concurrent_scans == 0) {
        reject("max_concurrent_scans must be positive");
    }
    if (metadata_cache_capacity == 0) {
        reject("metadata_cache_capacity must be positive");
    }
    if (freshness.count() < 0) {
        reject("freshness must not be negative");
    }
    if (thumbnail_generation_limit == 0 || thumbnail_generation_limit > 64) {
        reject("thumbnail_generation_limit must be in [1, 64], got " + std::to_string(thumbnail_generation_limit));
    }
    if (max_archive_entries == 0) {
        reject("max_archive_entries must be positive");
    }
    if (entry_timeout.count() <= 0) {
        reject("entry_timeout must be positive");
    }
}

} // namespace archivist
