//
// Created by Giuseppe Francione on 08/12/25.
//

/**
 * @file pipeline_config.hpp
 * @brief Settings consumed by the scan pipeline.
 *
 * Built once by the front-end (CLI flags or config file) and passed by
 * const reference to every component; nothing reads it after
 * construction, so limits stay fixed for the lifetime of a component.
 */

#ifndef ARCHIVIST_PIPELINE_CONFIG_HPP
#define ARCHIVIST_PIPELINE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace archivist {

    struct PipelineConfig {
        std::vector<std::filesystem::path> scan_directories; ///< Roots to index
        int thumbnail_size = 128;                   ///< Requested thumbnail edge, in pixels
        double archive_image_ratio_threshold = 0.5; ///< Archives below this image ratio are not indexed
        unsigned max_concurrent_scans = 4;          ///< Worker threads for stand-alone files
        std::size_t metadata_cache_capacity = 1000;
        std::chrono::hours freshness{24};           ///< A directory scanned more recently is not rescanned
        unsigned thumbnail_generation_limit = 4;    ///< Concurrent thumbnail decodes
        std::size_t max_archive_entries = 10000;    ///< Larger archives are skipped
        std::chrono::milliseconds entry_timeout{10000};
        bool generate_thumbnails = true;
        bool generate_archive_thumbnails = true;
        bool index_standalone_images = false;       ///< Off: only archives are persisted
        bool read_archive_dimensions = false;       ///< On: decode entry headers during the archive pass

        /**
         * @brief Checks every value against its allowed range.
         * @throws std::invalid_argument naming the first offending setting.
         */
        void validate() const;
    };

} // namespace archivist

#endif // ARCHIVIST_PIPELINE_CONFIG_HPP
