//
// Created by Giuseppe Francione on 09/12/25.
//

#ifndef ARCHIVIST_CLI_PARSER_HPP
#define ARCHIVIST_CLI_PARSER_HPP

#include "../../../libarchivist/include/pipeline_config.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Scan,
    Update,
    Plan,
    ThumbsClear,
    ThumbsSize,
    ThumbsCleanup,
    ThumbsOrphans,
    DbOptimize,
    DbSize,
    DbHistory,
    DbDirs,
    DbStats
};

struct Settings {
    Command command = Command::None;

    bool quiet = false;
    unsigned num_threads = 4;
    std::string log_level = "INFO";
    std::filesystem::path log_file = "archivist.log";
    std::filesystem::path db_path = "archivist.db";
    std::filesystem::path thumbnails_dir = "thumbnails";
    std::vector<std::filesystem::path> directories;

    // pipeline tuning
    int thumbnail_size = 128;
    double ratio_threshold = 0.5;
    std::size_t cache_capacity = 1000;
    int freshness_hours = 24;
    unsigned thumbnail_limit = 4;
    std::size_t max_archive_entries = 10000;
    int entry_timeout_ms = 10000;
    bool no_thumbnails = false;
    bool no_archive_thumbnails = false;
    bool index_images = false;
    bool read_dimensions = false;

    // subcommand arguments
    int cleanup_days = 30;
    int history_limit = 10;
    std::filesystem::path history_dir;

    /**
     * @brief Maps the parsed options onto the pipeline settings (not yet validated).
     */
    [[nodiscard]] archivist::PipelineConfig to_pipeline_config() const;
};

/**
 * @brief Configures the CLI11 parser with global options and subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // ARCHIVIST_CLI_PARSER_HPP
