//
// Created by Giuseppe Francione on 09/12/25.
//

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <thread>

namespace {

// registers a leaf subcommand that selects @p cmd when parsed
CLI::App* add_command(CLI::App& parent, const std::string& name, const std::string& help,
                      Settings& settings, const Command cmd) {
    CLI::App* sub = parent.add_subcommand(name, help);
    sub->callback([&settings, cmd] { settings.command = cmd; });
    return sub;
}

} // namespace

archivist::PipelineConfig Settings::to_pipeline_config() const {
    archivist::PipelineConfig config;
    config.scan_directories = directories;
    config.thumbnail_size = thumbnail_size;
    config.archive_image_ratio_threshold = ratio_threshold;
    config.max_concurrent_scans = num_threads;
    config.metadata_cache_capacity = cache_capacity;
    config.freshness = std::chrono::hours(freshness_hours);
    config.thumbnail_generation_limit = thumbnail_limit;
    config.max_archive_entries = max_archive_entries;
    config.entry_timeout = std::chrono::milliseconds(entry_timeout_ms);
    config.generate_thumbnails = !no_thumbnails;
    config.generate_archive_thumbnails = !no_archive_thumbnails;
    config.index_standalone_images = index_images;
    config.read_archive_dimensions = read_dimensions;
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file.");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_option("--db", settings.db_path, "SQLite database file.")
       ->default_val(settings.db_path.string());

    app.add_option("--thumbnails", settings.thumbnails_dir, "Thumbnail cache directory.")
       ->default_val(settings.thumbnails_dir.string());

    app.add_option("-d,--dir", settings.directories,
                   "Directory to index. (Can be used multiple times).");

    settings.num_threads = std::max(1U, std::min(4U, std::thread::hardware_concurrency()));
    app.add_option("--threads", settings.num_threads,
                   "Worker threads for stand-alone files.")
       ->default_val(settings.num_threads)
       ->check(CLI::PositiveNumber);

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, report).");

    app.add_option("--log-level", settings.log_level,
                   "Console log level: ERROR, WARNING, INFO, DEBUG, NONE.")
       ->default_val("ERROR")
       ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file, "Log file, truncated on each run.")
       ->default_val(settings.log_file.string());

    // --- Pipeline tuning ---
    app.add_option("--thumbnail-size", settings.thumbnail_size, "Thumbnail size in pixels.")
       ->default_val(settings.thumbnail_size)
       ->check(CLI::Range(1, 4096));

    app.add_option("--ratio", settings.ratio_threshold,
                   "Minimum share of images for an archive to be indexed.")
       ->default_val(settings.ratio_threshold);

    app.add_option("--cache-capacity", settings.cache_capacity, "Metadata cache entries.")
       ->default_val(settings.cache_capacity)
       ->check(CLI::PositiveNumber);

    app.add_option("--freshness", settings.freshness_hours,
                   "Hours before an indexed directory is scanned again by 'update'.")
       ->default_val(settings.freshness_hours)
       ->check(CLI::NonNegativeNumber);

    app.add_option("--thumbnail-jobs", settings.thumbnail_limit, "Concurrent thumbnail generations.")
       ->default_val(settings.thumbnail_limit)
       ->check(CLI::Range(1, 64));

    app.add_option("--max-entries", settings.max_archive_entries,
                   "Archives with more entries are skipped.")
       ->default_val(settings.max_archive_entries)
       ->check(CLI::PositiveNumber);

    app.add_option("--entry-timeout", settings.entry_timeout_ms,
                   "Per-entry metadata timeout in milliseconds.")
       ->default_val(settings.entry_timeout_ms)
       ->check(CLI::PositiveNumber);

    app.add_flag("--no-thumbnails", settings.no_thumbnails, "Do not generate thumbnails.");
    app.add_flag("--no-archive-thumbnails", settings.no_archive_thumbnails,
                 "Do not generate archive thumbnails.");
    app.add_flag("--index-images", settings.index_images,
                 "Also index stand-alone image files.");
    app.add_flag("--read-dimensions", settings.read_dimensions,
                 "Read image dimensions of archive entries (slower).");

    // --- Commands ---
    add_command(app, "scan", "Full scan of every configured directory.", settings, Command::Scan);
    add_command(app, "update", "Incremental scan: purge stale records, rescan due directories.",
                settings, Command::Update);
    add_command(app, "plan", "Show what 'update' would scan and purge.", settings, Command::Plan);

    CLI::App* thumbs = app.add_subcommand("thumbs", "Thumbnail cache maintenance.");
    thumbs->require_subcommand(1);
    add_command(*thumbs, "clear", "Delete every thumbnail.", settings, Command::ThumbsClear);
    add_command(*thumbs, "size", "Print the cache size.", settings, Command::ThumbsSize);
    add_command(*thumbs, "cleanup", "Delete old thumbnails.", settings, Command::ThumbsCleanup)
        ->add_option("--days", settings.cleanup_days, "Age in days.")
        ->default_val(settings.cleanup_days)
        ->check(CLI::PositiveNumber);
    add_command(*thumbs, "orphans", "Delete thumbnails of sources no longer indexed.",
                settings, Command::ThumbsOrphans);

    CLI::App* db = app.add_subcommand("db", "Database maintenance.");
    db->require_subcommand(1);
    add_command(*db, "optimize", "VACUUM and ANALYZE the database.", settings, Command::DbOptimize);
    add_command(*db, "size", "Print the database size.", settings, Command::DbSize);
    CLI::App* history = add_command(*db, "history", "Recent scans of a directory.", settings, Command::DbHistory);
    history->add_option("directory", settings.history_dir, "Scanned directory.")->required();
    history->add_option("--limit", settings.history_limit, "Number of scans.")
           ->default_val(settings.history_limit)
           ->check(CLI::PositiveNumber);
    add_command(*db, "dirs", "Directories with scan history.", settings, Command::DbDirs);
    add_command(*db, "stats", "Indexed archive and image counts.", settings, Command::DbStats);

    // --- Cross-validation logic ---
    app.callback([&settings] {
        const bool needs_dirs = settings.command == Command::Scan || settings.command == Command::Update ||
                                settings.command == Command::Plan;
        if (needs_dirs && settings.directories.empty()) {
            throw CLI::ValidationError("At least one '--dir' is required (on the command line or in --config).");
        }
        if (!(settings.ratio_threshold > 0.0 && settings.ratio_threshold <= 1.0)) {
            throw CLI::ValidationError("--ratio must be in (0, 1].");
        }
    });
}
