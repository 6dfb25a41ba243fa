//
// Created by Giuseppe Francione on 09/12/25.
//

#include <CLI/CLI.hpp>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libarchivist/include/archive_batch_processor.hpp"
#include "../../libarchivist/include/incremental_scan_controller.hpp"
#include "../../libarchivist/include/logger.hpp"
#include "../../libarchivist/include/metadata_cache.hpp"
#include "../../libarchivist/include/metadata_extractor.hpp"
#include "../../libarchivist/include/pipeline_config.hpp"
#include "../../libarchivist/include/scan_orchestrator.hpp"
#include "../../libarchivist/include/sqlite_gateway.hpp"
#include "../../libarchivist/include/thumbnail_cache.hpp"

using namespace archivist;
namespace fs = std::filesystem;

static std::stop_source g_stop;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Waiting for running archives to finish..."
                  << RESET << std::endl;
        g_stop.request_stop();
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

namespace {

int run_thumbs_command(const Settings& settings, const PipelineConfig& config, IPersistenceGateway& gateway) {
    ThumbnailCache thumbnails(settings.thumbnails_dir, config.thumbnail_generation_limit);
    switch (settings.command) {
        case Command::ThumbsClear:
            if (!thumbnails.clear()) {
                std::cerr << RED << "Failed to clear " << settings.thumbnails_dir.string() << RESET << std::endl;
                return 1;
            }
            std::cout << "Thumbnail cache cleared.\n";
            return 0;
        case Command::ThumbsSize:
            std::cout << format_bytes(thumbnails.cache_size_bytes()) << "\n";
            return 0;
        case Command::ThumbsCleanup:
            std::cout << "Removed " << thumbnails.cleanup_older_than(settings.cleanup_days)
                      << " thumbnails older than " << settings.cleanup_days << " days.\n";
            return 0;
        case Command::ThumbsOrphans:
            std::cout << "Removed " << thumbnails.cleanup_orphans(gateway.all_indexed_sources())
                      << " orphaned thumbnails.\n";
            return 0;
        default:
            return 2;
    }
}

int run_db_command(const Settings& settings, IPersistenceGateway& gateway) {
    switch (settings.command) {
        case Command::DbOptimize:
            gateway.optimize();
            std::cout << "Database optimized (" << format_bytes(gateway.database_size()) << ").\n";
            return 0;
        case Command::DbSize:
            std::cout << format_bytes(gateway.database_size()) << "\n";
            return 0;
        case Command::DbHistory:
            print_history(gateway.scan_history(settings.history_dir, settings.history_limit));
            return 0;
        case Command::DbDirs:
            for (const auto& d : gateway.scanned_directories()) std::cout << d << "\n";
            return 0;
        case Command::DbStats:
            std::cout << "Archives: " << gateway.archive_count() << "\n"
                      << "Images:   " << gateway.image_count() << "\n";
            return 0;
        default:
            return 2;
    }
}

int run_scan_command(const Settings& settings, const PipelineConfig& config, IPersistenceGateway& gateway) {
    MetadataCache metadata_cache(config.metadata_cache_capacity);
    const MetadataExtractor extractor(&metadata_cache);
    ThumbnailCache thumbnails(settings.thumbnails_dir, config.thumbnail_generation_limit);
    ThumbnailCache* thumbs = config.generate_thumbnails ? &thumbnails : nullptr;

    ArchiveBatchProcessor processor(config, gateway, extractor, thumbs);
    ScanOrchestrator orchestrator(config, gateway, processor);
    IncrementalScanController controller(config, gateway, orchestrator, &thumbnails);

    if (settings.command == Command::Plan) {
        print_plan(controller.plan_scan(config.scan_directories));
        return 0;
    }

    ProgressCallback progress;
    if (!settings.quiet) {
        progress = [](const ScanProgress& p) { print_progress_bar(p); };
    }

    const ScanSummary summary = settings.command == Command::Scan
        ? controller.run_full(config.scan_directories, progress, g_stop.get_token())
        : controller.run_incremental(config.scan_directories, progress, g_stop.get_token());

    if (!settings.quiet) {
        print_scan_report(summary, config.max_concurrent_scans);
    }
    return summary.cancelled ? 130 : 0; // 130: standard exit code for SIGINT
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"archivist: incremental image archive indexer."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set file logger
    Logger::clear_sinks();
    auto file_sink = std::make_unique<FileLogSink>(settings.log_file, false);
    if (!file_sink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(file_sink));

    // quiet keeps errors on the console
    const LogLevel console_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = console_level;
    Logger::add_sink(std::move(console_sink));

    // debug messages are only built when asked for
    Logger::set_min_level(console_level == LogLevel::Debug ? LogLevel::Debug : LogLevel::Info);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    init_utf8_locale();

    PipelineConfig config = settings.to_pipeline_config();
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return 2;
    }

    try {
        SqliteGateway gateway(settings.db_path);
        switch (settings.command) {
            case Command::Scan:
            case Command::Update:
            case Command::Plan:
                return run_scan_command(settings, config, gateway);
            case Command::ThumbsClear:
            case Command::ThumbsSize:
            case Command::ThumbsCleanup:
            case Command::ThumbsOrphans:
                return run_thumbs_command(settings, config, gateway);
            case Command::None:
                std::cerr << app.help() << std::endl;
                return 2;
            default:
                return run_db_command(settings, gateway);
        }
    } catch (const StorageError& e) {
        std::cerr << RED << "Database error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
