//
// Created by Giuseppe Francione on 02/12/25.
//

#ifndef ARCHIVIST_LOG_SINK_HPP
#define ARCHIVIST_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from the most verbose to the most severe, so that a sink or the
 * Logger facade can filter with a simple comparison.
 */
enum class LogLevel {
    Debug,   ///< Per-entry and per-batch diagnostics
    Info,    ///< Scan milestones (directory started, archive indexed, totals)
    Warning, ///< Skipped files, decode failures, slow operations
    Error,   ///< Failures that abort an archive, a directory or the run
    None     ///< Filter-only value: suppresses every message
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink decide where log messages end up
 * (console, file, test capture). The Logger class fans every message
 * out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component (e.g. "scanner").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // ARCHIVIST_LOG_SINK_HPP
