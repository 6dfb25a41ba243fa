//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of the indexing pipeline logs through Logger::log with
 * its own tag. The facade owns the installed sinks and applies a global
 * minimum level before any sink is called, so that hot paths (one message
 * per archive entry) cost a single atomic load when Debug is disabled.
 */

#ifndef ARCHIVIST_LOGGER_HPP
#define ARCHIVIST_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for archivist.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the process-wide minimum level.
     *
     * Messages below this level are dropped before reaching any sink.
     * Defaults to LogLevel::Debug (everything is forwarded).
     */
    static void set_min_level(LogLevel level) noexcept;

    /**
     * @brief Current process-wide minimum level.
     */
    [[nodiscard]] static LogLevel min_level() noexcept;

    /**
     * @brief Cheap check used to skip building expensive messages.
     */
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "archivist").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "archivist");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     *
     * Case-insensitive. Accepts both "WARN" and "WARNING".
     * Returns LogLevel::Error if not matched.
     */
    static LogLevel string_to_level(const std::string& level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
    ///< Global threshold, read without the mutex.
    static std::atomic<int> min_level_;
};

#endif //ARCHIVIST_LOGGER_HPP
