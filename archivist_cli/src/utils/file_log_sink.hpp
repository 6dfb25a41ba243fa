//
// Created by Giuseppe Francione on 09/12/25.
//

#ifndef ARCHIVIST_FILE_LOG_SINK_HPP
#define ARCHIVIST_FILE_LOG_SINK_HPP

#include "../../../libarchivist/include/file_utils.hpp"
#include "../../../libarchivist/include/log_sink.hpp"
#include "../../../libarchivist/include/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << archivist::format_local_time(std::chrono::system_clock::now(), "%F %T ")
             << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // ARCHIVIST_FILE_LOG_SINK_HPP
