//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::atomic<int> Logger::min_level_{static_cast<int>(LogLevel::Debug)};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_min_level(const LogLevel level) noexcept {
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::min_level() noexcept {
    return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
}

bool Logger::enabled(const LogLevel level) noexcept {
    return level != LogLevel::None &&
           static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (!enabled(level)) return;
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

LogLevel Logger::string_to_level(const std::string& level) {
    std::string up = level;
    std::ranges::transform(up, up.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG")
        return LogLevel::Debug;
    if (up == "INFO")
        return LogLevel::Info;
    if (up == "WARNING" || up == "WARN")
        return LogLevel::Warning;
    if (up == "NONE")
        return LogLevel::None;
    return LogLevel::Error;
}
