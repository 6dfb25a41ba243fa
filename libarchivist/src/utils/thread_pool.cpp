//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads, std::string name)
    : name_(std::move(name)) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if ((stop_ && tasks_.empty()) || st.stop_requested())
                        return;
                    if (tasks_.empty())
                        continue;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                    ++active_;
                }
                try {
                    task(st);
                } catch (const std::exception& e) {
                    // packaged_task stores exceptions in the future; this only
                    // fires if the wrapper itself throws
                    Logger::log(LogLevel::Error,
                                "Unhandled exception in thread pool '" + name_ + "': " + e.what(),
                                "thread_pool");
                }
                std::lock_guard lock(queue_mutex_);
                --active_;
            }
        });
    }
    Logger::log(LogLevel::Debug,
                "Thread pool '" + name_ + "' started with " + std::to_string(threads) + " workers",
                "thread_pool");
}

void ThreadPool::request_stop() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        std::queue<std::function<void(std::stop_token)>>().swap(tasks_);
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

bool ThreadPool::idle() {
    std::lock_guard lock(queue_mutex_);
    return tasks_.empty() && active_ == 0;
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}
