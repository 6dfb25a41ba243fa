//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool used by the scan pipeline.
 *
 * One pool instance backs the directory orchestrator (whole files and
 * archives), and a short-lived pool is created per archive for entry
 * processing. Worker counts are fixed at construction.
 */

#ifndef ARCHIVIST_THREAD_POOL_HPP
#define ARCHIVIST_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Uses std::jthread internally, so destruction joins the
 * workers and requesting a stop reaches running tasks through their
 * std::stop_token. Tasks enqueued must accept a `std::stop_token`.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the pool and starts the workers.
     * @param threads Number of worker threads (0 is bumped to 1).
     * @param name Label used in log messages from this pool.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2,
                        std::string name = "pool");

    /**
     * @brief Drains the queue and joins every worker.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F Callable accepting a `std::stop_token`.
     * @param f The task to execute.
     * @return A std::future carrying the task's result or exception.
     * @throws std::runtime_error if the pool was stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool '" + name_ + "'");
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Discards queued tasks and signals running ones to stop.
     */
    void request_stop();

    /**
     * @brief Number of worker threads.
     */
    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /**
     * @brief True when no task is queued or running.
     */
    [[nodiscard]] bool idle();

    /**
     * @brief Label given at construction.
     */
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;                      ///< Label for log messages
    std::mutex queue_mutex_;                ///< Protects tasks_ and stop_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::queue<std::function<void(std::stop_token)>> tasks_; ///< The queue of tasks
    bool stop_{false};                      ///< Flag to signal workers to stop
    std::size_t active_{0};                 ///< Tasks currently running, protected by queue_mutex_
    std::vector<std::jthread> workers_;     ///< The worker threads
};

#endif // ARCHIVIST_THREAD_POOL_HPP
