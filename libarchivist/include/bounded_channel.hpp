//
// Created by Giuseppe Francione on 03/12/25.
//

/**
 * @file bounded_channel.hpp
 * @brief Blocking multi-producer / single-consumer queue with a capacity.
 *
 * Scan workers push finished records while the persistence consumer pops
 * them in small batches, so a long scan never accumulates its whole result
 * set in memory.
 */

#ifndef ARCHIVIST_BOUNDED_CHANNEL_HPP
#define ARCHIVIST_BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace archivist {

    template <typename T>
    class BoundedChannel {
    public:
        explicit BoundedChannel(const std::size_t capacity = 1000)
            : capacity_(capacity == 0 ? 1 : capacity) {}

        /**
         * @brief Push a value, blocking while the channel is full.
         * @return false if the channel was closed (the value is dropped).
         */
        bool push(T value) {
            std::unique_lock lock(mtx_);
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) return false;
            items_.push_back(std::move(value));
            not_empty_.notify_one();
            return true;
        }

        /**
         * @brief Pop a value, blocking until one is available.
         * @return std::nullopt once the channel is closed and drained.
         */
        std::optional<T> pop() {
            std::unique_lock lock(mtx_);
            not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) return std::nullopt;
            T value = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return value;
        }

        /**
         * @brief No more pushes; pending items stay poppable.
         */
        void close() {
            {
                std::lock_guard lock(mtx_);
                closed_ = true;
            }
            not_empty_.notify_all();
            not_full_.notify_all();
        }

        [[nodiscard]] bool closed() const {
            std::lock_guard lock(mtx_);
            return closed_;
        }

    private:
        const std::size_t capacity_;
        mutable std::mutex mtx_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> items_;
        bool closed_{false};
    };

} // namespace archivist

#endif // ARCHIVIST_BOUNDED_CHANNEL_HPP
