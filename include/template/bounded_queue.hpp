/**
 * @file bounded_queue.hpp
 * @brief Fixed-capacity, thread-safe hand-off queue that drops the oldest entry on overflow
 * @version 1.0
 * @date 2026-10-19
 *
 * Single ring buffer guarded by one mutex. Producers never block: when the
 * ring is full the oldest item is discarded to make room. Consumers wait on
 * a condition variable with a timeout.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace canlink {

    /**
     * @brief Result of a push
     */
    enum class PushResult : std::uint8_t {
        OK,
        DROPPED_OLDEST  ///< Queue was full; the oldest item was discarded
    };

    /**
     * @brief Bounded multi-producer / multi-consumer queue
     * @tparam T Movable, default-constructible item type
     */
    template<typename T>
    class BoundedQueue {
        private:
            mutable std::mutex mutex_;
            std::condition_variable not_empty_;
            std::vector<T> buffer_;
            std::size_t capacity_;
            std::size_t head_ = 0;  // Next item to pop
            std::size_t tail_ = 0;  // Next slot to push
            std::size_t size_ = 0;
            std::uint64_t drop_count_ = 0;
            bool closed_ = false;

        public:
            /**
             * @brief Construct queue
             * @param capacity Maximum number of queued items (> 0)
             * @throws std::invalid_argument if capacity is 0
             */
            explicit BoundedQueue(std::size_t capacity)
                : buffer_(capacity), capacity_(capacity) {
                if (capacity == 0) {
                    throw std::invalid_argument("BoundedQueue capacity must be > 0");
                }
            }

            BoundedQueue(const BoundedQueue&) = delete;
            BoundedQueue& operator=(const BoundedQueue&) = delete;

            /**
             * @brief Push an item, discarding the oldest one if full
             * @param item Item to move into the queue
             * @return PushResult OK, or DROPPED_OLDEST if an item was discarded
             */
            PushResult push(T item) {
                PushResult result = PushResult::OK;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (size_ == capacity_) {
                        head_ = (head_ + 1) % capacity_;
                        --size_;
                        ++drop_count_;
                        result = PushResult::DROPPED_OLDEST;
                    }
                    buffer_[tail_] = std::move(item);
                    tail_ = (tail_ + 1) % capacity_;
                    ++size_;
                }
                not_empty_.notify_one();
                return result;
            }

            /**
             * @brief Pop, waiting up to timeout for an item
             * @param timeout Maximum wait
             * @return std::optional<T> Front item, or nullopt on timeout or close()
             */
            template<typename Rep, typename Period>
            std::optional<T> wait_pop(std::chrono::duration<Rep, Period> timeout) {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait_for(lock, timeout, [this] { return size_ > 0 || closed_; });
                return pop_locked();
            }

            /**
             * @brief Wake all waiters; later waits return immediately when empty
             */
            void close() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    closed_ = true;
                }
                not_empty_.notify_all();
            }

            /**
             * @brief Re-enable waiting after close()
             */
            void reopen() {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = false;
            }

            std::size_t size() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return size_;
            }

            std::size_t capacity() const { return capacity_; }

            bool empty() const { return size() == 0; }

            /**
             * @brief Number of items discarded by overflow (cumulative)
             */
            std::uint64_t drop_count() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return drop_count_;
            }

        private:
            std::optional<T> pop_locked() {
                if (size_ == 0) {
                    return std::nullopt;
                }
                T item = std::move(buffer_[head_]);
                head_ = (head_ + 1) % capacity_;
                --size_;
                return item;
            }
    };

} // namespace canlink
