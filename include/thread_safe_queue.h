#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "clock.h"

namespace brook {

/**
 * @brief Outcome of a bounded wait on the queue
 */
enum class QueueStatus {
    OK,
    TIMED_OUT,
    CANCELLED,
    CLOSED
};

/**
 * @brief Thread-safe bounded queue
 *
 * - Multiple producers and consumers, one mutex
 * - Producers block while the queue is full; enqueue_until bounds the
 *   wait by a deadline and a cancellation token
 * - close() wakes everyone; consumers drain what is left, producers fail
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity = 10000)
        : capacity_(capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Enqueue, waiting for space until `deadline`
     *
     * The item is moved from only on QueueStatus::OK. Cancellation is
     * checked at least every WAIT_SLICE.
     */
    QueueStatus enqueue_until(T& item, TimePoint deadline, const CancellationToken* cancel = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!closed_ && queue_.size() >= capacity_) {
            if (cancelled(cancel)) {
                return QueueStatus::CANCELLED;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return QueueStatus::TIMED_OUT;
            }
            not_full_.wait_until(lock, next_wakeup(deadline));
        }

        if (closed_) {
            return QueueStatus::CLOSED;
        }
        if (cancelled(cancel)) {
            return QueueStatus::CANCELLED;
        }

        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return QueueStatus::OK;
    }

    /**
     * @brief Take up to max_items, blocking until at least one is available
     *
     * After the first item, waits up to `linger` for the batch to fill.
     * @return Number of items appended to `out`; 0 once closed and empty
     */
    size_t dequeue_batch(std::vector<T>& out, size_t max_items,
                         std::chrono::milliseconds linger = std::chrono::milliseconds(0)) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return !queue_.empty() || closed_;
        });

        if (linger.count() > 0 && !closed_ && queue_.size() < max_items) {
            not_empty_.wait_for(lock, linger, [this, max_items] {
                return queue_.size() >= max_items || closed_;
            });
        }

        size_t taken = 0;
        while (!queue_.empty() && taken < max_items) {
            out.push_back(std::move(queue_.front()));
            queue_.pop_front();
            ++taken;
        }
        if (taken > 0) {
            not_full_.notify_all();
        }
        return taken;
    }

    /**
     * @brief Close the queue (no more enqueues allowed)
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

private:
    std::deque<T> queue_;
    size_t capacity_;
    bool closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace brook
