/**
 * @file blocking_queue.hpp
 * @brief Thread-safe FIFO channel used for the task queue and the results queue
 *
 * The worker pool has exactly two channels: crawler → workers (tasks) and
 * workers → orchestrator (outcomes). Both are instances of this queue.
 *
 * LIFECYCLE:
 * - open:    push() and pop() behave normally
 * - closed:  push() is refused, pop() drains what is left, then returns nullopt
 * - aborted: push() is refused, pending items are dropped, pop() returns nullopt
 *
 * EXAMPLE:
 * BlockingQueue<int> queue(16);   // bounded: producers wait when 16 items are queued
 * queue.push(1);                  // producer
 * auto item = queue.pop();        // consumer, blocks until item or close
 * queue.close();                  // no more items will arrive
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mirror::fetch {

template<typename T>
class BlockingQueue {
public:
    /// @param capacity Maximum queued items; 0 means unbounded
    explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @brief Append an item, waiting for room when the queue is bounded
     *
     * RETURNS: false if the queue was closed or aborted (item not queued)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return closed_ || capacity_ == 0 || items_.size() < capacity_;
            });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest item, waiting until one is available
     *
     * RETURNS: nullopt once the queue is closed and drained, or aborted
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !items_.empty() || closed_;
        });
        return take_locked(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !items_.empty() || closed_;
        })) {
            return std::nullopt;
        }
        return take_locked(lock);
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked(lock);
    }

    /// No further pushes; consumers drain the remaining items.
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * @brief Close and drop everything still queued
     *
     * RETURNS: number of items discarded
     */
    std::size_t abort() {
        std::size_t dropped = 0;
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
            dropped = items_.size();
            items_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        return dropped;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return items_.empty();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_locked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    std::deque<T> items_;
    std::size_t capacity_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace mirror::fetch
