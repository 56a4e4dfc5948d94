/**
 * @file event_queue.hpp
 * @brief Blocking FIFO used to hand events from a worker to the control thread
 *
 * EXAMPLE:
 * ThreadSafeQueue<TransferEvent> queue;
 * queue.push(event);                        // worker thread
 * for (auto& e : queue.drain()) { ... }     // control thread, never blocks
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace lft::events {

/**
 * @brief Mutex-guarded FIFO with blocking and non-blocking consumers
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - After shutdown() blocked consumers wake up; items already queued can
 *   still be popped
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    /// Blocks until an item arrives; nullopt once shut down and empty
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !items_.empty() || shutdown_; });
        return take_front();
    }

    /// Like pop(), but gives up after timeout
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !items_.empty() || shutdown_; });
        return take_front();
    }

    /// Everything queued right now, oldest first
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) {
            out.push_back(std::move(item));
        }
        items_.clear();
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        ready_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool shutdown_ = false;
};

} // namespace lft::events
