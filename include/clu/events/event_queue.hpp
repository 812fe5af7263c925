/**
 * @file event_queue.hpp
 * @brief Blocking FIFO handing results from a worker thread to its owner
 *
 * A TransferTask's worker pushes progress updates and then its single
 * final outcome; the orchestrator waits on the queue at most one poll
 * interval at a time so it can renew the session lease in between.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace clu::events {

/**
 * @brief Thread-safe FIFO with timed waits and shutdown
 *
 * Once shut down, items already queued are still handed out in order, and
 * a wait on an empty queue returns nullopt immediately instead of blocking.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take();
    }

    /// Wait until an item is available or the queue is shut down.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return available(); });
        return take();
    }

    /// Like pop(), giving up after `timeout`.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return available(); });
        return take();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return items_.empty();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    // mutex_ held by the caller for both helpers
    bool available() const { return closed_ || !items_.empty(); }

    std::optional<T> take() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace clu::events
