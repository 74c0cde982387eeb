/**
 * @file thread_safe_queue.h
 * @brief Blocking event queue between transport threads and the client loop.
 * @details libdatachannel invokes WebSocket callbacks on its own threads. The sync client only
 *          pushes events from those callbacks; its loop thread pops them with a deadline equal to
 *          the next tick, so the queue doubles as the loop's timer.
 */
#ifndef THREAD_SAFE_QUEUE_H
#define THREAD_SAFE_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace syncroom {
namespace engine {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief FIFO queue with a timed pop and a stop signal.
 * @tparam T Event type. Must be movable.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /** @brief Enqueues `item`. Ignored once the queue is stopped. */
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    /**
     * @brief Waits up to `timeout` for an event.
     * @return true if `out` was filled. A stopped queue still hands out what it holds.
     */
    template <typename Rep, typename Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return stopped_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    /** @brief Rejects further pushes and wakes every waiter. */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        ready_.notify_all();
    }

    /** @brief Drops pending events and reopens the queue for a new client run. */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        stopped_ = false;
    }

    bool is_stopped() const { return stopped_; }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    std::atomic<bool> stopped_{false};
};

} // namespace utils
} // namespace engine
} // namespace syncroom

#endif // THREAD_SAFE_QUEUE_H
