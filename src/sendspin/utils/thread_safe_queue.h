/**
 * @file thread_safe_queue.h
 * @brief Blocking FIFO channel used to hand events between engine threads.
 * @details Session events travel from the network receive path to the service
 *          dispatch thread through this queue. `stop()` wakes every waiter so a
 *          consumer loop can exit promptly.
 */
#ifndef SENDSPIN_THREAD_SAFE_QUEUE_H
#define SENDSPIN_THREAD_SAFE_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace sendspin {
namespace audio {
namespace utils {

/**
 * @class ThreadSafeQueue
 * @brief A mutex/condition-variable guarded deque.
 * @tparam T The type of elements to be stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : stop_requested_(false) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue(ThreadSafeQueue&&) = delete;
    ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

    /**
     * @brief Appends an item. Items pushed after `stop()` are discarded.
     * @return false if the queue was stopped.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * @brief Pops the head, blocking while the queue is empty.
     * @return false once the queue is stopped and drained.
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || stop_requested_; });
        return take_front_locked(item);
    }

    /**
     * @brief Wakes all waiters. Queued items can still be drained afterwards.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        cond_.notify_all();
    }

    /** @brief Drops queued items and accepts pushes again. */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        stop_requested_ = false;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool is_stopped() const {
        return stop_requested_;
    }

private:
    bool take_front_locked(T& item) {
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    std::atomic<bool> stop_requested_;
};

} // namespace utils
} // namespace audio
} // namespace sendspin
#endif // SENDSPIN_THREAD_SAFE_QUEUE_H
