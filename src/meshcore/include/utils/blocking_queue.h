#ifndef MESHCORE_UTILS_BLOCKING_QUEUE_H
#define MESHCORE_UTILS_BLOCKING_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace meshcore {
namespace utils {

/**
 * @brief Exception thrown when pushing onto a closed queue
 */
class QueueClosedException : public std::runtime_error {
public:
    QueueClosedException() : std::runtime_error("Queue is closed") {}
};

/**
 * @brief Thread-safe producer/consumer queue with an optional capacity
 *
 * Used as the task queue of ThreadPool and as the delivery queue of the
 * EventDispatcher. close() wakes every waiter; items already queued can
 * still be drained after close.
 *
 * @tparam T Element type (movable)
 */
template<typename T>
class BlockingQueue {
public:
    /**
     * @param maxSize Maximum queue size (0 = unlimited)
     */
    explicit BlockingQueue(size_t maxSize = 0)
        : maxSize_(maxSize)
        , closed_(false) {
    }

    ~BlockingQueue() {
        close();
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @brief Push an item, blocking while the queue is full
     * @throws QueueClosedException if the queue is closed
     */
    void push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (maxSize_ > 0) {
            notFull_.wait(lock, [this]() {
                return queue_.size() < maxSize_ || closed_;
            });
        }
        if (closed_) {
            throw QueueClosedException();
        }
        queue_.push_back(std::move(item));
        notEmpty_.notify_one();
    }

    /**
     * @brief Push without blocking
     * @return false if the queue is full or closed
     */
    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || (maxSize_ > 0 && queue_.size() >= maxSize_)) {
            return false;
        }
        queue_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Pop an item, blocking until one is available
     * @return std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return takeFront();
    }

    /**
     * @brief Pop an item, waiting at most @p timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        });
        return takeFront();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    bool isClosed() const {
        return closed_;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

private:
    // Caller holds mutex_
    std::optional<T> takeFront() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        if (maxSize_ > 0) {
            notFull_.notify_one();
        }
        return item;
    }

    std::deque<T> queue_;
    size_t maxSize_;
    std::atomic<bool> closed_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace utils
} // namespace meshcore

#endif // MESHCORE_UTILS_BLOCKING_QUEUE_H
