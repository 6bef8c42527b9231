#ifndef MESHCORE_UTILS_THREAD_POOL_H
#define MESHCORE_UTILS_THREAD_POOL_H

#include "utils/blocking_queue.h"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace meshcore {
namespace utils {

/**
 * @brief Fixed-size worker pool
 *
 * Runs asynchronous bus deliveries and concurrent health probes.
 * Exceptions thrown by a task are delivered through its future; the
 * worker itself keeps running.
 *
 * @code
 * ThreadPool pool(4, "probe");
 * auto ok = pool.enqueue([&]() { return probe(endpoint); });
 * bool healthy = ok.get();
 * @endcode
 */
class ThreadPool {
public:
    /**
     * @param numThreads Number of worker threads
     * @param name Name used in log lines
     * @throws std::invalid_argument if numThreads is 0
     */
    explicit ThreadPool(size_t numThreads, std::string name = "pool");

    /**
     * @brief Calls shutdown() and wait()
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a callable
     * @throws std::runtime_error if the pool is shut down
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        if (shutdown_) {
            throw std::runtime_error("Cannot enqueue task: thread pool '" + name_ + "' is shut down");
        }

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));

        std::future<ReturnType> result = task->get_future();
        ++outstanding_;
        try {
            tasks_.push([task]() { (*task)(); });
        } catch (const QueueClosedException&) {
            --outstanding_;
            throw std::runtime_error("Cannot enqueue task: thread pool '" + name_ + "' is shut down");
        }
        return result;
    }

    /**
     * @brief Stop accepting tasks; queued tasks still run
     */
    void shutdown();

    /**
     * @brief Join all workers (call after shutdown())
     */
    void wait();

    bool isShutdown() const {
        return shutdown_;
    }

    size_t getThreadCount() const {
        return workers_.size();
    }

    size_t getPendingTaskCount() const {
        return tasks_.size();
    }

    /**
     * @brief Number of tasks queued or still executing
     */
    size_t getOutstandingTaskCount() const {
        return outstanding_;
    }

private:
    void workerThread();

    using Task = std::function<void()>;

    std::string name_;
    std::vector<std::thread> workers_;
    BlockingQueue<Task> tasks_;
    std::atomic<bool> shutdown_;
    std::atomic<size_t> outstanding_;
};

} // namespace utils
} // namespace meshcore

#endif // MESHCORE_UTILS_THREAD_POOL_H
