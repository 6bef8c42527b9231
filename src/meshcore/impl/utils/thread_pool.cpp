#include "utils/thread_pool.h"
#include "utils/log.h"

#include <stdexcept>

namespace meshcore {
namespace utils {

ThreadPool::ThreadPool(size_t numThreads, std::string name)
    : name_(std::move(name))
    , tasks_(0)
    , shutdown_(false)
    , outstanding_(0) {
    if (numThreads == 0) {
        throw std::invalid_argument("Thread pool must have at least one thread");
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::workerThread, this);
    }
    LOGD_FMT("ThreadPool '" << name_ << "' started with " << numThreads << " workers");
}

ThreadPool::~ThreadPool() {
    shutdown();
    wait();
}

void ThreadPool::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    tasks_.close();
}

void ThreadPool::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::workerThread() {
    while (true) {
        auto task = tasks_.pop();
        if (!task.has_value()) {
            break;
        }

        // packaged_task stores the exception in the future; anything else is a bug in the wrapper
        try {
            task.value()();
        } catch (const std::exception& e) {
            LOGE_FMT("ThreadPool '" << name_ << "' task escaped with exception: " << e.what());
        }
        --outstanding_;
    }
}

} // namespace utils
} // namespace meshcore
