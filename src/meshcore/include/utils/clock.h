#ifndef MESHCORE_UTILS_CLOCK_H
#define MESHCORE_UTILS_CLOCK_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace meshcore {
namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Wall-clock source shared by TTL, heartbeat and breaker logic
 *
 * Every timestamp that is persisted or compared across processes
 * (heartbeats, expiry, circuit openedAt) is taken from a Clock so that
 * the whole mesh can be driven deterministically in tests.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

using ClockPtr = std::shared_ptr<Clock>;

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Manually advanced clock
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
        : now_(start) {
    }

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template<typename Rep, typename Period>
    void advance(const std::chrono::duration<Rep, Period>& delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
    }

    void set(TimePoint value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

inline ClockPtr systemClock() {
    static ClockPtr clock = std::make_shared<SystemClock>();
    return clock;
}

/**
 * @brief Milliseconds since the Unix epoch, the persisted timestamp format
 */
inline int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace utils
} // namespace meshcore

#endif // MESHCORE_UTILS_CLOCK_H
