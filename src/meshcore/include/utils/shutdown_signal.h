#ifndef MESHCORE_UTILS_SHUTDOWN_SIGNAL_H
#define MESHCORE_UTILS_SHUTDOWN_SIGNAL_H

#include <atomic>
#include <initializer_list>

namespace meshcore {
namespace utils {

/**
 * @brief Process-wide shutdown request set from a signal handler
 *
 * The installed handler only stores lock-free atomics, so it is safe to
 * interrupt any thread, including one holding the log mutex. Whoever polls
 * requested() does the logging and the actual shutdown.
 */
class ShutdownSignal {
public:
    /**
     * @brief Route the given signals to the shutdown handler
     * @throws std::runtime_error if a handler cannot be installed
     */
    static void install(std::initializer_list<int> signals);

    static bool requested() { return requested_.load(); }

    /**
     * @return The last signal received, 0 if none
     */
    static int signalNumber() { return signal_.load(); }

    /**
     * @brief Request shutdown without a signal (console 'exit', fatal error)
     */
    static void request() { requested_ = true; }

    static void reset();

private:
    static void handle(int signal);

    static std::atomic<bool> requested_;
    static std::atomic<int> signal_;
};

} // namespace utils
} // namespace meshcore

#endif // MESHCORE_UTILS_SHUTDOWN_SIGNAL_H
