#include "utils/shutdown_signal.h"

#include <csignal>
#include <stdexcept>
#include <string>

namespace meshcore {
namespace utils {

std::atomic<bool> ShutdownSignal::requested_{false};
std::atomic<int> ShutdownSignal::signal_{0};

void ShutdownSignal::install(std::initializer_list<int> signals) {
    for (int signal : signals) {
        if (std::signal(signal, &ShutdownSignal::handle) == SIG_ERR) {
            throw std::runtime_error("Cannot install handler for signal " + std::to_string(signal));
        }
    }
}

void ShutdownSignal::reset() {
    requested_ = false;
    signal_ = 0;
}

void ShutdownSignal::handle(int signal) {
    signal_ = signal;
    requested_ = true;
}

} // namespace utils
} // namespace meshcore
