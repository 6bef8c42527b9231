#ifndef MESHCORE_RESILIENCE_HEALTH_CHECK_WORKER_H
#define MESHCORE_RESILIENCE_HEALTH_CHECK_WORKER_H

#include "client/http_transport.h"
#include "config/mesh_config.h"
#include "core/message_bus.h"
#include "registry/registry_service.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace meshcore {

namespace utils {
class ThreadPool;
}

/**
 * @brief Health check statistics
 */
struct HealthCheckStats {
    /** Completed check cycles */
    uint64_t cycles = 0;

    /** Probes sent */
    uint64_t probes = 0;

    /** Failed probes */
    uint64_t failures = 0;

    /** Endpoints removed for failing their checks */
    uint64_t deregistrations = 0;
};

/**
 * @brief Active health checking of registered endpoints
 *
 * After the startup delay, every interval the worker probes each registered
 * endpoint with GET /{path} and counts consecutive failures per endpoint.
 * An endpoint reaching the failure threshold is announced on
 * "mesh.endpoint.health-check-failed" and deregistered with reason
 * HealthCheckFailed. A success resets its count; counts of endpoints that
 * are no longer registered are dropped. A threshold of 0 never
 * deregisters.
 *
 * Probes of one cycle run concurrently on a thread pool.
 */
class HealthCheckWorker {
public:
    HealthCheckWorker(const HealthCheckConfig& config,
                      RegistryServicePtr registry,
                      HttpTransportPtr transport,
                      MessageBusPtr bus = nullptr,
                      const std::string& origin = "health-check",
                      size_t probe_threads = 4);

    ~HealthCheckWorker();

    HealthCheckWorker(const HealthCheckWorker&) = delete;
    HealthCheckWorker& operator=(const HealthCheckWorker&) = delete;

    /**
     * @return false if disabled by configuration or already running
     */
    bool start();

    void stop();

    bool isRunning() const;

    /**
     * @brief Probe every registered endpoint once
     */
    void runCycle();

    uint32_t getFailureCount(const std::string& instanceId) const;

    HealthCheckStats getStats() const;

private:
    void checkLoop();
    bool probe(const Endpoint& endpoint, std::string& error);
    void handleFailure(const Endpoint& endpoint, uint32_t failures, const std::string& error);

    HealthCheckConfig config_;
    RegistryServicePtr registry_;
    HttpTransportPtr transport_;
    MessageBusPtr bus_;
    std::string origin_;
    std::unique_ptr<utils::ThreadPool> probe_pool_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_;
    std::atomic<bool> should_stop_;
    std::thread check_thread_;

    mutable std::mutex counters_mutex_;
    std::map<std::string, uint32_t> failures_;
    HealthCheckStats stats_;
};

} // namespace meshcore

#endif // MESHCORE_RESILIENCE_HEALTH_CHECK_WORKER_H
