#ifndef MESHCORE_CONFIG_MESH_CONFIG_H
#define MESHCORE_CONFIG_MESH_CONFIG_H

#include "resilience/reliability_types.h"
#include "routing/load_balancer.h"
#include "store/redis_connection.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace meshcore {

/**
 * @brief Registry and routing settings ("mesh" section)
 */
struct RegistryConfig {
    /**
     * @brief Endpoints without a heartbeat for this long expire
     */
    std::chrono::seconds endpoint_ttl{90};

    /**
     * @brief Cadence returned to heartbeating instances
     */
    std::chrono::seconds heartbeat_interval{30};

    /**
     * @brief Heartbeat age after which a Healthy endpoint reads as Degraded
     * and is dropped by the router liveness filter
     */
    std::chrono::seconds degradation_threshold{60};

    LoadBalancingAlgorithm default_load_balancer = LoadBalancingAlgorithm::ROUND_ROBIN;

    /**
     * @brief Router load filter drops endpoints above this load
     */
    double load_threshold_percent = 80.0;

    /**
     * @brief Maximum number of alternates returned with a route
     */
    uint32_t max_top_endpoints_returned = 2;

    /**
     * @brief Cap on appIds tracked by load balancing state (0 = unlimited)
     */
    size_t load_balancing_state_max_app_ids = 0;

    /**
     * @brief Port used when a heartbeat auto-registers an endpoint
     */
    int endpoint_port = 80;

    /**
     * @brief Capacity used when a heartbeat does not report one
     */
    int default_max_connections = 1000;

    /**
     * @brief Target of every service name after an empty mapping snapshot
     */
    std::string default_app_id = "default";

    /**
     * @brief Window for suppressing repeated degradation events (0 = never suppress)
     */
    std::chrono::seconds degradation_event_dedup_window{60};
};

/**
 * @brief Invocation client settings ("invocation" section)
 */
struct InvocationConfig {
    RetryConfig retry;

    std::chrono::seconds connect_timeout{10};

    std::chrono::seconds request_timeout{30};

    /**
     * @brief Lifetime of a resolved endpoint in the local cache
     */
    std::chrono::seconds endpoint_cache_ttl{5};

    /**
     * @brief Maximum cached appIds (0 = unlimited)
     */
    size_t endpoint_cache_max_size = 0;
};

/**
 * @brief Active health probing settings ("health_check" section)
 */
struct HealthCheckConfig {
    bool enabled = false;

    std::chrono::seconds interval{60};

    std::chrono::seconds timeout{5};

    /**
     * @brief Consecutive probe failures before deregistration (0 = never deregister)
     */
    uint32_t failure_threshold = 3;

    std::chrono::seconds startup_delay{10};

    /**
     * @brief Probe path, without the leading slash
     */
    std::string path = "health";
};

enum class StoreBackend {
    /** In-process store; state is private to the process */
    MEMORY,
    REDIS
};

enum class BusBackend {
    /** In-process dispatcher; events stay inside the process */
    LOCAL,
    REDIS
};

/**
 * @brief Parse "memory" or "redis" (case-insensitive)
 * @throws std::invalid_argument on any other name
 */
StoreBackend parseStoreBackend(const std::string& name);

/**
 * @brief Parse "local" or "redis" (case-insensitive)
 * @throws std::invalid_argument on any other name
 */
BusBackend parseBusBackend(const std::string& name);

/**
 * @brief Shared state settings ("store" section)
 */
struct StoreConfig {
    StoreBackend backend = StoreBackend::MEMORY;

    /**
     * @brief Server used by the redis store and the redis bus
     */
    RedisConfig redis;
};

/**
 * @brief Complete configuration of a mesh process
 *
 * Loaded from JSON, e.g.:
 * @code
 * {
 *   "logging": { "level": "INFO" },
 *   "mesh": { "endpoint_ttl_seconds": 90, "default_load_balancer": "RoundRobin" },
 *   "circuit_breaker": { "enabled": true, "threshold": 5, "reset_seconds": 30 },
 *   "invocation": { "max_retries": 3, "retry_delay_ms": 100 },
 *   "health_check": { "enabled": false },
 *   "store": { "backend": "redis", "redis": { "host": "10.0.0.5", "port": 6379 } },
 *   "event": { "thread_pool_size": 4, "bus": "redis" }
 * }
 * @endcode
 * Missing keys keep their defaults.
 */
struct MeshConfig {
    std::string log_level = "INFO";

    RegistryConfig registry;

    CircuitBreakerConfig circuit_breaker;

    InvocationConfig invocation;

    HealthCheckConfig health_check;

    StoreConfig store;

    size_t event_thread_pool_size = 4;

    BusBackend bus = BusBackend::LOCAL;

    /**
     * @brief Check cross-field constraints
     * @throws std::invalid_argument describing the first violation
     */
    void validate() const;

    /**
     * @brief Build a configuration from parsed JSON
     * @throws std::invalid_argument on an unknown algorithm or backend name
     * @throws nlohmann::json::exception on a mistyped value
     */
    static MeshConfig fromJson(const nlohmann::json& json);
};

/**
 * @brief Load configuration from a JSON file
 *
 * A missing file or a malformed document is logged and yields the
 * defaults. The result is validated.
 *
 * @throws std::invalid_argument if the loaded values are inconsistent
 */
MeshConfig loadMeshConfig(const std::string& path);

} // namespace meshcore

#endif // MESHCORE_CONFIG_MESH_CONFIG_H
