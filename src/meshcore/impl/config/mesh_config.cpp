#include "config/mesh_config.h"
#include "utils/log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace meshcore {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::chrono::milliseconds millis(const nlohmann::json& section, const char* key, std::chrono::milliseconds fallback) {
    if (section.contains(key)) {
        return std::chrono::milliseconds(section[key].get<int64_t>());
    }
    return fallback;
}

std::chrono::seconds seconds(const nlohmann::json& section, const char* key, std::chrono::seconds fallback) {
    if (section.contains(key)) {
        return std::chrono::seconds(section[key].get<int64_t>());
    }
    return fallback;
}

void loadRegistry(const nlohmann::json& mesh, RegistryConfig& cfg) {
    cfg.endpoint_ttl = seconds(mesh, "endpoint_ttl_seconds", cfg.endpoint_ttl);
    cfg.heartbeat_interval = seconds(mesh, "heartbeat_interval_seconds", cfg.heartbeat_interval);
    cfg.degradation_threshold = seconds(mesh, "degradation_threshold_seconds", cfg.degradation_threshold);
    if (mesh.contains("default_load_balancer")) {
        cfg.default_load_balancer = parseLoadBalancingAlgorithm(mesh["default_load_balancer"].get<std::string>());
    }
    if (mesh.contains("load_threshold_percent")) cfg.load_threshold_percent = mesh["load_threshold_percent"].get<double>();
    if (mesh.contains("max_top_endpoints_returned")) cfg.max_top_endpoints_returned = mesh["max_top_endpoints_returned"].get<uint32_t>();
    if (mesh.contains("load_balancing_state_max_app_ids")) cfg.load_balancing_state_max_app_ids = mesh["load_balancing_state_max_app_ids"].get<size_t>();
    if (mesh.contains("endpoint_port")) cfg.endpoint_port = mesh["endpoint_port"].get<int>();
    if (mesh.contains("default_max_connections")) cfg.default_max_connections = mesh["default_max_connections"].get<int>();
    if (mesh.contains("default_app_id")) cfg.default_app_id = mesh["default_app_id"].get<std::string>();
    cfg.degradation_event_dedup_window = seconds(mesh, "degradation_event_dedup_window_seconds",
                                                 cfg.degradation_event_dedup_window);
}

void loadCircuitBreaker(const nlohmann::json& cb, CircuitBreakerConfig& cfg) {
    if (cb.contains("enabled")) cfg.enabled = cb["enabled"].get<bool>();
    if (cb.contains("threshold")) cfg.failure_threshold = cb["threshold"].get<uint32_t>();
    if (cb.contains("reset_seconds")) {
        cfg.open_timeout = std::chrono::seconds(cb["reset_seconds"].get<int64_t>());
    }
}

void loadInvocation(const nlohmann::json& inv, InvocationConfig& cfg) {
    if (inv.contains("max_retries")) cfg.retry.max_retries = inv["max_retries"].get<uint32_t>();
    if (inv.contains("retry_delay_ms")) {
        cfg.retry.initial_delay = std::chrono::milliseconds(inv["retry_delay_ms"].get<int64_t>());
    }
    cfg.connect_timeout = seconds(inv, "connect_timeout_seconds", cfg.connect_timeout);
    cfg.request_timeout = seconds(inv, "request_timeout_seconds", cfg.request_timeout);
    cfg.endpoint_cache_ttl = seconds(inv, "endpoint_cache_ttl_seconds", cfg.endpoint_cache_ttl);
    if (inv.contains("endpoint_cache_max_size")) cfg.endpoint_cache_max_size = inv["endpoint_cache_max_size"].get<size_t>();
}

void loadHealthCheck(const nlohmann::json& hc, HealthCheckConfig& cfg) {
    if (hc.contains("enabled")) cfg.enabled = hc["enabled"].get<bool>();
    cfg.interval = seconds(hc, "interval_seconds", cfg.interval);
    cfg.timeout = seconds(hc, "timeout_seconds", cfg.timeout);
    if (hc.contains("failure_threshold")) cfg.failure_threshold = hc["failure_threshold"].get<uint32_t>();
    cfg.startup_delay = seconds(hc, "startup_delay_seconds", cfg.startup_delay);
    if (hc.contains("path")) cfg.path = hc["path"].get<std::string>();
}

void loadStore(const nlohmann::json& store, StoreConfig& cfg) {
    if (store.contains("backend")) cfg.backend = parseStoreBackend(store["backend"].get<std::string>());
    if (!store.contains("redis")) {
        return;
    }
    auto redis = store["redis"];
    if (redis.contains("host")) cfg.redis.host = redis["host"].get<std::string>();
    if (redis.contains("port")) cfg.redis.port = redis["port"].get<int>();
    if (redis.contains("db")) cfg.redis.db = redis["db"].get<int>();
    if (redis.contains("password")) cfg.redis.password = redis["password"].get<std::string>();
    cfg.redis.connect_timeout = millis(redis, "connect_timeout_ms", cfg.redis.connect_timeout);
    cfg.redis.command_timeout = millis(redis, "command_timeout_ms", cfg.redis.command_timeout);
}

} // anonymous namespace

StoreBackend parseStoreBackend(const std::string& name) {
    std::string value = lower(name);
    if (value == "memory") return StoreBackend::MEMORY;
    if (value == "redis") return StoreBackend::REDIS;
    throw std::invalid_argument("Unknown store backend: " + name);
}

BusBackend parseBusBackend(const std::string& name) {
    std::string value = lower(name);
    if (value == "local") return BusBackend::LOCAL;
    if (value == "redis") return BusBackend::REDIS;
    throw std::invalid_argument("Unknown message bus backend: " + name);
}

MeshConfig MeshConfig::fromJson(const nlohmann::json& json) {
    MeshConfig config;

    if (json.contains("logging")) {
        auto logging = json["logging"];
        if (logging.contains("level")) config.log_level = logging["level"].get<std::string>();
    }

    if (json.contains("mesh")) {
        loadRegistry(json["mesh"], config.registry);
    }

    if (json.contains("circuit_breaker")) {
        loadCircuitBreaker(json["circuit_breaker"], config.circuit_breaker);
    }

    if (json.contains("invocation")) {
        loadInvocation(json["invocation"], config.invocation);
    }

    if (json.contains("health_check")) {
        loadHealthCheck(json["health_check"], config.health_check);
    }

    if (json.contains("store")) {
        loadStore(json["store"], config.store);
    }

    if (json.contains("event")) {
        auto event = json["event"];
        if (event.contains("thread_pool_size")) config.event_thread_pool_size = event["thread_pool_size"].get<size_t>();
        if (event.contains("bus")) config.bus = parseBusBackend(event["bus"].get<std::string>());
    }

    return config;
}

void MeshConfig::validate() const {
    if (registry.endpoint_ttl.count() <= 0) {
        throw std::invalid_argument("mesh.endpoint_ttl_seconds must be positive");
    }
    if (registry.heartbeat_interval.count() <= 0) {
        throw std::invalid_argument("mesh.heartbeat_interval_seconds must be positive");
    }
    if (registry.heartbeat_interval >= registry.endpoint_ttl) {
        throw std::invalid_argument("mesh.heartbeat_interval_seconds must be shorter than the endpoint TTL");
    }
    if (registry.degradation_threshold.count() <= 0) {
        throw std::invalid_argument("mesh.degradation_threshold_seconds must be positive");
    }
    if (registry.load_threshold_percent < 0.0 || registry.load_threshold_percent > 100.0) {
        throw std::invalid_argument("mesh.load_threshold_percent must be within 0-100");
    }
    if (registry.endpoint_port <= 0 || registry.endpoint_port > 65535) {
        throw std::invalid_argument("mesh.endpoint_port must be a valid TCP port");
    }
    if (registry.default_max_connections < 0) {
        throw std::invalid_argument("mesh.default_max_connections must not be negative");
    }
    if (registry.default_app_id.empty()) {
        throw std::invalid_argument("mesh.default_app_id must not be empty");
    }
    if (registry.degradation_event_dedup_window.count() < 0) {
        throw std::invalid_argument("mesh.degradation_event_dedup_window_seconds must not be negative");
    }
    if (circuit_breaker.failure_threshold == 0) {
        throw std::invalid_argument("circuit_breaker.threshold must be at least 1");
    }
    if (circuit_breaker.open_timeout.count() <= 0) {
        throw std::invalid_argument("circuit_breaker.reset_seconds must be positive");
    }
    if (invocation.retry.initial_delay.count() < 0) {
        throw std::invalid_argument("invocation.retry_delay_ms must not be negative");
    }
    if (invocation.connect_timeout.count() <= 0 || invocation.request_timeout.count() <= 0) {
        throw std::invalid_argument("invocation timeouts must be positive");
    }
    if (invocation.endpoint_cache_ttl.count() < 0) {
        throw std::invalid_argument("invocation.endpoint_cache_ttl_seconds must not be negative");
    }
    if (health_check.enabled) {
        if (health_check.interval.count() <= 0) {
            throw std::invalid_argument("health_check.interval_seconds must be positive");
        }
        if (health_check.timeout.count() <= 0) {
            throw std::invalid_argument("health_check.timeout_seconds must be positive");
        }
    }
    if (health_check.startup_delay.count() < 0) {
        throw std::invalid_argument("health_check.startup_delay_seconds must not be negative");
    }
    if (event_thread_pool_size == 0) {
        throw std::invalid_argument("event.thread_pool_size must be at least 1");
    }
    if (store.backend == StoreBackend::REDIS || bus == BusBackend::REDIS) {
        const RedisConfig& redis = store.redis;
        if (redis.host.empty()) {
            throw std::invalid_argument("store.redis.host must not be empty");
        }
        if (redis.port <= 0 || redis.port > 65535) {
            throw std::invalid_argument("store.redis.port must be a valid TCP port");
        }
        if (redis.db < 0) {
            throw std::invalid_argument("store.redis.db must not be negative");
        }
        if (redis.connect_timeout.count() <= 0 || redis.command_timeout.count() <= 0) {
            throw std::invalid_argument("store.redis timeouts must be positive");
        }
    }
}

MeshConfig loadMeshConfig(const std::string& path) {
    MeshConfig config;

    try {
        std::ifstream configFile(path);
        if (!configFile.is_open()) {
            LOGW_FMT("Configuration file not found: " << path << ", using defaults");
            config.validate();
            return config;
        }

        nlohmann::json json;
        configFile >> json;
        config = MeshConfig::fromJson(json);

        LOGI_FMT("Loaded mesh configuration from: " << path);

    } catch (const nlohmann::json::exception& e) {
        LOGE_FMT("Failed to load configuration file: " << e.what() << ", using defaults");
        config = MeshConfig();
    }

    config.validate();
    return config;
}

} // namespace meshcore
