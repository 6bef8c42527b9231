#include "resilience/health_check_worker.h"
#include "client/invocation_client.h"
#include "core/mesh_error.h"
#include "core/mesh_topics.h"
#include "utils/log.h"
#include "utils/thread_pool.h"

#include <future>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace meshcore {

HealthCheckWorker::HealthCheckWorker(const HealthCheckConfig& config,
                                     RegistryServicePtr registry,
                                     HttpTransportPtr transport,
                                     MessageBusPtr bus,
                                     const std::string& origin,
                                     size_t probe_threads)
    : config_(config)
    , registry_(std::move(registry))
    , transport_(std::move(transport))
    , bus_(std::move(bus))
    , origin_(origin)
    , probe_pool_(std::make_unique<utils::ThreadPool>(probe_threads == 0 ? 1 : probe_threads, "health-probe"))
    , running_(false)
    , should_stop_(false) {
    if (!registry_) {
        throw std::invalid_argument("HealthCheckWorker requires a registry");
    }
    if (!transport_) {
        throw std::invalid_argument("HealthCheckWorker requires an HTTP transport");
    }
}

HealthCheckWorker::~HealthCheckWorker() {
    stop();
}

bool HealthCheckWorker::start() {
    if (!config_.enabled) {
        LOGI_FMT("HealthCheckWorker::start: active health checks are disabled");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LOGW_FMT("HealthCheckWorker::start: already running");
        return false;
    }

    should_stop_ = false;
    running_ = true;
    check_thread_ = std::thread(&HealthCheckWorker::checkLoop, this);

    LOGI_FMT("HealthCheckWorker started: interval " << config_.interval.count() << "s, timeout "
             << config_.timeout.count() << "s, threshold " << config_.failure_threshold
             << ", startup delay " << config_.startup_delay.count() << "s");
    return true;
}

void HealthCheckWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        should_stop_ = true;
        running_ = false;
    }
    cv_.notify_all();

    if (check_thread_.joinable()) {
        check_thread_.join();
    }
    LOGI_FMT("HealthCheckWorker stopped");
}

bool HealthCheckWorker::isRunning() const {
    return running_;
}

void HealthCheckWorker::checkLoop() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, config_.startup_delay, [this] { return should_stop_.load(); })) {
            return;
        }
    }

    while (!should_stop_) {
        try {
            runCycle();
        } catch (const std::exception& e) {
            LOGE_FMT("Health check cycle failed: " << e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, config_.interval, [this] { return should_stop_.load(); });
    }
}

void HealthCheckWorker::runCycle() {
    std::vector<Endpoint> endpoints;
    try {
        endpoints = registry_->listEndpoints().endpoints;
    } catch (const MeshException& e) {
        LOGW_FMT("Health check skipped, endpoint listing failed: " << e.what());
        return;
    }

    {
        std::set<std::string> registered;
        for (const auto& endpoint : endpoints) {
            registered.insert(endpoint.instanceId);
        }
        std::lock_guard<std::mutex> lock(counters_mutex_);
        for (auto it = failures_.begin(); it != failures_.end();) {
            if (registered.count(it->first) == 0) {
                it = failures_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::vector<std::future<std::pair<bool, std::string>>> results;
    results.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
        results.push_back(probe_pool_->enqueue([this, endpoint]() {
            std::string error;
            bool ok = probe(endpoint, error);
            return std::make_pair(ok, error);
        }));
    }

    for (size_t i = 0; i < endpoints.size(); ++i) {
        const Endpoint& endpoint = endpoints[i];
        auto outcome = results[i].get();

        uint32_t count = 0;
        {
            std::lock_guard<std::mutex> lock(counters_mutex_);
            ++stats_.probes;
            if (outcome.first) {
                failures_.erase(endpoint.instanceId);
                continue;
            }
            ++stats_.failures;
            count = ++failures_[endpoint.instanceId];
        }

        LOGD_FMT("Health check of " << endpoint.instanceId << " failed (" << count << "): " << outcome.second);
        if (config_.failure_threshold > 0 && count >= config_.failure_threshold) {
            handleFailure(endpoint, count, outcome.second);
        }
    }

    std::lock_guard<std::mutex> lock(counters_mutex_);
    ++stats_.cycles;
}

bool HealthCheckWorker::probe(const Endpoint& endpoint, std::string& error) {
    HttpRequest request;
    request.method = "GET";
    request.scheme = InvocationClient::schemeFor(endpoint.port);
    request.host = endpoint.host;
    request.port = endpoint.port;
    request.target = InvocationClient::buildTarget(config_.path);
    request.connect_timeout = config_.timeout;
    request.request_timeout = config_.timeout;

    TransportResult<HttpResponse> result = transport_->send(request);
    if (!result) {
        error = result.error_message;
        return false;
    }
    if (!result.value.isSuccess()) {
        error = "status " + std::to_string(result.value.status);
        return false;
    }
    return true;
}

void HealthCheckWorker::handleFailure(const Endpoint& endpoint, uint32_t failures, const std::string& error) {
    LOGW_FMT("Endpoint " << endpoint.instanceId << " (" << endpoint.appId << ") failed "
             << failures << " consecutive health checks, deregistering");

    if (bus_) {
        Event event(topics::ENDPOINT_HEALTH_CHECK_FAILED, origin_);
        event.setProperty("instanceId", endpoint.instanceId);
        event.setProperty("appId", endpoint.appId);
        event.setProperty("consecutiveFailures", static_cast<int>(failures));
        event.setProperty("lastError", error);
        if (!bus_->publish(event)) {
            LOGW_FMT("Failed to publish health check failure for " << endpoint.instanceId);
        }
    }

    try {
        registry_->deregisterEndpoint(endpoint.instanceId, DeregistrationReason::HEALTH_CHECK_FAILED);
        std::lock_guard<std::mutex> lock(counters_mutex_);
        ++stats_.deregistrations;
    } catch (const MeshException& e) {
        if (e.code() != MeshErrorCode::NOT_FOUND) {
            LOGE_FMT("Failed to deregister " << endpoint.instanceId << ": " << e.what());
            return;
        }
        LOGD_FMT("Endpoint " << endpoint.instanceId << " already gone");
    }

    std::lock_guard<std::mutex> lock(counters_mutex_);
    failures_.erase(endpoint.instanceId);
}

uint32_t HealthCheckWorker::getFailureCount(const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    auto it = failures_.find(instanceId);
    return it == failures_.end() ? 0 : it->second;
}

HealthCheckStats HealthCheckWorker::getStats() const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    return stats_;
}

} // namespace meshcore
