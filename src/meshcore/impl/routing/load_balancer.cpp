#include "routing/load_balancer.h"
#include "utils/log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace meshcore {

const char* to_string(LoadBalancingAlgorithm algorithm) {
    switch (algorithm) {
        case LoadBalancingAlgorithm::ROUND_ROBIN: return "RoundRobin";
        case LoadBalancingAlgorithm::LEAST_CONNECTIONS: return "LeastConnections";
        case LoadBalancingAlgorithm::RANDOM: return "Random";
        case LoadBalancingAlgorithm::WEIGHTED: return "Weighted";
        case LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN: return "WeightedRoundRobin";
        default: return "Unknown";
    }
}

LoadBalancingAlgorithm parseLoadBalancingAlgorithm(const std::string& name) {
    std::string lower;
    for (char c : name) {
        if (c != '_' && c != '-') {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (lower == "roundrobin") return LoadBalancingAlgorithm::ROUND_ROBIN;
    if (lower == "leastconnections") return LoadBalancingAlgorithm::LEAST_CONNECTIONS;
    if (lower == "random") return LoadBalancingAlgorithm::RANDOM;
    if (lower == "weighted") return LoadBalancingAlgorithm::WEIGHTED;
    if (lower == "weightedroundrobin") return LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN;

    throw std::invalid_argument("Unknown load balancing algorithm: " + name);
}

int effectiveWeight(const Endpoint& endpoint) {
    int weight = 100 - static_cast<int>(std::lround(endpoint.loadPercent));
    return std::max(weight, 1);
}

// ============================================================================
// LoadBalancingState
// ============================================================================

LoadBalancingState::LoadBalancingState(size_t maxAppIds)
    : maxAppIds_(maxAppIds) {
}

std::string LoadBalancingState::weightKey(const std::string& appId, const std::string& instanceId) {
    return appId + ":" + instanceId;
}

LoadBalancingState::AppState& LoadBalancingState::touch(const std::string& appId) {
    auto it = apps_.find(appId);
    if (it != apps_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.lruPosition);
        return it->second;
    }

    if (maxAppIds_ > 0 && apps_.size() >= maxAppIds_) {
        const std::string& victim = lru_.back();
        LOGD_FMT("Evicting load balancing state for appId " << victim);
        apps_.erase(victim);
        lru_.pop_back();
    }

    lru_.push_front(appId);
    AppState& state = apps_[appId];
    state.lruPosition = lru_.begin();
    return state;
}

uint64_t LoadBalancingState::nextRoundRobin(const std::string& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return touch(appId).roundRobinCounter++;
}

size_t LoadBalancingState::selectWeightedRoundRobin(const std::string& appId,
                                                    const std::vector<Endpoint>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("No candidates for weighted round robin on " + appId);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    AppState& state = touch(appId);

    std::unordered_map<std::string, int64_t> next;
    int64_t total = 0;
    size_t best = 0;
    int64_t bestWeight = 0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        std::string key = weightKey(appId, candidates[i].instanceId);
        int weight = effectiveWeight(candidates[i]);

        int64_t current = 0;
        auto it = state.currentWeights.find(key);
        if (it != state.currentWeights.end()) {
            current = it->second;
        }
        current += weight;
        total += weight;
        next[key] = current;

        if (i == 0 || current > bestWeight) {
            best = i;
            bestWeight = current;
        }
    }

    next[weightKey(appId, candidates[best].instanceId)] -= total;
    state.currentWeights.swap(next);
    return best;
}

int64_t LoadBalancingState::currentWeight(const std::string& appId, const std::string& instanceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto app = apps_.find(appId);
    if (app == apps_.end()) {
        return 0;
    }
    auto it = app->second.currentWeights.find(weightKey(appId, instanceId));
    return it == app->second.currentWeights.end() ? 0 : it->second;
}

size_t LoadBalancingState::trackedAppIdCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return apps_.size();
}

bool LoadBalancingState::isTracked(const std::string& appId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return apps_.count(appId) > 0;
}

void LoadBalancingState::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    apps_.clear();
    lru_.clear();
}

// ============================================================================
// LoadBalancer
// ============================================================================

LoadBalancer::LoadBalancer(LoadBalancingStatePtr state)
    : state_(state ? std::move(state) : std::make_shared<LoadBalancingState>())
    , rng_(std::random_device{}()) {
}

size_t LoadBalancer::select(LoadBalancingAlgorithm algorithm,
                            const std::string& appId,
                            const std::vector<Endpoint>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("No candidates to select from for " + appId);
    }
    if (candidates.size() == 1) {
        return 0;
    }

    switch (algorithm) {
        case LoadBalancingAlgorithm::ROUND_ROBIN:
            return static_cast<size_t>(state_->nextRoundRobin(appId) % candidates.size());
        case LoadBalancingAlgorithm::LEAST_CONNECTIONS:
            return selectLeastConnections(candidates);
        case LoadBalancingAlgorithm::RANDOM:
            return selectRandom(candidates.size());
        case LoadBalancingAlgorithm::WEIGHTED:
            return selectWeighted(candidates);
        case LoadBalancingAlgorithm::WEIGHTED_ROUND_ROBIN:
            return state_->selectWeightedRoundRobin(appId, candidates);
        default:
            return 0;
    }
}

size_t LoadBalancer::selectLeastConnections(const std::vector<Endpoint>& candidates) const {
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (candidates[i].currentConnections < candidates[best].currentConnections) {
            best = i;
        }
    }
    return best;
}

size_t LoadBalancer::selectRandom(size_t count) {
    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_int_distribution<size_t> dist(0, count - 1);
    return dist(rng_);
}

size_t LoadBalancer::selectWeighted(const std::vector<Endpoint>& candidates) {
    std::vector<int> weights;
    weights.reserve(candidates.size());
    for (const auto& endpoint : candidates) {
        weights.push_back(effectiveWeight(endpoint));
    }

    std::lock_guard<std::mutex> lock(rngMutex_);
    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return dist(rng_);
}

} // namespace meshcore
