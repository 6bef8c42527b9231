#ifndef MESHCORE_ROUTING_LOAD_BALANCER_H
#define MESHCORE_ROUTING_LOAD_BALANCER_H

#include "registry/endpoint.h"

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshcore {

/**
 * @brief Endpoint selection strategies
 */
enum class LoadBalancingAlgorithm {
    /**
     * @brief Per-appId counter, list[counter % size]
     */
    ROUND_ROBIN,

    /**
     * @brief Minimum currentConnections, ties broken by list order
     */
    LEAST_CONNECTIONS,

    /**
     * @brief Uniform random pick
     */
    RANDOM,

    /**
     * @brief Random pick proportional to max(100 - loadPercent, 1)
     */
    WEIGHTED,

    /**
     * @brief Smooth (nginx-style) weighted round robin on the same weight
     */
    WEIGHTED_ROUND_ROBIN
};

const char* to_string(LoadBalancingAlgorithm algorithm);

/**
 * @brief Parse an algorithm name ("RoundRobin", "leastconnections", ...)
 * @throws std::invalid_argument for an unknown name
 */
LoadBalancingAlgorithm parseLoadBalancingAlgorithm(const std::string& name);

/**
 * @brief Selection weight of an endpoint: max(100 - loadPercent, 1)
 */
int effectiveWeight(const Endpoint& endpoint);

/**
 * @brief Keyed round-robin counters and smooth-WRR current weights
 *
 * State is grouped per appId. With a non-zero cap, adding state for a new
 * appId beyond the cap evicts the least recently used appId.
 */
class LoadBalancingState {
public:
    /**
     * @param maxAppIds Maximum number of tracked appIds (0 = unlimited)
     */
    explicit LoadBalancingState(size_t maxAppIds = 0);

    /**
     * @brief Return the current round-robin counter for @p appId and advance it
     */
    uint64_t nextRoundRobin(const std::string& appId);

    /**
     * @brief One smooth weighted round-robin round
     *
     * Every candidate's current weight (keyed "appId:instanceId") grows by
     * its effective weight, the highest wins (first on ties) and the winner
     * is reduced by the total weight. Entries for instances that are no
     * longer candidates are dropped.
     *
     * @return Index of the winner in @p candidates
     * @throws std::invalid_argument if @p candidates is empty
     */
    size_t selectWeightedRoundRobin(const std::string& appId,
                                    const std::vector<Endpoint>& candidates);

    /**
     * @brief Current smooth-WRR weight for an instance (0 if untracked)
     */
    int64_t currentWeight(const std::string& appId, const std::string& instanceId) const;

    size_t trackedAppIdCount() const;

    bool isTracked(const std::string& appId) const;

    size_t getMaxAppIds() const { return maxAppIds_; }

    void clear();

private:
    struct AppState {
        uint64_t roundRobinCounter = 0;
        std::unordered_map<std::string, int64_t> currentWeights;
        std::list<std::string>::iterator lruPosition;
    };

    AppState& touch(const std::string& appId);

    static std::string weightKey(const std::string& appId, const std::string& instanceId);

    mutable std::mutex mutex_;
    size_t maxAppIds_;
    std::unordered_map<std::string, AppState> apps_;
    std::list<std::string> lru_;
};

using LoadBalancingStatePtr = std::shared_ptr<LoadBalancingState>;

/**
 * @brief Applies a LoadBalancingAlgorithm to a candidate list
 */
class LoadBalancer {
public:
    explicit LoadBalancer(LoadBalancingStatePtr state);

    /**
     * @brief Choose one candidate
     * @return Index of the selection in @p candidates
     * @throws std::invalid_argument if @p candidates is empty
     */
    size_t select(LoadBalancingAlgorithm algorithm,
                  const std::string& appId,
                  const std::vector<Endpoint>& candidates);

    const LoadBalancingStatePtr& getState() const { return state_; }

private:
    size_t selectLeastConnections(const std::vector<Endpoint>& candidates) const;
    size_t selectRandom(size_t count);
    size_t selectWeighted(const std::vector<Endpoint>& candidates);

    LoadBalancingStatePtr state_;
    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

} // namespace meshcore

#endif // MESHCORE_ROUTING_LOAD_BALANCER_H
