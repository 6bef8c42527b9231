#include <gtest/gtest.h>
#include "store/endpoint_store.h"
#include "store/memory_state_store.h"
#include "store/circuit_breaker_store.h"
#include "core/mesh_error.h"
#include "test_support.h"
#include <algorithm>

using namespace meshcore;
using namespace meshcore::testing_support;
using namespace std::chrono_literals;

namespace {

Endpoint makeEndpoint(const std::string& id, const std::string& appId, utils::TimePoint now) {
    Endpoint ep;
    ep.instanceId = id;
    ep.appId = appId;
    ep.host = "10.0.0.1";
    ep.port = 8080;
    ep.serviceNames = {"login"};
    ep.lastHeartbeatAt = now;
    ep.registeredAt = now;
    return ep;
}

std::vector<std::string> ids(const std::vector<Endpoint>& endpoints) {
    std::vector<std::string> result;
    for (const auto& ep : endpoints) {
        result.push_back(ep.instanceId);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace

class EndpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<utils::ManualClock>();
        state = std::make_shared<MemoryStateStore>(clock);
        store = std::make_unique<EndpointStore>(state);
    }

    std::shared_ptr<utils::ManualClock> clock;
    std::shared_ptr<MemoryStateStore> state;
    std::unique_ptr<EndpointStore> store;
};

TEST_F(EndpointStoreTest, NullStoreRejected) {
    EXPECT_THROW(EndpointStore(nullptr), std::invalid_argument);
}

TEST_F(EndpointStoreTest, RegisterWritesRecordAndIndexes) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);

    auto ep = store->getEndpoint("i-1");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ("auth", ep->appId);
    EXPECT_EQ(8080, ep->port);
    EXPECT_TRUE(ep->servesService("login"));

    EXPECT_EQ(std::vector<std::string>{"i-1"}, state->setMembers("mesh:appid:auth"));
    EXPECT_EQ(std::vector<std::string>{"i-1"}, state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY));
    EXPECT_EQ(90000, state->ttl("mesh:endpoint:i-1")->count());
    EXPECT_EQ(90000, state->ttl("mesh:appid:auth")->count());
    EXPECT_FALSE(state->ttl(EndpointStore::ENDPOINT_INDEX_KEY).has_value());
}

TEST_F(EndpointStoreTest, AppIdChangeMovesIndexMembership) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);
    store->registerEndpoint(makeEndpoint("i-1", "billing", clock->now()), 90s);

    EXPECT_TRUE(store->getEndpointsForApp("auth").empty());
    EXPECT_EQ(std::vector<std::string>{"i-1"}, ids(store->getEndpointsForApp("billing")));
    EXPECT_EQ(1u, store->getAllEndpoints().size());
}

TEST_F(EndpointStoreTest, ExpiredRecordsArePrunedFromIndexes) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);
    clock->advance(60s);
    store->registerEndpoint(makeEndpoint("i-2", "auth", clock->now()), 90s);

    // i-1 expires, i-2 keeps the appId index alive
    clock->advance(31s);
    EXPECT_EQ(std::vector<std::string>{"i-2"}, ids(store->getEndpointsForApp("auth")));
    EXPECT_EQ(std::vector<std::string>{"i-2"}, state->setMembers("mesh:appid:auth"));

    // The global index keeps the stale member until a full read prunes it
    EXPECT_EQ(2u, state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY).size());
    EXPECT_EQ(std::vector<std::string>{"i-2"}, ids(store->getAllEndpoints()));
    EXPECT_EQ(std::vector<std::string>{"i-2"}, state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY));
}

TEST_F(EndpointStoreTest, UpdateRefreshesTtl) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);
    clock->advance(80s);

    auto ep = store->getEndpoint("i-1").value();
    ep.loadPercent = 42.0;
    store->updateEndpoint(ep, 90s);

    clock->advance(80s);
    auto refreshed = store->getEndpoint("i-1");
    ASSERT_TRUE(refreshed.has_value());
    EXPECT_DOUBLE_EQ(42.0, refreshed->loadPercent);
    EXPECT_EQ(1u, store->getEndpointsForApp("auth").size());
}

TEST_F(EndpointStoreTest, FailedAppIdIndexWriteLeavesEndpointInGlobalIndex) {
    auto intercepting = std::make_shared<InterceptingStateStore>(state);
    intercepting->beforeSetAdd = [](const std::string& key) {
        if (key.rfind(EndpointStore::APPID_KEY_PREFIX, 0) == 0) {
            throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE, "connection reset");
        }
    };
    EndpointStore failing(intercepting);

    EXPECT_THROW(failing.registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s), MeshException);
    EXPECT_EQ(std::vector<std::string>{"i-1"}, state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY));
    EXPECT_EQ(std::vector<std::string>{"i-1"}, ids(store->getAllEndpoints()));

    EXPECT_THROW(failing.updateEndpoint(makeEndpoint("i-2", "auth", clock->now()), 90s), MeshException);
    EXPECT_EQ((std::vector<std::string>{"i-1", "i-2"}), ids(store->getAllEndpoints()));
}

TEST_F(EndpointStoreTest, ModifyEndpointRewritesAndRefreshesTtl) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);
    clock->advance(80s);

    auto update = store->modifyEndpoint("i-1", [](Endpoint& ep) { ep.loadPercent = 55.0; }, 90s);
    ASSERT_TRUE(update.has_value());
    EXPECT_DOUBLE_EQ(0.0, update->before.loadPercent);
    EXPECT_DOUBLE_EQ(55.0, update->after.loadPercent);

    clock->advance(80s);
    auto refreshed = store->getEndpoint("i-1");
    ASSERT_TRUE(refreshed.has_value());
    EXPECT_DOUBLE_EQ(55.0, refreshed->loadPercent);
    EXPECT_EQ(1u, store->getEndpointsForApp("auth").size());
}

TEST_F(EndpointStoreTest, ModifyEndpointNeverCreatesRecords) {
    bool called = false;
    auto update = store->modifyEndpoint("i-9", [&](Endpoint&) { called = true; }, 90s);

    EXPECT_FALSE(update.has_value());
    EXPECT_FALSE(called);
    EXPECT_FALSE(state->exists(EndpointStore::endpointKey("i-9")));
    EXPECT_TRUE(state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY).empty());
}

TEST_F(EndpointStoreTest, ModifyEndpointSkipsConcurrentlyDeregisteredEndpoint) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);

    auto intercepting = std::make_shared<InterceptingStateStore>(state);
    intercepting->beforeAtomicUpdate = [this](const std::string&) {
        // Another process deregisters between our read and our write
        store->deregisterEndpoint("i-1", "auth");
    };
    EndpointStore racing(intercepting);

    auto update = racing.modifyEndpoint("i-1", [](Endpoint& ep) { ep.loadPercent = 10.0; }, 90s);

    EXPECT_FALSE(update.has_value());
    EXPECT_FALSE(state->exists(EndpointStore::endpointKey("i-1")));
    EXPECT_TRUE(state->setMembers(EndpointStore::ENDPOINT_INDEX_KEY).empty());
    EXPECT_TRUE(state->setMembers(EndpointStore::appIdKey("auth")).empty());
}

TEST_F(EndpointStoreTest, DeregisterRemovesEverything) {
    store->registerEndpoint(makeEndpoint("i-1", "auth", clock->now()), 90s);
    store->deregisterEndpoint("i-1", "auth");

    EXPECT_FALSE(store->getEndpoint("i-1").has_value());
    EXPECT_TRUE(store->getEndpointsForApp("auth").empty());
    EXPECT_TRUE(store->getAllEndpoints().empty());
}

TEST_F(EndpointStoreTest, PrefixFilterIsCaseInsensitive) {
    store->registerEndpoint(makeEndpoint("i-1", "AuthService", clock->now()), 90s);
    store->registerEndpoint(makeEndpoint("i-2", "billing", clock->now()), 90s);

    EXPECT_EQ(std::vector<std::string>{"i-1"}, ids(store->getAllEndpoints("auth")));
    EXPECT_EQ(2u, store->getAllEndpoints("").size());
}

TEST_F(EndpointStoreTest, MalformedRecordReadsAsAbsent) {
    state->set("mesh:endpoint:broken", "{not json");
    EXPECT_FALSE(store->getEndpoint("broken").has_value());
}

TEST_F(EndpointStoreTest, OutagePropagates) {
    state->setAvailable(false);
    EXPECT_FALSE(store->isHealthy());
    EXPECT_THROW(store->getEndpointsForApp("auth"), MeshException);
}

TEST(CircuitBreakerStoreTest, MissingRecordReadsClosed) {
    auto state = std::make_shared<MemoryStateStore>();
    CircuitBreakerStore store(state);

    auto record = store.get("auth");
    EXPECT_EQ(CircuitState::CLOSED, record.state);
    EXPECT_EQ(0u, record.consecutiveFailures);
    EXPECT_FALSE(record.openedAt.has_value());
}

TEST(CircuitBreakerStoreTest, UpdateReportsTransition) {
    auto clock = std::make_shared<utils::ManualClock>();
    auto state = std::make_shared<MemoryStateStore>(clock);
    CircuitBreakerStore store(state);

    auto update = store.update("auth", [&](const CircuitRecord& current) {
        CircuitRecord next = current;
        next.state = CircuitState::OPEN;
        next.consecutiveFailures = 5;
        next.openedAt = clock->now();
        return next;
    });

    EXPECT_TRUE(update.stateChanged());
    EXPECT_EQ(CircuitState::CLOSED, update.before.state);

    auto stored = store.get("auth");
    EXPECT_EQ(CircuitState::OPEN, stored.state);
    EXPECT_EQ(5u, stored.consecutiveFailures);
    EXPECT_EQ(utils::toEpochMillis(clock->now()), utils::toEpochMillis(*stored.openedAt));
    EXPECT_TRUE(state->exists(CircuitBreakerStore::circuitKey("auth")));
}
