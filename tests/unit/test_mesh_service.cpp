#include <gtest/gtest.h>
#include "mesh/mesh_service.h"
#include "store/memory_state_store.h"
#include "core/mesh_error.h"
#include "core/mesh_topics.h"
#include "test_support.h"

using namespace meshcore;
using namespace meshcore::testing_support;
using namespace std::chrono_literals;

class MeshServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<utils::ManualClock>(utils::fromEpochMillis(1700000000000LL));
        state = std::make_shared<MemoryStateStore>(clock);
        bus = std::make_shared<RecordingMessageBus>();
        mesh = std::make_unique<MeshService>(config, state, bus, "mesh-1", nullptr, clock);
    }

    void TearDown() override {
        mesh.reset();
    }

    std::string add(const std::string& id, const std::string& appId = "auth") {
        RegisterRequest request;
        request.appId = appId;
        request.host = "10.0.0.1";
        request.port = 8080;
        request.serviceNames = {"login"};
        request.instanceId = id;
        return mesh->registerEndpoint(request);
    }

    void beat(const std::string& id, EndpointStatus status) {
        HeartbeatRequest request;
        request.instanceId = id;
        request.status = status;
        mesh->heartbeat(request);
    }

    Event heartbeatSignal(const std::string& id) {
        Event event(topics::HEARTBEAT_SIGNAL, "agent");
        event.setProperty("instanceId", id);
        event.setProperty("status", std::string("Healthy"));
        event.setProperty("loadPercent", 25.0);
        event.setProperty("currentConnections", 3);
        return event;
    }

    Event mappingsSignal(const std::map<std::string, std::string>& mappings) {
        Event event(topics::MAPPINGS_SIGNAL, "control-plane");
        event.setProperty("mappings", mappings);
        return event;
    }

    MeshConfig config;
    std::shared_ptr<utils::ManualClock> clock;
    std::shared_ptr<MemoryStateStore> state;
    std::shared_ptr<RecordingMessageBus> bus;
    std::unique_ptr<MeshService> mesh;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(MeshServiceTest, RequiresStore) {
    EXPECT_THROW(MeshService(config, nullptr, bus, "x"), std::invalid_argument);
}

TEST_F(MeshServiceTest, RejectsInvalidConfig) {
    MeshConfig bad;
    bad.registry.heartbeat_interval = bad.registry.endpoint_ttl;
    EXPECT_THROW(MeshService(bad, state, bus, "x"), std::invalid_argument);
}

TEST_F(MeshServiceTest, InvocationComponentsNeedTransport) {
    EXPECT_EQ(nullptr, mesh->getInvocationClient());
    EXPECT_EQ(nullptr, mesh->getHealthCheckWorker());
    EXPECT_NE(nullptr, mesh->getRegistry());
    EXPECT_NE(nullptr, mesh->getRouter());
    EXPECT_NE(nullptr, mesh->getCircuitBreaker());
    EXPECT_EQ("mesh-1", mesh->getOrigin());

    MeshService withTransport(config, state, bus, "mesh-2", std::make_shared<FakeHttpTransport>(), clock);
    EXPECT_NE(nullptr, withTransport.getInvocationClient());
    EXPECT_NE(nullptr, withTransport.getHealthCheckWorker());
}

TEST_F(MeshServiceTest, StartAndStopManageSubscriptions) {
    mesh->start();
    // heartbeat + mappings signals, circuit broadcasts
    EXPECT_EQ(3u, bus->subscriptionCount());

    mesh->start();
    EXPECT_EQ(3u, bus->subscriptionCount());

    mesh->stop();
    EXPECT_EQ(0u, bus->subscriptionCount());
}

// ============================================================================
// Registry and routing
// ============================================================================

TEST_F(MeshServiceTest, RegisteredEndpointIsRoutableUntilTtlExpires) {
    add("i-1");

    HeartbeatRequest request;
    request.instanceId = "i-1";
    request.loadPercent = 40.0;
    HeartbeatResponse response = mesh->heartbeat(request);
    EXPECT_EQ(config.registry.heartbeat_interval, response.nextHeartbeat);
    EXPECT_EQ(config.registry.endpoint_ttl, response.ttl);
    EXPECT_FALSE(response.registered);

    Route route = mesh->getRoute("auth");
    EXPECT_EQ("i-1", route.primary.instanceId);
    EXPECT_DOUBLE_EQ(40.0, route.primary.loadPercent);

    EXPECT_EQ(1u, mesh->listEndpoints("auth").summary.healthy);

    clock->advance(config.registry.endpoint_ttl + 1s);
    EXPECT_EQ(0u, mesh->getEndpoints("auth").totalCount);
    EXPECT_THROW(mesh->getRoute("auth"), MeshException);

    EndpointSummary summary = mesh->listEndpoints("auth").summary;
    EXPECT_EQ(0u, summary.healthy);
    EXPECT_EQ(0u, summary.healthyByAppId.count("auth"));
}

TEST_F(MeshServiceTest, RouteForServiceFollowsMappings) {
    add("i-1", "billing");
    mesh->handleMappingsSignal(mappingsSignal({{"charge", "billing"}}));

    EXPECT_EQ("i-1", mesh->getRouteForService("charge").primary.instanceId);
    EXPECT_EQ(1u, mesh->getMappings("CH").mappings.size());
    EXPECT_TRUE(mesh->getMappings("x").mappings.empty());
}

TEST_F(MeshServiceTest, DeregisteredEndpointIsGone) {
    add("i-1");
    mesh->deregisterEndpoint("i-1");
    EXPECT_EQ(0u, mesh->listEndpoints().summary.total);
}

// ============================================================================
// Inbound signals
// ============================================================================

TEST_F(MeshServiceTest, HeartbeatSignalUpdatesEndpointAndKeepsIssues) {
    add("i-1");
    mesh->start();

    HeartbeatRequest withIssues;
    withIssues.instanceId = "i-1";
    withIssues.issues = std::vector<std::string>{"disk"};
    mesh->heartbeat(withIssues);

    bus->publish(heartbeatSignal("i-1"));

    Endpoint endpoint = mesh->getRegistry()->getEndpoint("i-1");
    EXPECT_DOUBLE_EQ(25.0, endpoint.loadPercent);
    EXPECT_EQ(3, endpoint.currentConnections);
    EXPECT_EQ(std::vector<std::string>{"disk"}, endpoint.issues);
    mesh->stop();
}

TEST_F(MeshServiceTest, HeartbeatSignalWithAppIdRegistersUnknownEndpoint) {
    mesh->start();

    Event event = heartbeatSignal("new-1");
    event.setProperty("appId", std::string("orders"));
    event.setProperty("serviceNames", std::vector<std::string>{"place", "cancel"});
    event.setProperty("maxConnections", 50);
    bus->publish(event);

    Endpoint endpoint = mesh->getRegistry()->getEndpoint("new-1");
    EXPECT_EQ("orders", endpoint.appId);
    EXPECT_EQ("orders", endpoint.host);
    EXPECT_EQ(config.registry.endpoint_port, endpoint.port);
    EXPECT_EQ(2u, endpoint.serviceNames.size());
    EXPECT_EQ(50, endpoint.maxConnections);
    EXPECT_EQ(1u, bus->eventsFor(topics::ENDPOINT_REGISTERED).size());
    EXPECT_TRUE(bus->eventsFor(topics::ERROR).empty());
    mesh->stop();
}

TEST_F(MeshServiceTest, FailedHeartbeatSignalPublishesError) {
    mesh->handleHeartbeatSignal(heartbeatSignal("ghost"));

    auto errors = bus->eventsFor(topics::ERROR);
    ASSERT_EQ(1u, errors.size());
    EXPECT_EQ("mesh", errors[0].getPropertyString("service"));
    EXPECT_EQ("HandleServiceHeartbeat", errors[0].getPropertyString("operation"));
    EXPECT_EQ("NOT_FOUND", errors[0].getPropertyString("errorType"));
    EXPECT_FALSE(errors[0].getPropertyString("message").empty());
    EXPECT_EQ("mesh-1", errors[0].getOrigin());
}

TEST_F(MeshServiceTest, SignalsAreIgnoredAfterStop) {
    mesh->start();
    mesh->stop();

    Event event = heartbeatSignal("late");
    event.setProperty("appId", std::string("orders"));
    bus->publish(event);

    EXPECT_THROW(mesh->getRegistry()->getEndpoint("late"), MeshException);
}

TEST_F(MeshServiceTest, MappingsSignalRespectsVersions) {
    mesh->start();

    Event v2 = mappingsSignal({{"charge", "billing"}});
    v2.setProperty("version", int64_t{2});
    bus->publish(v2);
    EXPECT_EQ(2, mesh->getMappings().version);

    Event stale = mappingsSignal({{"charge", "legacy"}});
    stale.setProperty("version", int64_t{1});
    bus->publish(stale);
    EXPECT_EQ("billing", mesh->getMappingResolver()->resolve("charge"));

    bus->publish(mappingsSignal({{"charge", "payments"}}));
    EXPECT_EQ(3, mesh->getMappings().version);
    EXPECT_EQ("payments", mesh->getMappingResolver()->resolve("charge"));
    mesh->stop();
}

TEST_F(MeshServiceTest, MappingsSignalDefaultAppIdFallsBackToConfig) {
    Event custom = mappingsSignal({});
    custom.setProperty("defaultAppId", std::string("catch-all"));
    mesh->handleMappingsSignal(custom);
    EXPECT_EQ("catch-all", mesh->getMappings().defaultAppId);

    mesh->handleMappingsSignal(mappingsSignal({}));
    EXPECT_EQ(config.registry.default_app_id, mesh->getMappings().defaultAppId);
}

TEST_F(MeshServiceTest, EmptyMappingsSendEverythingToDefault) {
    mesh->handleMappingsSignal(mappingsSignal({{"charge", "billing"}}));
    mesh->handleMappingsSignal(mappingsSignal({}));

    EXPECT_TRUE(mesh->getMappings().mappings.empty());
    EXPECT_EQ(config.registry.default_app_id, mesh->getMappingResolver()->resolve("charge"));
}

// ============================================================================
// Health
// ============================================================================

TEST_F(MeshServiceTest, HealthyWithNoIssues) {
    add("i-1");
    clock->advance(65s);
    beat("i-1", EndpointStatus::HEALTHY);

    HealthReport report = mesh->getHealth();
    EXPECT_EQ(EndpointStatus::HEALTHY, report.status);
    EXPECT_TRUE(report.storeConnected);
    EXPECT_EQ(1u, report.summary.healthy);
    EXPECT_TRUE(report.lastUpdateTime.has_value());
    EXPECT_EQ(65s, report.uptime);
    EXPECT_EQ("1m 5s", report.uptimeText);
    EXPECT_TRUE(report.endpoints.empty());
}

TEST_F(MeshServiceTest, HealthDegradedWhenAnyEndpointIsDegradedOrUnavailable) {
    add("a");
    add("b");
    beat("b", EndpointStatus::UNAVAILABLE);

    HealthReport report = mesh->getHealth(true);
    EXPECT_EQ(EndpointStatus::DEGRADED, report.status);
    EXPECT_EQ(2u, report.endpoints.size());

    beat("b", EndpointStatus::DEGRADED);
    EXPECT_EQ(EndpointStatus::DEGRADED, mesh->getHealth().status);
}

TEST_F(MeshServiceTest, HealthUnavailableWhenUnavailableOutnumberHealthy) {
    add("a");
    add("b");
    add("c");
    beat("b", EndpointStatus::UNAVAILABLE);
    beat("c", EndpointStatus::UNAVAILABLE);

    EXPECT_EQ(EndpointStatus::UNAVAILABLE, mesh->getHealth().status);
}

TEST_F(MeshServiceTest, HealthUnavailableWhenStoreIsDown) {
    add("a");
    state->setAvailable(false);

    HealthReport report = mesh->getHealth(true);
    EXPECT_EQ(EndpointStatus::UNAVAILABLE, report.status);
    EXPECT_FALSE(report.storeConnected);
    EXPECT_TRUE(report.endpoints.empty());
}

TEST(MeshServiceUptimeTest, FormatsByMagnitude) {
    EXPECT_EQ("0m 5s", MeshService::formatUptime(5s));
    EXPECT_EQ("1h 1m", MeshService::formatUptime(3660s));
    EXPECT_EQ("1d 1h 1m", MeshService::formatUptime(90060s));
    EXPECT_EQ("0m 0s", MeshService::formatUptime(-3s));
}
