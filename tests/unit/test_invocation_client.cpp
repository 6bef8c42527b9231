#include <gtest/gtest.h>
#include "client/invocation_client.h"
#include "core/mesh_error.h"
#include "store/memory_state_store.h"
#include "test_support.h"
#include <functional>

using namespace meshcore;
using namespace meshcore::testing_support;
using namespace std::chrono_literals;

class InvocationClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<utils::ManualClock>(utils::fromEpochMillis(1700000000000LL));
        state = std::make_shared<MemoryStateStore>(clock);
        store = std::make_shared<EndpointStore>(state);
        router = std::make_shared<Router>(registryConfig, store,
                                          std::make_shared<ServiceMappingResolver>("default"),
                                          nullptr, clock);
        transport = std::make_shared<FakeHttpTransport>();
        breaker = DistributedCircuitBreakerBuilder()
            .withStore(std::make_shared<CircuitBreakerStore>(state))
            .withFailureThreshold(2)
            .withResetTimeout(30s)
            .withClock(clock)
            .build();
        makeClient();
    }

    void makeClient() {
        client = std::make_unique<InvocationClient>(config, router, transport, breaker, clock);
        client->getRetryPolicy().setSleepFunction([this](std::chrono::milliseconds d) {
            delays.push_back(d);
        });
    }

    void addEndpoint(const std::string& id, const std::string& host, int port,
                     const std::string& appId = "auth") {
        Endpoint ep;
        ep.instanceId = id;
        ep.appId = appId;
        ep.host = host;
        ep.port = port;
        ep.lastHeartbeatAt = clock->now();
        ep.registeredAt = clock->now();
        store->registerEndpoint(ep, registryConfig.endpoint_ttl);
    }

    static MeshException raised(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const MeshException& e) {
            return e;
        }
        ADD_FAILURE() << "Expected MeshException";
        return MeshException(MeshErrorCode::INVALID_ARGUMENT, "none");
    }

    RegistryConfig registryConfig;
    InvocationConfig config;
    std::shared_ptr<utils::ManualClock> clock;
    std::shared_ptr<MemoryStateStore> state;
    EndpointStorePtr store;
    RouterPtr router;
    std::shared_ptr<FakeHttpTransport> transport;
    std::shared_ptr<DistributedCircuitBreaker> breaker;
    std::unique_ptr<InvocationClient> client;
    std::vector<std::chrono::milliseconds> delays;
};

// ============================================================================
// Request construction
// ============================================================================

TEST_F(InvocationClientTest, BuildsRequestFromEndpoint) {
    addEndpoint("i-1", "10.0.0.5", 8080);
    transport->enqueue(FakeHttpTransport::status(200, "ok"));

    InvocationRequest request;
    request.http_method = "PUT";
    request.body = "payload";
    request.headers["X-Trace"] = "abc";

    HttpResponse response = client->invoke("auth", "/users/42", request);
    EXPECT_EQ(200, response.status);
    EXPECT_EQ("ok", response.body);

    auto sent = transport->requests();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ("PUT", sent[0].method);
    EXPECT_EQ("http", sent[0].scheme);
    EXPECT_EQ("10.0.0.5", sent[0].host);
    EXPECT_EQ(8080, sent[0].port);
    EXPECT_EQ("/users/42", sent[0].target);
    EXPECT_EQ("payload", sent[0].body);
    EXPECT_EQ("abc", sent[0].headers.at("X-Trace"));
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(config.request_timeout),
              sent[0].request_timeout);
}

TEST_F(InvocationClientTest, Port443UsesHttps) {
    addEndpoint("i-1", "auth.example.com", 443);
    client->invoke("auth", "login");

    auto sent = transport->requests();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ("https", sent[0].scheme);
    EXPECT_EQ("https://auth.example.com:443/login", sent[0].url());
}

TEST_F(InvocationClientTest, BuildTargetNormalizesSlashes) {
    EXPECT_EQ("/login", InvocationClient::buildTarget("login"));
    EXPECT_EQ("/login", InvocationClient::buildTarget("//login"));
    EXPECT_EQ("/", InvocationClient::buildTarget(""));
    EXPECT_EQ("/a/b", InvocationClient::buildTarget("/a/b"));
}

// ============================================================================
// Retries
// ============================================================================

TEST_F(InvocationClientTest, NonTransientStatusReturnedWithoutRetry) {
    addEndpoint("i-1", "h", 80);
    transport->enqueue(FakeHttpTransport::status(404, "missing"));

    HttpResponse response = client->invoke("auth", "users");
    EXPECT_EQ(404, response.status);
    EXPECT_EQ(1u, transport->callCount());
    EXPECT_TRUE(delays.empty());
}

TEST_F(InvocationClientTest, TransientStatusRetriedWithBackoff) {
    addEndpoint("i-1", "h", 80);
    transport->enqueue(FakeHttpTransport::status(503));
    transport->enqueue(FakeHttpTransport::status(429));
    transport->enqueue(FakeHttpTransport::status(200, "done"));

    HttpResponse response = client->invoke("auth", "users");
    EXPECT_EQ("done", response.body);
    EXPECT_EQ(3u, transport->callCount());
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{100ms, 200ms}), delays);
}

TEST_F(InvocationClientTest, ExhaustedStatusRetriesRaiseTerminalUpstream) {
    addEndpoint("i-1", "h", 80);
    transport->setHandler([](const HttpRequest&) { return FakeHttpTransport::status(502); });

    MeshException e = raised([&]() { client->invoke("auth", "users"); });
    EXPECT_EQ(MeshErrorCode::TERMINAL_UPSTREAM, e.code());
    EXPECT_EQ(502, e.httpStatus());
    EXPECT_EQ(config.retry.max_retries + 1, transport->callCount());
}

TEST_F(InvocationClientTest, ExhaustedConnectionRetriesRaiseTransientUpstream) {
    addEndpoint("i-1", "h", 80);
    transport->setHandler([](const HttpRequest&) { return FakeHttpTransport::connectionError(); });

    MeshException e = raised([&]() { client->invoke("auth", "users"); });
    EXPECT_EQ(MeshErrorCode::TRANSIENT_UPSTREAM, e.code());
    EXPECT_EQ(0, e.httpStatus());
    EXPECT_EQ(4u, transport->callCount());
}

TEST_F(InvocationClientTest, EveryTransportErrorIsRetried) {
    addEndpoint("i-1", "h", 80);

    // The breaker threshold is 2, so both invocations reach the transport
    size_t expected = 0;
    for (int error : {EPROTO, ENETDOWN}) {
        transport->setHandler([error](const HttpRequest&) { return FakeHttpTransport::connectionError(error); });

        MeshException e = raised([&]() { client->invoke("auth", "users"); });
        EXPECT_EQ(MeshErrorCode::TRANSIENT_UPSTREAM, e.code()) << error;
        expected += config.retry.max_retries + 1;
        EXPECT_EQ(expected, transport->callCount()) << error;
    }
}

TEST_F(InvocationClientTest, ProtocolErrorThenSuccessRecovers) {
    addEndpoint("i-1", "h", 80);
    transport->enqueue(FakeHttpTransport::connectionError(EPROTO));
    transport->enqueue(FakeHttpTransport::status(200));

    EXPECT_EQ(200, client->invoke("auth", "users").status);
    EXPECT_EQ(2u, transport->callCount());
}

TEST_F(InvocationClientTest, ZeroRetriesMakesOneAttempt) {
    config.retry.max_retries = 0;
    makeClient();
    addEndpoint("i-1", "h", 80);
    transport->setHandler([](const HttpRequest&) { return FakeHttpTransport::status(500); });

    EXPECT_THROW(client->invoke("auth", "users"), MeshException);
    EXPECT_EQ(1u, transport->callCount());
}

TEST_F(InvocationClientTest, UnknownAppIdIsNotFoundAfterRetries) {
    MeshException e = raised([&]() { client->invoke("ghost", "users"); });
    EXPECT_EQ(MeshErrorCode::NOT_FOUND, e.code());
    EXPECT_EQ(0u, transport->callCount());
    EXPECT_EQ(3u, delays.size());
}

TEST_F(InvocationClientTest, EndpointAppearingDuringRetriesIsUsed) {
    client->getRetryPolicy().setSleepFunction([this](std::chrono::milliseconds) {
        addEndpoint("late", "h", 80);
    });

    HttpResponse response = client->invoke("auth", "users");
    EXPECT_EQ(200, response.status);
    EXPECT_EQ(1u, transport->callCount());
}

TEST_F(InvocationClientTest, StoreOutageSurfacesImmediately) {
    state->setAvailable(false);

    MeshException e = raised([&]() { client->invokeRaw("auth", "users"); });
    EXPECT_EQ(MeshErrorCode::DEPENDENCY_UNAVAILABLE, e.code());
    EXPECT_TRUE(delays.empty());
}

// ============================================================================
// Endpoint cache
// ============================================================================

TEST_F(InvocationClientTest, ResolvedEndpointIsCached) {
    addEndpoint("i-1", "first", 80);
    client->invoke("auth", "a");

    store->deregisterEndpoint("i-1", "auth");
    addEndpoint("i-2", "second", 80);
    client->invoke("auth", "b");

    auto sent = transport->requests();
    ASSERT_EQ(2u, sent.size());
    EXPECT_EQ("first", sent[1].host);

    clock->advance(config.endpoint_cache_ttl);
    client->invoke("auth", "c");
    EXPECT_EQ("second", transport->requests()[2].host);
}

TEST_F(InvocationClientTest, ConnectionFailureInvalidatesCache) {
    addEndpoint("i-1", "first", 80);
    client->invoke("auth", "a");

    store->deregisterEndpoint("i-1", "auth");
    addEndpoint("i-2", "second", 80);
    transport->enqueue(FakeHttpTransport::connectionError());

    client->invoke("auth", "b");

    auto sent = transport->requests();
    ASSERT_EQ(3u, sent.size());
    EXPECT_EQ("first", sent[1].host);
    EXPECT_EQ("second", sent[2].host);
}

TEST(EndpointCacheTest, ZeroTtlDisablesCaching) {
    EndpointCache cache(0s);
    Endpoint ep;
    ep.instanceId = "i-1";
    cache.put("auth", ep);

    EXPECT_FALSE(cache.get("auth").has_value());
    EXPECT_EQ(0u, cache.size());
}

TEST(EndpointCacheTest, EvictsEntryClosestToExpiry) {
    auto clock = std::make_shared<utils::ManualClock>();
    EndpointCache cache(10s, 2, clock);
    Endpoint ep;

    cache.put("a", ep);
    clock->advance(1s);
    cache.put("b", ep);
    clock->advance(1s);
    cache.put("c", ep);

    EXPECT_EQ(2u, cache.size());
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_TRUE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());

    cache.invalidate("b");
    EXPECT_FALSE(cache.get("b").has_value());
    cache.clear();
    EXPECT_EQ(0u, cache.size());
}

// ============================================================================
// Circuit breaker integration
// ============================================================================

TEST_F(InvocationClientTest, OneBreakerFailurePerExhaustedInvocation) {
    addEndpoint("i-1", "h", 80);
    transport->setHandler([](const HttpRequest&) { return FakeHttpTransport::status(503); });

    EXPECT_THROW(client->invoke("auth", "users"), MeshException);
    EXPECT_EQ(1u, breaker->getRecord("auth").consecutiveFailures);
    EXPECT_EQ(CircuitState::CLOSED, breaker->getState("auth"));
}

TEST_F(InvocationClientTest, OpenCircuitFailsFastWithoutNetwork) {
    addEndpoint("i-1", "h", 80);
    breaker->recordFailure("auth");
    breaker->recordFailure("auth");

    MeshException e = raised([&]() { client->invoke("auth", "users"); });
    EXPECT_EQ(MeshErrorCode::CIRCUIT_OPEN, e.code());
    EXPECT_EQ(0u, transport->callCount());
}

TEST_F(InvocationClientTest, SuccessfulProbeClosesCircuit) {
    addEndpoint("i-1", "h", 80);
    breaker->recordFailure("auth");
    breaker->recordFailure("auth");
    clock->advance(30s);
    addEndpoint("i-1", "h", 80);

    EXPECT_EQ(200, client->invoke("auth", "users").status);
    EXPECT_EQ(CircuitState::CLOSED, breaker->getState("auth"));
}

TEST_F(InvocationClientTest, NonTransientErrorStatusCountsAsSuccess) {
    addEndpoint("i-1", "h", 80);
    breaker->recordFailure("auth");
    transport->enqueue(FakeHttpTransport::status(400));

    EXPECT_EQ(400, client->invoke("auth", "users").status);
    EXPECT_EQ(0u, breaker->getRecord("auth").consecutiveFailures);
}

TEST_F(InvocationClientTest, InvokeRawBypassesBreaker) {
    addEndpoint("i-1", "h", 80);
    breaker->recordFailure("auth");
    breaker->recordFailure("auth");

    EXPECT_EQ(200, client->invokeRaw("auth", "users").status);
    EXPECT_EQ(CircuitState::OPEN, breaker->getState("auth"));
}

// ============================================================================
// Typed and service-addressed calls
// ============================================================================

TEST_F(InvocationClientTest, InvokeJsonRoundTrip) {
    addEndpoint("i-1", "h", 80);
    transport->enqueue(FakeHttpTransport::status(200, R"({"token":"t-1"})"));

    nlohmann::json reply = client->invokeJson("auth", "login", {{"user", "ada"}});
    EXPECT_EQ("t-1", reply["token"].get<std::string>());

    auto sent = transport->requests();
    ASSERT_EQ(1u, sent.size());
    EXPECT_EQ("application/json", sent[0].headers.at("Content-Type"));
    EXPECT_EQ("ada", nlohmann::json::parse(sent[0].body)["user"].get<std::string>());
}

TEST_F(InvocationClientTest, InvokeJsonRejectsErrorsAndGarbage) {
    addEndpoint("i-1", "h", 80);

    transport->enqueue(FakeHttpTransport::status(404, "nope"));
    MeshException notFound = raised([&]() { client->invokeJson("auth", "login", nullptr); });
    EXPECT_EQ(MeshErrorCode::TERMINAL_UPSTREAM, notFound.code());
    EXPECT_EQ(404, notFound.httpStatus());

    transport->enqueue(FakeHttpTransport::status(200, "<html>"));
    MeshException garbage = raised([&]() { client->invokeJson("auth", "login", nullptr); });
    EXPECT_EQ(MeshErrorCode::TERMINAL_UPSTREAM, garbage.code());

    transport->enqueue(FakeHttpTransport::status(204, ""));
    EXPECT_TRUE(client->invokeJson("auth", "logout", nullptr, "DELETE").is_null());
    EXPECT_EQ("DELETE", transport->requests().back().method);
}

TEST_F(InvocationClientTest, InvokeServiceFollowsMappings) {
    addEndpoint("i-1", "billing-host", 80, "billing");
    router->getMappings()->applySnapshot({{"charge", "billing"}});

    client->invokeService("charge", "pay");
    EXPECT_EQ("billing-host", transport->requests().at(0).host);
}

TEST_F(InvocationClientTest, ServiceAvailability) {
    EXPECT_FALSE(client->isServiceAvailable("auth"));
    addEndpoint("i-1", "h", 80);
    EXPECT_TRUE(client->isServiceAvailable("auth"));

    client->getEndpointCache().clear();
    state->setAvailable(false);
    EXPECT_FALSE(client->isServiceAvailable("auth"));
}
