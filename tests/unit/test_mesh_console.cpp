#include <gtest/gtest.h>
#include "console/mesh_console.h"
#include "mesh/mesh_service.h"
#include "store/memory_state_store.h"
#include "test_support.h"
#include <nlohmann/json.hpp>

using namespace meshcore;
using namespace meshcore::testing_support;

class MeshConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeHttpTransport>();
        mesh = std::make_unique<MeshService>(MeshConfig(), std::make_shared<MemoryStateStore>(),
                                             std::make_shared<RecordingMessageBus>(), "console", transport);
        console = std::make_unique<MeshConsole>(mesh.get());
    }

    void TearDown() override {
        console.reset();
        mesh.reset();
    }

    nlohmann::json run(const std::string& line) {
        CommandResult result = console->processCommand(line);
        EXPECT_TRUE(result.success) << line << ": " << result.message;
        return result.success ? nlohmann::json::parse(result.message) : nlohmann::json();
    }

    std::shared_ptr<FakeHttpTransport> transport;
    std::unique_ptr<MeshService> mesh;
    std::unique_ptr<MeshConsole> console;
};

TEST_F(MeshConsoleTest, EmptyLineIsNoOp) {
    CommandResult result = console->processCommand("   ");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.message.empty());
}

TEST_F(MeshConsoleTest, UnknownCommandFails) {
    CommandResult result = console->processCommand("frobnicate");
    EXPECT_FALSE(result.success);
    EXPECT_NE(std::string::npos, result.message.find("Unknown command"));
}

TEST_F(MeshConsoleTest, HelpListsCommands) {
    CommandResult result = console->processCommand("help");
    EXPECT_TRUE(result.success);
    EXPECT_NE(std::string::npos, result.message.find("register"));
    EXPECT_NE(std::string::npos, result.message.find("route"));
}

TEST_F(MeshConsoleTest, RegisterHeartbeatAndRoute) {
    auto registered = run("register auth 10.0.0.1 8080 login,logout");
    std::string id = registered["instanceId"].get<std::string>();
    EXPECT_FALSE(id.empty());

    auto beat = run("heartbeat " + id + " Healthy 30 4");
    EXPECT_EQ(30, beat["nextHeartbeatSeconds"].get<int>());

    auto route = run("route app auth");
    EXPECT_EQ(id, route["primary"]["instanceId"].get<std::string>());

    auto endpoints = run("endpoints auth logout");
    EXPECT_EQ(1u, endpoints["totalCount"].get<size_t>());
}

TEST_F(MeshConsoleTest, UsageErrorsAreReported) {
    EXPECT_FALSE(console->processCommand("register auth").success);
    EXPECT_FALSE(console->processCommand("route somewhere auth").success);
    EXPECT_FALSE(console->processCommand("heartbeat i-1 Sleeping").success);
}

TEST_F(MeshConsoleTest, MeshErrorsBecomeFailedResults) {
    CommandResult result = console->processCommand("route app nobody");
    EXPECT_FALSE(result.success);
    EXPECT_NE(std::string::npos, result.message.find("NOT_FOUND"));

    EXPECT_FALSE(console->processCommand("register auth host notaport").success);
}

TEST_F(MeshConsoleTest, HealthAndListReportSummary) {
    run("register auth 10.0.0.1 8080");

    auto health = run("health --endpoints");
    EXPECT_EQ("Healthy", health["status"].get<std::string>());
    EXPECT_TRUE(health["storeConnected"].get<bool>());
    EXPECT_EQ(1u, health["endpoints"].size());

    auto list = run("list au");
    EXPECT_EQ(1u, list["summary"]["total"].get<size_t>());
}

TEST_F(MeshConsoleTest, CircuitShowsState) {
    auto circuit = run("circuit auth");
    EXPECT_EQ("Closed", circuit["state"].get<std::string>());
    EXPECT_TRUE(circuit["callAllowed"].get<bool>());
}

TEST_F(MeshConsoleTest, InvokeGoesThroughTransport) {
    run("register auth 10.0.0.1 8080");

    auto response = run("invoke auth login {\"user\":\"a\"}");
    EXPECT_EQ(200, response["status"].get<int>());
    ASSERT_EQ(1u, transport->callCount());
    EXPECT_EQ("{\"user\":\"a\"}", transport->requests()[0].body);
}

TEST_F(MeshConsoleTest, ExitRequestsStop) {
    CommandResult result = console->processCommand("exit");
    EXPECT_TRUE(result.success);
}
