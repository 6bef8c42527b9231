/**
 * @file main.cpp
 * @brief Main entry point for a meshcore process
 *
 * Starts the mesh core with the following components:
 * - Message bus: in-process dispatcher, or Redis pub/sub feeding it
 * - State store holding endpoints and circuit records: in-process or Redis
 * - Mesh service (registry, router, circuit breaker, health checks)
 * - Boost.Beast transport for service invocation and health probes
 * - Interactive admin console
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "client/beast_http_transport.h"
#include "config/mesh_config.h"
#include "console/mesh_console.h"
#include "core/event_dispatcher.h"
#include "core/redis_message_bus.h"
#include "mesh/mesh_service.h"
#include "registry/endpoint.h"
#include "store/memory_state_store.h"
#include "store/redis_state_store.h"
#include "utils/log.h"
#include "utils/shutdown_signal.h"

using meshcore::utils::ShutdownSignal;

/**
 * Load the mesh configuration named by MESHCORE_CONFIG
 */
meshcore::MeshConfig setupMeshConfig() {
    const char* configPath = std::getenv("MESHCORE_CONFIG");
    std::string configFile = configPath ? configPath : "./config/meshcore.json";
    return meshcore::loadMeshConfig(configFile);
}

/**
 * Create the state store selected by "store.backend"
 */
meshcore::StateStorePtr setupStateStore(const meshcore::StoreConfig& config) {
    if (config.backend == meshcore::StoreBackend::REDIS) {
        auto store = std::make_shared<meshcore::RedisStateStore>(config.redis);
        store->connect();
        return store;
    }
    LOGI("Using in-process state store");
    return std::make_shared<meshcore::MemoryStateStore>();
}

int main(int /*argc*/, char* /*argv*/[]) {
    LOGI("========================================");
    LOGI("meshcore - service mesh routing core");
    LOGI("========================================");

    std::shared_ptr<meshcore::EventDispatcher> dispatcher;
    std::shared_ptr<meshcore::RedisMessageBus> redisBus;
    std::unique_ptr<meshcore::MeshService> mesh;

    try {
        ShutdownSignal::install({SIGINT, SIGTERM});

        LOGI("Loading configuration...");
        meshcore::MeshConfig config = setupMeshConfig();
        meshcore::utils::setLogLevel(meshcore::utils::parseLogLevel(config.log_level));

        LOGI("Starting event dispatcher...");
        dispatcher = std::make_shared<meshcore::EventDispatcher>(config.event_thread_pool_size);
        dispatcher->start();

        meshcore::MessageBusPtr bus = dispatcher;
        if (config.bus == meshcore::BusBackend::REDIS) {
            LOGI("Starting Redis message bus...");
            redisBus = std::make_shared<meshcore::RedisMessageBus>(config.store.redis, dispatcher);
            redisBus->start();
            bus = redisBus;
        }

        meshcore::StateStorePtr store = setupStateStore(config.store);
        auto transport = std::make_shared<meshcore::BeastHttpTransport>();
        std::string origin = meshcore::generateInstanceId();

        LOGI("Starting mesh service...");
        mesh = std::make_unique<meshcore::MeshService>(config, store, bus, origin, transport);
        mesh->start();

        LOGI_FMT("Mesh process " << origin << " is running. Starting admin console...");

        meshcore::MeshConsole console(mesh.get());

        std::atomic<bool> consoleDone{false};
        std::thread consoleThread([&console, &consoleDone]() {
            console.runInteractive();
            consoleDone = true;
        });

        while (!consoleDone && !ShutdownSignal::requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (int signal = ShutdownSignal::signalNumber()) {
            std::cout << "\n";
            LOGW_FMT("Received signal " << signal << ", initiating graceful shutdown...");
        }
        console.requestExit();

        // readline may still be blocked on stdin after a signal
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!consoleDone && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (consoleDone) {
            consoleThread.join();
        } else {
            LOGW("Console thread did not exit cleanly, detaching...");
            consoleThread.detach();
            std::cout.flush();
            LOGI("Stopping mesh service...");
            mesh->stop();
            if (redisBus) {
                redisBus->stop();
            }
            dispatcher->stop();
            std::_Exit(0);
        }

        LOGI("Stopping mesh service...");
        mesh->stop();
        mesh.reset();

        if (redisBus) {
            LOGI("Stopping Redis message bus...");
            redisBus->stop();
        }

        LOGI("Stopping event dispatcher...");
        dispatcher->stop();

        LOGI("Shutdown complete");

    } catch (const std::exception& e) {
        LOGF_FMT("Fatal error: " << e.what());

        if (mesh) {
            mesh->stop();
        }
        if (redisBus) {
            redisBus->stop();
        }
        if (dispatcher) {
            dispatcher->stop();
        }
        return 1;
    }

    return 0;
}
