/**
 * @file mesh_console.cpp
 * @brief Implementation of the interactive admin console
 */

#include "console/mesh_console.h"
#include "core/mesh_error.h"
#include "mesh/mesh_service.h"
#include "utils/log.h"

#include <nlohmann/json.hpp>

#include <readline/history.h>
#include <readline/readline.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace meshcore {

namespace {

nlohmann::json summaryToJson(const EndpointSummary& summary) {
    nlohmann::json json;
    json["total"] = summary.total;
    json["healthy"] = summary.healthy;
    json["degraded"] = summary.degraded;
    json["unavailable"] = summary.unavailable;
    json["shuttingDown"] = summary.shuttingDown;
    json["uniqueAppIds"] = summary.uniqueAppIds;
    json["healthyByAppId"] = summary.healthyByAppId;
    return json;
}

nlohmann::json endpointsToJson(const std::vector<Endpoint>& endpoints) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& endpoint : endpoints) {
        array.push_back(toJson(endpoint));
    }
    return array;
}

CommandResult ok(const nlohmann::json& json) {
    return CommandResult(true, json.dump(2));
}

std::optional<LoadBalancingAlgorithm> algorithmArg(const std::vector<std::string>& args, size_t index) {
    if (args.size() > index) {
        return parseLoadBalancingAlgorithm(args[index]);
    }
    return std::nullopt;
}

} // anonymous namespace

MeshConsole::MeshConsole(MeshService* mesh)
    : mesh_(mesh)
    , exitRequested_(false) {
    registerCommands();
}

void MeshConsole::requestExit() {
    exitRequested_ = true;
}

void MeshConsole::registerCommands() {
    commands_["register"] = [this](const std::vector<std::string>& args) { return handleRegister(args); };
    commands_["deregister"] = [this](const std::vector<std::string>& args) { return handleDeregister(args); };
    commands_["heartbeat"] = [this](const std::vector<std::string>& args) { return handleHeartbeat(args); };
    commands_["endpoints"] = [this](const std::vector<std::string>& args) { return handleEndpoints(args); };
    commands_["list"] = [this](const std::vector<std::string>& args) { return handleList(args); };
    commands_["route"] = [this](const std::vector<std::string>& args) { return handleRoute(args); };
    commands_["mappings"] = [this](const std::vector<std::string>& args) { return handleMappings(args); };
    commands_["health"] = [this](const std::vector<std::string>& args) { return handleHealth(args); };
    commands_["circuit"] = [this](const std::vector<std::string>& args) { return handleCircuit(args); };
    commands_["invoke"] = [this](const std::vector<std::string>& args) { return handleInvoke(args); };
    commands_["help"] = [this](const std::vector<std::string>& args) { return handleHelp(args); };
    commands_["exit"] = [this](const std::vector<std::string>& args) { return handleExit(args); };
}

std::vector<std::string> MeshConsole::parseCommandLine(const std::string& commandLine) {
    std::vector<std::string> tokens;
    std::istringstream iss(commandLine);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

CommandResult MeshConsole::processCommand(const std::string& commandLine) {
    auto tokens = parseCommandLine(commandLine);
    if (tokens.empty()) {
        return CommandResult(true, "");
    }

    std::string command = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return CommandResult(false, "Unknown command: " + command + ". Type 'help' for available commands.");
    }

    try {
        return it->second(args);
    } catch (const std::exception& e) {
        return CommandResult(false, std::string("Error executing command: ") + e.what());
    }
}

std::string MeshConsole::getHelpText() const {
    std::ostringstream oss;
    oss << "Available commands:\n";
    oss << "  register <appId> <host> <port> [svc,...]      - Register an endpoint\n";
    oss << "  deregister <instanceId> [reason]              - Remove an endpoint\n";
    oss << "  heartbeat <instanceId> <status> [load] [conn] - Report endpoint liveness\n";
    oss << "  endpoints <appId> [service] [--all]           - Endpoints of an appId\n";
    oss << "  list [prefix] [status]                        - All endpoints with summary\n";
    oss << "  route app <appId> [algorithm]                 - Resolve an appId\n";
    oss << "  route service <name> [algorithm]              - Resolve a service name\n";
    oss << "  mappings [prefix]                             - Show service mappings\n";
    oss << "  health [--endpoints]                          - Show mesh health\n";
    oss << "  circuit <appId>                               - Show circuit breaker state\n";
    oss << "  invoke <appId> <method> [body]                - Call a method on an appId\n";
    oss << "  help                                          - Show this help message\n";
    oss << "  exit                                          - Exit the console\n";
    return oss.str();
}

void MeshConsole::runInteractive() {
    std::cout << "meshcore admin console\n";
    std::cout << "Type 'help' for available commands, 'exit' to quit.\n";
    std::cout << "Use UP/DOWN arrow keys to navigate command history.\n\n";

    exitRequested_ = false;

    while (!exitRequested_) {
        char* line = readline("mesh> ");
        if (!line) {
            std::cout << "\n";
            break;
        }

        std::string commandLine(line);
        commandLine.erase(0, commandLine.find_first_not_of(" \t\n\r"));
        commandLine.erase(commandLine.find_last_not_of(" \t\n\r") + 1);

        if (!commandLine.empty()) {
            add_history(line);

            CommandResult result = processCommand(commandLine);
            if (!result.message.empty()) {
                std::cout << result.message << "\n";
            }
            if (!result.success) {
                std::cout << "[ERROR] Command failed\n";
            }
        }

        std::free(line);
    }

    std::cout << "Exiting console.\n";
}

CommandResult MeshConsole::handleRegister(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult(false, "Usage: register <appId> <host> <port> [service,...]");
    }

    RegisterRequest request;
    request.appId = args[0];
    request.host = args[1];
    request.port = std::stoi(args[2]);
    if (args.size() > 3) {
        std::istringstream names(args[3]);
        std::string name;
        while (std::getline(names, name, ',')) {
            if (!name.empty()) {
                request.serviceNames.insert(name);
            }
        }
    }

    std::string instanceId = mesh_->registerEndpoint(request);
    return ok({{"instanceId", instanceId}});
}

CommandResult MeshConsole::handleDeregister(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult(false, "Usage: deregister <instanceId> [Graceful|HealthCheckFailed|Error]");
    }
    DeregistrationReason reason = args.size() > 1
        ? deregistrationReasonFromString(args[1]) : DeregistrationReason::GRACEFUL;
    mesh_->deregisterEndpoint(args[0], reason);
    return CommandResult(true, "Deregistered " + args[0]);
}

CommandResult MeshConsole::handleHeartbeat(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult(false, "Usage: heartbeat <instanceId> <status> [load] [connections]");
    }

    HeartbeatRequest request;
    request.instanceId = args[0];
    if (!tryParseEndpointStatus(args[1], request.status)) {
        return CommandResult(false, "Unknown status: " + args[1]);
    }
    if (args.size() > 2) {
        request.loadPercent = std::stod(args[2]);
    }
    if (args.size() > 3) {
        request.currentConnections = std::stoi(args[3]);
    }

    HeartbeatResponse response = mesh_->heartbeat(request);
    return ok({{"nextHeartbeatSeconds", response.nextHeartbeat.count()},
               {"ttlSeconds", response.ttl.count()},
               {"registered", response.registered}});
}

CommandResult MeshConsole::handleEndpoints(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult(false, "Usage: endpoints <appId> [service] [--all]");
    }

    std::optional<std::string> serviceName;
    bool healthyOnly = true;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--all") {
            healthyOnly = false;
        } else {
            serviceName = args[i];
        }
    }

    EndpointsResult result = mesh_->getEndpoints(args[0], serviceName, healthyOnly);
    return ok({{"endpoints", endpointsToJson(result.endpoints)},
               {"healthyCount", result.healthyCount},
               {"totalCount", result.totalCount}});
}

CommandResult MeshConsole::handleList(const std::vector<std::string>& args) {
    std::string prefix = args.empty() ? "" : args[0];
    std::optional<EndpointStatus> filter;
    if (args.size() > 1) {
        EndpointStatus status;
        if (!tryParseEndpointStatus(args[1], status)) {
            return CommandResult(false, "Unknown status: " + args[1]);
        }
        filter = status;
    }

    EndpointListing listing = mesh_->listEndpoints(prefix, filter);
    return ok({{"endpoints", endpointsToJson(listing.endpoints)},
               {"summary", summaryToJson(listing.summary)}});
}

CommandResult MeshConsole::handleRoute(const std::vector<std::string>& args) {
    if (args.size() < 2 || (args[0] != "app" && args[0] != "service")) {
        return CommandResult(false, "Usage: route app <appId> [algorithm] | route service <name> [algorithm]");
    }

    Route route = args[0] == "app"
        ? mesh_->getRoute(args[1], std::nullopt, algorithmArg(args, 2))
        : mesh_->getRouteForService(args[1], algorithmArg(args, 2));

    return ok({{"appId", route.appId},
               {"algorithm", to_string(route.algorithm)},
               {"primary", toJson(route.primary)},
               {"alternates", endpointsToJson(route.alternates)}});
}

CommandResult MeshConsole::handleMappings(const std::vector<std::string>& args) {
    MappingSnapshot snapshot = mesh_->getMappings(args.empty() ? "" : args[0]);
    return ok({{"mappings", snapshot.mappings},
               {"defaultAppId", snapshot.defaultAppId},
               {"version", snapshot.version}});
}

CommandResult MeshConsole::handleHealth(const std::vector<std::string>& args) {
    bool includeEndpoints = !args.empty() && args[0] == "--endpoints";
    HealthReport report = mesh_->getHealth(includeEndpoints);

    nlohmann::json json;
    json["status"] = to_string(report.status);
    json["storeConnected"] = report.storeConnected;
    json["summary"] = summaryToJson(report.summary);
    json["uptime"] = report.uptimeText;
    if (report.lastUpdateTime) {
        json["lastUpdateTime"] = utils::toEpochMillis(*report.lastUpdateTime);
    } else {
        json["lastUpdateTime"] = nullptr;
    }
    if (includeEndpoints) {
        json["endpoints"] = endpointsToJson(report.endpoints);
    }
    return ok(json);
}

CommandResult MeshConsole::handleCircuit(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult(false, "Usage: circuit <appId>");
    }

    const auto& breaker = mesh_->getCircuitBreaker();
    CircuitRecord record = breaker->getRecord(args[0]);

    nlohmann::json json;
    json["appId"] = args[0];
    json["state"] = to_string(breaker->getState(args[0]));
    json["consecutiveFailures"] = record.consecutiveFailures;
    json["callAllowed"] = breaker->isCallAllowed(args[0]);
    json["enabled"] = breaker->isEnabled();
    return ok(json);
}

CommandResult MeshConsole::handleInvoke(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult(false, "Usage: invoke <appId> <method> [body]");
    }

    const auto& client = mesh_->getInvocationClient();
    if (!client) {
        return CommandResult(false, "Invocation is not available in this process");
    }

    InvocationRequest request;
    if (args.size() > 2) {
        request.headers["Content-Type"] = "application/json";
        for (size_t i = 2; i < args.size(); ++i) {
            request.body += (i > 2 ? " " : "") + args[i];
        }
    }

    HttpResponse response = client->invoke(args[0], args[1], request);
    return ok({{"status", response.status}, {"body", response.body}});
}

CommandResult MeshConsole::handleHelp(const std::vector<std::string>& /*args*/) {
    return CommandResult(true, getHelpText());
}

CommandResult MeshConsole::handleExit(const std::vector<std::string>& /*args*/) {
    exitRequested_ = true;
    return CommandResult(true, "Exiting...");
}

} // namespace meshcore
