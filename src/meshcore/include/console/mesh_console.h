/**
 * @file mesh_console.h
 * @brief Interactive admin console for a mesh process
 */

#ifndef MESHCORE_CONSOLE_MESH_CONSOLE_H
#define MESHCORE_CONSOLE_MESH_CONSOLE_H

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace meshcore {

class MeshService;

/**
 * @brief Command result structure
 */
struct CommandResult {
    bool success;
    std::string message;

    CommandResult(bool s = true, const std::string& m = "")
        : success(s), message(m) {}
};

/**
 * @brief Command interpreter on top of a MeshService
 *
 * Commands:
 * - register <appId> <host> <port> [service,...] - Register an endpoint
 * - deregister <instanceId> [reason]             - Remove an endpoint
 * - heartbeat <instanceId> <status> [load] [connections] - Report liveness
 * - endpoints <appId> [service] [--all]          - Endpoints of an appId
 * - list [prefix] [status]                       - All endpoints with summary
 * - route app <appId> [algorithm]                - Resolve an appId
 * - route service <name> [algorithm]             - Resolve a service name
 * - mappings [prefix]                            - Service mapping table
 * - health [--endpoints]                         - Mesh health
 * - circuit <appId>                              - Circuit breaker state
 * - invoke <appId> <method> [body]               - Call a method
 * - help, exit
 *
 * Results are printed as JSON.
 */
class MeshConsole {
public:
    explicit MeshConsole(MeshService* mesh);

    CommandResult processCommand(const std::string& commandLine);

    std::string getHelpText() const;

    /**
     * @brief Read commands with readline until 'exit', EOF or requestExit()
     */
    void runInteractive();

    void requestExit();

private:
    using CommandFunc = std::function<CommandResult(const std::vector<std::string>&)>;

    void registerCommands();

    static std::vector<std::string> parseCommandLine(const std::string& commandLine);

    CommandResult handleRegister(const std::vector<std::string>& args);
    CommandResult handleDeregister(const std::vector<std::string>& args);
    CommandResult handleHeartbeat(const std::vector<std::string>& args);
    CommandResult handleEndpoints(const std::vector<std::string>& args);
    CommandResult handleList(const std::vector<std::string>& args);
    CommandResult handleRoute(const std::vector<std::string>& args);
    CommandResult handleMappings(const std::vector<std::string>& args);
    CommandResult handleHealth(const std::vector<std::string>& args);
    CommandResult handleCircuit(const std::vector<std::string>& args);
    CommandResult handleInvoke(const std::vector<std::string>& args);
    CommandResult handleHelp(const std::vector<std::string>& args);
    CommandResult handleExit(const std::vector<std::string>& args);

    MeshService* mesh_;
    std::map<std::string, CommandFunc> commands_;
    std::atomic<bool> exitRequested_;
};

} // namespace meshcore

#endif // MESHCORE_CONSOLE_MESH_CONSOLE_H
