#pragma once
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <nlohmann/json.hpp>
#include "httplib.h"
#include "core/HubErrors.h"

class MCPManager;

/**
 * @brief Control RPC served by the hub process over loopback TCP or a Unix
 * socket. Every call goes through the router, so approval and disabled
 * filters apply exactly as they do for in-process callers.
 *
 *   GET  /api/health
 *   GET  /api/servers
 *   POST /api/servers/tools      {server_name, tool, arguments, caller}
 *   POST /api/servers/resources  {server_name, uri, caller}
 *   POST /api/servers/prompts    {server_name, prompt, arguments, caller}
 *   POST /api/servers/start      {server_name}
 *   POST /api/servers/stop       {server_name, disable}
 */
class ControlServer {
public:
    explicit ControlServer(MCPManager& hub);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Binds synchronously, then serves on a background thread
    bool start(const std::string& host, int port);
    bool startUnix(const std::string& socketPath);
    void stop();

    bool isRunning() const { return running.load(); }
    int getPort() const { return port; }

    // Reported by /api/health
    void setWorkspace(const std::string& root) { workspace = root; }

    static int httpStatusFor(ErrorCode code);

private:
    MCPManager& hub;
    std::unique_ptr<httplib::Server> server;
    std::thread serverThread;
    std::atomic<bool> running{false};
    int port = 0;
    std::string socketPath;
    std::string workspace;

    void setupRoutes();
    bool serve();

    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleServers(const httplib::Request& req, httplib::Response& res);
    void handleTool(const httplib::Request& req, httplib::Response& res);
    void handleResource(const httplib::Request& req, httplib::Response& res);
    void handlePrompt(const httplib::Request& req, httplib::Response& res);
    void handleLifecycle(const httplib::Request& req, httplib::Response& res, bool start);

    static void sendOutcome(httplib::Response& res, const CallOutcome& outcome);
    static void sendError(httplib::Response& res, const HubError& error);
};
