#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/HubErrors.h"
#include "mcp/MCPManager.h"

/**
 * @brief What the proxy bridge needs from a running hub.
 *
 * getAllServers() throws HubError; the call operations deliver errors in
 * the returned CallOutcome.
 */
class IHubConnection {
public:
    virtual ~IHubConnection() = default;

    // Every provider as {name, displayName, description, status, capabilities}
    virtual nlohmann::json getAllServers() = 0;

    virtual CallOutcome callTool(const std::string& serverName, const std::string& toolName,
                                 const nlohmann::json& arguments, const CallerContext& caller) = 0;
    virtual CallOutcome accessResource(const std::string& serverName, const std::string& uri,
                                       const CallerContext& caller) = 0;
    virtual CallOutcome getPrompt(const std::string& serverName, const std::string& promptName,
                                  const nlohmann::json& arguments, const CallerContext& caller) = 0;
};

/**
 * @brief Control RPC client for a hub in another process.
 */
class ControlClient : public IHubConnection {
public:
    ControlClient(std::string host, int port,
                  std::chrono::milliseconds connectionTimeout = std::chrono::milliseconds(5000),
                  std::chrono::milliseconds rpcTimeout = std::chrono::milliseconds(60000));

    static ControlClient unixSocket(const std::string& socketPath,
                                    std::chrono::milliseconds connectionTimeout = std::chrono::milliseconds(5000),
                                    std::chrono::milliseconds rpcTimeout = std::chrono::milliseconds(60000));

    // GET /api/health; throws HubError when the hub cannot be reached
    nlohmann::json health();

    nlohmann::json getAllServers() override;
    CallOutcome callTool(const std::string& serverName, const std::string& toolName,
                         const nlohmann::json& arguments, const CallerContext& caller) override;
    CallOutcome accessResource(const std::string& serverName, const std::string& uri,
                               const CallerContext& caller) override;
    CallOutcome getPrompt(const std::string& serverName, const std::string& promptName,
                          const nlohmann::json& arguments, const CallerContext& caller) override;

    // {error, code} -> failure, anything else -> success
    static CallOutcome outcomeFromBody(int status, const std::string& body);

private:
    std::string host;
    int port;
    bool useUnixSocket = false;
    std::chrono::milliseconds connectionTimeout;
    std::chrono::milliseconds rpcTimeout;

    std::string target() const;
    CallOutcome post(const std::string& path, const nlohmann::json& body);
    nlohmann::json get(const std::string& path);
};

/**
 * @brief In-process connection straight to a router, for embedding the
 * bridge next to the hub and for tests.
 */
class LocalHubConnection : public IHubConnection {
public:
    explicit LocalHubConnection(MCPManager& hub) : hub(hub) {}

    nlohmann::json getAllServers() override;
    CallOutcome callTool(const std::string& serverName, const std::string& toolName,
                         const nlohmann::json& arguments, const CallerContext& caller) override;
    CallOutcome accessResource(const std::string& serverName, const std::string& uri,
                               const CallerContext& caller) override;
    CallOutcome getPrompt(const std::string& serverName, const std::string& promptName,
                          const nlohmann::json& arguments, const CallerContext& caller) override;

private:
    MCPManager& hub;
};
