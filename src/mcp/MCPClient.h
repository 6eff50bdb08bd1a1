#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include "mcp/Capabilities.h"
#include "mcp/Completion.h"
#include "mcp/UriTemplate.h"
#include "core/ConfigManager.h"

#ifndef _WIN32
#include <sys/types.h>
#endif

/**
 * @brief One capability provider as seen by the router.
 *
 * call/read/get operations complete through the given Completion, either
 * before returning or later from another thread.
 */
class IMCPClient {
public:
    using NotificationHandler = std::function<void(const std::string& method, const nlohmann::json& params)>;
    using ExitHandler = std::function<void(const std::string& reason)>;

    virtual ~IMCPClient() = default;

    virtual std::string getTransportType() const = 0;

    // Connects and initializes; throws HubError on failure
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    virtual Capabilities listCapabilities() = 0;

    virtual void callTool(const std::string& name, const nlohmann::json& arguments, Completion done) = 0;
    virtual void readResource(const ResourceMatch& match, Completion done) = 0;
    virtual void getPrompt(const std::string& name, const nlohmann::json& arguments, Completion done) = 0;

    // Server notifications such as notifications/tools/list_changed
    void setNotificationHandler(NotificationHandler handler) { notificationHandler = std::move(handler); }
    // Unexpected disconnects (process exit, broken stream)
    void setExitHandler(ExitHandler handler) { exitHandler = std::move(handler); }

protected:
    NotificationHandler notificationHandler;
    ExitHandler exitHandler;
};

/**
 * @brief Shared MCP client logic for providers spoken to over JSON-RPC.
 * Subclasses supply the transport.
 */
class RemoteMCPClient : public IMCPClient {
public:
    using ResponseCallback = std::function<void(const CallOutcome&)>;

    RemoteMCPClient(std::string name, std::chrono::milliseconds requestTimeout);

    void start() override;
    Capabilities listCapabilities() override;
    void callTool(const std::string& name, const nlohmann::json& arguments, Completion done) override;
    void readResource(const ResourceMatch& match, Completion done) override;
    void getPrompt(const std::string& name, const nlohmann::json& arguments, Completion done) override;

    const nlohmann::json& getServerInfo() const { return serverInfo; }

protected:
    std::string name;
    std::chrono::milliseconds requestTimeout;
    nlohmann::json serverInfo = nlohmann::json::object();
    nlohmann::json serverCapabilities = nlohmann::json::object();

    virtual void connect() = 0;
    // Must complete `onResponse` exactly once, with TransportTimeout on expiry
    virtual void sendRequest(const std::string& method, const nlohmann::json& params, ResponseCallback onResponse) = 0;
    virtual void sendNotification(const std::string& method, const nlohmann::json& params) = 0;

    CallOutcome requestSync(const std::string& method, const nlohmann::json& params);
    // Follows nextCursor pages and concatenates `key`
    nlohmann::json listAll(const std::string& method, const std::string& key);

    // Routes an incoming server->client message that is not a response
    void handleIncoming(const nlohmann::json& message);
    virtual void sendResponse(const nlohmann::json& response) { (void)response; }
};

/**
 * @brief Subprocess provider speaking newline-delimited JSON-RPC on stdio.
 */
class MCPClient : public RemoteMCPClient {
public:
    MCPClient(const Config::ServerConfig& config, std::chrono::milliseconds requestTimeout);
    ~MCPClient() override;

    std::string getTransportType() const override { return "stdio"; }
    void stop() override;
    bool isRunning() const override { return running.load(); }

protected:
    void connect() override;
    void sendRequest(const std::string& method, const nlohmann::json& params, ResponseCallback onResponse) override;
    void sendNotification(const std::string& method, const nlohmann::json& params) override;
    void sendResponse(const nlohmann::json& response) override;

private:
    struct PendingRequest {
        std::string method;
        std::chrono::steady_clock::time_point deadline;
        ResponseCallback callback;
    };

    Config::ServerConfig config;
#ifndef _WIN32
    pid_t childPid = -1;
#endif
    int readFd = -1;
    int writeFd = -1;
    int requestId = 0;

    std::thread readerThread;
    std::atomic<bool> stopReader{false};
    std::atomic<bool> running{false};

    std::mutex mtx;
    std::mutex writeMtx;
    std::map<int, PendingRequest> pending;

    bool writeLine(const std::string& line);
    void readerLoop();
    void handleLine(const std::string& line);
    void expirePending();
    void failAllPending(ErrorCode code, const std::string& message);
    void stopProcess();
};
