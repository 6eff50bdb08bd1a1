#pragma once
#include <string>
#include <vector>
#include <future>
#include <mutex>
#include <atomic>
#include "mcp/MCPClient.h"

// Streamable HTTP: one POST per message, replies as JSON or SSE `data:` lines
class HttpMCPClient : public RemoteMCPClient {
public:
    HttpMCPClient(const Config::ServerConfig& config, std::chrono::milliseconds requestTimeout);
    ~HttpMCPClient() override;

    std::string getTransportType() const override { return "http"; }
    void stop() override;
    bool isRunning() const override { return running.load(); }

    struct Endpoint {
        bool isSsl = false;
        std::string host;
        int port = 80;
        std::string path = "/";
    };
    // Throws HubError(InvalidParams) for URLs that are not http(s)
    static Endpoint parseUrl(const std::string& url);

    // Pulls every JSON object out of an SSE body's `data:` lines
    static std::vector<nlohmann::json> parseEventStream(const std::string& body);

protected:
    void connect() override;
    void sendRequest(const std::string& method, const nlohmann::json& params, ResponseCallback onResponse) override;
    void sendNotification(const std::string& method, const nlohmann::json& params) override;

private:
    Config::ServerConfig config;
    Endpoint endpoint;
    std::atomic<bool> running{false};
    std::atomic<int> requestId{0};

    std::mutex mtx;
    std::string sessionId;
    std::vector<std::future<void>> inflight;

    // Blocking POST; returns the reply for `id` (or null for notifications)
    CallOutcome post(const nlohmann::json& message, const nlohmann::json& id);
    void pruneInflight();
};
