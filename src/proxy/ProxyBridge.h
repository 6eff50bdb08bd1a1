#pragma once
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "control/ControlClient.h"
#include "mcp/JsonRpc.h"
#include "mcp/Namespacing.h"

// Stdio MCP server backed by a live hub. Nothing is cached between requests.
class ProxyBridge {
public:
    explicit ProxyBridge(IHubConnection& hub);

    // Serves until `in` reaches EOF
    int run(std::istream& in, std::ostream& out);

    // Returns the response, or null for notifications
    nlohmann::json handleLine(const std::string& line);
    nlohmann::json handleMessage(const nlohmann::json& message);

private:
    IHubConnection& hub;

    nlohmann::json dispatch(const JsonRpc::Request& request);

    nlohmann::json handleInitialize(const nlohmann::json& params) const;
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& params);
    nlohmann::json handleResourcesList();
    nlohmann::json handleResourceTemplatesList();
    nlohmann::json handleResourcesRead(const nlohmann::json& params);
    nlohmann::json handlePromptsList();
    nlohmann::json handlePromptsGet(const nlohmann::json& params);

    AggregatedCapabilities fetch();
    // Throws JsonRpc::Error carrying the hub's message verbatim
    static nlohmann::json unwrap(const CallOutcome& outcome, const char* key, const char* emptyMessage);
    static CallerContext proxyCaller();
};
