#include "proxy/ProxyBridge.h"
#include "utils/Logger.h"
#include <iostream>

ProxyBridge::ProxyBridge(IHubConnection& hub) : hub(hub) {}

int ProxyBridge::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json response = handleLine(line);
        if (!response.is_null()) {
            out << response.dump() << '\n';
            out.flush();
        }
    }
    Logger::getInstance().info("Client closed the connection");
    return 0;
}

nlohmann::json ProxyBridge::handleLine(const std::string& line) {
    nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        Logger::getInstance().warn("Ignoring malformed message: " + line);
        return JsonRpc::makeError(nullptr, JsonRpc::PARSE_ERROR, "Parse error");
    }
    return handleMessage(message);
}

nlohmann::json ProxyBridge::handleMessage(const nlohmann::json& message) {
    // Responses to requests we never send
    if (JsonRpc::isResponse(message)) return nullptr;

    nlohmann::json id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json();
    bool notification = !message.is_object() || !message.contains("id");
    try {
        JsonRpc::Request request = JsonRpc::parseRequest(message);
        notification = request.isNotification();
        nlohmann::json result = dispatch(request);
        if (notification) return nullptr;
        return JsonRpc::makeResult(*request.id, result);
    } catch (const JsonRpc::Error& e) {
        if (notification) return nullptr;
        return JsonRpc::makeError(id, e);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Request failed: ") + e.what());
        if (notification) return nullptr;
        return JsonRpc::makeError(id, JsonRpc::INTERNAL_ERROR, e.what());
    }
}

nlohmann::json ProxyBridge::dispatch(const JsonRpc::Request& request) {
    const std::string& method = request.method;
    Logger::getInstance().debug("Request " + method);

    if (method == "initialize") return handleInitialize(request.params);
    if (method == "ping") return nlohmann::json::object();
    if (method == "tools/list") return handleToolsList();
    if (method == "tools/call") return handleToolsCall(request.params);
    if (method == "resources/list") return handleResourcesList();
    if (method == "resources/templates/list") return handleResourceTemplatesList();
    if (method == "resources/read") return handleResourcesRead(request.params);
    if (method == "prompts/list") return handlePromptsList();
    if (method == "prompts/get") return handlePromptsGet(request.params);

    if (request.isNotification()) {
        // notifications/initialized, notifications/cancelled, ...
        return nullptr;
    }
    throw JsonRpc::Error(JsonRpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

nlohmann::json ProxyBridge::handleInitialize(const nlohmann::json& params) const {
    std::string version = "2024-11-05";
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    return {
        {"protocolVersion", version},
        {"serverInfo", {{"name", "mcphub-proxy"}, {"version", "1.0.0"}}},
        {"capabilities",
         {{"tools", {{"listChanged", false}}},
          {"resources", {{"listChanged", false}}},
          {"prompts", {{"listChanged", false}}}}}
    };
}

CallerContext ProxyBridge::proxyCaller() {
    CallerContext caller;
    caller.type = "external";
    caller.source = "proxy";
    return caller;
}

AggregatedCapabilities ProxyBridge::fetch() {
    nlohmann::json servers;
    try {
        servers = hub.getAllServers();
    } catch (const HubError& e) {
        Logger::getInstance().error(std::string("Failed to fetch servers from hub: ") + e.what());
        throw JsonRpc::Error(JsonRpc::INTERNAL_ERROR, e.what(), {{"code", errorCodeName(e.getCode())}});
    }

    std::vector<ProviderInfo> providers;
    for (const auto& server : servers) {
        try {
            providers.push_back(server.get<ProviderInfo>());
        } catch (const nlohmann::json::exception& e) {
            Logger::getInstance().warn(std::string("Skipping malformed server entry: ") + e.what());
        }
    }
    return aggregateCapabilities(providers);
}

nlohmann::json ProxyBridge::unwrap(const CallOutcome& outcome, const char* key, const char* emptyMessage) {
    if (!outcome.ok()) {
        throw JsonRpc::Error(JsonRpc::INTERNAL_ERROR, outcome.error->what(),
                             {{"code", errorCodeName(outcome.error->getCode())}});
    }
    const nlohmann::json& result = outcome.result;
    if (!result.is_object() || !result.contains(key)) {
        throw JsonRpc::Error(JsonRpc::INTERNAL_ERROR, emptyMessage);
    }
    return result;
}

nlohmann::json ProxyBridge::handleToolsList() {
    return {{"tools", fetch().tools}};
}

nlohmann::json ProxyBridge::handleToolsCall(const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "name must be a string");
    }
    const std::string name = params["name"].get<std::string>();
    auto parts = Namespacing::splitName(name);
    if (!parts) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "Invalid tool name: " + name);
    }
    nlohmann::json arguments = params.contains("arguments") && params["arguments"].is_object()
                                   ? params["arguments"]
                                   : nlohmann::json::object();

    CallOutcome outcome = hub.callTool(parts->first, parts->second, arguments, proxyCaller());
    if (!outcome.ok()) Logger::getInstance().warn("Tool " + name + " returned error: " + outcome.error->what());
    nlohmann::json result = unwrap(outcome, "content", "Tool returned no result");

    nlohmann::json response = {{"content", result.value("content", nlohmann::json::array())}};
    if (result.value("isError", false)) response["isError"] = true;
    return response;
}

nlohmann::json ProxyBridge::handleResourcesList() {
    return {{"resources", fetch().resources}};
}

nlohmann::json ProxyBridge::handleResourceTemplatesList() {
    return {{"resourceTemplates", fetch().resourceTemplates}};
}

nlohmann::json ProxyBridge::handleResourcesRead(const nlohmann::json& params) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "uri must be a string");
    }
    const std::string uri = params["uri"].get<std::string>();
    auto parts = Namespacing::splitUri(uri);
    if (!parts) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "Invalid resource URI: " + uri);
    }

    nlohmann::json result = unwrap(hub.accessResource(parts->first, parts->second, proxyCaller()), "contents",
                                   "Resource returned no result");
    return {{"contents", result.value("contents", nlohmann::json::array())}};
}

nlohmann::json ProxyBridge::handlePromptsList() {
    return {{"prompts", fetch().prompts}};
}

nlohmann::json ProxyBridge::handlePromptsGet(const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "name must be a string");
    }
    const std::string name = params["name"].get<std::string>();
    auto parts = Namespacing::splitName(name);
    if (!parts) {
        throw JsonRpc::Error(JsonRpc::INVALID_PARAMS, "Invalid prompt name: " + name);
    }
    nlohmann::json arguments = params.contains("arguments") && params["arguments"].is_object()
                                   ? params["arguments"]
                                   : nlohmann::json::object();

    nlohmann::json result = unwrap(hub.getPrompt(parts->first, parts->second, arguments, proxyCaller()), "messages",
                                   "Prompt returned no result");
    nlohmann::json response = {{"messages", result.value("messages", nlohmann::json::array())}};
    if (result.contains("description")) response["description"] = result["description"];
    return response;
}
