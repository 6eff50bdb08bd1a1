#include "native/BuiltinServer.h"
#include "mcp/MCPManager.h"
#include <sstream>

namespace {
const char* SERVER_NAME = "mcphub";

std::string serversMarkdown(MCPManager& hub) {
    std::ostringstream out;
    auto servers = hub.getServers(true);
    out << "# MCP Servers\n\n";
    if (servers.empty()) {
        out << "No servers are registered.\n";
        return out.str();
    }
    for (const auto& server : servers) {
        out << serverToText(server) << "\n";
    }
    return out.str();
}

void toggleServer(MCPManager& hub, const ToolRequest& req, ToolResponse& res) {
    std::string serverName = req.params.value("server_name", "");
    std::string action = req.params.value("action", "");
    if (serverName.empty() || action.empty()) {
        res.error("Missing required parameters: server_name and action");
        return;
    }
    if (!hub.getServer(serverName)) {
        res.error("Server '" + serverName + "' not found in active servers");
        return;
    }

    if (action == "start") {
        if (!hub.startServer(serverName)) {
            auto server = hub.getServer(serverName);
            res.error("Failed to start MCP server: " +
                      (server && server->error ? *server->error : std::string("unknown error")));
            return;
        }
        auto server = hub.getServer(serverName);
        if (!server) {
            res.error("Server '" + serverName + "' was removed while starting");
            return;
        }
        res.text("Started MCP server: " + serverName + "\n" + serverToText(*server)).send();
    } else if (action == "stop") {
        if (serverName == SERVER_NAME) {
            res.error("The '" + std::string(SERVER_NAME) + "' server cannot stop itself");
            return;
        }
        hub.stopServer(serverName, true);
        res.text("Stopped MCP server: " + serverName).send();
    } else {
        res.error("Invalid action '" + action + "'. Use 'start' or 'stop'");
    }
}
} // namespace

std::string serverToText(const ProviderInfo& server) {
    std::ostringstream out;
    out << "## " << server.displayName;
    if (server.displayName != server.name) out << " (" << server.name << ")";
    out << "\n\n";
    out << "- Status: " << providerStatusName(server.status) << "\n";
    out << "- Transport: " << server.transportType << "\n";
    if (!server.description.empty()) out << "- Description: " << server.description << "\n";
    if (server.error) out << "- Error: " << *server.error << "\n";

    const auto& caps = server.capabilities;
    out << "- Tools (" << caps.tools.size() << ")";
    for (size_t i = 0; i < caps.tools.size(); ++i) out << (i == 0 ? ": " : ", ") << caps.tools[i].name;
    out << "\n";
    out << "- Resources (" << caps.resources.size() << ")";
    for (size_t i = 0; i < caps.resources.size(); ++i) out << (i == 0 ? ": " : ", ") << caps.resources[i].uri;
    out << "\n";
    out << "- Resource templates (" << caps.resourceTemplates.size() << ")";
    for (size_t i = 0; i < caps.resourceTemplates.size(); ++i) {
        out << (i == 0 ? ": " : ", ") << caps.resourceTemplates[i].uriTemplate;
    }
    out << "\n";
    out << "- Prompts (" << caps.prompts.size() << ")";
    for (size_t i = 0; i < caps.prompts.size(); ++i) out << (i == 0 ? ": " : ", ") << caps.prompts[i].name;
    out << "\n";
    return out.str();
}

std::shared_ptr<NativeServer> createBuiltinServer(MCPManager& hub) {
    MCPManager* hubPtr = &hub;
    NativeServerDef def;
    def.name = SERVER_NAME;
    def.displayName = "MCP Hub";
    def.description = "Information about the hub and its servers";

    NativeResource servers;
    servers.descriptor.uri = "mcphub://servers";
    servers.descriptor.name = "MCP Servers";
    servers.descriptor.description = "Every registered server with its status and capabilities";
    servers.descriptor.mimeType = "text/markdown";
    servers.handler = [hubPtr](const ResourceRequest&, ResourceResponse& res) {
        res.text(serversMarkdown(*hubPtr), "text/markdown").send();
    };
    def.resources.push_back(servers);

    NativeResourceTemplate server;
    server.descriptor.uriTemplate = "mcphub://servers/{name}";
    server.descriptor.name = "MCP Server";
    server.descriptor.description = "One server as JSON";
    server.descriptor.mimeType = "application/json";
    server.handler = [hubPtr](const ResourceRequest& req, ResourceResponse& res) {
        std::string name = req.params.value("name", "");
        auto info = hubPtr->getServer(name);
        if (!info) {
            res.error("Server '" + name + "' not found");
            return;
        }
        res.text(nlohmann::json(*info).dump(2), "application/json").send();
    };
    def.resourceTemplates.push_back(server);

    NativeTool toggle;
    toggle.descriptor.name = "toggle_mcp_server";
    toggle.descriptor.description =
        "Start or stop an MCP server. You can only start a server from one of the disabled servers.";
    toggle.descriptor.inputSchema = {
        {"type", "object"},
        {"properties",
         {{"server_name", {{"type", "string"}, {"description", "Name of the MCP server to toggle"}}},
          {"action",
           {{"type", "string"},
            {"description", "Action to perform. One of 'start' or 'stop'"},
            {"enum", {"start", "stop"}}}}}},
        {"required", {"server_name", "action"}}};
    toggle.handler = [hubPtr](const ToolRequest& req, ToolResponse& res) { toggleServer(*hubPtr, req, res); };
    def.tools.push_back(toggle);

    NativePrompt create;
    create.descriptor.name = "create_native_server";
    create.descriptor.description = "Walks through writing a new in-process server";
    create.descriptor.arguments = {{"name", "Name of the new server", true},
                                   {"purpose", "What the server should expose", false}};
    create.handler = [](const PromptRequest& req, PromptResponse& res) {
        std::string name = req.params.value("name", "");
        std::string purpose = req.params.value("purpose", "");
        std::string request = "Create a native MCP server named '" + name + "'.";
        if (!purpose.empty()) request += " It should " + purpose + ".";
        res.system()
            .text("Native servers register tools, resources, resource templates and prompts with handlers "
                  "that receive a request and a response builder. Every handler must finish with send() "
                  "or error().")
            .user()
            .text(request)
            .send();
    };
    def.prompts.push_back(create);

    NativePrompt overview;
    overview.descriptor.name = "server_overview";
    overview.descriptor.description = "Summarizes one connected server";
    overview.descriptor.argumentsProvider = [hubPtr]() {
        std::string names;
        for (const auto& name : hubPtr->getServerNames()) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        return std::vector<PromptArgument>{{"server", "One of: " + names, true}};
    };
    overview.handler = [hubPtr](const PromptRequest& req, PromptResponse& res) {
        std::string name = req.params.value("server", "");
        auto info = hubPtr->getServer(name);
        if (!info) {
            res.error("Server '" + name + "' not found");
            return;
        }
        res.user()
            .text("Give me an overview of the '" + name + "' server.")
            .assistant()
            .text(serverToText(*info))
            .send();
    };
    def.prompts.push_back(overview);

    return std::make_shared<NativeServer>(std::move(def));
}
