#include "control/ControlServer.h"
#include "mcp/MCPManager.h"
#include "utils/Logger.h"
#include <filesystem>

#ifndef _WIN32
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace {
nlohmann::json parseBody(const httplib::Request& req) {
    if (req.body.empty()) return nlohmann::json::object();
    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw HubError(ErrorCode::InvalidParams, "Request body must be a JSON object");
    }
    return body;
}

CallOptions optionsFrom(const nlohmann::json& body) {
    CallOptions options;
    options.caller.type = "external";
    if (body.contains("caller")) options.caller = CallerContext::fromJson(body["caller"]);
    return options;
}

std::string stringField(const nlohmann::json& body, const char* key) {
    if (body.contains(key) && body[key].is_string()) return body[key].get<std::string>();
    return "";
}
} // namespace

ControlServer::ControlServer(MCPManager& hub) : hub(hub), server(std::make_unique<httplib::Server>()) {
    setupRoutes();
}

ControlServer::~ControlServer() {
    stop();
}

int ControlServer::httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidParams: return 400;
        case ErrorCode::ApprovalDenied: return 403;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::NotConnected: return 409;
        case ErrorCode::ApprovalTimeout:
        case ErrorCode::TransportTimeout: return 504;
        default: return 500;
    }
}

void ControlServer::sendOutcome(httplib::Response& res, const CallOutcome& outcome) {
    res.status = outcome.ok() ? 200 : httpStatusFor(outcome.error->getCode());
    res.set_content(outcome.toEnvelope().dump(), "application/json");
}

void ControlServer::sendError(httplib::Response& res, const HubError& error) {
    res.status = httpStatusFor(error.getCode());
    res.set_content(error.toJson().dump(), "application/json");
}

void ControlServer::setupRoutes() {
    server->set_read_timeout(5, 0);
    server->set_write_timeout(5, 0);

    server->Get("/api/health", [this](const httplib::Request& req, httplib::Response& res) { handleHealth(req, res); });
    server->Get("/api/servers", [this](const httplib::Request& req, httplib::Response& res) { handleServers(req, res); });
    server->Post("/api/servers/tools", [this](const httplib::Request& req, httplib::Response& res) { handleTool(req, res); });
    server->Post("/api/servers/resources",
                 [this](const httplib::Request& req, httplib::Response& res) { handleResource(req, res); });
    server->Post("/api/servers/prompts",
                 [this](const httplib::Request& req, httplib::Response& res) { handlePrompt(req, res); });
    server->Post("/api/servers/start",
                 [this](const httplib::Request& req, httplib::Response& res) { handleLifecycle(req, res, true); });
    server->Post("/api/servers/stop",
                 [this](const httplib::Request& req, httplib::Response& res) { handleLifecycle(req, res, false); });

    server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const HubError& e) {
            sendError(res, e);
            return;
        } catch (const std::exception& e) {
            message = e.what();
        }
        Logger::getInstance().error("Control request " + req.path + " failed: " + message);
        sendError(res, HubError(ErrorCode::Handler, message));
    });

    server->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        nlohmann::json body = {{"error", "No handler for " + req.method + " " + req.path},
                               {"code", errorCodeName(ErrorCode::NotFound)}};
        res.set_content(body.dump(), "application/json");
    });
}

void ControlServer::handleHealth(const httplib::Request&, httplib::Response& res) {
    nlohmann::json body = {
        {"status", "ok"},
        {"pid", static_cast<long>(::getpid())},
        {"port", port},
        {"workspace", workspace.empty() ? nlohmann::json(nullptr) : nlohmann::json(workspace)},
        {"servers", hub.getServers().size()}
    };
    res.set_content(body.dump(), "application/json");
}

void ControlServer::handleServers(const httplib::Request&, httplib::Response& res) {
    nlohmann::json body = {{"servers", hub.getAllServersJson()}};
    res.set_content(body.dump(), "application/json");
}

void ControlServer::handleTool(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body = parseBody(req);
    nlohmann::json params = {{"server_name", body.contains("server_name") ? body["server_name"] : nlohmann::json()},
                             {"tool_name", body.contains("tool") ? body["tool"] : nlohmann::json()},
                             {"tool_input", body.contains("arguments") ? body["arguments"] : nlohmann::json()}};
    CallParams call = MCPManager::parseParams(params, ApprovalRequest::USE_TOOL);
    if (!call.ok()) {
        sendError(res, call.toError());
        return;
    }
    sendOutcome(res, hub.callTool(call.serverName, call.toolName, call.arguments, optionsFrom(body)));
}

void ControlServer::handleResource(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body = parseBody(req);
    CallParams call = MCPManager::parseParams(body, ApprovalRequest::ACCESS_RESOURCE);
    if (!call.ok()) {
        sendError(res, call.toError());
        return;
    }
    sendOutcome(res, hub.accessResource(call.serverName, call.uri, optionsFrom(body)));
}

void ControlServer::handlePrompt(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body = parseBody(req);
    std::string serverName = stringField(body, "server_name");
    std::string prompt = stringField(body, "prompt");
    if (serverName.empty() || prompt.empty()) {
        sendError(res, HubError(ErrorCode::InvalidParams, "server_name and prompt are required"));
        return;
    }
    nlohmann::json arguments = body.contains("arguments") && body["arguments"].is_object()
                                   ? body["arguments"]
                                   : nlohmann::json::object();
    sendOutcome(res, hub.getPrompt(serverName, prompt, arguments, optionsFrom(body)));
}

void ControlServer::handleLifecycle(const httplib::Request& req, httplib::Response& res, bool start) {
    nlohmann::json body = parseBody(req);
    std::string serverName = stringField(body, "server_name");
    if (serverName.empty()) {
        sendError(res, HubError(ErrorCode::InvalidParams, "server_name is required"));
        return;
    }
    bool ok = start ? hub.startServer(serverName) : hub.stopServer(serverName, body.value("disable", false));
    auto info = hub.getServer(serverName);
    if (!info) {
        sendError(res, HubError(ErrorCode::NotFound, "Server '" + serverName + "' not found"));
        return;
    }
    if (!ok) {
        sendError(res, HubError(ErrorCode::Handler, info->error.value_or("Failed to start server '" + serverName + "'")));
        return;
    }
    res.set_content(nlohmann::json{{"server", *info}}.dump(), "application/json");
}

bool ControlServer::start(const std::string& host, int requestedPort) {
    if (running) return false;
    if (!server->bind_to_port(host, requestedPort)) {
        Logger::getInstance().error("Failed to bind control server to " + host + ":" + std::to_string(requestedPort));
        return false;
    }
    port = requestedPort;
    return serve();
}

bool ControlServer::startUnix(const std::string& path) {
    if (running) return false;
#ifndef _WIN32
    std::error_code ec;
    std::filesystem::remove(path, ec);  // stale socket from a crashed hub
    server->set_address_family(AF_UNIX);
    if (!server->bind_to_port(path, 80)) {
        Logger::getInstance().error("Failed to bind control server to socket " + path);
        return false;
    }
    socketPath = path;
    return serve();
#else
    (void)path;
    return false;
#endif
}

bool ControlServer::serve() {
    running = true;
    serverThread = std::thread([this]() {
        if (!server->listen_after_bind()) {
            Logger::getInstance().error("Control server stopped unexpectedly");
        }
        running = false;
    });
    Logger::getInstance().info(socketPath.empty() ? "Control server listening on port " + std::to_string(port)
                                                  : "Control server listening on " + socketPath);
    return true;
}

void ControlServer::stop() {
    if (server) server->stop();
    if (serverThread.joinable()) serverThread.join();
    running = false;
    if (!socketPath.empty()) {
        std::error_code ec;
        std::filesystem::remove(socketPath, ec);
        socketPath.clear();
    }
}
