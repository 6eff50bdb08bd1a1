#include "control/ControlClient.h"
#include "utils/Logger.h"
#include "httplib.h"

#ifndef _WIN32
#include <sys/socket.h>
#endif

namespace {
template <typename Duration>
void applyTimeouts(httplib::Client& cli, Duration connectTimeout, Duration readTimeout) {
    cli.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(connectTimeout).count(),
                               static_cast<long>((connectTimeout.count() % 1000) * 1000));
    cli.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(readTimeout).count(),
                         static_cast<long>((readTimeout.count() % 1000) * 1000));
    cli.set_write_timeout(std::chrono::duration_cast<std::chrono::seconds>(connectTimeout).count(),
                          static_cast<long>((connectTimeout.count() % 1000) * 1000));
}

HubError transportError(const httplib::Result& res, std::chrono::steady_clock::duration elapsed,
                        std::chrono::milliseconds connectionTimeout, std::chrono::milliseconds rpcTimeout,
                        const std::string& target) {
    httplib::Error err = res.error();
    if (err == httplib::Error::Connection) {
        if (elapsed >= connectionTimeout) {
            return HubError(ErrorCode::TransportTimeout,
                            "Connection to hub at " + target + " timed out after " +
                            std::to_string(connectionTimeout.count()) + " ms");
        }
        return HubError(ErrorCode::Transport, "Cannot connect to hub at " + target);
    }
    if (elapsed >= rpcTimeout) {
        return HubError(ErrorCode::TransportTimeout,
                        "Hub request timed out after " + std::to_string(rpcTimeout.count()) + " ms");
    }
    return HubError(ErrorCode::Transport, "Hub request failed: " + httplib::to_string(err));
}
} // namespace

ControlClient::ControlClient(std::string host, int port, std::chrono::milliseconds connectionTimeout,
                             std::chrono::milliseconds rpcTimeout)
    : host(std::move(host)), port(port), connectionTimeout(connectionTimeout), rpcTimeout(rpcTimeout) {}

ControlClient ControlClient::unixSocket(const std::string& socketPath, std::chrono::milliseconds connectionTimeout,
                                        std::chrono::milliseconds rpcTimeout) {
    ControlClient client(socketPath, 80, connectionTimeout, rpcTimeout);
    client.useUnixSocket = true;
    return client;
}

std::string ControlClient::target() const {
    return useUnixSocket ? host : host + ":" + std::to_string(port);
}

CallOutcome ControlClient::outcomeFromBody(int status, const std::string& body) {
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return CallOutcome::failure(ErrorCode::Transport,
                                    "Invalid response from hub (HTTP " + std::to_string(status) + ")");
    }
    if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
        ErrorCode code = ErrorCode::Handler;
        if (parsed.contains("code") && parsed["code"].is_string()) {
            code = errorCodeFromName(parsed["code"].get<std::string>());
        }
        return CallOutcome::failure(code, parsed["error"].get<std::string>());
    }
    if (status < 200 || status >= 300) {
        return CallOutcome::failure(ErrorCode::Transport, "Hub returned HTTP " + std::to_string(status));
    }
    return CallOutcome::success(parsed);
}

CallOutcome ControlClient::post(const std::string& path, const nlohmann::json& body) {
    httplib::Client cli(host, port);
#ifndef _WIN32
    if (useUnixSocket) cli.set_address_family(AF_UNIX);
#endif
    applyTimeouts(cli, connectionTimeout, rpcTimeout);

    Logger::getInstance().debug("POST " + path + " " + body.dump());
    auto started = std::chrono::steady_clock::now();
    auto res = cli.Post(path.c_str(), body.dump(), "application/json");
    if (!res) {
        HubError error = transportError(res, std::chrono::steady_clock::now() - started, connectionTimeout,
                                        rpcTimeout, target());
        Logger::getInstance().warn(error.what());
        return CallOutcome::failure(error.getCode(), error.what());
    }
    return outcomeFromBody(res->status, res->body);
}

nlohmann::json ControlClient::get(const std::string& path) {
    httplib::Client cli(host, port);
#ifndef _WIN32
    if (useUnixSocket) cli.set_address_family(AF_UNIX);
#endif
    applyTimeouts(cli, connectionTimeout, rpcTimeout);

    auto started = std::chrono::steady_clock::now();
    auto res = cli.Get(path.c_str());
    if (!res) {
        throw transportError(res, std::chrono::steady_clock::now() - started, connectionTimeout, rpcTimeout,
                             target());
    }
    CallOutcome outcome = outcomeFromBody(res->status, res->body);
    if (!outcome.ok()) throw *outcome.error;
    return outcome.result;
}

nlohmann::json ControlClient::health() {
    return get("/api/health");
}

nlohmann::json ControlClient::getAllServers() {
    nlohmann::json body = get("/api/servers");
    if (!body.contains("servers") || !body["servers"].is_array()) {
        throw HubError(ErrorCode::Transport, "Hub returned no server list");
    }
    return body["servers"];
}

CallOutcome ControlClient::callTool(const std::string& serverName, const std::string& toolName,
                                    const nlohmann::json& arguments, const CallerContext& caller) {
    return post("/api/servers/tools",
                {{"server_name", serverName}, {"tool", toolName}, {"arguments", arguments}, {"caller", caller.toJson()}});
}

CallOutcome ControlClient::accessResource(const std::string& serverName, const std::string& uri,
                                          const CallerContext& caller) {
    return post("/api/servers/resources", {{"server_name", serverName}, {"uri", uri}, {"caller", caller.toJson()}});
}

CallOutcome ControlClient::getPrompt(const std::string& serverName, const std::string& promptName,
                                     const nlohmann::json& arguments, const CallerContext& caller) {
    return post("/api/servers/prompts", {{"server_name", serverName},
                                         {"prompt", promptName},
                                         {"arguments", arguments},
                                         {"caller", caller.toJson()}});
}

// ---------------------------------------------------------------------------

nlohmann::json LocalHubConnection::getAllServers() {
    return hub.getAllServersJson();
}

CallOutcome LocalHubConnection::callTool(const std::string& serverName, const std::string& toolName,
                                         const nlohmann::json& arguments, const CallerContext& caller) {
    CallOptions options;
    options.caller = caller;
    return hub.callTool(serverName, toolName, arguments, options);
}

CallOutcome LocalHubConnection::accessResource(const std::string& serverName, const std::string& uri,
                                               const CallerContext& caller) {
    CallOptions options;
    options.caller = caller;
    return hub.accessResource(serverName, uri, options);
}

CallOutcome LocalHubConnection::getPrompt(const std::string& serverName, const std::string& promptName,
                                          const nlohmann::json& arguments, const CallerContext& caller) {
    CallOptions options;
    options.caller = caller;
    return hub.getPrompt(serverName, promptName, arguments, options);
}
