#include "mcp/HttpMCPClient.h"
#include "mcp/JsonRpc.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <regex>
#include <algorithm>
#include <sstream>

namespace {
template <typename ClientT>
httplib::Result doPost(ClientT& cli, const std::string& path, const httplib::Headers& headers,
                       const std::string& body, std::chrono::milliseconds timeout) {
    cli.set_follow_location(true);
    cli.set_connection_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count(),
                               static_cast<long>((timeout.count() % 1000) * 1000));
    cli.set_read_timeout(std::chrono::duration_cast<std::chrono::seconds>(timeout).count(),
                         static_cast<long>((timeout.count() % 1000) * 1000));
    return cli.Post(path.c_str(), headers, body, "application/json");
}
} // namespace

HttpMCPClient::HttpMCPClient(const Config::ServerConfig& config, std::chrono::milliseconds requestTimeout)
    : RemoteMCPClient(config.name, requestTimeout), config(config), endpoint(parseUrl(config.url)) {}

HttpMCPClient::~HttpMCPClient() {
    stop();
}

HttpMCPClient::Endpoint HttpMCPClient::parseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw HubError(ErrorCode::InvalidParams, "Unsupported server url: " + url);
    }
    Endpoint ep;
    ep.isSsl = (match[1] == "https");
    ep.host = match[2];
    ep.port = match[3].matched ? std::stoi(match[3]) : (ep.isSsl ? 443 : 80);
    ep.path = match[4];
    if (ep.path.empty()) ep.path = "/";
    return ep;
}

std::vector<nlohmann::json> HttpMCPClient::parseEventStream(const std::string& body) {
    std::vector<nlohmann::json> messages;
    std::istringstream stream(body);
    std::string line;
    std::string data;

    auto flush = [&]() {
        if (data.empty()) return;
        try {
            messages.push_back(nlohmann::json::parse(data));
        } catch (const nlohmann::json::parse_error&) {
            Logger::getInstance().trace("Ignoring non-JSON event: " + data);
        }
        data.clear();
    };

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            flush();
        } else if (line.rfind("data:", 0) == 0) {
            std::string chunk = line.substr(5);
            if (!chunk.empty() && chunk[0] == ' ') chunk.erase(0, 1);
            if (!data.empty()) data += "\n";
            data += chunk;
        }
    }
    flush();
    return messages;
}

void HttpMCPClient::connect() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        sessionId.clear();
    }
    running = true;
}

void HttpMCPClient::stop() {
    running = false;
    std::vector<std::future<void>> pendingPosts;
    {
        std::lock_guard<std::mutex> lock(mtx);
        pendingPosts.swap(inflight);
    }
    for (auto& f : pendingPosts) f.wait();
}

CallOutcome HttpMCPClient::post(const nlohmann::json& message, const nlohmann::json& id) {
    httplib::Headers headers = {
        {"Accept", "application/json, text/event-stream"}
    };
    for (const auto& [key, value] : config.headers) {
        headers.emplace(key, value);
    }
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!sessionId.empty()) headers.emplace("Mcp-Session-Id", sessionId);
    }

    auto started = std::chrono::steady_clock::now();
    httplib::Result res;
    if (endpoint.isSsl) {
        httplib::SSLClient cli(endpoint.host, endpoint.port);
        res = doPost(cli, endpoint.path, headers, message.dump(), requestTimeout);
    } else {
        httplib::Client cli(endpoint.host, endpoint.port);
        res = doPost(cli, endpoint.path, headers, message.dump(), requestTimeout);
    }

    if (!res) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed >= requestTimeout) {
            return CallOutcome::failure(ErrorCode::TransportTimeout,
                                        "Request to '" + name + "' timed out after " +
                                        std::to_string(requestTimeout.count()) + " ms");
        }
        return CallOutcome::failure(ErrorCode::Transport,
                                    "Request to '" + name + "' failed: " + httplib::to_string(res.error()));
    }

    if (res->has_header("Mcp-Session-Id")) {
        std::lock_guard<std::mutex> lock(mtx);
        sessionId = res->get_header_value("Mcp-Session-Id");
    }

    if (res->status == 202 || id.is_null()) {
        return CallOutcome::success(nlohmann::json::object());
    }
    if (res->status < 200 || res->status >= 300) {
        return CallOutcome::failure(ErrorCode::Transport,
                                    "Server '" + name + "' returned HTTP " + std::to_string(res->status));
    }

    std::vector<nlohmann::json> messages;
    std::string contentType = res->get_header_value("Content-Type");
    if (contentType.find("text/event-stream") != std::string::npos) {
        messages = parseEventStream(res->body);
    } else {
        try {
            auto parsed = nlohmann::json::parse(res->body);
            if (parsed.is_array()) {
                for (auto& item : parsed) messages.push_back(item);
            } else {
                messages.push_back(parsed);
            }
        } catch (const nlohmann::json::parse_error& e) {
            return CallOutcome::failure(ErrorCode::Handler, "Invalid JSON from '" + name + "': " + e.what());
        }
    }

    std::optional<CallOutcome> reply;
    for (const auto& msg : messages) {
        if (JsonRpc::isResponse(msg) && msg["id"] == id) {
            reply = JsonRpc::toOutcome(msg);
        } else if (!JsonRpc::isResponse(msg)) {
            handleIncoming(msg);
        }
    }
    if (!reply) {
        return CallOutcome::failure(ErrorCode::Handler, "No result returned from '" + name + "'");
    }
    return *reply;
}

void HttpMCPClient::pruneInflight() {
    std::lock_guard<std::mutex> lock(mtx);
    inflight.erase(std::remove_if(inflight.begin(), inflight.end(),
                                  [](std::future<void>& f) {
                                      return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                  }),
                   inflight.end());
}

void HttpMCPClient::sendRequest(const std::string& method, const nlohmann::json& params, ResponseCallback onResponse) {
    if (!running) {
        onResponse(CallOutcome::failure(ErrorCode::Transport, "Server '" + name + "' is not running"));
        return;
    }
    pruneInflight();

    int id = ++requestId;
    nlohmann::json message = JsonRpc::makeRequest(id, method, params);
    auto task = std::async(std::launch::async, [this, message, id, onResponse]() {
        onResponse(post(message, id));
    });
    std::lock_guard<std::mutex> lock(mtx);
    inflight.push_back(std::move(task));
}

void HttpMCPClient::sendNotification(const std::string& method, const nlohmann::json& params) {
    auto outcome = post(JsonRpc::makeNotification(method, params), nullptr);
    if (!outcome.ok()) {
        Logger::getInstance().debug("Notification " + method + " to '" + name + "' failed: " + outcome.error->what());
    }
}
