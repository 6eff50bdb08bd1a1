#include "mcp/JsonRpc.h"

JsonRpc::Request JsonRpc::parseRequest(const nlohmann::json& message) {
    if (!message.is_object()) {
        throw Error(INVALID_REQUEST, "Request must be a JSON object");
    }
    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || *version != VERSION) {
        throw Error(INVALID_REQUEST, "jsonrpc must be \"2.0\"");
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        throw Error(INVALID_REQUEST, "method must be a string");
    }

    Request request;
    request.method = method->get<std::string>();

    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        if (!params->is_object() && !params->is_array()) {
            throw Error(INVALID_REQUEST, "params must be an object or an array");
        }
        request.params = *params;
    }

    auto id = message.find("id");
    if (id != message.end()) {
        if (!id->is_null() && !id->is_string() && !id->is_number_integer()) {
            throw Error(INVALID_REQUEST, "id must be a string, an integer or null");
        }
        request.id = *id;
    }
    return request;
}

nlohmann::json JsonRpc::makeRequest(int id, const std::string& method, const nlohmann::json& params) {
    return {{"jsonrpc", VERSION}, {"id", id}, {"method", method}, {"params", params}};
}

nlohmann::json JsonRpc::makeNotification(const std::string& method, const nlohmann::json& params) {
    return {{"jsonrpc", VERSION}, {"method", method}, {"params", params}};
}

nlohmann::json JsonRpc::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {{"jsonrpc", VERSION}, {"id", id}, {"result", result}};
}

nlohmann::json JsonRpc::makeError(const nlohmann::json& id, int code, const std::string& message,
                                  const nlohmann::json& data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) error["data"] = data;
    return {{"jsonrpc", VERSION}, {"id", id}, {"error", error}};
}

nlohmann::json JsonRpc::makeError(const nlohmann::json& id, const Error& error) {
    return makeError(id, error.getCode(), error.what(), error.getData());
}

bool JsonRpc::isResponse(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") && !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

CallOutcome JsonRpc::toOutcome(const nlohmann::json& response) {
    if (response.contains("error")) {
        const auto& error = response["error"];
        std::string message = error.is_object() ? error.value("message", "Unknown error") : error.dump();
        return CallOutcome::failure(ErrorCode::Handler, message);
    }
    if (!response.contains("result") || response["result"].is_null()) {
        return CallOutcome::failure(ErrorCode::Handler, "No result returned");
    }
    return CallOutcome::success(response["result"]);
}
