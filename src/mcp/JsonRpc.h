#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "core/HubErrors.h"

class JsonRpc {
public:
    static constexpr const char* VERSION = "2.0";

    static constexpr int PARSE_ERROR = -32700;
    static constexpr int INVALID_REQUEST = -32600;
    static constexpr int METHOD_NOT_FOUND = -32601;
    static constexpr int INVALID_PARAMS = -32602;
    static constexpr int INTERNAL_ERROR = -32603;

    struct Request {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        std::optional<nlohmann::json> id;

        bool isNotification() const { return !id.has_value(); }
    };

    class Error : public std::runtime_error {
    public:
        Error(int code, const std::string& message, nlohmann::json data = nullptr)
            : std::runtime_error(message), code(code), data(std::move(data)) {}

        int getCode() const { return code; }
        const nlohmann::json& getData() const { return data; }

    private:
        int code;
        nlohmann::json data;
    };

    // Throws JsonRpc::Error(INVALID_REQUEST) on malformed messages
    static Request parseRequest(const nlohmann::json& message);

    static nlohmann::json makeRequest(int id, const std::string& method, const nlohmann::json& params);
    static nlohmann::json makeNotification(const std::string& method, const nlohmann::json& params);
    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message,
                                    const nlohmann::json& data = nullptr);
    static nlohmann::json makeError(const nlohmann::json& id, const Error& error);

    static bool isResponse(const nlohmann::json& message);

    // An `error` member becomes a Handler error
    static CallOutcome toOutcome(const nlohmann::json& response);
};
