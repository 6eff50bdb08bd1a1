#pragma once
#include <string>
#include <stdexcept>
#include <optional>
#include <nlohmann/json.hpp>

enum class ErrorCode {
    NotFound,
    NotConnected,
    ApprovalDenied,
    ApprovalTimeout,
    TransportTimeout,
    Transport,
    Handler,
    ConfigConflict,
    InvalidParams
};

const char* errorCodeName(ErrorCode code);
ErrorCode errorCodeFromName(const std::string& name);

/**
 * @brief Error raised or delivered by the hub.
 *
 * what() is the user-facing reason and is surfaced verbatim to chat
 * adapters and proxy clients.
 */
class HubError : public std::runtime_error {
public:
    HubError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code(code) {}

    ErrorCode getCode() const { return code; }

    nlohmann::json toJson() const {
        return {{"error", what()}, {"code", errorCodeName(code)}};
    }

private:
    ErrorCode code;
};

struct CallOutcome {
    nlohmann::json result;
    std::optional<HubError> error;

    static CallOutcome success(nlohmann::json value) {
        CallOutcome outcome;
        outcome.result = std::move(value);
        return outcome;
    }

    static CallOutcome failure(ErrorCode code, const std::string& message) {
        CallOutcome outcome;
        outcome.error = HubError(code, message);
        return outcome;
    }

    bool ok() const { return !error.has_value(); }

    // {content/contents/messages...} on success, {error, code} otherwise
    nlohmann::json toEnvelope() const {
        if (error) return error->toJson();
        return result.is_null() ? nlohmann::json::object() : result;
    }
};
