#include "core/HubErrors.h"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::NotConnected: return "NOT_CONNECTED";
        case ErrorCode::ApprovalDenied: return "APPROVAL_DENIED";
        case ErrorCode::ApprovalTimeout: return "APPROVAL_TIMEOUT";
        case ErrorCode::TransportTimeout: return "TRANSPORT_TIMEOUT";
        case ErrorCode::Transport: return "TRANSPORT";
        case ErrorCode::Handler: return "HANDLER";
        case ErrorCode::ConfigConflict: return "CONFIG_CONFLICT";
        case ErrorCode::InvalidParams: return "INVALID_PARAMS";
    }
    return "HANDLER";
}

ErrorCode errorCodeFromName(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::NotFound, ErrorCode::NotConnected, ErrorCode::ApprovalDenied,
        ErrorCode::ApprovalTimeout, ErrorCode::TransportTimeout, ErrorCode::Transport,
        ErrorCode::Handler, ErrorCode::ConfigConflict, ErrorCode::InvalidParams
    };
    for (auto code : all) {
        if (name == errorCodeName(code)) return code;
    }
    return ErrorCode::Handler;
}
