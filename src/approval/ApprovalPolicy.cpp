#include "approval/ApprovalPolicy.h"
#include <algorithm>
#include <stdexcept>

nlohmann::json ApprovalRequest::toJson() const {
    nlohmann::json j = {
        {"server_name", serverName},
        {"tool_name", toolName ? nlohmann::json(*toolName) : nlohmann::json(nullptr)},
        {"arguments", arguments},
        {"action", action},
        {"uri", uri ? nlohmann::json(*uri) : nlohmann::json(nullptr)},
        {"is_auto_approved_in_server", isAutoApprovedInServer}
    };
    return j;
}

ApprovalVerdict ApprovalVerdict::fromJson(const nlohmann::json& value) {
    if (value.is_boolean() && value.get<bool>()) return approve();
    if (value.is_string()) return deny(value.get<std::string>());
    return defer();
}

AutoApprovePolicy AutoApprovePolicy::fromJson(const nlohmann::json& value) {
    if (value.is_null()) return AutoApprovePolicy();
    if (value.is_boolean()) {
        return value.get<bool>() ? all() : AutoApprovePolicy();
    }
    if (value.is_array()) {
        std::vector<std::string> names;
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw std::runtime_error("autoApprove list entries must be strings");
            }
            names.push_back(item.get<std::string>());
        }
        if (names.empty()) return AutoApprovePolicy();
        return listed(std::move(names));
    }
    throw std::runtime_error("autoApprove must be a boolean or a list of names");
}

nlohmann::json AutoApprovePolicy::toJson() const {
    switch (mode) {
        case Mode::All: return true;
        case Mode::Listed: return names;
        case Mode::None: break;
    }
    return false;
}

bool AutoApprovePolicy::allows(const std::string& capability) const {
    if (mode == Mode::All) return true;
    if (mode == Mode::Listed) {
        return std::find(names.begin(), names.end(), capability) != names.end();
    }
    return false;
}
