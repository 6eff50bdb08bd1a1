#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

/**
 * @brief What the decision function sees for one call.
 */
struct ApprovalRequest {
    static constexpr const char* USE_TOOL = "use_mcp_tool";
    static constexpr const char* ACCESS_RESOURCE = "access_mcp_resource";

    std::string serverName;
    std::optional<std::string> toolName;
    nlohmann::json arguments = nlohmann::json::object();
    std::string action = USE_TOOL;
    std::optional<std::string> uri;
    bool isAutoApprovedInServer = false;

    bool isResourceAccess() const { return action == ACCESS_RESOURCE; }
    nlohmann::json toJson() const;
};

/**
 * @brief Final per-call decision. `error` set implies `approve == false`.
 */
struct ApprovalDecision {
    bool approve = false;
    std::optional<std::string> error;

    static ApprovalDecision approved() { return {true, std::nullopt}; }
    static ApprovalDecision denied(const std::string& reason) { return {false, reason}; }
};

/**
 * @brief Return value of a custom decision function: approve, defer to the
 * next rule, or deny with a user-facing reason.
 */
class ApprovalVerdict {
public:
    enum class Kind { Approve, Defer, Deny };

    static ApprovalVerdict approve() { return ApprovalVerdict(Kind::Approve, ""); }
    static ApprovalVerdict defer() { return ApprovalVerdict(Kind::Defer, ""); }
    static ApprovalVerdict deny(const std::string& reason) { return ApprovalVerdict(Kind::Deny, reason); }

    // true -> approve, false/null -> defer, string -> deny(string)
    static ApprovalVerdict fromJson(const nlohmann::json& value);

    Kind getKind() const { return kind; }
    const std::string& getReason() const { return reason; }

private:
    ApprovalVerdict(Kind kind, std::string reason) : kind(kind), reason(std::move(reason)) {}
    Kind kind;
    std::string reason;
};

using ApprovalDecider = std::function<ApprovalVerdict(const ApprovalRequest&)>;

/**
 * @brief Provider-scoped `autoApprove` setting: `true`, `false`, or a list of
 * capability names.
 */
class AutoApprovePolicy {
public:
    enum class Mode { None, All, Listed };

    AutoApprovePolicy() = default;

    static AutoApprovePolicy all() { return AutoApprovePolicy(Mode::All, {}); }
    static AutoApprovePolicy listed(std::vector<std::string> names) {
        return AutoApprovePolicy(Mode::Listed, std::move(names));
    }

    // Accepts a boolean or an array of strings; throws std::runtime_error otherwise
    static AutoApprovePolicy fromJson(const nlohmann::json& value);
    nlohmann::json toJson() const;

    bool allows(const std::string& capability) const;
    Mode getMode() const { return mode; }
    const std::vector<std::string>& getNames() const { return names; }

private:
    AutoApprovePolicy(Mode mode, std::vector<std::string> names) : mode(mode), names(std::move(names)) {}
    Mode mode = Mode::None;
    std::vector<std::string> names;
};
