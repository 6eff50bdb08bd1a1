#pragma once
#include <string>
#include <set>
#include <mutex>
#include "approval/ApprovalPolicy.h"

// Always invoked on the hub's main loop
class IConfirmationPrompt {
public:
    virtual ~IConfirmationPrompt() = default;
    virtual ApprovalDecision confirm(const ApprovalRequest& request) = 0;
};

/**
 * @brief Asks on the controlling terminal (/dev/tty), leaving stdin and
 * stdout alone. Answers: y(es), n(o), a(ll) = allow this tool for the rest
 * of the session.
 */
class TerminalConfirmation : public IConfirmationPrompt {
public:
    explicit TerminalConfirmation(std::string ttyPath = "/dev/tty") : ttyPath(std::move(ttyPath)) {}

    ApprovalDecision confirm(const ApprovalRequest& request) override;

private:
    std::string ttyPath;
    std::mutex mtx;
    std::set<std::string> sessionAllowed;  // "server/tool"
};
