#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include "approval/ApprovalPolicy.h"
#include "approval/ConfirmationPrompt.h"

class EventLoop;

/**
 * @brief Layered per-call approval.
 *
 * Rules are evaluated in order and the first that decides wins:
 *   1. custom decision function (per call, else the engine-wide one)
 *   2. global auto-approve switch
 *   3. the provider's autoApprove policy
 *   4. interactive confirmation
 * Resource access is always approved.
 */
class ApprovalEngine {
public:
    explicit ApprovalEngine(bool globalAutoApprove = false,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    void setGlobalAutoApprove(bool enabled);
    bool getGlobalAutoApprove() const;

    // Engine-wide decision function, used when a call brings none of its own
    void setDecider(ApprovalDecider decider);

    void setConfirmation(std::shared_ptr<IConfirmationPrompt> prompt);

    // Confirmations requested off this loop's thread are posted to it
    void setEventLoop(EventLoop* loop);

    void setTimeout(std::chrono::milliseconds value);
    std::chrono::milliseconds getTimeout() const;

    /**
     * @brief Rules 1-3 only: Approve, Deny(reason), or Defer when the call
     * needs interactive confirmation.
     */
    ApprovalVerdict evaluate(const ApprovalRequest& request, const AutoApprovePolicy& policy,
                             const ApprovalDecider& callerDecider = nullptr) const;

    /**
     * @brief Full decision including confirmation. Never blocks longer than
     * the configured timeout when called off the loop thread; expiry yields
     * {false, "Approval timeout"}.
     */
    ApprovalDecision decide(const ApprovalRequest& request, const AutoApprovePolicy& policy,
                            const ApprovalDecider& callerDecider = nullptr);

private:
    mutable std::mutex mtx;
    bool globalAutoApprove;
    std::chrono::milliseconds timeout;
    ApprovalDecider decider;
    std::shared_ptr<IConfirmationPrompt> confirmation;
    EventLoop* loop = nullptr;

    ApprovalDecision confirm(const ApprovalRequest& request);
};
