#include "approval/ApprovalEngine.h"
#include "core/EventLoop.h"
#include "utils/Logger.h"
#include <atomic>
#include <future>

ApprovalEngine::ApprovalEngine(bool globalAutoApprove, std::chrono::milliseconds timeout)
    : globalAutoApprove(globalAutoApprove), timeout(timeout) {}

void ApprovalEngine::setGlobalAutoApprove(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx);
    globalAutoApprove = enabled;
}

bool ApprovalEngine::getGlobalAutoApprove() const {
    std::lock_guard<std::mutex> lock(mtx);
    return globalAutoApprove;
}

void ApprovalEngine::setDecider(ApprovalDecider value) {
    std::lock_guard<std::mutex> lock(mtx);
    decider = std::move(value);
}

void ApprovalEngine::setConfirmation(std::shared_ptr<IConfirmationPrompt> prompt) {
    std::lock_guard<std::mutex> lock(mtx);
    confirmation = std::move(prompt);
}

void ApprovalEngine::setEventLoop(EventLoop* value) {
    std::lock_guard<std::mutex> lock(mtx);
    loop = value;
}

void ApprovalEngine::setTimeout(std::chrono::milliseconds value) {
    std::lock_guard<std::mutex> lock(mtx);
    timeout = value;
}

std::chrono::milliseconds ApprovalEngine::getTimeout() const {
    std::lock_guard<std::mutex> lock(mtx);
    return timeout;
}

ApprovalVerdict ApprovalEngine::evaluate(const ApprovalRequest& request, const AutoApprovePolicy& policy,
                                         const ApprovalDecider& callerDecider) const {
    if (request.isResourceAccess()) {
        return ApprovalVerdict::approve();
    }

    ApprovalDecider active;
    bool global = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        active = callerDecider ? callerDecider : decider;
        global = globalAutoApprove;
    }

    if (active) {
        ApprovalRequest enriched = request;
        enriched.isAutoApprovedInServer = request.toolName && policy.allows(*request.toolName);
        ApprovalVerdict verdict = active(enriched);
        // false/nil from the function means "ask", not "fall through"
        return verdict;
    }

    if (global) {
        return ApprovalVerdict::approve();
    }

    if (request.toolName && policy.allows(*request.toolName)) {
        return ApprovalVerdict::approve();
    }
    return ApprovalVerdict::defer();
}

ApprovalDecision ApprovalEngine::decide(const ApprovalRequest& request, const AutoApprovePolicy& policy,
                                        const ApprovalDecider& callerDecider) {
    ApprovalVerdict verdict = ApprovalVerdict::defer();
    try {
        verdict = evaluate(request, policy, callerDecider);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Approval function failed: ") + e.what());
        return ApprovalDecision::denied(std::string("Approval function failed: ") + e.what());
    }

    switch (verdict.getKind()) {
        case ApprovalVerdict::Kind::Approve:
            return ApprovalDecision::approved();
        case ApprovalVerdict::Kind::Deny:
            Logger::getInstance().info("Denied " + request.serverName + "/" + request.toolName.value_or("") +
                                       ": " + verdict.getReason());
            return ApprovalDecision::denied(verdict.getReason());
        case ApprovalVerdict::Kind::Defer:
            break;
    }
    return confirm(request);
}

ApprovalDecision ApprovalEngine::confirm(const ApprovalRequest& request) {
    std::shared_ptr<IConfirmationPrompt> prompt;
    EventLoop* target = nullptr;
    std::chrono::milliseconds wait;
    {
        std::lock_guard<std::mutex> lock(mtx);
        prompt = confirmation;
        target = loop;
        wait = timeout;
    }

    if (!prompt) {
        return ApprovalDecision::denied("Approval required but no interactive confirmation is available");
    }

    if (!target || target->isLoopThread()) {
        return prompt->confirm(request);
    }

    auto promise = std::make_shared<std::promise<ApprovalDecision>>();
    auto future = promise->get_future();
    auto expired = std::make_shared<std::atomic<bool>>(false);
    target->post([prompt, request, promise, expired]() {
        // The caller already answered "Approval timeout"; do not ask anymore
        if (expired->load()) return;
        try {
            promise->set_value(prompt->confirm(request));
        } catch (const std::exception& e) {
            promise->set_value(ApprovalDecision::denied(e.what()));
        }
    });

    if (future.wait_for(wait) != std::future_status::ready) {
        expired->store(true);
        Logger::getInstance().warn("Approval for " + request.serverName + "/" + request.toolName.value_or("") +
                                   " timed out after " + std::to_string(wait.count()) + " ms");
        return ApprovalDecision::denied("Approval timeout");
    }
    return future.get();
}
