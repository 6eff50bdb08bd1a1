#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include "core/HubErrors.h"

// One-shot delivery token; copies share the flag and only the first delivery counts
class Completion {
public:
    using Callback = std::function<void(const CallOutcome&)>;

    Completion() : state(std::make_shared<State>()) {}
    explicit Completion(Callback callback) : state(std::make_shared<State>()) {
        state->callback = std::move(callback);
    }

    // Returns false when the call was already completed
    bool deliver(const CallOutcome& outcome) const;

    bool succeed(nlohmann::json result) const { return deliver(CallOutcome::success(std::move(result))); }
    bool fail(ErrorCode code, const std::string& message) const {
        return deliver(CallOutcome::failure(code, message));
    }

    bool isDone() const { return state->done.load(); }

private:
    struct State {
        std::atomic<bool> done{false};
        Callback callback;
    };
    std::shared_ptr<State> state;
};
