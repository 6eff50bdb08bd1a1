#include "mcp/Completion.h"
#include "utils/Logger.h"

bool Completion::deliver(const CallOutcome& outcome) const {
    if (state->done.exchange(true)) {
        Logger::getInstance().debug("Dropping duplicate completion");
        return false;
    }
    if (state->callback) {
        state->callback(outcome);
    }
    return true;
}
