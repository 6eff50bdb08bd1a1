#include "approval/ConfirmationPrompt.h"
#include "utils/Logger.h"
#include <fstream>
#include <algorithm>
#include <cctype>

namespace {
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[38;5;226m";
const std::string GRAY = "\033[38;5;242m";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

ApprovalDecision TerminalConfirmation::confirm(const ApprovalRequest& request) {
    std::string key = request.serverName + "/" + request.toolName.value_or("");
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (sessionAllowed.count(key)) return ApprovalDecision::approved();
    }

    std::ofstream out(ttyPath);
    std::ifstream in(ttyPath);
    if (!out.is_open() || !in.is_open()) {
        Logger::getInstance().warn("No terminal available to confirm '" + key + "'");
        return ApprovalDecision::denied("Approval required but no terminal is available");
    }

    out << YELLOW << BOLD << "? " << RESET << "Allow " << BOLD << request.toolName.value_or("?") << RESET
        << " on " << BOLD << request.serverName << RESET << "?" << std::endl;
    out << GRAY << "  Arguments: " << request.arguments.dump() << RESET << std::endl;
    out << "  [y]es / [n]o / [a]lways for this session: " << std::flush;

    std::string input;
    if (!std::getline(in, input)) {
        return ApprovalDecision::denied("User cancelled the operation");
    }
    input = toLower(input);

    if (input == "a" || input == "all" || input == "always") {
        std::lock_guard<std::mutex> lock(mtx);
        sessionAllowed.insert(key);
        return ApprovalDecision::approved();
    }
    if (input == "y" || input == "yes") {
        return ApprovalDecision::approved();
    }
    return ApprovalDecision::denied("User cancelled the operation");
}
