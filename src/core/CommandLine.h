#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "utils/Logger.h"

struct HubOptions {
    std::vector<std::string> configPaths;
    std::optional<int> port;
    // Where workspace discovery starts; the current directory when empty
    std::string workspaceDir;
    bool noWorkspace = false;
    std::string socketPath;
    std::string logFile;
    std::optional<LogLevel> logLevel;
    bool autoApprove = false;
    bool help = false;
};

struct ProxyOptions {
    std::string socketPath;
    std::optional<int> port;
    std::string workspaceDir;
    std::chrono::milliseconds rpcCallTimeout{60000};
    std::chrono::milliseconds connectionTimeout{5000};
    std::string logFile;
    std::optional<LogLevel> logLevel;
    bool help = false;
};

// Throws std::runtime_error on unknown options or bad values
HubOptions parseHubArgs(int argc, const char* const argv[]);
ProxyOptions parseProxyArgs(int argc, const char* const argv[]);

std::string hubUsage();
std::string proxyUsage();
