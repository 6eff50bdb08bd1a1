#include <iostream>
#include <csignal>
#include <memory>
#include <filesystem>
#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "control/ControlClient.h"
#include "proxy/ProxyBridge.h"
#include "workspace/Workspace.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
std::unique_ptr<ControlClient> connectToHub(const ProxyOptions& options) {
    if (!options.socketPath.empty()) {
        return std::make_unique<ControlClient>(
            ControlClient::unixSocket(options.socketPath, options.connectionTimeout, options.rpcCallTimeout));
    }
    if (options.port) {
        return std::make_unique<ControlClient>("127.0.0.1", *options.port, options.connectionTimeout,
                                               options.rpcCallTimeout);
    }

    Config::Workspace defaults;
    auto match = WorkspaceRegistry::findWorkspaceConfig(defaults.lookFor, options.workspaceDir);
    std::string root = match ? match->rootDir : fs::absolute(fs::u8path(options.workspaceDir)).lexically_normal().u8string();

    WorkspaceRegistry registry;
    auto entry = registry.findHubForWorkspace(root);
    if (!entry) {
        throw std::runtime_error("No running hub found for workspace " + root);
    }
    Logger::getInstance().info("Attaching to hub " + std::to_string(entry->pid) + " on port " +
                               std::to_string(entry->port));
    return std::make_unique<ControlClient>("127.0.0.1", entry->port, options.connectionTimeout,
                                           options.rpcCallTimeout);
}
} // namespace

int main(int argc, char* argv[]) {
    ProxyOptions options;
    try {
        options = parseProxyArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "mcphub-proxy: " << e.what() << "\n" << proxyUsage();
        return 1;
    }
    if (options.help) {
        std::cerr << proxyUsage();
        return 0;
    }

    std::signal(SIGPIPE, SIG_IGN);

    Logger& logger = Logger::getInstance();
    if (options.logLevel) logger.setLevel(*options.logLevel);
    if (!options.logFile.empty() && !logger.setLogFile(options.logFile)) {
        std::cerr << "mcphub-proxy: cannot open log file " << options.logFile << std::endl;
    }

    std::unique_ptr<ControlClient> hub;
    try {
        hub = connectToHub(options);
        nlohmann::json health = hub->health();
        logger.info("Connected to hub (pid " + health.value("pid", nlohmann::json(0)).dump() + ")");
    } catch (const std::exception& e) {
        logger.error(std::string("Cannot attach to hub: ") + e.what());
        std::cerr << "mcphub-proxy: " << e.what() << std::endl;
        return 1;
    }

    ProxyBridge bridge(*hub);
    return bridge.run(std::cin, std::cout);
}
