#include "core/HubService.h"
#include "approval/ApprovalEngine.h"
#include "approval/ConfirmationPrompt.h"
#include "control/ControlServer.h"
#include "mcp/MCPManager.h"
#include "native/BuiltinServer.h"
#include "utils/Logger.h"
#include <filesystem>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
std::int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string absolutePath(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::u8path(path), ec);
    return ec ? path : abs.lexically_normal().u8string();
}
} // namespace

HubService::HubService(HubOptions options, std::string cachePath)
    : options(std::move(options)), registry(std::move(cachePath)) {}

HubService::~HubService() {
    shutdown();
}

void HubService::configure() {
    std::vector<std::string> files;
    if (!options.configPaths.empty()) {
        for (const auto& path : options.configPaths) files.push_back(absolutePath(path));
    } else {
        std::string global = Config::defaultGlobalPath();
        std::error_code ec;
        if (fs::exists(global, ec)) files.push_back(global);
    }

    config = Config::merge(files);

    if (!options.noWorkspace && config.workspace.enabled) {
        std::string startDir = options.workspaceDir.empty() ? fs::current_path().u8string() : options.workspaceDir;
        workspace = WorkspaceRegistry::findWorkspaceConfig(config.workspace.lookFor, startDir);
        if (workspace) {
            Logger::getInstance().info("Workspace " + workspace->rootDir + " (" + workspace->configFile + ")");
            if (std::find(files.begin(), files.end(), workspace->configFile) == files.end()) {
                files.push_back(workspace->configFile);
            }
            config = Config::merge(files);
        }
    }
    configFiles = files;

    Logger& logger = Logger::getInstance();
    logger.setLevel(options.logLevel ? *options.logLevel : Logger::parseLevel(config.log.level));
    std::string logFile = options.logFile.empty() ? config.log.filePath : options.logFile;
    if (!logFile.empty() && !logger.setLogFile(logFile)) {
        logger.warn("Cannot open log file " + logFile);
    }
}

std::optional<WorkspaceCacheEntry> HubService::findRunningHub() const {
    if (!options.socketPath.empty()) return std::nullopt;
    if (workspace) return registry.findMatchingHub(workspace->rootDir, configFiles);

    auto entry = registry.getHubInfo(options.port ? *options.port : config.port);
    if (entry && entry->configFiles == configFiles) return entry;
    return std::nullopt;
}

int HubService::choosePort() const {
    if (options.port) return *options.port;
    if (!workspace) return config.port;

    auto found = WorkspaceRegistry::findAvailablePort(config.workspace.portMin, config.workspace.portMax,
                                                      workspace->rootDir, config.workspace.maxAttempts);
    if (!found) {
        throw std::runtime_error("No free port in " + std::to_string(config.workspace.portMin) + "-" +
                                 std::to_string(config.workspace.portMax) + " for workspace " +
                                 workspace->rootDir);
    }
    return *found;
}

void HubService::start() {
    approval = std::make_shared<ApprovalEngine>(config.autoApprove || options.autoApprove,
                                                std::chrono::milliseconds(config.approvalTimeout));
    approval->setConfirmation(std::make_shared<TerminalConfirmation>());
    approval->setEventLoop(&loop);

    manager = std::make_unique<MCPManager>(approval, std::chrono::milliseconds(config.mcpRequestTimeout));
    manager->addNativeServer(createBuiltinServer(*manager));
    manager->initFromConfig(config);

    control = std::make_unique<ControlServer>(*manager);
    if (workspace) control->setWorkspace(workspace->rootDir);

    if (!options.socketPath.empty()) {
        if (!control->startUnix(options.socketPath)) {
            throw std::runtime_error("Cannot listen on socket " + options.socketPath);
        }
        Logger::getInstance().info("Hub ready on " + options.socketPath);
        return;
    }

    port = choosePort();
    if (!control->start("127.0.0.1", port)) {
        throw std::runtime_error("Cannot listen on port " + std::to_string(port));
    }

    WorkspaceCacheEntry entry;
    entry.port = port;
    entry.pid = static_cast<std::int64_t>(::getpid());
    entry.cwd = workspace ? workspace->rootDir : "";
    entry.configFiles = configFiles;
    entry.startTime = nowSeconds();
    try {
        registry.registerHub(entry);
        registered = true;
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Cannot register hub: ") + e.what());
    }
    Logger::getInstance().info("Hub ready on port " + std::to_string(port));
}

void HubService::run(const std::function<bool()>& shouldStop) {
    loop.run(std::chrono::milliseconds(100), [this, &shouldStop]() {
        if (shouldStop() || (control && !control->isRunning())) loop.stop();
    });
}

void HubService::shutdown() {
    if (control) {
        control->stop();
        control.reset();
    }
    if (registered) {
        try {
            registry.unregisterHub(port);
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Cannot unregister hub: ") + e.what());
        }
        registered = false;
    }
    manager.reset();
}
