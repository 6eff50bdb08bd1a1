#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "core/EventLoop.h"
#include "workspace/Workspace.h"

class ApprovalEngine;
class MCPManager;
class ControlServer;

/**
 * @brief Wires one hub process together: config files, workspace port,
 * router, builtin server, control RPC and the workspace cache entry.
 */
class HubService {
public:
    explicit HubService(HubOptions options, std::string cachePath = WorkspaceRegistry::defaultCachePath());
    ~HubService();

    /**
     * @brief Resolves the workspace and loads and merges the config files.
     * @throws std::runtime_error when a config file is unreadable
     */
    void configure();

    // A live hub already serving the same workspace and config files
    std::optional<WorkspaceCacheEntry> findRunningHub() const;

    /**
     * @brief Starts providers, binds the control RPC and registers this hub.
     * @throws std::runtime_error when no port can be bound
     */
    void start();

    // Runs the main loop until shouldStop() returns true
    void run(const std::function<bool()>& shouldStop);
    void shutdown();

    int getPort() const { return port; }
    const Config& getConfig() const { return config; }
    const std::optional<WorkspaceConfigMatch>& getWorkspace() const { return workspace; }
    const std::vector<std::string>& getConfigFiles() const { return configFiles; }
    MCPManager& getManager() { return *manager; }
    EventLoop& getLoop() { return loop; }

private:
    HubOptions options;
    WorkspaceRegistry registry;
    Config config;
    std::optional<WorkspaceConfigMatch> workspace;
    std::vector<std::string> configFiles;

    EventLoop loop;
    std::shared_ptr<ApprovalEngine> approval;
    std::unique_ptr<MCPManager> manager;
    std::unique_ptr<ControlServer> control;
    int port = 0;
    bool registered = false;

    int choosePort() const;
};
