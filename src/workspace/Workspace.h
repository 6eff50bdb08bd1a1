#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

struct WorkspaceConfigMatch {
    std::string rootDir;
    std::string configFile;
};

/**
 * @brief One running hub as recorded in the shared workspace cache.
 */
struct WorkspaceCacheEntry {
    int port = 0;
    std::int64_t pid = 0;
    std::string cwd;
    std::vector<std::string> configFiles;
    std::int64_t startTime = 0;  // seconds since the epoch

    nlohmann::json toJson() const;
    static WorkspaceCacheEntry fromJson(const nlohmann::json& j);
};

/**
 * @brief Workspace discovery and the port-keyed cache of live hubs.
 *
 * Lookups only read the cache; registerHub/unregisterHub are used by the
 * hub process for its own entry.
 */
class WorkspaceRegistry {
public:
    explicit WorkspaceRegistry(std::string cachePath = defaultCachePath());

    const std::string& getCachePath() const { return cachePath; }

    /**
     * @brief Walks upward from startDir and returns the first directory that
     * contains one of the patterns, checked in order.
     */
    static std::optional<WorkspaceConfigMatch> findWorkspaceConfig(const std::vector<std::string>& lookFor,
                                                                   const std::string& startDir);

    // Deterministic port in [portMin, portMax] for a workspace root
    static int generateWorkspacePort(const std::string& workspacePath, int portMin, int portMax);
    static bool isPortAvailable(int port);
    // Probes maxAttempts ports from the workspace's port (random without one), wrapping inside the range
    static std::optional<int> findAvailablePort(int portMin, int portMax,
                                                const std::optional<std::string>& workspacePath,
                                                int maxAttempts = 100);

    // ~/.mcp-hub/workspaces.json when it exists, else $XDG_STATE_HOME/mcp-hub/workspaces.json
    static std::string defaultCachePath();
    static bool isProcessRunning(std::int64_t pid);

    // port string -> entry; missing or unreadable cache is empty
    std::map<std::string, WorkspaceCacheEntry> readCache() const;

    // The entry registered under `port`, if its process is alive
    std::optional<WorkspaceCacheEntry> getHubInfo(int port) const;
    // Live hub for the same workspace root and the same config files in the same order
    std::optional<WorkspaceCacheEntry> findMatchingHub(const std::string& workspacePath,
                                                       const std::vector<std::string>& configFiles) const;
    // Live hub for the workspace root, whatever its config files
    std::optional<WorkspaceCacheEntry> findHubForWorkspace(const std::string& workspacePath) const;

    // Both write a temp file and rename it over the cache
    void registerHub(const WorkspaceCacheEntry& entry);
    void unregisterHub(int port);

private:
    std::string cachePath;

    void writeCache(const nlohmann::json& cache);
    nlohmann::json readRaw() const;
};
