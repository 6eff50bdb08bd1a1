#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "approval/ApprovalPolicy.h"

struct Config {
    struct ServerConfig {
        std::string name;
        // stdio providers
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        std::string cwd;
        // remote providers
        std::string url;
        std::map<std::string, std::string> headers;

        bool disabled = false;
        AutoApprovePolicy autoApprove;
        std::vector<std::string> disabledTools;
        std::vector<std::string> disabledResources;
        std::vector<std::string> disabledResourceTemplates;
        std::vector<std::string> disabledPrompts;

        bool isRemote() const { return !url.empty(); }

        static ServerConfig fromJson(const std::string& name, const nlohmann::json& j, bool native);
    };

    struct Log {
        std::string level = "info";
        std::string filePath;
    } log;

    struct Workspace {
        bool enabled = true;
        std::vector<std::string> lookFor = {".mcphub/servers.json", ".vscode/mcp.json", ".cursor/mcp.json"};
        int portMin = 40000;
        int portMax = 41000;
        int maxAttempts = 100;
    } workspace;

    int port = 37373;
    int mcpRequestTimeout = 60000;
    int approvalTimeout = 60000;
    bool autoApprove = false;

    // Sorted by name within a file; a later file replaces an entry with the same name
    std::vector<ServerConfig> mcpServers;
    std::map<std::string, ServerConfig> nativeServers;

    // Files this config was built from, in merge order
    std::vector<std::string> configFiles;

    /**
     * @brief Reads one servers file.
     * @throws std::runtime_error when the file is missing or malformed
     */
    static Config load(const std::string& pathStr);

    /**
     * @brief Overlays several servers files, the first being the lowest priority.
     * @throws std::runtime_error when any file is missing or malformed
     */
    static Config merge(const std::vector<std::string>& paths);

    static Config fromJson(const nlohmann::json& j);

    // ~/.config/mcphub/servers.json
    static std::string defaultGlobalPath();

    const ServerConfig* findServer(const std::string& name) const;
    const ServerConfig* findNativeServer(const std::string& name) const;
};
