#include "core/ConfigManager.h"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>

namespace {
nlohmann::json readJsonFile(const std::string& pathStr) {
    std::filesystem::path path = std::filesystem::u8path(pathStr);
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + pathStr);
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    f.close();

    // An empty servers file is a valid, empty config
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return nlohmann::json::object();
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be an object: " + pathStr);
    }
    return j;
}

std::vector<std::string> stringList(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    if (!j[key].is_array()) {
        throw std::runtime_error(std::string("'") + key + "' must be a list of strings");
    }
    return j[key].get<std::vector<std::string>>();
}

std::map<std::string, std::string> stringMap(const nlohmann::json& j, const char* key) {
    std::map<std::string, std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_object()) {
        throw std::runtime_error(std::string("'") + key + "' must be an object");
    }
    for (auto it = j[key].begin(); it != j[key].end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return out;
}

const nlohmann::json* serversSection(const nlohmann::json& j) {
    if (j.contains("mcpServers")) return &j["mcpServers"];
    if (j.contains("servers")) return &j["servers"];
    return nullptr;
}
} // namespace

Config::ServerConfig Config::ServerConfig::fromJson(const std::string& name, const nlohmann::json& j, bool native) {
    if (!j.is_object()) {
        throw std::runtime_error("Server '" + name + "' must be an object");
    }
    ServerConfig server;
    server.name = name;
    try {
        server.command = j.value("command", "");
        server.args = stringList(j, "args");
        server.env = stringMap(j, "env");
        server.cwd = j.value("cwd", "");
        server.url = j.value("url", "");
        server.headers = stringMap(j, "headers");
        server.disabled = j.value("disabled", false);
        server.autoApprove = AutoApprovePolicy::fromJson(j.contains("autoApprove") ? j["autoApprove"] : nlohmann::json());
        server.disabledTools = stringList(j, "disabled_tools");
        server.disabledResources = stringList(j, "disabled_resources");
        server.disabledResourceTemplates = stringList(j, "disabled_resourceTemplates");
        server.disabledPrompts = stringList(j, "disabled_prompts");
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config for server '" + name + "': " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config for server '" + name + "': " + e.what());
    }

    if (!native && server.command.empty() && server.url.empty()) {
        throw std::runtime_error("Server '" + name + "' must define either 'command' or 'url'");
    }
    return server;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config cfg;
    try {
        cfg.port = j.value("port", cfg.port);
        cfg.mcpRequestTimeout = j.value("mcp_request_timeout", cfg.mcpRequestTimeout);
        cfg.approvalTimeout = j.value("approval_timeout", cfg.approvalTimeout);
        cfg.autoApprove = j.value("auto_approve", cfg.autoApprove);

        if (j.contains("log") && j["log"].is_object()) {
            const auto& log = j["log"];
            if (log.contains("level")) {
                cfg.log.level = log["level"].is_string() ? log["level"].get<std::string>()
                                                         : std::to_string(log["level"].get<int>());
            }
            cfg.log.filePath = log.value("file_path", cfg.log.filePath);
        }

        if (j.contains("workspace") && j["workspace"].is_object()) {
            const auto& ws = j["workspace"];
            cfg.workspace.enabled = ws.value("enabled", cfg.workspace.enabled);
            if (ws.contains("look_for")) {
                cfg.workspace.lookFor = ws["look_for"].get<std::vector<std::string>>();
            }
            if (ws.contains("port_range")) {
                cfg.workspace.portMin = ws["port_range"].value("min", cfg.workspace.portMin);
                cfg.workspace.portMax = ws["port_range"].value("max", cfg.workspace.portMax);
            }
            cfg.workspace.maxAttempts = ws.value("max_attempts", cfg.workspace.maxAttempts);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid hub settings: ") + e.what());
    }

    if (cfg.workspace.portMin <= 0 || cfg.workspace.portMax > 65535 || cfg.workspace.portMin > cfg.workspace.portMax) {
        throw std::runtime_error("workspace.port_range must satisfy 0 < min <= max <= 65535");
    }
    if (cfg.mcpRequestTimeout <= 0 || cfg.approvalTimeout <= 0) {
        throw std::runtime_error("Timeouts must be positive");
    }

    if (const auto* servers = serversSection(j)) {
        if (!servers->is_object()) {
            throw std::runtime_error("'mcpServers' must be an object");
        }
        for (auto it = servers->begin(); it != servers->end(); ++it) {
            cfg.mcpServers.push_back(ServerConfig::fromJson(it.key(), it.value(), false));
        }
    }

    if (j.contains("nativeMCPServers")) {
        const auto& natives = j["nativeMCPServers"];
        if (!natives.is_object()) {
            throw std::runtime_error("'nativeMCPServers' must be an object");
        }
        for (auto it = natives.begin(); it != natives.end(); ++it) {
            cfg.nativeServers[it.key()] = ServerConfig::fromJson(it.key(), it.value(), true);
        }
    }
    return cfg;
}

Config Config::load(const std::string& pathStr) {
    Config cfg = fromJson(readJsonFile(pathStr));
    cfg.configFiles.push_back(pathStr);
    return cfg;
}

Config Config::merge(const std::vector<std::string>& paths) {
    nlohmann::json settings = nlohmann::json::object();
    nlohmann::json servers = nlohmann::json::object();
    nlohmann::json natives = nlohmann::json::object();
    std::vector<std::string> order;

    for (const auto& path : paths) {
        nlohmann::json j = readJsonFile(path);
        if (const auto* section = serversSection(j)) {
            if (!section->is_object()) {
                throw std::runtime_error("'mcpServers' must be an object in " + path);
            }
            for (auto it = section->begin(); it != section->end(); ++it) {
                if (!servers.contains(it.key())) order.push_back(it.key());
                servers[it.key()] = it.value();
            }
        }
        if (j.contains("nativeMCPServers") && j["nativeMCPServers"].is_object()) {
            for (auto it = j["nativeMCPServers"].begin(); it != j["nativeMCPServers"].end(); ++it) {
                natives[it.key()] = it.value();
            }
        }
        j.erase("mcpServers");
        j.erase("servers");
        j.erase("nativeMCPServers");
        settings.merge_patch(j);
    }

    Config cfg = fromJson(settings);
    for (const auto& name : order) {
        cfg.mcpServers.push_back(ServerConfig::fromJson(name, servers[name], false));
    }
    for (auto it = natives.begin(); it != natives.end(); ++it) {
        cfg.nativeServers[it.key()] = ServerConfig::fromJson(it.key(), it.value(), true);
    }
    cfg.configFiles = paths;
    return cfg;
}

std::string Config::defaultGlobalPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (std::filesystem::path(xdg) / "mcphub" / "servers.json").string();
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("Unable to determine user home directory");
    }
    return (std::filesystem::path(home) / ".config" / "mcphub" / "servers.json").string();
}

const Config::ServerConfig* Config::findServer(const std::string& name) const {
    for (const auto& server : mcpServers) {
        if (server.name == name) return &server;
    }
    return nullptr;
}

const Config::ServerConfig* Config::findNativeServer(const std::string& name) const {
    auto it = nativeServers.find(name);
    return it == nativeServers.end() ? nullptr : &it->second;
}
