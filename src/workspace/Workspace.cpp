#include "workspace/Workspace.h"
#include "utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <random>
#include <chrono>
#include <cstdlib>
#include <cerrno>
#include <stdexcept>

#ifndef _WIN32
#include <signal.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#endif

namespace fs = std::filesystem;

nlohmann::json WorkspaceCacheEntry::toJson() const {
    return {{"port", port},
            {"pid", pid},
            {"cwd", cwd},
            {"config_files", configFiles},
            {"startTime", startTime}};
}

WorkspaceCacheEntry WorkspaceCacheEntry::fromJson(const nlohmann::json& j) {
    WorkspaceCacheEntry entry;
    if (j.contains("port") && j["port"].is_number_integer()) entry.port = j["port"].get<int>();
    if (j.contains("pid") && j["pid"].is_number_integer()) entry.pid = j["pid"].get<std::int64_t>();
    if (j.contains("cwd") && j["cwd"].is_string()) entry.cwd = j["cwd"].get<std::string>();
    if (j.contains("config_files") && j["config_files"].is_array()) {
        for (const auto& f : j["config_files"]) {
            if (f.is_string()) entry.configFiles.push_back(f.get<std::string>());
        }
    }
    // Older writers stored an ISO string; those entries keep startTime 0
    if (j.contains("startTime") && j["startTime"].is_number_integer()) {
        entry.startTime = j["startTime"].get<std::int64_t>();
    }
    return entry;
}

WorkspaceRegistry::WorkspaceRegistry(std::string cachePath) : cachePath(std::move(cachePath)) {}

std::optional<WorkspaceConfigMatch> WorkspaceRegistry::findWorkspaceConfig(const std::vector<std::string>& lookFor,
                                                                           const std::string& startDir) {
    std::error_code ec;
    fs::path current = fs::absolute(fs::u8path(startDir), ec).lexically_normal();
    if (ec) return std::nullopt;
    if (!current.has_filename() && current.has_parent_path() && current != current.root_path()) {
        current = current.parent_path();  // drop a trailing separator
    }

    // Stops below the filesystem root
    while (current != current.parent_path()) {
        for (const auto& pattern : lookFor) {
            fs::path candidate = current / fs::u8path(pattern);
            if (fs::exists(candidate, ec)) {
                return WorkspaceConfigMatch{current.u8string(), candidate.u8string()};
            }
        }
        current = current.parent_path();
    }
    return std::nullopt;
}

int WorkspaceRegistry::generateWorkspacePort(const std::string& workspacePath, int portMin, int portMax) {
    std::int64_t hash = 0;
    for (unsigned char c : workspacePath) {
        hash = (hash * 31 + c) % 2147483647;
    }
    std::int64_t rangeSize = static_cast<std::int64_t>(portMax) - portMin + 1;
    return portMin + static_cast<int>(hash % rangeSize);
}

#ifndef _WIN32
bool WorkspaceRegistry::isPortAvailable(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

bool WorkspaceRegistry::isProcessRunning(std::int64_t pid) {
    if (pid <= 0) return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    // The process exists but belongs to someone else
    return errno == EPERM;
}
#else
bool WorkspaceRegistry::isPortAvailable(int) { return false; }
bool WorkspaceRegistry::isProcessRunning(std::int64_t) { return false; }
#endif

std::optional<int> WorkspaceRegistry::findAvailablePort(int portMin, int portMax,
                                                        const std::optional<std::string>& workspacePath,
                                                        int maxAttempts) {
    int basePort;
    if (workspacePath) {
        basePort = generateWorkspacePort(*workspacePath, portMin, portMax);
    } else {
        std::mt19937 rng(static_cast<unsigned>(
            std::chrono::system_clock::now().time_since_epoch().count() ^ ::getpid()));
        std::uniform_int_distribution<int> dist(0, portMax - portMin);
        basePort = portMin + dist(rng);
    }

    for (int i = 0; i < maxAttempts; ++i) {
        int port = basePort + i;
        if (port > portMax) port = portMin + (port - portMax - 1);
        if (isPortAvailable(port)) return port;
    }
    return std::nullopt;
}

std::string WorkspaceRegistry::defaultCachePath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("Unable to determine user home directory");
    }

    fs::path legacy = fs::path(home) / ".mcp-hub" / "workspaces.json";
    std::error_code ec;
    if (fs::is_regular_file(legacy, ec)) return legacy.string();

    const char* stateHome = std::getenv("XDG_STATE_HOME");
    fs::path base = (stateHome && *stateHome) ? fs::path(stateHome) : fs::path(home) / ".local" / "state";
    return (base / "mcp-hub" / "workspaces.json").string();
}

nlohmann::json WorkspaceRegistry::readRaw() const {
    std::ifstream file(cachePath);
    if (!file.is_open()) return nlohmann::json::object();

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) return nlohmann::json::object();

    nlohmann::json cache = nlohmann::json::parse(content, nullptr, false);
    if (cache.is_discarded() || !cache.is_object()) {
        Logger::getInstance().warn("Failed to parse workspace cache: " + cachePath);
        return nlohmann::json::object();
    }
    return cache;
}

std::map<std::string, WorkspaceCacheEntry> WorkspaceRegistry::readCache() const {
    std::map<std::string, WorkspaceCacheEntry> entries;
    const nlohmann::json raw = readRaw();
    for (const auto& [port, value] : raw.items()) {
        if (value.is_object()) entries[port] = WorkspaceCacheEntry::fromJson(value);
    }
    return entries;
}

std::optional<WorkspaceCacheEntry> WorkspaceRegistry::getHubInfo(int port) const {
    auto cache = readCache();
    auto it = cache.find(std::to_string(port));
    if (it == cache.end() || !isProcessRunning(it->second.pid)) return std::nullopt;
    return it->second;
}

std::optional<WorkspaceCacheEntry> WorkspaceRegistry::findMatchingHub(
    const std::string& workspacePath, const std::vector<std::string>& configFiles) const {
    for (const auto& [port, entry] : readCache()) {
        if (entry.cwd != workspacePath) continue;
        if (entry.configFiles != configFiles) continue;
        if (isProcessRunning(entry.pid)) return entry;
    }
    return std::nullopt;
}

std::optional<WorkspaceCacheEntry> WorkspaceRegistry::findHubForWorkspace(const std::string& workspacePath) const {
    for (const auto& [port, entry] : readCache()) {
        if (entry.cwd == workspacePath && isProcessRunning(entry.pid)) return entry;
    }
    return std::nullopt;
}

void WorkspaceRegistry::writeCache(const nlohmann::json& cache) {
    fs::path target = fs::u8path(cachePath);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write workspace cache: " + tmp.string());
        }
        out << cache.dump(2);
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Cannot replace workspace cache " + cachePath);
    }
}

void WorkspaceRegistry::registerHub(const WorkspaceCacheEntry& entry) {
    nlohmann::json cache = readRaw();
    cache[std::to_string(entry.port)] = entry.toJson();
    writeCache(cache);
    Logger::getInstance().debug("Registered hub on port " + std::to_string(entry.port) + " for " + entry.cwd);
}

void WorkspaceRegistry::unregisterHub(int port) {
    nlohmann::json cache = readRaw();
    if (cache.erase(std::to_string(port)) == 0) return;
    writeCache(cache);
    Logger::getInstance().debug("Unregistered hub on port " + std::to_string(port));
}
