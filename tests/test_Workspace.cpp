#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <unistd.h>
#include "workspace/Workspace.h"

namespace fs = std::filesystem;

namespace {
// Far above any pid_max, so kill(pid, 0) reports ESRCH
const std::int64_t DEAD_PID = 2147483000;

void touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "{}";
}

WorkspaceCacheEntry entryFor(int port, std::int64_t pid, const std::string& cwd,
                             std::vector<std::string> configFiles) {
    WorkspaceCacheEntry entry;
    entry.port = port;
    entry.pid = pid;
    entry.cwd = cwd;
    entry.configFiles = std::move(configFiles);
    entry.startTime = 1767225600;
    return entry;
}
} // namespace

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("mcphub_workspace_test_" + std::to_string(now));
        fs::create_directories(testDir);
        registry = std::make_unique<WorkspaceRegistry>((testDir / "state" / "workspaces.json").string());
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    fs::path testDir;
    std::unique_ptr<WorkspaceRegistry> registry;
};

TEST_F(WorkspaceTest, PortIsDeterministicAndInRange) {
    EXPECT_EQ(WorkspaceRegistry::generateWorkspacePort("a", 40000, 41000), 40097);

    int first = WorkspaceRegistry::generateWorkspacePort("/home/dev/project", 40000, 41000);
    int second = WorkspaceRegistry::generateWorkspacePort("/home/dev/project", 40000, 41000);
    EXPECT_EQ(first, second);
    EXPECT_GE(first, 40000);
    EXPECT_LE(first, 41000);

    for (const std::string path : {"/", "/srv/a-very-long-workspace-path/with/many/segments", "C:\\work"}) {
        int port = WorkspaceRegistry::generateWorkspacePort(path, 50000, 50009);
        EXPECT_GE(port, 50000) << path;
        EXPECT_LE(port, 50009) << path;
    }
}

TEST_F(WorkspaceTest, AvailablePortStaysInsideRange) {
    auto port = WorkspaceRegistry::findAvailablePort(45000, 45999, std::string("/tmp/project"));
    ASSERT_TRUE(port.has_value());
    EXPECT_GE(*port, 45000);
    EXPECT_LE(*port, 45999);

    auto randomPort = WorkspaceRegistry::findAvailablePort(45000, 45999, std::nullopt);
    ASSERT_TRUE(randomPort.has_value());
    EXPECT_GE(*randomPort, 45000);
    EXPECT_LE(*randomPort, 45999);
}

TEST_F(WorkspaceTest, ProcessLiveness) {
    EXPECT_TRUE(WorkspaceRegistry::isProcessRunning(::getpid()));
    EXPECT_FALSE(WorkspaceRegistry::isProcessRunning(DEAD_PID));
    EXPECT_FALSE(WorkspaceRegistry::isProcessRunning(0));
}

TEST_F(WorkspaceTest, MissingOrCorruptCacheReadsEmpty) {
    EXPECT_TRUE(registry->readCache().empty());

    fs::create_directories(fs::path(registry->getCachePath()).parent_path());
    std::ofstream(registry->getCachePath()) << "   \n";
    EXPECT_TRUE(registry->readCache().empty());

    std::ofstream(registry->getCachePath()) << "{not json";
    EXPECT_TRUE(registry->readCache().empty());
}

TEST_F(WorkspaceTest, RegisterAndUnregister) {
    registry->registerHub(entryFor(40123, ::getpid(), "/work/app", {"/work/app/.mcphub/servers.json"}));

    auto cache = registry->readCache();
    ASSERT_EQ(cache.count("40123"), 1u);
    EXPECT_EQ(cache["40123"].cwd, "/work/app");
    EXPECT_EQ(cache["40123"].startTime, 1767225600);

    auto info = registry->getHubInfo(40123);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, ::getpid());

    registry->unregisterHub(40123);
    EXPECT_TRUE(registry->readCache().empty());
    EXPECT_FALSE(registry->getHubInfo(40123).has_value());
}

TEST_F(WorkspaceTest, CacheUsesSharedKeyNames) {
    registry->registerHub(entryFor(40200, ::getpid(), "/work/app", {"/a.json"}));

    std::ifstream file(registry->getCachePath());
    nlohmann::json raw = nlohmann::json::parse(file);
    ASSERT_TRUE(raw.contains("40200"));
    const auto& entry = raw["40200"];
    EXPECT_EQ(entry["port"], 40200);
    EXPECT_EQ(entry["cwd"], "/work/app");
    EXPECT_EQ(entry["config_files"], nlohmann::json::array({"/a.json"}));
    EXPECT_EQ(entry["startTime"], 1767225600);
    EXPECT_TRUE(entry.contains("pid"));
}

TEST_F(WorkspaceTest, LegacyStringStartTimeIsTolerated) {
    WorkspaceCacheEntry entry = WorkspaceCacheEntry::fromJson(
        {{"port", 40300}, {"pid", 42}, {"cwd", "/w"}, {"config_files", nlohmann::json::array()},
         {"startTime", "2026-01-01T00:00:00Z"}});
    EXPECT_EQ(entry.port, 40300);
    EXPECT_EQ(entry.startTime, 0);
}

TEST_F(WorkspaceTest, DeadHubsAreIgnored) {
    registry->registerHub(entryFor(40300, DEAD_PID, "/work/app", {"/a.json"}));

    EXPECT_FALSE(registry->getHubInfo(40300).has_value());
    EXPECT_FALSE(registry->findMatchingHub("/work/app", {"/a.json"}).has_value());
    EXPECT_FALSE(registry->findHubForWorkspace("/work/app").has_value());
}

TEST_F(WorkspaceTest, MatchingIsOrderSensitive) {
    registry->registerHub(entryFor(40400, ::getpid(), "/work/app", {"/global.json", "/work/app/.mcphub/servers.json"}));

    EXPECT_TRUE(registry->findMatchingHub("/work/app", {"/global.json", "/work/app/.mcphub/servers.json"}).has_value());
    EXPECT_FALSE(registry->findMatchingHub("/work/app", {"/work/app/.mcphub/servers.json", "/global.json"}).has_value());
    EXPECT_FALSE(registry->findMatchingHub("/work/other", {"/global.json", "/work/app/.mcphub/servers.json"}).has_value());

    auto any = registry->findHubForWorkspace("/work/app");
    ASSERT_TRUE(any.has_value());
    EXPECT_EQ(any->port, 40400);
}

TEST_F(WorkspaceTest, DiscoveryWalksUpward) {
    fs::path root = testDir / "project";
    fs::path nested = root / "src" / "deep";
    fs::create_directories(nested);
    touch(root / ".vscode" / "mcp.json");

    auto match = WorkspaceRegistry::findWorkspaceConfig({".mcphub/servers.json", ".vscode/mcp.json"}, nested.string());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(fs::path(match->rootDir), root);
    EXPECT_EQ(fs::path(match->configFile), root / ".vscode" / "mcp.json");
}

TEST_F(WorkspaceTest, DiscoveryPrefersNearestThenPatternOrder) {
    fs::path root = testDir / "project";
    fs::path package = root / "packages" / "web";
    fs::create_directories(package);
    touch(root / ".mcphub" / "servers.json");
    touch(package / ".cursor" / "mcp.json");
    touch(package / ".vscode" / "mcp.json");

    auto match = WorkspaceRegistry::findWorkspaceConfig({".mcphub/servers.json", ".vscode/mcp.json", ".cursor/mcp.json"},
                                                        package.string());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(fs::path(match->rootDir), package);
    EXPECT_EQ(fs::path(match->configFile), package / ".vscode" / "mcp.json");
}

TEST_F(WorkspaceTest, DiscoveryWithoutConfigFindsNothing) {
    fs::path lonely = testDir / "lonely";
    fs::create_directories(lonely);
    auto match = WorkspaceRegistry::findWorkspaceConfig({"definitely-not-present-7f3a.json"}, lonely.string());
    EXPECT_FALSE(match.has_value());
}
