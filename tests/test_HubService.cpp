#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <chrono>
#include "core/HubService.h"
#include "mcp/MCPManager.h"

namespace fs = std::filesystem;

class HubServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("mcphub_service_test_" + std::to_string(now));
        projectDir = testDir / "project";
        fs::create_directories(projectDir / ".mcphub");
        fs::create_directories(projectDir / "src");

        globalFile = (testDir / "global.json").string();
        std::ofstream(globalFile) << R"({
            "workspace": {"port_range": {"min": 48000, "max": 48999}},
            "mcpServers": {"git": {"command": "git-mcp", "disabled": true}}
        })";
        std::ofstream(projectDir / ".mcphub" / "servers.json") << R"({
            "mcpServers": {"db": {"command": "db-mcp", "disabled": true}}
        })";
        cachePath = (testDir / "state" / "workspaces.json").string();
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    HubOptions optionsFor(const fs::path& startDir) const {
        HubOptions options;
        options.configPaths = {globalFile};
        options.workspaceDir = startDir.string();
        options.logLevel = LogLevel::ERROR;
        return options;
    }

    fs::path testDir;
    fs::path projectDir;
    std::string globalFile;
    std::string cachePath;
};

TEST_F(HubServiceTest, WorkspaceConfigIsMergedLast) {
    HubService service(optionsFor(projectDir / "src"), cachePath);
    service.configure();

    ASSERT_TRUE(service.getWorkspace().has_value());
    EXPECT_EQ(fs::path(service.getWorkspace()->rootDir), projectDir);
    ASSERT_EQ(service.getConfigFiles().size(), 2u);
    EXPECT_EQ(service.getConfigFiles()[0], globalFile);
    EXPECT_EQ(fs::path(service.getConfigFiles()[1]), projectDir / ".mcphub" / "servers.json");
    EXPECT_NE(service.getConfig().findServer("git"), nullptr);
    EXPECT_NE(service.getConfig().findServer("db"), nullptr);
}

TEST_F(HubServiceTest, NoWorkspaceUsesOnlyGivenFiles) {
    HubOptions options = optionsFor(projectDir);
    options.noWorkspace = true;
    HubService service(options, cachePath);
    service.configure();

    EXPECT_FALSE(service.getWorkspace().has_value());
    EXPECT_EQ(service.getConfigFiles(), (std::vector<std::string>{globalFile}));
    EXPECT_EQ(service.getConfig().findServer("db"), nullptr);
}

TEST_F(HubServiceTest, StartRegistersAndIsFoundAgain) {
    HubService service(optionsFor(projectDir), cachePath);
    service.configure();
    EXPECT_FALSE(service.findRunningHub().has_value());

    service.start();
    EXPECT_GE(service.getPort(), 48000);
    EXPECT_LE(service.getPort(), 48999);

    auto builtin = service.getManager().getServer("mcphub");
    ASSERT_TRUE(builtin.has_value());
    EXPECT_EQ(builtin->status, ProviderStatus::Connected);
    EXPECT_EQ(service.getManager().getServer("db")->status, ProviderStatus::Disabled);

    HubService second(optionsFor(projectDir / "src"), cachePath);
    second.configure();
    auto running = second.findRunningHub();
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->port, service.getPort());

    service.shutdown();
    EXPECT_FALSE(second.findRunningHub().has_value());
}
