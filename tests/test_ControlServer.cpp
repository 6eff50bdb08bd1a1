#include <gtest/gtest.h>
#include "control/ControlServer.h"
#include "control/ControlClient.h"
#include "mcp/MCPManager.h"
#include "workspace/Workspace.h"

namespace {
std::shared_ptr<NativeServer> makeClockServer() {
    NativeServerDef def;
    def.name = "clock";

    NativeTool now;
    now.descriptor.name = "now";
    now.handler = [](const ToolRequest& req, ToolResponse& res) {
        res.text("12:00 " + req.params.value("zone", "UTC")).send();
    };
    def.tools.push_back(now);

    NativeResource zones;
    zones.descriptor.uri = "clock://zones";
    zones.handler = [](const ResourceRequest&, ResourceResponse& res) { res.text("UTC,CET").send(); };
    def.resources.push_back(zones);

    NativePrompt greet;
    greet.descriptor.name = "greet";
    greet.handler = [](const PromptRequest&, PromptResponse& res) { res.text("Good morning").send(); };
    def.prompts.push_back(greet);

    return std::make_shared<NativeServer>(std::move(def));
}
} // namespace

TEST(ControlClientTest, OutcomeFromBody) {
    CallOutcome ok = ControlClient::outcomeFromBody(200, R"({"content":[{"type":"text","text":"hi"}]})");
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.result["content"][0]["text"], "hi");

    CallOutcome denied = ControlClient::outcomeFromBody(403, R"({"error":"nope","code":"APPROVAL_DENIED"})");
    ASSERT_FALSE(denied.ok());
    EXPECT_EQ(denied.error->getCode(), ErrorCode::ApprovalDenied);
    EXPECT_STREQ(denied.error->what(), "nope");

    CallOutcome unknownCode = ControlClient::outcomeFromBody(500, R"({"error":"odd","code":"SOMETHING_NEW"})");
    ASSERT_FALSE(unknownCode.ok());
    EXPECT_EQ(unknownCode.error->getCode(), ErrorCode::Handler);

    CallOutcome garbage = ControlClient::outcomeFromBody(502, "<html>bad gateway</html>");
    ASSERT_FALSE(garbage.ok());
    EXPECT_EQ(garbage.error->getCode(), ErrorCode::Transport);

    CallOutcome status = ControlClient::outcomeFromBody(500, "{}");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error->getCode(), ErrorCode::Transport);
}

TEST(ControlClientTest, HttpStatusMapping) {
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::InvalidParams), 400);
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::ApprovalDenied), 403);
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::NotFound), 404);
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::NotConnected), 409);
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::ApprovalTimeout), 504);
    EXPECT_EQ(ControlServer::httpStatusFor(ErrorCode::Handler), 500);
}

TEST(ControlClientTest, UnreachableHubIsATransportError) {
    auto port = WorkspaceRegistry::findAvailablePort(46000, 46999, std::nullopt);
    ASSERT_TRUE(port.has_value());
    ControlClient client("127.0.0.1", *port, std::chrono::milliseconds(500), std::chrono::milliseconds(500));

    CallOutcome outcome = client.callTool("clock", "now", nlohmann::json::object(), CallerContext());
    ASSERT_FALSE(outcome.ok());
    EXPECT_TRUE(outcome.error->getCode() == ErrorCode::Transport ||
                outcome.error->getCode() == ErrorCode::TransportTimeout);
    EXPECT_THROW(client.getAllServers(), HubError);
}

// ---------------------------------------------------------------------------

class ControlServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager = std::make_unique<MCPManager>(std::make_shared<ApprovalEngine>(true), std::chrono::milliseconds(2000));
        manager->addNativeServer(makeClockServer());
        server = std::make_unique<ControlServer>(*manager);

        auto available = WorkspaceRegistry::findAvailablePort(47000, 47999, std::nullopt);
        ASSERT_TRUE(available.has_value());
        port = *available;
        ASSERT_TRUE(server->start("127.0.0.1", port));
        client = std::make_unique<ControlClient>("127.0.0.1", port);
    }

    void TearDown() override {
        client.reset();
        if (server) server->stop();
        server.reset();
        manager.reset();
    }

    int port = 0;
    std::unique_ptr<MCPManager> manager;
    std::unique_ptr<ControlServer> server;
    std::unique_ptr<ControlClient> client;
};

TEST_F(ControlServerTest, HealthReportsPortAndServers) {
    server->setWorkspace("/work/app");
    nlohmann::json health = client->health();
    EXPECT_EQ(health["status"], "ok");
    EXPECT_EQ(health["port"], port);
    EXPECT_EQ(health["workspace"], "/work/app");
    EXPECT_EQ(health["servers"], 1);
}

TEST_F(ControlServerTest, ServersIncludeCapabilities) {
    nlohmann::json servers = client->getAllServers();
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0]["name"], "clock");
    EXPECT_EQ(servers[0]["status"], "connected");
    EXPECT_EQ(servers[0]["capabilities"]["tools"][0]["name"], "now");
}

TEST_F(ControlServerTest, CallsRoundTrip) {
    CallerContext caller;
    caller.type = "external";
    caller.source = "test";

    CallOutcome tool = client->callTool("clock", "now", {{"zone", "CET"}}, caller);
    ASSERT_TRUE(tool.ok()) << tool.error->what();
    EXPECT_EQ(tool.result["content"][0]["text"], "12:00 CET");

    CallOutcome resource = client->accessResource("clock", "clock://zones", caller);
    ASSERT_TRUE(resource.ok());
    EXPECT_EQ(resource.result["contents"][0]["text"], "UTC,CET");

    CallOutcome prompt = client->getPrompt("clock", "greet", nlohmann::json::object(), caller);
    ASSERT_TRUE(prompt.ok());
    EXPECT_EQ(prompt.result["messages"][0]["content"]["text"], "Good morning");
}

TEST_F(ControlServerTest, ErrorsKeepCodeAndMessage) {
    CallOutcome missing = client->callTool("calendar", "now", nlohmann::json::object(), CallerContext());
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->getCode(), ErrorCode::NotFound);
    EXPECT_STREQ(missing.error->what(), "Server 'calendar' not found");

    manager->stopServer("clock");
    CallOutcome stopped = client->callTool("clock", "now", nlohmann::json::object(), CallerContext());
    ASSERT_FALSE(stopped.ok());
    EXPECT_EQ(stopped.error->getCode(), ErrorCode::NotConnected);

    CallOutcome invalid = client->callTool("", "", nlohmann::json::object(), CallerContext());
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error->getCode(), ErrorCode::InvalidParams);
    EXPECT_STREQ(invalid.error->what(), "server_name is required\ntool_name is required");
}
