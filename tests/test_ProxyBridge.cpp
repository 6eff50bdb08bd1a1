#include <gtest/gtest.h>
#include <sstream>
#include "proxy/ProxyBridge.h"
#include "control/ControlClient.h"
#include "mcp/MCPManager.h"

namespace {
std::shared_ptr<NativeServer> makeNotesServer() {
    NativeServerDef def;
    def.name = "my-notes";

    NativeTool add;
    add.descriptor.name = "add_note";
    add.handler = [](const ToolRequest& req, ToolResponse& res) {
        res.text("Added: " + req.params.value("text", "")).send();
    };
    def.tools.push_back(add);

    NativeTool fail;
    fail.descriptor.name = "fail_note";
    fail.handler = [](const ToolRequest&, ToolResponse& res) { res.error("Note store is read-only"); };
    def.tools.push_back(fail);

    NativeTool silent;
    silent.descriptor.name = "silent";
    silent.handler = [](const ToolRequest&, ToolResponse& res) { res.send(nlohmann::json::object()); };
    def.tools.push_back(silent);

    NativeResourceTemplate note;
    note.descriptor.uriTemplate = "notes://{id}";
    note.handler = [](const ResourceRequest& req, ResourceResponse& res) {
        res.text("note " + req.params.value("id", "")).send();
    };
    def.resourceTemplates.push_back(note);

    NativePrompt summary;
    summary.descriptor.name = "summarize";
    summary.descriptor.description = "Summarize notes";
    summary.handler = [](const PromptRequest&, PromptResponse& res) { res.text("Summarize my notes").send(); };
    def.prompts.push_back(summary);

    return std::make_shared<NativeServer>(std::move(def));
}

std::shared_ptr<NativeServer> makeReplyServer(const std::string& name,
                                              const std::vector<std::pair<std::string, std::string>>& tools) {
    NativeServerDef def;
    def.name = name;
    for (const auto& [toolName, reply] : tools) {
        NativeTool tool;
        tool.descriptor.name = toolName;
        tool.handler = [reply](const ToolRequest&, ToolResponse& res) { res.text(reply).send(); };
        def.tools.push_back(tool);
    }
    return std::make_shared<NativeServer>(std::move(def));
}

nlohmann::json request(int id, const std::string& method, const nlohmann::json& params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}
} // namespace

class ProxyBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager = std::make_unique<MCPManager>(std::make_shared<ApprovalEngine>(true), std::chrono::milliseconds(2000));
        manager->addNativeServer(makeNotesServer());
        connection = std::make_unique<LocalHubConnection>(*manager);
        bridge = std::make_unique<ProxyBridge>(*connection);
    }

    void TearDown() override {
        bridge.reset();
        connection.reset();
        manager.reset();
    }

    std::unique_ptr<MCPManager> manager;
    std::unique_ptr<LocalHubConnection> connection;
    std::unique_ptr<ProxyBridge> bridge;
};

TEST_F(ProxyBridgeTest, InitializeEchoesProtocolVersion) {
    nlohmann::json response = bridge->handleMessage(request(1, "initialize", {{"protocolVersion", "2025-03-26"}}));
    EXPECT_EQ(response["id"], 1);
    EXPECT_EQ(response["result"]["protocolVersion"], "2025-03-26");
    EXPECT_EQ(response["result"]["serverInfo"]["name"], "mcphub-proxy");
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

TEST_F(ProxyBridgeTest, ToolsAreNamespaced) {
    nlohmann::json response = bridge->handleMessage(request(2, "tools/list"));
    std::vector<std::string> names;
    for (const auto& tool : response["result"]["tools"]) names.push_back(tool["name"].get<std::string>());
    EXPECT_EQ(names, (std::vector<std::string>{"my_notes__add_note", "my_notes__fail_note", "my_notes__silent"}));
}

TEST_F(ProxyBridgeTest, ToolCallRoutesThroughHub) {
    nlohmann::json response = bridge->handleMessage(
        request(3, "tools/call", {{"name", "my_notes__add_note"}, {"arguments", {{"text", "milk"}}}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_EQ(response["result"]["content"][0]["text"], "Added: milk");
    EXPECT_FALSE(response["result"].contains("isError"));
}

TEST_F(ProxyBridgeTest, ToolErrorResultKeepsIsError) {
    nlohmann::json response = bridge->handleMessage(request(4, "tools/call", {{"name", "my_notes__fail_note"}}));
    ASSERT_TRUE(response.contains("result"));
    EXPECT_TRUE(response["result"].value("isError", false));
    EXPECT_EQ(response["result"]["content"][0]["text"], "Note store is read-only");
}

TEST_F(ProxyBridgeTest, EmptyToolResultIsAnError) {
    nlohmann::json response = bridge->handleMessage(request(5, "tools/call", {{"name", "my_notes__silent"}}));
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["message"], "Tool returned no result");
}

TEST_F(ProxyBridgeTest, RemovedToolDisappearsFromNextListing) {
    ASSERT_TRUE(manager->removeTool("my-notes", "fail_note"));
    nlohmann::json response = bridge->handleMessage(request(6, "tools/list"));
    for (const auto& tool : response["result"]["tools"]) {
        EXPECT_NE(tool["name"], "my_notes__fail_note");
    }
    EXPECT_EQ(response["result"]["tools"].size(), 2u);
}

TEST_F(ProxyBridgeTest, HubErrorsPassThroughVerbatim) {
    manager->stopServer("my-notes");
    nlohmann::json response = bridge->handleMessage(request(7, "tools/call", {{"name", "my_notes__add_note"}}));
    ASSERT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], JsonRpc::INTERNAL_ERROR);
    EXPECT_EQ(response["error"]["message"], "Server 'my-notes' is not connected (status: disconnected)");
    EXPECT_EQ(response["error"]["data"]["code"], "NOT_CONNECTED");
}

TEST_F(ProxyBridgeTest, MalformedNamesAreInvalidParams) {
    nlohmann::json tool = bridge->handleMessage(request(8, "tools/call", {{"name", "no-separator"}}));
    EXPECT_EQ(tool["error"]["code"], JsonRpc::INVALID_PARAMS);
    EXPECT_EQ(tool["error"]["message"], "Invalid tool name: no-separator");

    nlohmann::json resource = bridge->handleMessage(request(9, "resources/read", {{"uri", "plain"}}));
    EXPECT_EQ(resource["error"]["message"], "Invalid resource URI: plain");

    nlohmann::json prompt = bridge->handleMessage(request(10, "prompts/get", {{"name", "x"}}));
    EXPECT_EQ(prompt["error"]["message"], "Invalid prompt name: x");
}

TEST_F(ProxyBridgeTest, ResourceTemplateReadIsUnwrapped) {
    nlohmann::json templates = bridge->handleMessage(request(11, "resources/templates/list"));
    ASSERT_EQ(templates["result"]["resourceTemplates"].size(), 1u);
    EXPECT_EQ(templates["result"]["resourceTemplates"][0]["uriTemplate"], "my_notes://notes://{id}");

    nlohmann::json response = bridge->handleMessage(request(12, "resources/read", {{"uri", "my_notes://notes://7"}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_EQ(response["result"]["contents"][0]["text"], "note 7");
}

TEST_F(ProxyBridgeTest, PromptsListAndGet) {
    nlohmann::json list = bridge->handleMessage(request(13, "prompts/list"));
    ASSERT_EQ(list["result"]["prompts"].size(), 1u);
    EXPECT_EQ(list["result"]["prompts"][0]["name"], "my_notes__summarize");

    nlohmann::json response = bridge->handleMessage(request(14, "prompts/get", {{"name", "my_notes__summarize"}}));
    ASSERT_TRUE(response.contains("result"));
    EXPECT_EQ(response["result"]["messages"][0]["content"]["text"], "Summarize my notes");
}

TEST_F(ProxyBridgeTest, UnknownMethodAndNotifications) {
    nlohmann::json response = bridge->handleMessage(request(15, "sampling/createMessage"));
    EXPECT_EQ(response["error"]["code"], JsonRpc::METHOD_NOT_FOUND);
    EXPECT_EQ(response["error"]["message"], "Method not found: sampling/createMessage");

    nlohmann::json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    EXPECT_TRUE(bridge->handleMessage(notification).is_null());
}

TEST_F(ProxyBridgeTest, RunServesLineDelimitedMessages) {
    std::istringstream in(request(1, "ping").dump() + "\n" + "{broken\n" + "\n" +
                          nlohmann::json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump() + "\n" +
                          request(2, "tools/list").dump() + "\n");
    std::ostringstream out;
    EXPECT_EQ(bridge->run(in, out), 0);

    std::istringstream lines(out.str());
    std::vector<nlohmann::json> responses;
    std::string line;
    while (std::getline(lines, line)) responses.push_back(nlohmann::json::parse(line));

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["error"]["code"], JsonRpc::PARSE_ERROR);
    EXPECT_TRUE(responses[1]["id"].is_null());
    EXPECT_EQ(responses[2]["id"], 2);
}

TEST_F(ProxyBridgeTest, ResultWithoutContentIsAnError) {
    NativeTool odd;
    odd.descriptor.name = "odd";
    odd.handler = [](const ToolRequest&, ToolResponse& res) { res.send({{"foo", 1}}); };
    ASSERT_TRUE(manager->addTool("my-notes", odd));

    nlohmann::json response = bridge->handleMessage(request(16, "tools/call", {{"name", "my_notes__odd"}}));
    ASSERT_TRUE(response.contains("error")) << response.dump();
    EXPECT_EQ(response["error"]["message"], "Tool returned no result");
}

TEST_F(ProxyBridgeTest, ServerNamesCollidingAfterSanitizingAreRejected) {
    manager->addNativeServer(makeReplyServer("a-b", {{"run", "from a-b"}}));
    try {
        manager->addNativeServer(makeReplyServer("a_b", {{"run", "from a_b"}}));
        FAIL() << "second server should be refused";
    } catch (const HubError& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::ConfigConflict);
    }
    auto owner = manager->getServer("a_b");
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->name, "a-b");

    nlohmann::json list = bridge->handleMessage(request(17, "tools/list"));
    int runs = 0;
    for (const auto& tool : list["result"]["tools"]) {
        if (tool["name"] == "a_b__run") runs++;
    }
    EXPECT_EQ(runs, 1);

    nlohmann::json response = bridge->handleMessage(request(18, "tools/call", {{"name", "a_b__run"}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_EQ(response["result"]["content"][0]["text"], "from a-b");
}

TEST_F(ProxyBridgeTest, ToolNamesCollidingAfterSanitizingKeepFirstDeclared) {
    manager->addNativeServer(makeReplyServer("w", {{"get-x", "dash"}, {"get_x", "underscore"}}));

    nlohmann::json list = bridge->handleMessage(request(19, "tools/list"));
    int matches = 0;
    for (const auto& tool : list["result"]["tools"]) {
        if (tool["name"] == "w__get_x") matches++;
    }
    EXPECT_EQ(matches, 1);

    nlohmann::json response = bridge->handleMessage(request(20, "tools/call", {{"name", "w__get_x"}}));
    ASSERT_TRUE(response.contains("result")) << response.dump();
    EXPECT_EQ(response["result"]["content"][0]["text"], "dash");

    // The router agrees with the listing for raw names too
    CallOutcome direct = manager->callTool("w", "get_x", nlohmann::json::object());
    ASSERT_TRUE(direct.ok());
    EXPECT_EQ(direct.result["content"][0]["text"], "dash");
}
