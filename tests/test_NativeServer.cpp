#include <gtest/gtest.h>
#include <thread>
#include <future>
#include "native/NativeServer.h"

namespace {
struct Captured {
    std::vector<CallOutcome> outcomes;
    std::mutex mtx;

    Completion completion() {
        return Completion([this](const CallOutcome& outcome) {
            std::lock_guard<std::mutex> lock(mtx);
            outcomes.push_back(outcome);
        });
    }
};

std::string ExtractText(const nlohmann::json& res) {
    if (res.contains("content") && res["content"].is_array() && !res["content"].empty()) {
        return res["content"][0].value("text", "");
    }
    return "";
}

NativeServerDef weatherDef() {
    NativeServerDef def;
    def.name = "weather";
    def.displayName = "Weather";

    NativeTool tool;
    tool.descriptor.name = "get_weather";
    tool.descriptor.description = "Current weather for a city";
    tool.handler = [](const ToolRequest& req, ToolResponse& res) {
        res.text("Sunny in " + req.params.value("city", "nowhere")).send();
    };
    def.tools.push_back(tool);

    NativeResource resource;
    resource.descriptor.uri = "weather://forecast/default";
    resource.descriptor.name = "Default forecast";
    resource.handler = [](const ResourceRequest& req, ResourceResponse& res) {
        res.text("default forecast for " + req.uri).send();
    };
    def.resources.push_back(resource);

    NativeResourceTemplate forecast;
    forecast.descriptor.uriTemplate = "weather://forecast/{city}";
    forecast.descriptor.name = "City forecast";
    forecast.descriptor.mimeType = "text/plain";
    forecast.handler = [](const ResourceRequest& req, ResourceResponse& res) {
        res.text("forecast for " + req.params.value("city", "")).send();
    };
    def.resourceTemplates.push_back(forecast);

    NativePrompt prompt;
    prompt.descriptor.name = "plan_trip";
    prompt.descriptor.arguments = {{"city", "Destination", true}};
    prompt.handler = [](const PromptRequest& req, PromptResponse& res) {
        res.system().text("You plan trips").user().text("Plan a trip to " + req.params.value("city", "")).send();
    };
    def.prompts.push_back(prompt);
    return def;
}
} // namespace

class NativeServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<NativeServer>(weatherDef());
        server->start();
    }

    std::unique_ptr<NativeServer> server;
    Captured captured;
};

TEST_F(NativeServerTest, ListsDeclaredCapabilities) {
    Capabilities caps = server->listCapabilities();
    ASSERT_EQ(caps.tools.size(), 1u);
    EXPECT_EQ(caps.tools[0].name, "get_weather");
    ASSERT_EQ(caps.resources.size(), 1u);
    ASSERT_EQ(caps.resourceTemplates.size(), 1u);
    ASSERT_EQ(caps.prompts.size(), 1u);
    EXPECT_EQ(server->getTransportType(), "native");
    EXPECT_EQ(server->getDisplayName(), "Weather");
}

TEST_F(NativeServerTest, ToolHandlerReceivesArguments) {
    server->callTool("get_weather", {{"city", "Oslo"}}, captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    ASSERT_TRUE(captured.outcomes[0].ok());
    EXPECT_EQ(ExtractText(captured.outcomes[0].result), "Sunny in Oslo");
}

TEST_F(NativeServerTest, SecondSendIsDropped) {
    NativeTool twice;
    twice.descriptor.name = "twice";
    twice.handler = [](const ToolRequest&, ToolResponse& res) {
        EXPECT_TRUE(res.text("first").send());
        EXPECT_FALSE(res.send(nlohmann::json{{"content", nlohmann::json::array()}}));
        EXPECT_FALSE(res.error("too late"));
    };
    server->addTool(twice);

    server->callTool("twice", nlohmann::json::object(), captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    EXPECT_EQ(ExtractText(captured.outcomes[0].result), "first");
}

TEST_F(NativeServerTest, HandlerExceptionBecomesErrorResult) {
    NativeTool broken;
    broken.descriptor.name = "broken";
    broken.handler = [](const ToolRequest&, ToolResponse&) { throw std::runtime_error("disk on fire"); };
    server->addTool(broken);

    server->callTool("broken", nlohmann::json::object(), captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    ASSERT_TRUE(captured.outcomes[0].ok());
    EXPECT_TRUE(captured.outcomes[0].result.value("isError", false));
    EXPECT_EQ(ExtractText(captured.outcomes[0].result), "disk on fire");
}

TEST_F(NativeServerTest, ErrorWithDetailsAddsSecondContentItem) {
    NativeTool failing;
    failing.descriptor.name = "failing";
    failing.handler = [](const ToolRequest&, ToolResponse& res) {
        res.error("Bad input", {{"field", "city"}});
    };
    server->addTool(failing);

    server->callTool("failing", nlohmann::json::object(), captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    const auto& content = captured.outcomes[0].result["content"];
    ASSERT_EQ(content.size(), 2u);
    EXPECT_EQ(content[0]["text"], "Bad input");
    EXPECT_EQ(content[1]["text"].get<std::string>().rfind("Details: ", 0), 0u);
}

TEST_F(NativeServerTest, HandlerMayFinishLaterFromAnotherThread) {
    std::thread worker;
    NativeTool slow;
    slow.descriptor.name = "slow";
    slow.handler = [&worker](const ToolRequest&, ToolResponse& res) {
        ToolResponse later = res;
        worker = std::thread([later]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            later.text("done").send();
        });
    };
    server->addTool(slow);

    auto promise = std::make_shared<std::promise<CallOutcome>>();
    auto future = promise->get_future();
    server->callTool("slow", nlohmann::json::object(),
                     Completion([promise](const CallOutcome& outcome) { promise->set_value(outcome); }));

    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(ExtractText(future.get().result), "done");
    worker.join();
}

TEST_F(NativeServerTest, UnknownToolFailsWithNotFound) {
    server->callTool("missing", nlohmann::json::object(), captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    ASSERT_FALSE(captured.outcomes[0].ok());
    EXPECT_EQ(captured.outcomes[0].error->getCode(), ErrorCode::NotFound);
}

TEST_F(NativeServerTest, StoppedServerRefusesCalls) {
    server->stop();
    server->callTool("get_weather", nlohmann::json::object(), captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    ASSERT_FALSE(captured.outcomes[0].ok());
    EXPECT_EQ(captured.outcomes[0].error->getCode(), ErrorCode::NotConnected);
}

TEST_F(NativeServerTest, TemplateHandlerReceivesCaptures) {
    ResourceMatch match;
    match.uri = "weather://forecast/Tokyo";
    match.uriTemplate = "weather://forecast/{city}";
    match.params["city"] = "Tokyo";

    server->readResource(match, captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    const auto& contents = captured.outcomes[0].result["contents"];
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0]["text"], "forecast for Tokyo");
    EXPECT_EQ(contents[0]["uri"], "weather://forecast/Tokyo");
}

TEST_F(NativeServerTest, PromptMessagesKeepRoleOrder) {
    server->getPrompt("plan_trip", {{"city", "Lima"}}, captured.completion());
    ASSERT_EQ(captured.outcomes.size(), 1u);
    const auto& messages = captured.outcomes[0].result["messages"];
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["role"], "system");
    EXPECT_EQ(messages[1]["role"], "user");
    EXPECT_EQ(messages[1]["content"]["text"], "Plan a trip to Lima");
}

TEST_F(NativeServerTest, AddReplacesAndRemoveDeletes) {
    NativeTool replacement;
    replacement.descriptor.name = "get_weather";
    replacement.descriptor.description = "v2";
    replacement.handler = [](const ToolRequest&, ToolResponse& res) { res.text("v2").send(); };
    server->addTool(replacement);

    Capabilities caps = server->listCapabilities();
    ASSERT_EQ(caps.tools.size(), 1u);
    EXPECT_EQ(caps.tools[0].description, "v2");

    EXPECT_TRUE(server->removeTool("get_weather"));
    EXPECT_FALSE(server->removeTool("get_weather"));
    EXPECT_TRUE(server->listCapabilities().tools.empty());
}
