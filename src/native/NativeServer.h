#pragma once
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <atomic>
#include "mcp/MCPClient.h"
#include "native/NativeRequest.h"
#include "native/NativeResponse.h"

using ToolHandler = std::function<void(const ToolRequest&, ToolResponse&)>;
using ResourceHandler = std::function<void(const ResourceRequest&, ResourceResponse&)>;
using PromptHandler = std::function<void(const PromptRequest&, PromptResponse&)>;

struct NativeTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

struct NativeResource {
    ResourceDescriptor descriptor;
    ResourceHandler handler;
};

struct NativeResourceTemplate {
    ResourceTemplateDescriptor descriptor;
    ResourceHandler handler;
};

struct NativePrompt {
    PromptDescriptor descriptor;
    PromptHandler handler;
};

struct NativeServerDef {
    std::string name;
    std::string displayName;
    std::string description;
    std::vector<NativeTool> tools;
    std::vector<NativeResource> resources;
    std::vector<NativeResourceTemplate> resourceTemplates;
    std::vector<NativePrompt> prompts;
};

class NativeServer : public IMCPClient {
public:
    explicit NativeServer(NativeServerDef def);

    const std::string& getName() const { return name; }
    const std::string& getDisplayName() const { return displayName; }
    const std::string& getDescription() const { return description; }

    std::string getTransportType() const override { return "native"; }
    void start() override { running = true; }
    void stop() override { running = false; }
    bool isRunning() const override { return running.load(); }

    Capabilities listCapabilities() override;

    void callTool(const std::string& toolName, const nlohmann::json& arguments, Completion done) override;
    void readResource(const ResourceMatch& match, Completion done) override;
    void getPrompt(const std::string& promptName, const nlohmann::json& arguments, Completion done) override;

    // Replaces an existing capability with the same name/uri
    void addTool(NativeTool tool);
    bool removeTool(const std::string& toolName);
    void addResource(NativeResource resource);
    bool removeResource(const std::string& uri);
    void addResourceTemplate(NativeResourceTemplate resourceTemplate);
    bool removeResourceTemplate(const std::string& uriTemplate);
    void addPrompt(NativePrompt prompt);
    bool removePrompt(const std::string& promptName);

private:
    std::string name;
    std::string displayName;
    std::string description;
    std::atomic<bool> running{false};

    mutable std::mutex mtx;
    std::vector<NativeTool> tools;
    std::vector<NativeResource> resources;
    std::vector<NativeResourceTemplate> resourceTemplates;
    std::vector<NativePrompt> prompts;
};
