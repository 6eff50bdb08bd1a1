#pragma once
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    // Filled from the provider's autoApprove config when listing
    bool autoApproved = false;
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
};

struct ResourceTemplateDescriptor {
    std::string uriTemplate;
    std::string name;
    std::string description;
    std::string mimeType;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
    // When set, replaces `arguments` and is evaluated every time the prompt is listed
    std::function<std::vector<PromptArgument>()> argumentsProvider;

    std::vector<PromptArgument> resolveArguments() const;
};

struct Capabilities {
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::vector<ResourceTemplateDescriptor> resourceTemplates;
    std::vector<PromptDescriptor> prompts;
};

enum class CapabilityKind {
    Tools,
    Resources,
    Prompts
};

enum class ProviderStatus {
    Connected,
    Disconnected,
    Disabled,
    Connecting,
    Error
};

const char* providerStatusName(ProviderStatus status);
ProviderStatus providerStatusFromName(const std::string& name);

struct ProviderInfo {
    std::string name;
    std::string displayName;
    std::string description;
    std::string transportType;  // "stdio" | "http" | "native"
    ProviderStatus status = ProviderStatus::Disconnected;
    Capabilities capabilities;
    std::int64_t lastStarted = 0;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const ToolDescriptor& tool);
void from_json(const nlohmann::json& j, ToolDescriptor& tool);
void to_json(nlohmann::json& j, const ResourceDescriptor& resource);
void from_json(const nlohmann::json& j, ResourceDescriptor& resource);
void to_json(nlohmann::json& j, const ResourceTemplateDescriptor& resourceTemplate);
void from_json(const nlohmann::json& j, ResourceTemplateDescriptor& resourceTemplate);
void to_json(nlohmann::json& j, const PromptArgument& argument);
void from_json(const nlohmann::json& j, PromptArgument& argument);
void to_json(nlohmann::json& j, const PromptDescriptor& prompt);
void from_json(const nlohmann::json& j, PromptDescriptor& prompt);
void to_json(nlohmann::json& j, const Capabilities& capabilities);
void from_json(const nlohmann::json& j, Capabilities& capabilities);
void to_json(nlohmann::json& j, const ProviderInfo& info);
void from_json(const nlohmann::json& j, ProviderInfo& info);
