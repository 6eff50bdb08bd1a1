#include "mcp/Capabilities.h"

namespace {
void putIfNotEmpty(nlohmann::json& j, const char* key, const std::string& value) {
    if (!value.empty()) j[key] = value;
}
} // namespace

std::vector<PromptArgument> PromptDescriptor::resolveArguments() const {
    if (argumentsProvider) {
        return argumentsProvider();
    }
    return arguments;
}

const char* providerStatusName(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::Connected: return "connected";
        case ProviderStatus::Disconnected: return "disconnected";
        case ProviderStatus::Disabled: return "disabled";
        case ProviderStatus::Connecting: return "connecting";
        case ProviderStatus::Error: return "error";
    }
    return "disconnected";
}

ProviderStatus providerStatusFromName(const std::string& name) {
    if (name == "connected") return ProviderStatus::Connected;
    if (name == "disabled") return ProviderStatus::Disabled;
    if (name == "connecting") return ProviderStatus::Connecting;
    if (name == "error") return ProviderStatus::Error;
    return ProviderStatus::Disconnected;
}

void to_json(nlohmann::json& j, const ToolDescriptor& tool) {
    j = {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.inputSchema}};
    if (tool.autoApproved) j["autoApprove"] = true;
}

void from_json(const nlohmann::json& j, ToolDescriptor& tool) {
    tool.name = j.value("name", "");
    tool.description = j.value("description", "");
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        tool.inputSchema = j["inputSchema"];
    }
    tool.autoApproved = j.value("autoApprove", false);
}

void to_json(nlohmann::json& j, const ResourceDescriptor& resource) {
    j = {{"uri", resource.uri}, {"name", resource.name.empty() ? resource.uri : resource.name}};
    putIfNotEmpty(j, "description", resource.description);
    putIfNotEmpty(j, "mimeType", resource.mimeType);
}

void from_json(const nlohmann::json& j, ResourceDescriptor& resource) {
    resource.uri = j.value("uri", "");
    resource.name = j.value("name", "");
    resource.description = j.value("description", "");
    resource.mimeType = j.value("mimeType", "");
}

void to_json(nlohmann::json& j, const ResourceTemplateDescriptor& resourceTemplate) {
    j = {{"uriTemplate", resourceTemplate.uriTemplate},
         {"name", resourceTemplate.name.empty() ? resourceTemplate.uriTemplate : resourceTemplate.name}};
    putIfNotEmpty(j, "description", resourceTemplate.description);
    putIfNotEmpty(j, "mimeType", resourceTemplate.mimeType);
}

void from_json(const nlohmann::json& j, ResourceTemplateDescriptor& resourceTemplate) {
    resourceTemplate.uriTemplate = j.value("uriTemplate", "");
    resourceTemplate.name = j.value("name", "");
    resourceTemplate.description = j.value("description", "");
    resourceTemplate.mimeType = j.value("mimeType", "");
}

void to_json(nlohmann::json& j, const PromptArgument& argument) {
    j = {{"name", argument.name}, {"required", argument.required}};
    putIfNotEmpty(j, "description", argument.description);
}

void from_json(const nlohmann::json& j, PromptArgument& argument) {
    argument.name = j.value("name", "");
    argument.description = j.value("description", "");
    argument.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptDescriptor& prompt) {
    j = {{"name", prompt.name}, {"arguments", prompt.resolveArguments()}};
    putIfNotEmpty(j, "description", prompt.description);
}

void from_json(const nlohmann::json& j, PromptDescriptor& prompt) {
    prompt.name = j.value("name", "");
    prompt.description = j.value("description", "");
    prompt.arguments.clear();
    if (j.contains("arguments") && j["arguments"].is_array()) {
        prompt.arguments = j["arguments"].get<std::vector<PromptArgument>>();
    }
}

void to_json(nlohmann::json& j, const Capabilities& capabilities) {
    j = {{"tools", capabilities.tools},
         {"resources", capabilities.resources},
         {"resourceTemplates", capabilities.resourceTemplates},
         {"prompts", capabilities.prompts}};
}

void from_json(const nlohmann::json& j, Capabilities& capabilities) {
    auto listOf = [&j](const char* key) {
        return j.contains(key) && j[key].is_array() ? j[key] : nlohmann::json::array();
    };
    capabilities.tools = listOf("tools").get<std::vector<ToolDescriptor>>();
    capabilities.resources = listOf("resources").get<std::vector<ResourceDescriptor>>();
    capabilities.resourceTemplates = listOf("resourceTemplates").get<std::vector<ResourceTemplateDescriptor>>();
    capabilities.prompts = listOf("prompts").get<std::vector<PromptDescriptor>>();
}

void to_json(nlohmann::json& j, const ProviderInfo& info) {
    j = {{"name", info.name},
         {"displayName", info.displayName.empty() ? info.name : info.displayName},
         {"description", info.description},
         {"transportType", info.transportType},
         {"status", providerStatusName(info.status)},
         {"capabilities", info.capabilities},
         {"lastStarted", info.lastStarted}};
    if (info.error) j["error"] = *info.error;
}

void from_json(const nlohmann::json& j, ProviderInfo& info) {
    info.name = j.value("name", "");
    info.displayName = j.value("displayName", info.name);
    info.description = j.value("description", "");
    info.transportType = j.value("transportType", "");
    info.status = providerStatusFromName(j.value("status", "disconnected"));
    if (j.contains("capabilities") && j["capabilities"].is_object()) {
        info.capabilities = j["capabilities"].get<Capabilities>();
    }
    info.lastStarted = j.value("lastStarted", static_cast<std::int64_t>(0));
    if (j.contains("error") && j["error"].is_string()) {
        info.error = j["error"].get<std::string>();
    }
}
