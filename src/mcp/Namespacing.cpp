#include "mcp/Namespacing.h"
#include "utils/Logger.h"
#include <cctype>
#include <cstring>
#include <set>

std::string Namespacing::sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        char mapped = std::isalnum(c) ? static_cast<char>(c) : '_';
        if (mapped == '_' && (out.empty() || out.back() == '_')) continue;
        out.push_back(mapped);
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    if (out.empty()) return "unnamed";
    return out;
}

std::string Namespacing::composeName(const std::string& provider, const std::string& capability) {
    return sanitize(provider) + TOOL_SEPARATOR + sanitize(capability);
}

std::optional<std::pair<std::string, std::string>> Namespacing::splitName(const std::string& namespaced) {
    auto pos = namespaced.find(TOOL_SEPARATOR);
    if (pos == std::string::npos || pos == 0) return std::nullopt;
    std::string capability = namespaced.substr(pos + std::strlen(TOOL_SEPARATOR));
    if (capability.empty()) return std::nullopt;
    return std::make_pair(namespaced.substr(0, pos), capability);
}

std::string Namespacing::composeUri(const std::string& provider, const std::string& uri) {
    return sanitize(provider) + RESOURCE_SEPARATOR + uri;
}

std::optional<std::pair<std::string, std::string>> Namespacing::splitUri(const std::string& namespaced) {
    auto pos = namespaced.find(RESOURCE_SEPARATOR);
    if (pos == std::string::npos || pos == 0) return std::nullopt;
    std::string uri = namespaced.substr(pos + std::strlen(RESOURCE_SEPARATOR));
    if (uri.empty()) return std::nullopt;
    return std::make_pair(namespaced.substr(0, pos), uri);
}

AggregatedCapabilities aggregateCapabilities(const std::vector<ProviderInfo>& providers) {
    AggregatedCapabilities out;
    std::set<std::string> seenTools, seenResources, seenTemplates, seenPrompts;

    auto claim = [&out](std::set<std::string>& seen, const std::string& id,
                        const std::string& provider, const char* kind) {
        if (seen.insert(id).second) return true;
        HubError conflict(ErrorCode::ConfigConflict,
                          std::string("Skipping ") + kind + " '" + id + "' from server '" + provider +
                          "': name already provided by another server");
        Logger::getInstance().warn(conflict.what());
        out.conflicts.push_back(conflict);
        return false;
    };

    for (const auto& provider : providers) {
        if (provider.status != ProviderStatus::Connected) continue;
        const auto& caps = provider.capabilities;

        for (const auto& tool : caps.tools) {
            std::string id = Namespacing::composeName(provider.name, tool.name);
            if (!claim(seenTools, id, provider.name, "tool")) continue;
            nlohmann::json item = tool;
            item["name"] = id;
            item.erase("autoApprove");
            out.tools.push_back(item);
        }

        for (const auto& resource : caps.resources) {
            std::string id = Namespacing::composeUri(provider.name, resource.uri);
            if (!claim(seenResources, id, provider.name, "resource")) continue;
            nlohmann::json item = resource;
            item["uri"] = id;
            out.resources.push_back(item);
        }

        for (const auto& resourceTemplate : caps.resourceTemplates) {
            std::string id = Namespacing::composeUri(provider.name, resourceTemplate.uriTemplate);
            if (!claim(seenTemplates, id, provider.name, "resource template")) continue;
            nlohmann::json item = resourceTemplate;
            item["uriTemplate"] = id;
            out.resourceTemplates.push_back(item);
        }

        for (const auto& prompt : caps.prompts) {
            std::string id = Namespacing::composeName(provider.name, prompt.name);
            if (!claim(seenPrompts, id, provider.name, "prompt")) continue;
            nlohmann::json item = prompt;
            item["name"] = id;
            out.prompts.push_back(item);
        }
    }
    return out;
}
