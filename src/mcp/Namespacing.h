#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>
#include "mcp/Capabilities.h"
#include "core/HubErrors.h"

/**
 * @brief Composition rules for aggregated listings.
 *
 * Tools and prompts render as `provider__capability`, resources and
 * resource templates as `provider://original-uri`. Both parts of a tool
 * name are sanitized first, so the provider part can never contain a
 * separator and the first separator occurrence always splits exactly.
 */
class Namespacing {
public:
    static constexpr const char* TOOL_SEPARATOR = "__";
    static constexpr const char* RESOURCE_SEPARATOR = "://";

    // Non-alphanumerics become '_', runs of '_' collapse, edges are trimmed
    static std::string sanitize(const std::string& name);

    static std::string composeName(const std::string& provider, const std::string& capability);
    static std::optional<std::pair<std::string, std::string>> splitName(const std::string& namespaced);

    static std::string composeUri(const std::string& provider, const std::string& uri);
    static std::optional<std::pair<std::string, std::string>> splitUri(const std::string& namespaced);
};

struct AggregatedCapabilities {
    nlohmann::json tools = nlohmann::json::array();
    nlohmann::json resources = nlohmann::json::array();
    nlohmann::json resourceTemplates = nlohmann::json::array();
    nlohmann::json prompts = nlohmann::json::array();
    // One ConfigConflict per skipped capability
    std::vector<HubError> conflicts;
};

/**
 * @brief Flattens connected providers into namespaced MCP list items.
 *
 * Capabilities whose namespaced identifier was already produced by an
 * earlier provider are skipped and reported in `conflicts`.
 */
AggregatedCapabilities aggregateCapabilities(const std::vector<ProviderInfo>& providers);
