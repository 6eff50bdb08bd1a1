#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <regex>
#include <nlohmann/json.hpp>
#include "mcp/Capabilities.h"

// Each `{name}` captures exactly one path segment
class UriTemplate {
public:
    explicit UriTemplate(const std::string& pattern);

    std::optional<std::map<std::string, std::string>> match(const std::string& uri) const;

    const std::string& getPattern() const { return pattern; }
    const std::vector<std::string>& getParamNames() const { return paramNames; }

private:
    std::string pattern;
    std::vector<std::string> paramNames;
    std::regex matcher;
};

struct ResourceMatch {
    std::string uri;
    // Set when the URI was resolved through a template
    std::optional<std::string> uriTemplate;
    std::map<std::string, std::string> params;
    std::string mimeType;

    nlohmann::json paramsJson() const;
};

// Exact URIs first, then templates in declaration order
std::optional<ResourceMatch> findMatchingResource(const Capabilities& capabilities, const std::string& uri);
