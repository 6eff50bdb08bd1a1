#include "mcp/UriTemplate.h"
#include "utils/Logger.h"

namespace {
std::string escapeRegex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}
} // namespace

UriTemplate::UriTemplate(const std::string& pattern) : pattern(pattern) {
    std::string expr = "^";
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        auto open = pattern.find('{', pos);
        auto close = open == std::string::npos ? std::string::npos : pattern.find('}', open);
        if (open == std::string::npos || close == std::string::npos) {
            expr += escapeRegex(pattern.substr(pos));
            break;
        }
        expr += escapeRegex(pattern.substr(pos, open - pos));
        paramNames.push_back(pattern.substr(open + 1, close - open - 1));
        expr += "([^/]+)";
        pos = close + 1;
    }
    expr += "$";
    matcher = std::regex(expr);
}

std::optional<std::map<std::string, std::string>> UriTemplate::match(const std::string& uri) const {
    std::smatch m;
    if (!std::regex_match(uri, m, matcher)) return std::nullopt;

    std::map<std::string, std::string> params;
    for (std::size_t i = 0; i < paramNames.size() && i + 1 < m.size(); ++i) {
        params[paramNames[i]] = m[i + 1].str();
    }
    return params;
}

nlohmann::json ResourceMatch::paramsJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : params) j[name] = value;
    return j;
}

std::optional<ResourceMatch> findMatchingResource(const Capabilities& capabilities, const std::string& uri) {
    for (const auto& resource : capabilities.resources) {
        if (resource.uri == uri) {
            ResourceMatch match;
            match.uri = uri;
            match.mimeType = resource.mimeType;
            return match;
        }
    }

    for (const auto& resourceTemplate : capabilities.resourceTemplates) {
        auto params = UriTemplate(resourceTemplate.uriTemplate).match(uri);
        if (!params) continue;
        Logger::getInstance().debug("Matched '" + uri + "' against template '" + resourceTemplate.uriTemplate + "'");
        ResourceMatch match;
        match.uri = uri;
        match.uriTemplate = resourceTemplate.uriTemplate;
        match.params = std::move(*params);
        match.mimeType = resourceTemplate.mimeType;
        return match;
    }
    return std::nullopt;
}
