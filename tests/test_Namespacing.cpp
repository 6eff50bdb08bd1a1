#include <gtest/gtest.h>
#include "mcp/Namespacing.h"
#include "mcp/UriTemplate.h"

namespace {
ProviderInfo connectedProvider(const std::string& name, const std::vector<std::string>& toolNames) {
    ProviderInfo info;
    info.name = name;
    info.status = ProviderStatus::Connected;
    for (const auto& toolName : toolNames) {
        ToolDescriptor tool;
        tool.name = toolName;
        info.capabilities.tools.push_back(tool);
    }
    return info;
}
} // namespace

TEST(NamespacingTest, SanitizeReplacesAndCollapses) {
    EXPECT_EQ(Namespacing::sanitize("my-server"), "my_server");
    EXPECT_EQ(Namespacing::sanitize("a  b..c"), "a_b_c");
    EXPECT_EQ(Namespacing::sanitize("__lead__trail__"), "lead_trail");
    EXPECT_EQ(Namespacing::sanitize("---"), "unnamed");
    EXPECT_EQ(Namespacing::sanitize(""), "unnamed");
}

TEST(NamespacingTest, SanitizeIsIdempotent) {
    for (const std::string name : {"my-server", "a__b", "Weather API v2", "x"}) {
        std::string once = Namespacing::sanitize(name);
        EXPECT_EQ(Namespacing::sanitize(once), once) << name;
        EXPECT_EQ(once.find("__"), std::string::npos) << name;
    }
}

TEST(NamespacingTest, ComposedNameSplitsBackIntoSanitizedParts) {
    std::string composed = Namespacing::composeName("my-server", "get-weather");
    EXPECT_EQ(composed, "my_server__get_weather");

    auto parts = Namespacing::splitName(composed);
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "my_server");
    EXPECT_EQ(parts->second, "get_weather");
}

TEST(NamespacingTest, SplitNameRejectsMissingParts) {
    EXPECT_FALSE(Namespacing::splitName("no_separator").has_value());
    EXPECT_FALSE(Namespacing::splitName("__tool").has_value());
    EXPECT_FALSE(Namespacing::splitName("server__").has_value());
}

TEST(NamespacingTest, UriRoundTripKeepsOriginalUri) {
    std::string composed = Namespacing::composeUri("files", "file:///tmp/a.txt");
    EXPECT_EQ(composed, "files://file:///tmp/a.txt");

    auto parts = Namespacing::splitUri(composed);
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "files");
    EXPECT_EQ(parts->second, "file:///tmp/a.txt");

    EXPECT_FALSE(Namespacing::splitUri("plain-text").has_value());
}

TEST(NamespacingTest, AggregationSkipsCollidingNames) {
    std::vector<ProviderInfo> providers = {
        connectedProvider("my-server", {"run", "stop"}),
        connectedProvider("my server", {"run", "build"}),
    };
    AggregatedCapabilities caps = aggregateCapabilities(providers);

    std::vector<std::string> names;
    for (const auto& tool : caps.tools) names.push_back(tool["name"].get<std::string>());
    EXPECT_EQ(names, (std::vector<std::string>{"my_server__run", "my_server__stop", "my_server__build"}));

    ASSERT_EQ(caps.conflicts.size(), 1u);
    EXPECT_EQ(caps.conflicts[0].getCode(), ErrorCode::ConfigConflict);
}

TEST(NamespacingTest, AggregationIgnoresDisconnectedProviders) {
    ProviderInfo offline = connectedProvider("offline", {"tool"});
    offline.status = ProviderStatus::Disabled;
    AggregatedCapabilities caps = aggregateCapabilities({offline});
    EXPECT_TRUE(caps.tools.empty());
}

TEST(NamespacingTest, AggregatedResourcesArePrefixed) {
    ProviderInfo info = connectedProvider("weather", {});
    ResourceDescriptor resource;
    resource.uri = "weather://forecast/default";
    info.capabilities.resources.push_back(resource);
    ResourceTemplateDescriptor forecast;
    forecast.uriTemplate = "weather://forecast/{city}";
    info.capabilities.resourceTemplates.push_back(forecast);

    AggregatedCapabilities caps = aggregateCapabilities({info});
    ASSERT_EQ(caps.resources.size(), 1u);
    EXPECT_EQ(caps.resources[0]["uri"], "weather://weather://forecast/default");
    ASSERT_EQ(caps.resourceTemplates.size(), 1u);
    EXPECT_EQ(caps.resourceTemplates[0]["uriTemplate"], "weather://weather://forecast/{city}");
}

// ---------------------------------------------------------------------------

TEST(UriTemplateTest, PlaceholderCapturesOneSegment) {
    UriTemplate forecast("weather://forecast/{city}");
    auto params = forecast.match("weather://forecast/Tokyo");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ((*params)["city"], "Tokyo");

    EXPECT_FALSE(forecast.match("weather://forecast/Tokyo/hourly").has_value());
    EXPECT_FALSE(forecast.match("weather://forecast/").has_value());
}

TEST(UriTemplateTest, MatchIsAnchoredAndLiteral) {
    UriTemplate doc("docs://v1.0/{page}");
    EXPECT_TRUE(doc.match("docs://v1.0/intro").has_value());
    EXPECT_FALSE(doc.match("docs://v1x0/intro").has_value());
    EXPECT_FALSE(doc.match("prefix-docs://v1.0/intro").has_value());
}

TEST(UriTemplateTest, MultiplePlaceholders) {
    UriTemplate repo("repo://{owner}/{name}/readme");
    auto params = repo.match("repo://octo/hub/readme");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ((*params)["owner"], "octo");
    EXPECT_EQ((*params)["name"], "hub");
    EXPECT_EQ(repo.getParamNames().size(), 2u);
}

TEST(UriTemplateTest, FixedResourceWinsOverTemplate) {
    Capabilities caps;
    ResourceDescriptor fixed;
    fixed.uri = "weather://forecast/default";
    fixed.mimeType = "text/plain";
    caps.resources.push_back(fixed);
    ResourceTemplateDescriptor forecast;
    forecast.uriTemplate = "weather://forecast/{city}";
    forecast.mimeType = "application/json";
    caps.resourceTemplates.push_back(forecast);

    auto fixedMatch = findMatchingResource(caps, "weather://forecast/default");
    ASSERT_TRUE(fixedMatch.has_value());
    EXPECT_FALSE(fixedMatch->uriTemplate.has_value());
    EXPECT_EQ(fixedMatch->mimeType, "text/plain");

    auto templateMatch = findMatchingResource(caps, "weather://forecast/Tokyo");
    ASSERT_TRUE(templateMatch.has_value());
    ASSERT_TRUE(templateMatch->uriTemplate.has_value());
    EXPECT_EQ(*templateMatch->uriTemplate, "weather://forecast/{city}");
    EXPECT_EQ(templateMatch->paramsJson(), (nlohmann::json{{"city", "Tokyo"}}));

    EXPECT_FALSE(findMatchingResource(caps, "weather://alerts").has_value());
}

TEST(UriTemplateTest, FirstDeclaredTemplateWins) {
    Capabilities caps;
    ResourceTemplateDescriptor first;
    first.uriTemplate = "notes://{id}";
    ResourceTemplateDescriptor second;
    second.uriTemplate = "notes://{slug}";
    caps.resourceTemplates = {first, second};

    auto match = findMatchingResource(caps, "notes://42");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match->uriTemplate, "notes://{id}");
    EXPECT_EQ(match->params.count("id"), 1u);
}
