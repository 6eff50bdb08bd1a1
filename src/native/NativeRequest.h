#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "mcp/Capabilities.h"

class NativeServer;

struct NativeRequest {
    // Owning provider; outlives any in-flight request
    NativeServer* server = nullptr;
    // Tool/prompt arguments or resource-template captures
    nlohmann::json params = nlohmann::json::object();
};

struct ToolRequest : NativeRequest {
    ToolDescriptor tool;
};

struct ResourceRequest : NativeRequest {
    std::string uri;
    std::optional<std::string> uriTemplate;
    std::string mimeType;
};

struct PromptRequest : NativeRequest {
    PromptDescriptor prompt;
};
