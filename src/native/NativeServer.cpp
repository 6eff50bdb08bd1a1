#include "native/NativeServer.h"
#include "utils/Logger.h"
#include <algorithm>

namespace {
template <typename T, typename Pred>
bool eraseFirst(std::vector<T>& items, Pred pred) {
    auto it = std::find_if(items.begin(), items.end(), pred);
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

template <typename T, typename Pred>
void upsert(std::vector<T>& items, T item, Pred pred) {
    auto it = std::find_if(items.begin(), items.end(), pred);
    if (it != items.end()) {
        *it = std::move(item);
    } else {
        items.push_back(std::move(item));
    }
}
} // namespace

NativeServer::NativeServer(NativeServerDef def)
    : name(std::move(def.name)),
      displayName(def.displayName.empty() ? name : std::move(def.displayName)),
      description(std::move(def.description)),
      tools(std::move(def.tools)),
      resources(std::move(def.resources)),
      resourceTemplates(std::move(def.resourceTemplates)),
      prompts(std::move(def.prompts)) {}

Capabilities NativeServer::listCapabilities() {
    std::lock_guard<std::mutex> lock(mtx);
    Capabilities caps;
    for (const auto& t : tools) caps.tools.push_back(t.descriptor);
    for (const auto& r : resources) caps.resources.push_back(r.descriptor);
    for (const auto& r : resourceTemplates) caps.resourceTemplates.push_back(r.descriptor);
    for (const auto& p : prompts) caps.prompts.push_back(p.descriptor);
    return caps;
}

void NativeServer::callTool(const std::string& toolName, const nlohmann::json& arguments, Completion done) {
    Logger::getInstance().debug("Calling tool '" + toolName + "' on server '" + name + "'");
    if (!running) {
        done.fail(ErrorCode::NotConnected, "Server '" + name + "' is not connected (status: disabled)");
        return;
    }

    NativeTool tool;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = std::find_if(tools.begin(), tools.end(),
                               [&](const NativeTool& t) { return t.descriptor.name == toolName; });
        if (it == tools.end()) {
            Logger::getInstance().warn("Tool '" + toolName + "' not found");
            done.fail(ErrorCode::NotFound, "Tool '" + toolName + "' not found");
            return;
        }
        tool = *it;
    }
    if (!tool.handler) {
        done.fail(ErrorCode::Handler, "Tool has no handler");
        return;
    }

    ToolRequest req;
    req.server = this;
    req.params = arguments.is_object() ? arguments : nlohmann::json::object();
    req.tool = tool.descriptor;
    ToolResponse res(done);

    try {
        tool.handler(req, res);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Tool execution failed: ") + e.what());
        res.error(e.what());
    }
}

void NativeServer::readResource(const ResourceMatch& match, Completion done) {
    Logger::getInstance().debug("Accessing resource '" + match.uri + "' on server '" + name + "'");
    if (!running) {
        done.fail(ErrorCode::NotConnected, "Server '" + name + "' is not connected (status: disabled)");
        return;
    }

    ResourceHandler handler;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (match.uriTemplate) {
            for (const auto& t : resourceTemplates) {
                if (t.descriptor.uriTemplate == *match.uriTemplate) {
                    handler = t.handler;
                    found = true;
                    break;
                }
            }
        } else {
            for (const auto& r : resources) {
                if (r.descriptor.uri == match.uri) {
                    handler = r.handler;
                    found = true;
                    break;
                }
            }
        }
    }
    if (!found) {
        Logger::getInstance().warn("Resource '" + match.uri + "' not found");
        done.fail(ErrorCode::NotFound, "Resource '" + match.uri + "' not found");
        return;
    }
    if (!handler) {
        Logger::getInstance().warn("Resource '" + match.uri + "' has no handler");
        done.fail(ErrorCode::Handler, "Resource has no handler");
        return;
    }

    ResourceRequest req;
    req.server = this;
    req.params = match.paramsJson();
    req.uri = match.uri;
    req.uriTemplate = match.uriTemplate;
    req.mimeType = match.mimeType;
    ResourceResponse res(done, match.uri, match.uriTemplate);

    try {
        handler(req, res);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Resource access failed: ") + e.what());
        res.error(e.what());
    }
}

void NativeServer::getPrompt(const std::string& promptName, const nlohmann::json& arguments, Completion done) {
    if (!running) {
        done.fail(ErrorCode::NotConnected, "Server '" + name + "' is not connected (status: disabled)");
        return;
    }

    NativePrompt prompt;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = std::find_if(prompts.begin(), prompts.end(),
                               [&](const NativePrompt& p) { return p.descriptor.name == promptName; });
        if (it == prompts.end()) {
            done.fail(ErrorCode::NotFound, "Prompt '" + promptName + "' not found");
            return;
        }
        prompt = *it;
    }
    if (!prompt.handler) {
        done.fail(ErrorCode::Handler, "Prompt has no handler");
        return;
    }

    PromptRequest req;
    req.server = this;
    req.params = arguments.is_object() ? arguments : nlohmann::json::object();
    req.prompt = prompt.descriptor;
    PromptResponse res(done);

    try {
        prompt.handler(req, res);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Prompt failed: ") + e.what());
        res.error(e.what());
    }
}

void NativeServer::addTool(NativeTool tool) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string key = tool.descriptor.name;
    upsert(tools, std::move(tool), [&](const NativeTool& t) { return t.descriptor.name == key; });
}

bool NativeServer::removeTool(const std::string& toolName) {
    std::lock_guard<std::mutex> lock(mtx);
    return eraseFirst(tools, [&](const NativeTool& t) { return t.descriptor.name == toolName; });
}

void NativeServer::addResource(NativeResource resource) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string key = resource.descriptor.uri;
    upsert(resources, std::move(resource), [&](const NativeResource& r) { return r.descriptor.uri == key; });
}

bool NativeServer::removeResource(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mtx);
    return eraseFirst(resources, [&](const NativeResource& r) { return r.descriptor.uri == uri; });
}

void NativeServer::addResourceTemplate(NativeResourceTemplate resourceTemplate) {
    std::lock_guard<std::mutex> lock(mtx);
    const std::string key = resourceTemplate.descriptor.uriTemplate;
    auto same = [&](const NativeResourceTemplate& t) { return t.descriptor.uriTemplate == key; };
    if (std::find_if(resourceTemplates.begin(), resourceTemplates.end(), same) != resourceTemplates.end()) {
        Logger::getInstance().warn("Server '" + name + "' already has template '" + key + "'; replacing it");
    }
    upsert(resourceTemplates, std::move(resourceTemplate), same);
}

bool NativeServer::removeResourceTemplate(const std::string& uriTemplate) {
    std::lock_guard<std::mutex> lock(mtx);
    return eraseFirst(resourceTemplates,
                      [&](const NativeResourceTemplate& t) { return t.descriptor.uriTemplate == uriTemplate; });
}

void NativeServer::addPrompt(NativePrompt prompt) {
    std::lock_guard<std::mutex> lock(mtx);
    std::string key = prompt.descriptor.name;
    upsert(prompts, std::move(prompt), [&](const NativePrompt& p) { return p.descriptor.name == key; });
}

bool NativeServer::removePrompt(const std::string& promptName) {
    std::lock_guard<std::mutex> lock(mtx);
    return eraseFirst(prompts, [&](const NativePrompt& p) { return p.descriptor.name == promptName; });
}
