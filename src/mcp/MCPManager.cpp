#include "mcp/MCPManager.h"
#include "mcp/HttpMCPClient.h"
#include "mcp/Namespacing.h"
#include "utils/Logger.h"
#include <algorithm>
#include <set>

namespace {
bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const HubEvent ALL_LIST_EVENTS[] = {HubEvent::ToolListChanged, HubEvent::ResourceListChanged,
                                    HubEvent::PromptListChanged};

// Keeps the first declared of several names that sanitize alike, so the
// namespaced listing and dispatch agree on which capability a name means
template <typename Descriptor>
void dropCollidingNames(std::vector<Descriptor>& items, const std::string& provider, const char* kind) {
    std::set<std::string> seen;
    auto collides = [&](const Descriptor& item) {
        if (seen.insert(Namespacing::sanitize(item.name)).second) return false;
        Logger::getInstance().warn(std::string("Ignoring ") + kind + " '" + item.name + "' on server '" + provider +
                                   "': name collides with an earlier " + kind);
        return true;
    };
    items.erase(std::remove_if(items.begin(), items.end(), collides), items.end());
}

Capabilities withUniqueNames(Capabilities caps, const std::string& provider) {
    dropCollidingNames(caps.tools, provider, "tool");
    dropCollidingNames(caps.prompts, provider, "prompt");
    return caps;
}
} // namespace

const char* hubEventName(HubEvent event) {
    switch (event) {
        case HubEvent::ServersUpdated: return "servers_updated";
        case HubEvent::ToolListChanged: return "tool_list_changed";
        case HubEvent::ResourceListChanged: return "resource_list_changed";
        case HubEvent::PromptListChanged: return "prompt_list_changed";
    }
    return "unknown";
}

CallerContext CallerContext::fromJson(const nlohmann::json& j) {
    CallerContext caller;
    if (!j.is_object()) return caller;
    if (j.contains("type") && j["type"].is_string()) caller.type = j["type"].get<std::string>();
    if (j.contains("source") && j["source"].is_string()) caller.source = j["source"].get<std::string>();
    return caller;
}

HubError CallParams::toError() const {
    std::string message;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) message += "\n";
        message += errors[i];
    }
    return HubError(ErrorCode::InvalidParams, message);
}

CallParams MCPManager::parseParams(const nlohmann::json& params, const std::string& action) {
    CallParams parsed;
    parsed.action = action;
    const nlohmann::json args = params.is_object() ? params : nlohmann::json::object();

    auto stringField = [&](const char* key) -> std::string {
        if (args.contains(key) && args[key].is_string()) return args[key].get<std::string>();
        return "";
    };

    if (action != ApprovalRequest::USE_TOOL && action != ApprovalRequest::ACCESS_RESOURCE) {
        parsed.errors.push_back("Action must be one of `use_mcp_tool` or `access_mcp_resource`");
    }

    parsed.serverName = stringField("server_name");
    if (parsed.serverName.empty()) parsed.errors.push_back("server_name is required");

    if (action == ApprovalRequest::USE_TOOL) {
        parsed.toolName = stringField("tool_name");
        if (parsed.toolName.empty()) parsed.errors.push_back("tool_name is required");

        nlohmann::json input = args.contains("tool_input") ? args["tool_input"] : nlohmann::json::object();
        if (input.is_string()) {
            // Some models send the arguments as an encoded JSON string
            input = nlohmann::json::parse(input.get<std::string>(), nullptr, false);
            if (input.is_discarded()) input = nlohmann::json::object();
        }
        if (input.is_null() || (input.is_array() && input.empty())) input = nlohmann::json::object();
        if (!input.is_object()) {
            parsed.errors.push_back("tool_input must be an object");
        } else {
            parsed.arguments = input;
        }
    } else if (action == ApprovalRequest::ACCESS_RESOURCE) {
        parsed.uri = stringField("uri");
        if (parsed.uri.empty()) parsed.errors.push_back("uri is required");
    }
    return parsed;
}

// ---------------------------------------------------------------------------

MCPManager::MCPManager(std::shared_ptr<ApprovalEngine> approval, std::chrono::milliseconds requestTimeout)
    : approval(approval ? std::move(approval) : std::make_shared<ApprovalEngine>()),
      requestTimeout(requestTimeout) {}

MCPManager::~MCPManager() {
    std::vector<std::shared_ptr<IMCPClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& [name, entry] : providers) clients.push_back(entry.client);
        providers.clear();
    }
    // Stopping first fails any request a background refresh is waiting on
    for (auto& client : clients) {
        try {
            client->stop();
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Failed to stop provider: ") + e.what());
        }
    }

    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(taskMtx);
        tasks.swap(backgroundTasks);
    }
    for (auto& task : tasks) task.wait();
}

int MCPManager::initFromConfig(const Config& config) {
    std::vector<std::string> toStart;
    std::vector<std::string> toDisable;
    {
        std::lock_guard<std::mutex> lock(mtx);
        nativeConfigs = config.nativeServers;
        // Native providers registered before the config was read pick up their policy now
        for (auto& [name, entry] : providers) {
            if (!entry.native) continue;
            auto it = nativeConfigs.find(name);
            if (it == nativeConfigs.end()) continue;
            entry.config = it->second;
            entry.config.name = name;
            if (entry.config.disabled && entry.info.status != ProviderStatus::Disabled) toDisable.push_back(name);
        }
    }
    for (const auto& name : toDisable) stopServer(name, true);

    for (const auto& cfg : config.mcpServers) {
        std::shared_ptr<IMCPClient> client;
        if (cfg.isRemote()) {
            client = std::make_shared<HttpMCPClient>(cfg, requestTimeout);
        } else {
            client = std::make_shared<MCPClient>(cfg, requestTimeout);
        }
        try {
            addProvider(client, cfg);
        } catch (const HubError& e) {
            Logger::getInstance().error("Not registering server '" + cfg.name + "': " + e.what());
            continue;
        }
        if (!cfg.disabled) toStart.push_back(cfg.name);
    }

    if (toStart.empty()) return 0;

    std::vector<std::future<bool>> futures;
    for (const auto& name : toStart) {
        futures.push_back(std::async(std::launch::async, [this, name]() { return startServer(name); }));
    }

    int count = 0;
    for (auto& f : futures) {
        if (f.get()) count++;
    }
    Logger::getInstance().info("Started " + std::to_string(count) + " of " + std::to_string(toStart.size()) +
                               " configured servers");
    return count;
}

void MCPManager::addProvider(std::shared_ptr<IMCPClient> client, const Config::ServerConfig& config,
                             const std::string& displayName, const std::string& description) {
    ProviderEntry entry;
    entry.info.name = config.name;
    entry.info.displayName = displayName.empty() ? config.name : displayName;
    entry.info.description = description;
    entry.info.transportType = client->getTransportType();
    entry.info.status = config.disabled ? ProviderStatus::Disabled : ProviderStatus::Disconnected;
    entry.config = config;
    entry.client = client;
    entry.native = std::dynamic_pointer_cast<NativeServer>(client);

    std::shared_ptr<IMCPClient> replaced;
    {
        std::lock_guard<std::mutex> lock(mtx);
        const std::string sanitized = Namespacing::sanitize(config.name);
        for (const auto& [key, existing] : providers) {
            if (key != config.name && Namespacing::sanitize(key) == sanitized) {
                HubError conflict(ErrorCode::ConfigConflict, "Server '" + config.name + "' conflicts with server '" +
                                                                 key + "': both are exposed as '" + sanitized + "'");
                Logger::getInstance().warn(conflict.what());
                throw conflict;
            }
        }
        attachHandlers(config.name, *client);

        auto it = providers.find(config.name);
        if (it != providers.end()) {
            Logger::getInstance().warn("Replacing provider '" + config.name + "'");
            replaced = it->second.client;
        }
        providers[config.name] = std::move(entry);
    }
    if (replaced && replaced != client) replaced->stop();

    emit(HubEvent::ServersUpdated, {{"server", config.name}});
}

void MCPManager::addNativeServer(std::shared_ptr<NativeServer> server) {
    Config::ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = nativeConfigs.find(server->getName());
        if (it != nativeConfigs.end()) config = it->second;
    }
    config.name = server->getName();

    addProvider(server, config, server->getDisplayName(), server->getDescription());
    if (!config.disabled) startServer(config.name);
}

bool MCPManager::removeProvider(const std::string& name) {
    std::shared_ptr<IMCPClient> client;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = providers.find(name);
        if (it == providers.end()) return false;
        client = it->second.client;
        providers.erase(it);
    }
    client->stop();

    emit(HubEvent::ServersUpdated, {{"server", name}});
    for (HubEvent event : ALL_LIST_EVENTS) emit(event, {{"server", name}});
    return true;
}

bool MCPManager::startServer(const std::string& name) {
    std::shared_ptr<IMCPClient> client;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ProviderEntry* entry = findEntry(name);
        if (!entry) return false;
        key = entry->info.name;
        client = entry->client;
        entry->config.disabled = false;
        entry->info.status = ProviderStatus::Connecting;
        entry->info.error.reset();
    }
    emit(HubEvent::ServersUpdated, {{"server", key}});

    Capabilities caps;
    try {
        if (!client->isRunning()) client->start();
        caps = client->listCapabilities();
    } catch (const std::exception& e) {
        Logger::getInstance().error("Failed to start server '" + key + "': " + e.what());
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = providers.find(key);
            if (it != providers.end()) {
                it->second.info.status = ProviderStatus::Error;
                it->second.info.error = e.what();
            }
        }
        emit(HubEvent::ServersUpdated, {{"server", key}});
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = providers.find(key);
        if (it == providers.end()) return false;
        it->second.info.status = ProviderStatus::Connected;
        it->second.info.capabilities = withUniqueNames(std::move(caps), key);
        it->second.info.lastStarted = nowSeconds();
    }
    Logger::getInstance().info("Server '" + key + "' connected");

    emit(HubEvent::ServersUpdated, {{"server", key}});
    for (HubEvent event : ALL_LIST_EVENTS) emit(event, {{"server", key}});
    return true;
}

bool MCPManager::stopServer(const std::string& name, bool disable) {
    std::shared_ptr<IMCPClient> client;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ProviderEntry* entry = findEntry(name);
        if (!entry) return false;
        key = entry->info.name;
        client = entry->client;
    }
    client->stop();

    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = providers.find(key);
        if (it == providers.end()) return false;
        it->second.info.status = disable ? ProviderStatus::Disabled : ProviderStatus::Disconnected;
        it->second.info.capabilities = Capabilities();
        it->second.info.error.reset();
        it->second.config.disabled = disable;
    }
    Logger::getInstance().info("Server '" + key + "' " + (disable ? "disabled" : "stopped"));

    emit(HubEvent::ServersUpdated, {{"server", key}});
    for (HubEvent event : ALL_LIST_EVENTS) emit(event, {{"server", key}});
    return true;
}

bool MCPManager::refreshCapabilities(const std::string& name) {
    std::shared_ptr<IMCPClient> client;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ProviderEntry* entry = findEntry(name);
        if (!entry || entry->info.status != ProviderStatus::Connected) return false;
        key = entry->info.name;
        client = entry->client;
    }

    Capabilities caps;
    try {
        caps = withUniqueNames(client->listCapabilities(), key);
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Failed to refresh capabilities of '" + key + "': " + e.what());
        return false;
    }

    // Compare descriptors only; argument providers are not evaluated here
    auto toolsJson = [](const Capabilities& c) { return nlohmann::json(c.tools); };
    auto resourcesJson = [](const Capabilities& c) {
        return nlohmann::json{{"r", c.resources}, {"t", c.resourceTemplates}};
    };
    auto promptNames = [](const Capabilities& c) {
        std::vector<std::string> names;
        for (const auto& p : c.prompts) names.push_back(p.name + "\n" + p.description);
        return names;
    };

    std::vector<HubEvent> changed;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = providers.find(key);
        if (it == providers.end()) return false;
        const Capabilities& old = it->second.info.capabilities;
        if (toolsJson(old) != toolsJson(caps)) changed.push_back(HubEvent::ToolListChanged);
        if (resourcesJson(old) != resourcesJson(caps)) changed.push_back(HubEvent::ResourceListChanged);
        if (promptNames(old) != promptNames(caps)) changed.push_back(HubEvent::PromptListChanged);
        it->second.info.capabilities = std::move(caps);
    }

    for (HubEvent event : changed) emit(event, {{"server", key}});
    return true;
}

// ---------------------------------------------------------------------------

std::shared_ptr<NativeServer> MCPManager::nativeFor(const std::string& serverName) {
    std::lock_guard<std::mutex> lock(mtx);
    ProviderEntry* entry = findEntry(serverName);
    if (!entry) return nullptr;
    return entry->native;
}

void MCPManager::syncNative(const std::string& serverName, HubEvent event) {
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ProviderEntry* entry = findEntry(serverName);
        if (!entry || !entry->native) return;
        key = entry->info.name;
        // Disconnected providers advertise nothing; the next start re-lists
        if (entry->info.status == ProviderStatus::Connected) {
            entry->info.capabilities = withUniqueNames(entry->native->listCapabilities(), key);
        }
    }
    emit(event, {{"server", key}});
}

bool MCPManager::addTool(const std::string& serverName, NativeTool tool) {
    auto native = nativeFor(serverName);
    if (!native) return false;
    native->addTool(std::move(tool));
    syncNative(serverName, HubEvent::ToolListChanged);
    return true;
}

bool MCPManager::removeTool(const std::string& serverName, const std::string& toolName) {
    auto native = nativeFor(serverName);
    if (!native || !native->removeTool(toolName)) return false;
    syncNative(serverName, HubEvent::ToolListChanged);
    return true;
}

bool MCPManager::addResource(const std::string& serverName, NativeResource resource) {
    auto native = nativeFor(serverName);
    if (!native) return false;
    native->addResource(std::move(resource));
    syncNative(serverName, HubEvent::ResourceListChanged);
    return true;
}

bool MCPManager::removeResource(const std::string& serverName, const std::string& uri) {
    auto native = nativeFor(serverName);
    if (!native || !native->removeResource(uri)) return false;
    syncNative(serverName, HubEvent::ResourceListChanged);
    return true;
}

bool MCPManager::addResourceTemplate(const std::string& serverName, NativeResourceTemplate resourceTemplate) {
    auto native = nativeFor(serverName);
    if (!native) return false;
    native->addResourceTemplate(std::move(resourceTemplate));
    syncNative(serverName, HubEvent::ResourceListChanged);
    return true;
}

bool MCPManager::addPrompt(const std::string& serverName, NativePrompt prompt) {
    auto native = nativeFor(serverName);
    if (!native) return false;
    native->addPrompt(std::move(prompt));
    syncNative(serverName, HubEvent::PromptListChanged);
    return true;
}

bool MCPManager::removePrompt(const std::string& serverName, const std::string& promptName) {
    auto native = nativeFor(serverName);
    if (!native || !native->removePrompt(promptName)) return false;
    syncNative(serverName, HubEvent::PromptListChanged);
    return true;
}

// ---------------------------------------------------------------------------

MCPManager::ProviderEntry* MCPManager::findEntry(const std::string& name) {
    auto it = providers.find(name);
    if (it != providers.end()) return &it->second;
    for (auto& [key, entry] : providers) {
        if (Namespacing::sanitize(key) == name) return &entry;
    }
    return nullptr;
}

const MCPManager::ProviderEntry* MCPManager::findEntry(const std::string& name) const {
    auto it = providers.find(name);
    if (it != providers.end()) return &it->second;
    for (const auto& [key, entry] : providers) {
        if (Namespacing::sanitize(key) == name) return &entry;
    }
    return nullptr;
}

MCPManager::Target MCPManager::resolveTarget(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(mtx);
    const ProviderEntry* entry = findEntry(serverName);
    if (!entry) {
        throw HubError(ErrorCode::NotFound, "Server '" + serverName + "' not found");
    }
    if (entry->info.status != ProviderStatus::Connected) {
        throw HubError(ErrorCode::NotConnected, "Server '" + entry->info.name + "' is not connected (status: " +
                                                    providerStatusName(entry->info.status) + ")");
    }
    return Target{entry->info.name, entry->client, entry->config, entry->info.capabilities};
}

void MCPManager::attachHandlers(const std::string& name, IMCPClient& client) {
    client.setExitHandler([this, name](const std::string& reason) { markExited(name, reason); });
    client.setNotificationHandler([this, name](const std::string& method, const nlohmann::json&) {
        if (method.size() < 13 || method.compare(method.size() - 13, 13, "/list_changed") != 0) return;
        Logger::getInstance().debug("Server '" + name + "' sent " + method);
        // Runs off the reader thread, which must stay free to deliver the list responses
        runInBackground([this, name]() { refreshCapabilities(name); });
    });
}

void MCPManager::markExited(const std::string& name, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = providers.find(name);
        if (it == providers.end() || it->second.info.status != ProviderStatus::Connected) return;
        it->second.info.status = ProviderStatus::Disconnected;
        it->second.info.capabilities = Capabilities();
        it->second.info.error = reason;
    }
    Logger::getInstance().warn("Server '" + name + "' disconnected: " + reason);
    emit(HubEvent::ServersUpdated, {{"server", name}});
}

void MCPManager::runInBackground(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(taskMtx);
    backgroundTasks.erase(std::remove_if(backgroundTasks.begin(), backgroundTasks.end(),
                                         [](std::future<void>& f) {
                                             return f.wait_for(std::chrono::seconds(0)) ==
                                                    std::future_status::ready;
                                         }),
                          backgroundTasks.end());
    backgroundTasks.push_back(std::async(std::launch::async, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Background task failed: ") + e.what());
        }
    }));
}

// ---------------------------------------------------------------------------

CallOutcome MCPManager::waitFor(const std::function<void(Completion)>& dispatch) {
    auto promise = std::make_shared<std::promise<CallOutcome>>();
    auto future = promise->get_future();
    Completion done([promise](const CallOutcome& outcome) { promise->set_value(outcome); });

    dispatch(done);

    auto limit = requestTimeout + approval->getTimeout() + std::chrono::seconds(1);
    if (future.wait_for(limit) == std::future_status::timeout) {
        done.fail(ErrorCode::TransportTimeout,
                  "Request timed out after " + std::to_string(limit.count()) + "ms");
    }
    return future.get();
}

CallOutcome MCPManager::callTool(const std::string& serverName, const std::string& toolName,
                                 const nlohmann::json& arguments, const CallOptions& options) {
    return waitFor([&](Completion done) { dispatchTool(serverName, toolName, arguments, options, done); });
}

void MCPManager::callTool(const std::string& serverName, const std::string& toolName,
                          const nlohmann::json& arguments, const CallOptions& options, Completion::Callback done) {
    dispatchTool(serverName, toolName, arguments, options, Completion(std::move(done)));
}

CallOutcome MCPManager::accessResource(const std::string& serverName, const std::string& uri,
                                       const CallOptions& options) {
    return waitFor([&](Completion done) { dispatchResource(serverName, uri, options, done); });
}

void MCPManager::accessResource(const std::string& serverName, const std::string& uri,
                                const CallOptions& options, Completion::Callback done) {
    dispatchResource(serverName, uri, options, Completion(std::move(done)));
}

CallOutcome MCPManager::getPrompt(const std::string& serverName, const std::string& promptName,
                                  const nlohmann::json& arguments, const CallOptions& options) {
    return waitFor([&](Completion done) { dispatchPrompt(serverName, promptName, arguments, options, done); });
}

void MCPManager::getPrompt(const std::string& serverName, const std::string& promptName,
                           const nlohmann::json& arguments, const CallOptions& options, Completion::Callback done) {
    dispatchPrompt(serverName, promptName, arguments, options, Completion(std::move(done)));
}

void MCPManager::dispatchTool(const std::string& serverName, const std::string& toolName,
                              const nlohmann::json& arguments, const CallOptions& options, Completion done) {
    Logger::getInstance().debug("call_tool " + serverName + "/" + toolName + " from " + options.caller.describe());
    try {
        Target target = resolveTarget(serverName);

        const auto& tools = target.capabilities.tools;
        auto it = std::find_if(tools.begin(), tools.end(),
                               [&](const ToolDescriptor& t) { return t.name == toolName; });
        if (it == tools.end()) {
            it = std::find_if(tools.begin(), tools.end(),
                              [&](const ToolDescriptor& t) { return Namespacing::sanitize(t.name) == toolName; });
        }
        if (it == tools.end()) {
            throw HubError(ErrorCode::NotFound, "Tool '" + toolName + "' not found on server '" + target.name + "'");
        }
        const std::string resolved = it->name;
        if (contains(target.config.disabledTools, resolved)) {
            throw HubError(ErrorCode::NotFound,
                           "Tool '" + resolved + "' on server '" + target.name + "' is disabled");
        }

        ApprovalRequest request;
        request.serverName = target.name;
        request.toolName = resolved;
        request.arguments = arguments.is_object() ? arguments : nlohmann::json::object();
        request.action = ApprovalRequest::USE_TOOL;

        ApprovalDecision decision = approval->decide(request, target.config.autoApprove, options.approve);
        if (!decision.approve) {
            std::string reason = decision.error.value_or("User cancelled the operation");
            ErrorCode code = reason == "Approval timeout" ? ErrorCode::ApprovalTimeout : ErrorCode::ApprovalDenied;
            Logger::getInstance().info("Tool call " + target.name + "/" + resolved + " denied: " + reason);
            done.fail(code, reason);
            return;
        }

        target.client->callTool(resolved, request.arguments, done);
    } catch (const HubError& e) {
        done.fail(e.getCode(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Tool call " + serverName + "/" + toolName + " failed: " + e.what());
        done.fail(ErrorCode::Handler, e.what());
    }
}

void MCPManager::dispatchResource(const std::string& serverName, const std::string& uri,
                                  const CallOptions& options, Completion done) {
    Logger::getInstance().debug("access_resource " + serverName + " " + uri + " from " + options.caller.describe());
    try {
        Target target = resolveTarget(serverName);

        auto match = findMatchingResource(target.capabilities, uri);
        if (!match) {
            throw HubError(ErrorCode::NotFound, "Resource '" + uri + "' not found on server '" + target.name + "'");
        }
        bool disabled = match->uriTemplate ? contains(target.config.disabledResourceTemplates, *match->uriTemplate)
                                           : contains(target.config.disabledResources, uri);
        if (disabled) {
            throw HubError(ErrorCode::NotFound,
                           "Resource '" + uri + "' on server '" + target.name + "' is disabled");
        }

        ApprovalRequest request;
        request.serverName = target.name;
        request.action = ApprovalRequest::ACCESS_RESOURCE;
        request.uri = uri;
        request.arguments = match->paramsJson();

        ApprovalDecision decision = approval->decide(request, target.config.autoApprove, options.approve);
        if (!decision.approve) {
            std::string reason = decision.error.value_or("User cancelled the operation");
            done.fail(reason == "Approval timeout" ? ErrorCode::ApprovalTimeout : ErrorCode::ApprovalDenied, reason);
            return;
        }

        target.client->readResource(*match, done);
    } catch (const HubError& e) {
        done.fail(e.getCode(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Resource access " + serverName + " " + uri + " failed: " + e.what());
        done.fail(ErrorCode::Handler, e.what());
    }
}

void MCPManager::dispatchPrompt(const std::string& serverName, const std::string& promptName,
                                const nlohmann::json& arguments, const CallOptions& options, Completion done) {
    Logger::getInstance().debug("get_prompt " + serverName + "/" + promptName + " from " +
                                options.caller.describe());
    try {
        Target target = resolveTarget(serverName);

        const auto& prompts = target.capabilities.prompts;
        auto it = std::find_if(prompts.begin(), prompts.end(),
                               [&](const PromptDescriptor& p) { return p.name == promptName; });
        if (it == prompts.end()) {
            it = std::find_if(prompts.begin(), prompts.end(), [&](const PromptDescriptor& p) {
                return Namespacing::sanitize(p.name) == promptName;
            });
        }
        if (it == prompts.end()) {
            throw HubError(ErrorCode::NotFound,
                           "Prompt '" + promptName + "' not found on server '" + target.name + "'");
        }
        const std::string resolved = it->name;
        if (contains(target.config.disabledPrompts, resolved)) {
            throw HubError(ErrorCode::NotFound,
                           "Prompt '" + resolved + "' on server '" + target.name + "' is disabled");
        }

        target.client->getPrompt(resolved, arguments.is_object() ? arguments : nlohmann::json::object(), done);
    } catch (const HubError& e) {
        done.fail(e.getCode(), e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Prompt " + serverName + "/" + promptName + " failed: " + e.what());
        done.fail(ErrorCode::Handler, e.what());
    }
}

// ---------------------------------------------------------------------------

ProviderInfo MCPManager::filteredInfo(ProviderInfo info, const Config::ServerConfig& config) {
    auto& caps = info.capabilities;
    caps.tools.erase(std::remove_if(caps.tools.begin(), caps.tools.end(),
                                    [&](const ToolDescriptor& t) { return contains(config.disabledTools, t.name); }),
                     caps.tools.end());
    caps.resources.erase(std::remove_if(caps.resources.begin(), caps.resources.end(),
                                        [&](const ResourceDescriptor& r) {
                                            return contains(config.disabledResources, r.uri);
                                        }),
                         caps.resources.end());
    caps.resourceTemplates.erase(std::remove_if(caps.resourceTemplates.begin(), caps.resourceTemplates.end(),
                                                [&](const ResourceTemplateDescriptor& r) {
                                                    return contains(config.disabledResourceTemplates,
                                                                    r.uriTemplate);
                                                }),
                                 caps.resourceTemplates.end());
    caps.prompts.erase(std::remove_if(caps.prompts.begin(), caps.prompts.end(),
                                      [&](const PromptDescriptor& p) {
                                          return contains(config.disabledPrompts, p.name);
                                      }),
                       caps.prompts.end());

    for (auto& tool : caps.tools) tool.autoApproved = config.autoApprove.allows(tool.name);
    for (auto& prompt : caps.prompts) {
        try {
            prompt.arguments = prompt.resolveArguments();
        } catch (const std::exception& e) {
            Logger::getInstance().warn("Failed to resolve arguments of prompt '" + prompt.name + "': " + e.what());
            prompt.arguments.clear();
        }
        prompt.argumentsProvider = nullptr;
    }
    return info;
}

std::vector<ProviderInfo> MCPManager::getServers(bool includeDisabled) const {
    std::vector<std::pair<ProviderInfo, Config::ServerConfig>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : providers) {
            if (!includeDisabled && entry.info.status != ProviderStatus::Connected) continue;
            snapshot.emplace_back(entry.info, entry.config);
        }
    }

    // Argument providers are user code and run without the registry lock
    std::vector<ProviderInfo> servers;
    for (auto& [info, config] : snapshot) servers.push_back(filteredInfo(std::move(info), config));
    return servers;
}

std::optional<ProviderInfo> MCPManager::getServer(const std::string& name) const {
    ProviderInfo info;
    Config::ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(mtx);
        const ProviderEntry* entry = findEntry(name);
        if (!entry) return std::nullopt;
        info = entry->info;
        config = entry->config;
    }
    return filteredInfo(std::move(info), config);
}

std::vector<std::string> MCPManager::getServerNames() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> names;
    for (const auto& [name, entry] : providers) names.push_back(name);
    return names;
}

nlohmann::json MCPManager::getAllServersJson() const {
    nlohmann::json servers = nlohmann::json::array();
    for (const auto& info : getServers(true)) servers.push_back(info);
    return servers;
}

nlohmann::json MCPManager::getTools() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& server : getServers()) {
        for (const auto& tool : server.capabilities.tools) {
            nlohmann::json item = tool;
            item["server_name"] = server.name;
            items.push_back(item);
        }
    }
    return items;
}

nlohmann::json MCPManager::getResources() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& server : getServers()) {
        for (const auto& resource : server.capabilities.resources) {
            nlohmann::json item = resource;
            item["server_name"] = server.name;
            items.push_back(item);
        }
    }
    return items;
}

nlohmann::json MCPManager::getResourceTemplates() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& server : getServers()) {
        for (const auto& resourceTemplate : server.capabilities.resourceTemplates) {
            nlohmann::json item = resourceTemplate;
            item["server_name"] = server.name;
            items.push_back(item);
        }
    }
    return items;
}

nlohmann::json MCPManager::getPrompts() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& server : getServers()) {
        for (const auto& prompt : server.capabilities.prompts) {
            nlohmann::json item = prompt;
            item["server_name"] = server.name;
            items.push_back(item);
        }
    }
    return items;
}

// ---------------------------------------------------------------------------

int MCPManager::on(HubEvent event, EventHandler handler) {
    std::lock_guard<std::mutex> lock(eventMtx);
    int id = nextHandlerId++;
    handlers[id] = {event, std::move(handler)};
    return id;
}

void MCPManager::off(int id) {
    std::lock_guard<std::mutex> lock(eventMtx);
    handlers.erase(id);
}

void MCPManager::emit(HubEvent event, const nlohmann::json& data) {
    std::vector<EventHandler> targets;
    {
        std::lock_guard<std::mutex> lock(eventMtx);
        for (const auto& [id, entry] : handlers) {
            if (entry.first == event) targets.push_back(entry.second);
        }
    }
    Logger::getInstance().trace(std::string("emit ") + hubEventName(event) + " " + data.dump());
    for (const auto& handler : targets) {
        try {
            handler(event, data);
        } catch (const std::exception& e) {
            Logger::getInstance().warn(std::string("Event handler for ") + hubEventName(event) + " failed: " + e.what());
        }
    }
}
