#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <future>
#include <optional>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "mcp/MCPClient.h"
#include "mcp/Capabilities.h"
#include "mcp/Completion.h"
#include "native/NativeServer.h"
#include "approval/ApprovalEngine.h"
#include "core/ConfigManager.h"
#include "core/HubErrors.h"

/**
 * @brief Who initiated a call. Used for attribution only.
 */
struct CallerContext {
    std::string type = "internal";  // "internal" | "ui" | "external" | "chat"
    std::string source;             // e.g. "proxy", "codecompanion"

    nlohmann::json toJson() const { return {{"type", type}, {"source", source}}; }
    static CallerContext fromJson(const nlohmann::json& j);
    std::string describe() const { return source.empty() ? type : type + ":" + source; }
};

struct CallOptions {
    CallerContext caller;
    // Per-call decision function; outranks the engine's own settings
    ApprovalDecider approve;
};

/**
 * @brief Validated call parameters (server_name, tool_name/uri, tool_input).
 */
struct CallParams {
    std::string action;
    std::string serverName;
    std::string toolName;
    std::string uri;
    nlohmann::json arguments = nlohmann::json::object();
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
    // All errors joined with newlines, as one InvalidParams error
    HubError toError() const;
};

enum class HubEvent {
    ServersUpdated,
    ToolListChanged,
    ResourceListChanged,
    PromptListChanged
};

const char* hubEventName(HubEvent event);

/**
 * @brief Capability registry and dispatch router.
 *
 * Owns every provider, tracks its status and capabilities, and routes
 * call_tool / access_resource / get_prompt to it after approval. Every
 * call completes exactly once, either through the returned CallOutcome or
 * through the callback overloads.
 */
class MCPManager {
public:
    using EventHandler = std::function<void(HubEvent, const nlohmann::json&)>;

    explicit MCPManager(std::shared_ptr<ApprovalEngine> approval = std::make_shared<ApprovalEngine>(),
                        std::chrono::milliseconds requestTimeout = std::chrono::milliseconds(60000));
    ~MCPManager();

    MCPManager(const MCPManager&) = delete;
    MCPManager& operator=(const MCPManager&) = delete;

    // ---- provider lifecycle ----

    // Creates stdio/http providers for every configured server and starts the enabled ones in parallel
    int initFromConfig(const Config& config);

    // Throws HubError(ConfigConflict) when another server already sanitizes to the same name
    void addProvider(std::shared_ptr<IMCPClient> client, const Config::ServerConfig& config,
                     const std::string& displayName = "", const std::string& description = "");
    // Policy comes from the `nativeMCPServers` entry with the same name, if any
    void addNativeServer(std::shared_ptr<NativeServer> server);
    bool removeProvider(const std::string& name);

    bool startServer(const std::string& name);
    bool stopServer(const std::string& name, bool disable = false);

    // Re-lists a provider's capabilities and emits the matching *_list_changed events
    bool refreshCapabilities(const std::string& name);

    // ---- native capability mutation ----

    bool addTool(const std::string& serverName, NativeTool tool);
    bool removeTool(const std::string& serverName, const std::string& toolName);
    bool addResource(const std::string& serverName, NativeResource resource);
    bool removeResource(const std::string& serverName, const std::string& uri);
    bool addResourceTemplate(const std::string& serverName, NativeResourceTemplate resourceTemplate);
    bool addPrompt(const std::string& serverName, NativePrompt prompt);
    bool removePrompt(const std::string& serverName, const std::string& promptName);

    // ---- dispatch ----

    CallOutcome callTool(const std::string& serverName, const std::string& toolName,
                         const nlohmann::json& arguments, const CallOptions& options = {});
    void callTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& arguments,
                  const CallOptions& options, Completion::Callback done);

    CallOutcome accessResource(const std::string& serverName, const std::string& uri,
                               const CallOptions& options = {});
    void accessResource(const std::string& serverName, const std::string& uri,
                        const CallOptions& options, Completion::Callback done);

    CallOutcome getPrompt(const std::string& serverName, const std::string& promptName,
                          const nlohmann::json& arguments, const CallOptions& options = {});
    void getPrompt(const std::string& serverName, const std::string& promptName, const nlohmann::json& arguments,
                   const CallOptions& options, Completion::Callback done);

    // ---- listing ----

    // Connected providers only unless includeDisabled; disabled_* capabilities filtered out
    std::vector<ProviderInfo> getServers(bool includeDisabled = false) const;
    std::optional<ProviderInfo> getServer(const std::string& name) const;
    // Registration names only; safe to call from prompt argument providers
    std::vector<std::string> getServerNames() const;
    // Every provider with its status, for the control RPC
    nlohmann::json getAllServersJson() const;

    // Flattened lists, each item annotated with server_name
    nlohmann::json getTools() const;
    nlohmann::json getResources() const;
    nlohmann::json getResourceTemplates() const;
    nlohmann::json getPrompts() const;

    // ---- events ----

    int on(HubEvent event, EventHandler handler);
    void off(int id);

    ApprovalEngine& getApprovalEngine() { return *approval; }
    std::chrono::milliseconds getRequestTimeout() const { return requestTimeout; }

    static CallParams parseParams(const nlohmann::json& params, const std::string& action);

private:
    struct ProviderEntry {
        ProviderInfo info;
        Config::ServerConfig config;
        std::shared_ptr<IMCPClient> client;
        std::shared_ptr<NativeServer> native;
    };

    // What a dispatch needs once the registry lock is released
    struct Target {
        std::string name;
        std::shared_ptr<IMCPClient> client;
        Config::ServerConfig config;
        Capabilities capabilities;
    };

    std::shared_ptr<ApprovalEngine> approval;
    std::chrono::milliseconds requestTimeout;
    std::map<std::string, Config::ServerConfig> nativeConfigs;

    mutable std::mutex mtx;
    std::map<std::string, ProviderEntry> providers;

    std::mutex eventMtx;
    int nextHandlerId = 1;
    std::map<int, std::pair<HubEvent, EventHandler>> handlers;

    std::mutex taskMtx;
    std::vector<std::future<void>> backgroundTasks;

    void emit(HubEvent event, const nlohmann::json& data = nlohmann::json::object());
    void runInBackground(std::function<void()> task);

    // Exact name first, then the sanitized form used in namespaced listings
    ProviderEntry* findEntry(const std::string& name);
    const ProviderEntry* findEntry(const std::string& name) const;
    // Throws HubError (NotFound / NotConnected)
    Target resolveTarget(const std::string& serverName) const;

    void attachHandlers(const std::string& name, IMCPClient& client);
    void markExited(const std::string& name, const std::string& reason);
    std::shared_ptr<NativeServer> nativeFor(const std::string& serverName);
    // Re-reads a native provider's descriptors after a mutation
    void syncNative(const std::string& serverName, HubEvent event);

    static ProviderInfo filteredInfo(ProviderInfo info, const Config::ServerConfig& config);
    CallOutcome waitFor(const std::function<void(Completion)>& dispatch);
    void dispatchTool(const std::string& serverName, const std::string& toolName, const nlohmann::json& arguments,
                      const CallOptions& options, Completion done);
    void dispatchResource(const std::string& serverName, const std::string& uri,
                          const CallOptions& options, Completion done);
    void dispatchPrompt(const std::string& serverName, const std::string& promptName,
                        const nlohmann::json& arguments, const CallOptions& options, Completion done);
};
