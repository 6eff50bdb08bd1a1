#pragma once
#include <memory>
#include <string>
#include "native/NativeServer.h"
#include "mcp/Capabilities.h"

class MCPManager;

/**
 * @brief The hub's own native provider, "mcphub".
 *
 * Exposes the live provider list as resources, a toggle_mcp_server tool,
 * and two prompts. The manager must outlive the returned server.
 */
std::shared_ptr<NativeServer> createBuiltinServer(MCPManager& hub);

// Markdown summary of one provider: status, transport and capability names
std::string serverToText(const ProviderInfo& server);
