#pragma once

#include <mcp_toolhost/config/app_config.hpp>
#include <mcp_toolhost/mcp/handler_resolver.hpp>
#include <mcp_toolhost/mcp/tool_registry.hpp>
#include <mcp_toolhost/mcp/transport.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

enum class ServerState {
    Uninitialized,
    Ready,
    ShuttingDown,
};

// ---------------------------------------------------------------------------
// McpServer: MCP server over a line transport.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - ping
//   - shutdown / exit (end the serve loop)
//   - notifications/* (accepted, never answered)
//
// Single-threaded: a message is handled to completion, including the tool
// call, and its response written before the next line is read.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ServerConfig config,
              ToolRegistry registry,
              HandlerResolver resolver,
              ITransport& transport);

    // Run the server loop. Returns on end of input, shutdown/exit, or when
    // the output stream fails.
    void Run();

    // Handle one raw input line. Returns nullopt when nothing must be
    // written (blank line, notification, unrecoverable garbage).
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(std::string_view line);

    // Process a single parsed JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] ServerState State() const noexcept { return state_; }

private:
    nlohmann::json Dispatch(const std::string& method,
                            const nlohmann::json& params,
                            const nlohmann::json& id);
    void HandleNotification(const std::string& method,
                            const nlohmann::json& params);

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    const ServerConfig config_;
    const ToolRegistry registry_;
    const HandlerResolver resolver_;
    ITransport& transport_;
    ServerState state_ = ServerState::Uninitialized;
};

} // namespace mcp_toolhost
