#pragma once

#include <mcp_toolhost/core/result.hpp>
#include <mcp_toolhost/mcp/json_rpc.hpp>
#include <mcp_toolhost/mcp/tool_registry.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

// ---------------------------------------------------------------------------
// ToolOutput: what a handler produces on success.
// ---------------------------------------------------------------------------
struct ToolOutput {
    std::string text;
    nlohmann::json structured;  // null when the tool has no structured result
};

// A handler either succeeds with output or fails with a human-readable reason.
using HandlerOutcome = Result<ToolOutput, std::string>;

// A tool handler receives the raw "arguments" object of tools/call and
// decodes it itself.
using ToolHandler = std::function<HandlerOutcome(const nlohmann::json& arguments)>;

HandlerOutcome ToolSuccess(std::string text,
                           nlohmann::json structured = nullptr);
HandlerOutcome ToolFailure(std::string reason);

// ---------------------------------------------------------------------------
// HandlerResolver: explicit map from tool name to handler.
//
// Populated once at startup. Call() is the only place where a handler
// outcome is turned into a protocol result or error.
// ---------------------------------------------------------------------------
class HandlerResolver {
public:
    void Register(const std::string& name, ToolHandler handler);

    // Returns nullptr when no handler is registered for name.
    [[nodiscard]] const ToolHandler* Resolve(std::string_view name) const;

    [[nodiscard]] bool HasHandler(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> Names() const;

    // Invoke the handler and translate its outcome. Exceptions escaping the
    // handler are caught and reported as a tool execution failure.
    [[nodiscard]] Result<nlohmann::json, RpcError> Call(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::map<std::string, ToolHandler, std::less<>> handlers_;
};

// ---------------------------------------------------------------------------
// Coverage: mismatches between the tool list and the registered handlers.
// ---------------------------------------------------------------------------
struct HandlerCoverage {
    std::vector<std::string> unresolved_tools;   // listed, no handler
    std::vector<std::string> unlisted_handlers;  // handler, not listed

    [[nodiscard]] bool Complete() const {
        return unresolved_tools.empty() && unlisted_handlers.empty();
    }
};

HandlerCoverage CheckCoverage(const ToolRegistry& registry,
                              const HandlerResolver& resolver);

} // namespace mcp_toolhost
