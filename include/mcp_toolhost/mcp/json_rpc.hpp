#pragma once

#include <mcp_toolhost/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 error codes used on the wire.
// ---------------------------------------------------------------------------
namespace rpc {

constexpr int kParseError           = -32700;
constexpr int kInvalidRequest       = -32600;
constexpr int kMethodNotFound       = -32601;
constexpr int kInvalidParams        = -32602;
constexpr int kInternalError        = -32603;
constexpr int kToolExecutionFailed  = -32000;
constexpr int kServerNotInitialized = -32002;

} // namespace rpc

// ---------------------------------------------------------------------------
// RpcError: the error member of a JSON-RPC response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = rpc::kInternalError;
    std::string message;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message;
    }
};

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);
nlohmann::json MakeError(const nlohmann::json& id, const RpcError& error);

// A JSON-RPC id is a string, a number or null.
[[nodiscard]] bool IsValidId(const nlohmann::json& id);

// Best-effort recovery of the top-level "id" member from a line that failed
// to parse. Returns nullopt unless a string or number id precedes the error.
[[nodiscard]] std::optional<nlohmann::json> SalvageId(std::string_view raw);

// Check the request envelope: an object with jsonrpc "2.0", a string
// method, and params (if present) that is an object or array.
[[nodiscard]] Result<void, RpcError> CheckEnvelope(const nlohmann::json& message);

// Serialize one message for the wire. Invalid UTF-8 coming from a handler is
// replaced rather than allowed to abort serialization.
[[nodiscard]] std::string SerializeMessage(const nlohmann::json& message);

} // namespace mcp_toolhost
