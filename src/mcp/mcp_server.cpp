#include <mcp_toolhost/mcp/mcp_server.hpp>

#include <mcp_toolhost/core/log.hpp>
#include <mcp_toolhost/mcp/json_rpc.hpp>
#include <mcp_toolhost/mcp/schema_check.hpp>

#include <optional>
#include <string>

namespace mcp_toolhost {

namespace {

constexpr const char* kComponent = "mcp";

bool IsBlank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

// Methods that are answered even before initialize in strict mode.
bool AllowedBeforeInitialize(const std::string& method) {
    return method == "initialize" || method == "ping";
}

} // anonymous namespace

McpServer::McpServer(ServerConfig config,
                     ToolRegistry registry,
                     HandlerResolver resolver,
                     ITransport& transport)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      resolver_(std::move(resolver)),
      transport_(transport) {}

void McpServer::Run() {
    LogInfo(kComponent, "Serving " + std::to_string(registry_.Size()) +
                            " tools as '" + config_.server_name + "'");

    while (state_ != ServerState::ShuttingDown) {
        auto line = transport_.ReadMessage();
        if (!line) {
            LogInfo(kComponent, "End of input, shutting down");
            break;
        }

        auto response = HandleLine(*line);
        if (response && !transport_.WriteMessage(SerializeMessage(*response))) {
            LogError(kComponent, "Output closed, shutting down");
            break;
        }
    }

    state_ = ServerState::ShuttingDown;
}

std::optional<nlohmann::json> McpServer::HandleLine(std::string_view line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        auto id = SalvageId(line);
        if (id) {
            LogWarn(kComponent, std::string("Parse error: ") + e.what());
            return MakeError(*id, rpc::kParseError, "Parse error");
        }
        LogWarn(kComponent, std::string("Dropping unparseable line: ") + e.what());
        return std::nullopt;
    }

    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    // Batches are not supported; an array has no id to answer to.
    if (!message.is_object()) {
        LogWarn(kComponent, "Dropping message that is not a JSON object");
        return std::nullopt;
    }

    // Notifications have no "id".
    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    if (!is_notification && !IsValidId(id)) {
        LogWarn(kComponent, "Dropping message with invalid id: " + id.dump());
        return std::nullopt;
    }

    auto envelope = CheckEnvelope(message);
    if (envelope.IsErr()) {
        if (is_notification) {
            LogWarn(kComponent, "Dropping invalid notification: " +
                                    envelope.Error().message);
            return std::nullopt;
        }
        return MakeError(id, envelope.Error());
    }

    const auto method = message["method"].get<std::string>();
    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json::object();

    if (is_notification) {
        HandleNotification(method, params);
        return std::nullopt;
    }

    LogDebug(kComponent, "Request " + id.dump() + ": " + method);
    return Dispatch(method, params, id);
}

nlohmann::json McpServer::Dispatch(const std::string& method,
                                   const nlohmann::json& params,
                                   const nlohmann::json& id) {
    if (state_ == ServerState::Uninitialized && !AllowedBeforeInitialize(method)) {
        if (config_.strict_lifecycle) {
            return MakeError(id, rpc::kServerNotInitialized, "Server not initialized");
        }
        LogWarn(kComponent, "'" + method + "' received before initialize");
    }

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "shutdown" || method == "exit") {
        LogInfo(kComponent, "Received " + method);
        state_ = ServerState::ShuttingDown;
        return MakeResult(id, nlohmann::json::object());
    }
    return MakeError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

void McpServer::HandleNotification(const std::string& method,
                                   const nlohmann::json& params) {
    if (method == "notifications/initialized" ||
        method == "notifications/cancelled") {
        LogDebug(kComponent, "Notification: " + method);
        return;
    }
    if (method.rfind("notifications/", 0) == 0) {
        LogWarn(kComponent, "Ignoring unknown notification: " + method);
        return;
    }
    if (method == "exit" || method == "shutdown") {
        LogInfo(kComponent, "Received " + method + " notification");
        state_ = ServerState::ShuttingDown;
        return;
    }

    // Any other method runs as usual; its response is discarded.
    auto response = Dispatch(method, params, nullptr);
    if (response.contains("error")) {
        LogWarn(kComponent, "Notification '" + method + "' failed: " +
                                response["error"]["message"].get<std::string>());
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (params.is_object()) {
        auto requested = params.find("protocolVersion");
        if (requested != params.end() && requested->is_string() &&
            *requested != config_.protocol_version) {
            LogInfo(kComponent, "Client requested protocol " +
                                    requested->get<std::string>() +
                                    ", offering " + config_.protocol_version);
        }
        auto client = params.find("clientInfo");
        if (client != params.end() && client->is_object()) {
            LogInfo(kComponent, "Client: " + client->value("name", std::string("?")) +
                                    " " + client->value("version", std::string("")));
        }
    }

    state_ = ServerState::Ready;

    nlohmann::json result;
    result["protocolVersion"] = config_.protocol_version;
    result["capabilities"] = config_.capabilities;
    result["serverInfo"] = {
        {"name", config_.server_name},
        {"version", config_.server_version}
    };
    result["instructions"] = config_.instructions;

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    return MakeResult(id, {{"tools", registry_.ToJson()}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, rpc::kInvalidParams, "Missing 'name' parameter");
    }

    const auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        return MakeError(id, rpc::kInvalidParams, "'arguments' must be an object");
    }

    const auto* descriptor = registry_.Get(tool_name);
    if (descriptor == nullptr) {
        LogWarn(kComponent, "Call to unlisted tool: " + tool_name);
        return MakeError(id, rpc::kMethodNotFound, "Tool not found: " + tool_name);
    }
    if (!resolver_.HasHandler(tool_name)) {
        LogError(kComponent, "Tool '" + tool_name +
                                 "' is listed but has no registered handler");
        return MakeError(id, rpc::kMethodNotFound, "Tool not found: " + tool_name);
    }

    if (config_.validate_arguments) {
        auto check = CheckArguments(descriptor->input_schema, arguments);
        if (check.IsErr()) {
            return MakeError(id, rpc::kInvalidParams,
                             "Invalid arguments for tool '" + tool_name + "': " +
                                 check.Error());
        }
    }

    LogInfo(kComponent, "Calling tool " + tool_name);
    auto result = resolver_.Call(tool_name, arguments);
    if (result.IsErr()) {
        LogInfo(kComponent, "Tool " + tool_name + " failed: " + result.Error().message);
        return MakeError(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

} // namespace mcp_toolhost
