#include <mcp_toolhost/mcp/handler_resolver.hpp>

#include <mcp_toolhost/core/log.hpp>

#include <exception>

namespace mcp_toolhost {

namespace {

RpcError ExecutionError(std::string message) {
    return RpcError{rpc::kToolExecutionFailed, std::move(message)};
}

Result<nlohmann::json, RpcError> Translate(const std::string& name,
                                           HandlerOutcome outcome) {
    if (outcome.IsErr()) {
        // The handler's own reason is the message, unwrapped.
        return Result<nlohmann::json, RpcError>::Err(
            ExecutionError(std::move(outcome).Error()));
    }

    auto output = std::move(outcome).Value();
    if (output.text.empty() && output.structured.is_null()) {
        return Result<nlohmann::json, RpcError>::Err(
            ExecutionError("Tool '" + name + "' returned no output"));
    }

    // Structured-only output is also rendered as text.
    auto text = output.text.empty() ? output.structured.dump(2) : output.text;

    nlohmann::json result;
    result["content"] = nlohmann::json::array({
        {{"type", "text"}, {"text", text}}
    });
    if (!output.structured.is_null()) {
        result["structuredContent"] = std::move(output.structured);
    }
    return Result<nlohmann::json, RpcError>::Ok(std::move(result));
}

} // anonymous namespace

HandlerOutcome ToolSuccess(std::string text, nlohmann::json structured) {
    return HandlerOutcome::Ok(ToolOutput{std::move(text), std::move(structured)});
}

HandlerOutcome ToolFailure(std::string reason) {
    return HandlerOutcome::Err(std::move(reason));
}

// ---------------------------------------------------------------------------
// HandlerResolver
// ---------------------------------------------------------------------------
void HandlerResolver::Register(const std::string& name, ToolHandler handler) {
    handlers_[name] = std::move(handler);
}

const ToolHandler* HandlerResolver::Resolve(std::string_view name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool HandlerResolver::HasHandler(std::string_view name) const {
    return handlers_.find(name) != handlers_.end();
}

std::vector<std::string> HandlerResolver::Names() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

Result<nlohmann::json, RpcError> HandlerResolver::Call(
    const std::string& name, const nlohmann::json& arguments) const {
    const auto* handler = Resolve(name);
    if (handler == nullptr) {
        return Result<nlohmann::json, RpcError>::Err(
            RpcError{rpc::kMethodNotFound, "Tool not found: " + name});
    }

    try {
        return Translate(name, (*handler)(arguments));
    } catch (const std::exception& e) {
        LogError("resolver", "Tool '" + name + "' threw: " + e.what());
        return Result<nlohmann::json, RpcError>::Err(
            ExecutionError("Tool '" + name + "' failed unexpectedly: " + e.what()));
    } catch (...) {
        LogError("resolver", "Tool '" + name + "' threw a non-standard exception");
        return Result<nlohmann::json, RpcError>::Err(
            ExecutionError("Tool '" + name + "' failed unexpectedly"));
    }
}

// ---------------------------------------------------------------------------
// CheckCoverage
// ---------------------------------------------------------------------------
HandlerCoverage CheckCoverage(const ToolRegistry& registry,
                              const HandlerResolver& resolver) {
    HandlerCoverage coverage;
    for (const auto& tool : registry.List()) {
        if (!resolver.HasHandler(tool.name)) {
            coverage.unresolved_tools.push_back(tool.name);
        }
    }
    for (const auto& name : resolver.Names()) {
        if (!registry.Contains(name)) {
            coverage.unlisted_handlers.push_back(name);
        }
    }
    return coverage;
}

} // namespace mcp_toolhost
