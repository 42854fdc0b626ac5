#pragma once

#include <mcp_toolhost/core/result.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

// ---------------------------------------------------------------------------
// ToolDescriptor: a tool as advertised to the host by tools/list.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolRegistry: the declarative tool list, loaded once at startup.
//
// Order is preserved from the source. The registry only describes tools;
// mapping a name to code is the HandlerResolver's job.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;

    // Load from a JSON file holding either an array of descriptors or an
    // object with a "tools" array.
    static Result<ToolRegistry, Error> Load(std::string_view file_path);

    // Build from an already-parsed JSON document (same shapes as Load).
    static Result<ToolRegistry, Error> FromJson(const nlohmann::json& source);

    [[nodiscard]] const std::vector<ToolDescriptor>& List() const noexcept {
        return tools_;
    }

    // Returns nullptr when no tool with that name is listed.
    [[nodiscard]] const ToolDescriptor* Get(std::string_view name) const;

    [[nodiscard]] bool Contains(std::string_view name) const;

    [[nodiscard]] std::size_t Size() const noexcept { return tools_.size(); }

    // The tools/list payload: [{name, description, inputSchema}, ...].
    [[nodiscard]] nlohmann::json ToJson() const;

private:
    std::vector<ToolDescriptor> tools_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace mcp_toolhost
