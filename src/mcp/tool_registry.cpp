#include <mcp_toolhost/mcp/tool_registry.hpp>

#include <fstream>

namespace mcp_toolhost {

namespace {

Error MakeRegistryError(const std::string& message,
                        std::optional<std::string> detail = std::nullopt) {
    return Error{"ToolRegistry", message, std::move(detail), std::nullopt,
                 ErrorCategory::Config};
}

// Validate the inputSchema of one descriptor. Only the outer shape is
// checked: the schema is advisory metadata for the host.
Result<void, Error> CheckInputSchema(const std::string& tool_name,
                                     const nlohmann::json& schema) {
    if (!schema.is_object()) {
        return Result<void, Error>::Err(
            MakeRegistryError("inputSchema of tool '" + tool_name + "' must be an object"));
    }
    auto type = schema.find("type");
    if (type == schema.end() || *type != "object") {
        return Result<void, Error>::Err(
            MakeRegistryError("inputSchema of tool '" + tool_name +
                              "' must have type \"object\""));
    }
    auto props = schema.find("properties");
    if (props != schema.end() && !props->is_object()) {
        return Result<void, Error>::Err(
            MakeRegistryError("inputSchema.properties of tool '" + tool_name +
                              "' must be an object"));
    }
    auto required = schema.find("required");
    if (required != schema.end()) {
        if (!required->is_array()) {
            return Result<void, Error>::Err(
                MakeRegistryError("inputSchema.required of tool '" + tool_name +
                                  "' must be an array"));
        }
        for (const auto& entry : *required) {
            if (!entry.is_string()) {
                return Result<void, Error>::Err(
                    MakeRegistryError("inputSchema.required of tool '" + tool_name +
                                      "' must contain only strings"));
            }
        }
    }
    return Result<void, Error>::Ok();
}

Result<ToolDescriptor, Error> ParseDescriptor(const nlohmann::json& entry,
                                              std::size_t position) {
    const auto where = "tool entry #" + std::to_string(position);
    if (!entry.is_object()) {
        return Result<ToolDescriptor, Error>::Err(
            MakeRegistryError(where + " must be an object"));
    }

    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string() ||
        name->get<std::string>().empty()) {
        return Result<ToolDescriptor, Error>::Err(
            MakeRegistryError(where + " is missing a non-empty 'name'"));
    }

    ToolDescriptor descriptor;
    descriptor.name = name->get<std::string>();

    auto description = entry.find("description");
    if (description != entry.end()) {
        if (!description->is_string()) {
            return Result<ToolDescriptor, Error>::Err(
                MakeRegistryError("description of tool '" + descriptor.name +
                                  "' must be a string"));
        }
        descriptor.description = description->get<std::string>();
    }

    auto schema = entry.find("inputSchema");
    if (schema == entry.end()) {
        return Result<ToolDescriptor, Error>::Err(
            MakeRegistryError("tool '" + descriptor.name + "' is missing 'inputSchema'"));
    }
    auto schema_ok = CheckInputSchema(descriptor.name, *schema);
    if (schema_ok.IsErr()) {
        return Result<ToolDescriptor, Error>::Err(schema_ok.Error());
    }
    descriptor.input_schema = *schema;

    return Result<ToolDescriptor, Error>::Ok(std::move(descriptor));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Load / FromJson
// ---------------------------------------------------------------------------
Result<ToolRegistry, Error> ToolRegistry::Load(std::string_view file_path) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<ToolRegistry, Error>::Err(
            MakeRegistryError("Cannot open tool list file", std::string(file_path)));
    }

    nlohmann::json source;
    try {
        source = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ToolRegistry, Error>::Err(
            MakeRegistryError("Failed to parse tool list JSON", e.what()));
    }
    return FromJson(source);
}

Result<ToolRegistry, Error> ToolRegistry::FromJson(const nlohmann::json& source) {
    const nlohmann::json* list = &source;
    if (source.is_object()) {
        auto it = source.find("tools");
        if (it == source.end()) {
            return Result<ToolRegistry, Error>::Err(
                MakeRegistryError("Tool list object has no 'tools' member"));
        }
        list = &*it;
    }
    if (!list->is_array()) {
        return Result<ToolRegistry, Error>::Err(
            MakeRegistryError("Tool list must be an array of tool descriptors"));
    }

    ToolRegistry registry;
    std::size_t position = 0;
    for (const auto& entry : *list) {
        ++position;
        auto parsed = ParseDescriptor(entry, position);
        if (parsed.IsErr()) {
            return Result<ToolRegistry, Error>::Err(std::move(parsed).Error());
        }
        auto descriptor = std::move(parsed).Value();
        if (registry.index_.count(descriptor.name) > 0) {
            return Result<ToolRegistry, Error>::Err(
                MakeRegistryError("Duplicate tool name: " + descriptor.name));
        }
        registry.index_.emplace(descriptor.name, registry.tools_.size());
        registry.tools_.push_back(std::move(descriptor));
    }

    return Result<ToolRegistry, Error>::Ok(std::move(registry));
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------
const ToolDescriptor* ToolRegistry::Get(std::string_view name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

bool ToolRegistry::Contains(std::string_view name) const {
    return index_.find(name) != index_.end();
}

nlohmann::json ToolRegistry::ToJson() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return tools;
}

} // namespace mcp_toolhost
