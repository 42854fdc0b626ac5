#include <mcp_toolhost/mcp/schema_check.hpp>

namespace mcp_toolhost {

namespace {

bool IsType(const nlohmann::json& value, const std::string& type) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "number")  return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    return true;
}

// "type" may be a single name or a list of alternatives.
bool MatchesType(const nlohmann::json& value, const nlohmann::json& type) {
    if (type.is_string()) {
        return IsType(value, type.get<std::string>());
    }
    if (type.is_array()) {
        for (const auto& alternative : type) {
            if (alternative.is_string() &&
                IsType(value, alternative.get<std::string>())) {
                return true;
            }
        }
        return false;
    }
    return true;
}

std::string TypeLabel(const nlohmann::json& type) {
    if (type.is_string()) return type.get<std::string>();
    return type.dump();
}

} // anonymous namespace

Result<void, std::string> CheckArguments(const nlohmann::json& schema,
                                         const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return Result<void, std::string>::Err("arguments must be an object");
    }
    if (!schema.is_object()) {
        return Result<void, std::string>::Ok();
    }

    auto required = schema.find("required");
    if (required != schema.end() && required->is_array()) {
        for (const auto& key : *required) {
            if (key.is_string() && !arguments.contains(key.get<std::string>())) {
                return Result<void, std::string>::Err(
                    "missing required property '" + key.get<std::string>() + "'");
            }
        }
    }

    auto properties = schema.find("properties");
    if (properties != schema.end() && properties->is_object()) {
        for (const auto& [name, property] : properties->items()) {
            auto value = arguments.find(name);
            if (value == arguments.end() || !property.is_object()) {
                continue;
            }
            auto type = property.find("type");
            if (type != property.end() && !MatchesType(*value, *type)) {
                return Result<void, std::string>::Err(
                    "property '" + name + "' must be of type " + TypeLabel(*type));
            }
        }
    }

    return Result<void, std::string>::Ok();
}

} // namespace mcp_toolhost
