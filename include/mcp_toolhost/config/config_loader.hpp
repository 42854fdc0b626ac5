#pragma once

#include <mcp_toolhost/config/app_config.hpp>
#include <mcp_toolhost/core/result.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace mcp_toolhost {

// Parse the server YAML file into a ServerConfig.
Result<ServerConfig, Error> LoadServerConfig(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateAppConfig(const AppConfig& config);
Result<void, Error> ValidateServerConfig(const ServerConfig& config);

// Convert a YAML node into JSON. Plain scalars become booleans, integers or
// floats when they parse as such; quoted scalars always stay strings.
nlohmann::json YamlToJson(const YAML::Node& node);

} // namespace mcp_toolhost
