#include <mcp_toolhost/config/config_loader.hpp>

#include <mcp_toolhost/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <exception>
#include <string>

namespace mcp_toolhost {

namespace {

Error MakeConfigError(const std::string& message,
                      std::optional<std::string> detail = std::nullopt) {
    return Error{"ConfigLoader", message, std::move(detail), std::nullopt,
                 ErrorCategory::Config};
}

Error MakeUsageError(const std::string& message) {
    return Error{"CommandLine", message, std::nullopt, std::nullopt,
                 ErrorCategory::Usage};
}

nlohmann::json ScalarToJson(const YAML::Node& node) {
    // Quoted scalars carry the non-specific "!" tag and always stay strings.
    if (node.Tag() == "!") {
        return node.Scalar();
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        return static_cast<std::int64_t>(i);
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return node.Scalar();
}

// Parse the "server" block: name (required) and version.
void ParseServerBlock(const YAML::Node& server, ServerConfig& config) {
    if (server["name"]) {
        config.server_name = server["name"].as<std::string>();
    }
    if (server["version"]) {
        config.server_version = server["version"].as<std::string>();
    }
}

void ParseWeatherBlock(const YAML::Node& weather, WeatherConfig& config) {
    if (weather["api_key_env"]) {
        config.api_key_env = weather["api_key_env"].as<std::string>();
    }
    if (weather["base_url"]) {
        config.base_url = weather["base_url"].as<std::string>();
    }
    if (weather["timeout_seconds"]) {
        config.timeout_seconds = weather["timeout_seconds"].as<int>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// YamlToJson
// ---------------------------------------------------------------------------
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return ScalarToJson(node);
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// LoadServerConfig
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadServerConfig(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::BadFile&) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Cannot open server config file",
                            std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse server config YAML", e.what()));
    }

    if (!root.IsMap()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Server config must be a YAML mapping",
                            std::string(file_path)));
    }

    ServerConfig config;
    try {
        if (root["protocol_version"]) {
            config.protocol_version = root["protocol_version"].as<std::string>();
        }

        // -- Identity --
        if (root["server"]) {
            if (!root["server"].IsMap()) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("'server' must be a mapping with name and version"));
            }
            ParseServerBlock(root["server"], config);
        }

        // -- Capabilities --
        if (root["capabilities"]) {
            if (!root["capabilities"].IsMap()) {
                return Result<ServerConfig, Error>::Err(
                    MakeConfigError("'capabilities' must be a mapping"));
            }
            config.capabilities = YamlToJson(root["capabilities"]);
        }

        if (root["instructions"]) {
            config.instructions = root["instructions"].as<std::string>();
        }

        // -- Behavior --
        if (root["strict_lifecycle"]) {
            config.strict_lifecycle = root["strict_lifecycle"].as<bool>();
        }
        if (root["validate_arguments"]) {
            config.validate_arguments = root["validate_arguments"].as<bool>();
        }

        // -- Tool settings --
        if (root["weather"]) {
            ParseWeatherBlock(root["weather"], config.weather);
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Invalid value in server config", e.what()));
    }

    auto valid = ValidateServerConfig(config);
    if (valid.IsErr()) {
        return Result<ServerConfig, Error>::Err(valid.Error());
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is taken by verbosity, so only --help is a default argument.
    argparse::ArgumentParser program("mcp-toolhost", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP tool server speaking JSON-RPC 2.0 over stdin/stdout.");

    program.add_argument("-c", "--config")
        .help("Path to the server config YAML file")
        .default_value(std::string("config/server.yaml"));
    program.add_argument("-t", "--tools")
        .help("Path to the tool list JSON file")
        .default_value(std::string("config/tools.json"));
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);

    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeUsageError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_path = program.get<std::string>("--config");
    config.tools_path = program.get<std::string>("--tools");
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.log_json = program.get<bool>("--log-json");
    config.force_color = program.get<bool>("--color");
    config.force_no_color = program.get<bool>("--no-color");
    config.show_version = program.get<bool>("--version");

    if (verbosity >= 2) {
        config.log_level = LogLevel::Debug;
    } else if (verbosity == 1) {
        config.log_level = LogLevel::Info;
    }

    auto valid = ValidateAppConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------
Result<void, Error> ValidateAppConfig(const AppConfig& config) {
    if (config.config_path.empty()) {
        return Result<void, Error>::Err(MakeUsageError("--config must not be empty"));
    }
    if (config.tools_path.empty()) {
        return Result<void, Error>::Err(MakeUsageError("--tools must not be empty"));
    }
    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, Error>::Err(MakeUsageError("--log-file must not be empty"));
    }
    if (config.force_color && config.force_no_color) {
        return Result<void, Error>::Err(
            MakeUsageError("Cannot use both --color and --no-color"));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ValidateServerConfig(const ServerConfig& config) {
    if (config.server_name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: server.name"));
    }
    if (config.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("protocol_version must not be empty"));
    }
    if (!config.capabilities.is_object()) {
        return Result<void, Error>::Err(
            MakeConfigError("'capabilities' must be a mapping"));
    }
    if (config.weather.api_key_env.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.api_key_env must not be empty"));
    }
    if (!kTlsAvailable && config.weather.base_url.rfind("https://", 0) == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.base_url uses https but this build has no TLS support"));
    }
    if (config.weather.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("weather.timeout_seconds must be positive, got " +
                            std::to_string(config.weather.timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_toolhost
