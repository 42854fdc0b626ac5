#pragma once

#include <mcp_toolhost/core/log.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_toolhost {

// True when cpp-httplib was built with OpenSSL and can reach https URLs.
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
inline constexpr bool kTlsAvailable = true;
#else
inline constexpr bool kTlsAvailable = false;
#endif

struct WeatherConfig {
    std::string api_key_env = "OPENWEATHER_API_KEY";  // env var holding the API key
    // The API key travels as a query parameter, so plain http exposes it.
    std::string base_url = kTlsAvailable ? "https://api.openweathermap.org"
                                         : "http://api.openweathermap.org";
    int timeout_seconds = 10;
};

// Identity and behavior of the MCP server, returned verbatim by initialize.
// Loaded once at startup and never mutated afterwards.
struct ServerConfig {
    std::string protocol_version = "2025-03-26";
    std::string server_name;
    std::string server_version = "1.0.0";
    nlohmann::json capabilities = {{"tools", {{"listChanged", false}}}};
    std::string instructions;

    // Reject requests other than initialize/ping until initialize was seen.
    bool strict_lifecycle = false;
    // Check tools/call arguments against the advertised inputSchema.
    bool validate_arguments = false;

    WeatherConfig weather;
};

// Process-level options, from the command line.
struct AppConfig {
    std::string config_path = "config/server.yaml";
    std::string tools_path = "config/tools.json";
    std::optional<std::string> log_file;
    bool log_json = false;
    LogLevel log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
    bool show_version = false;
};

} // namespace mcp_toolhost
