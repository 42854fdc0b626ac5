#include <catch2/catch_test_macros.hpp>

#include <mcp_toolhost/config/config_loader.hpp>

#include <string>

using namespace mcp_toolhost;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source tree from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);            // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));   // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadServerConfig
// ===========================================================================

TEST_CASE("LoadServerConfig: valid full config", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("valid_server.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.protocol_version == "2024-11-05");
    CHECK(config.server_name == "TestServer");
    CHECK(config.server_version == "2.3.4");
    CHECK(config.capabilities["tools"]["listChanged"] == true);
    CHECK(config.capabilities["logging"] == nlohmann::json::object());
    CHECK(config.instructions == "Use the test tools.");
    CHECK(config.strict_lifecycle == true);
    CHECK(config.validate_arguments == true);
    CHECK(config.weather.api_key_env == "TEST_WEATHER_KEY");
    CHECK(config.weather.base_url == "http://localhost:8089");
    CHECK(config.weather.timeout_seconds == 3);
}

TEST_CASE("LoadServerConfig: minimal config uses defaults", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("minimal_server.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server_name == "Minimal");
    CHECK(config.protocol_version == "2025-03-26");
    CHECK(config.server_version == "1.0.0");
    CHECK(config.capabilities["tools"]["listChanged"] == false);
    CHECK(config.instructions.empty());
    CHECK(config.strict_lifecycle == false);
    CHECK(config.validate_arguments == false);
    CHECK(config.weather.api_key_env == "OPENWEATHER_API_KEY");
    CHECK(config.weather.timeout_seconds == 10);
}

TEST_CASE("LoadServerConfig: nonexistent file", "[config][yaml]") {
    auto result = LoadServerConfig("/nonexistent/path/server.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().message == "Cannot open server config file");
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadServerConfig: server.name is required", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("missing_name_server.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing required field: server.name");
}

TEST_CASE("LoadServerConfig: capabilities must be a mapping", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("bad_capabilities_server.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "'capabilities' must be a mapping");
}

TEST_CASE("LoadServerConfig: timeout must be positive", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("bad_timeout_server.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("weather.timeout_seconds") != std::string::npos);
}

TEST_CASE("LoadServerConfig: malformed YAML", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("malformed_server.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadServerConfig: root must be a mapping", "[config][yaml]") {
    auto result = LoadServerConfig(TestDataPath("scalar_server.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Server config must be a YAML mapping");
}

// ===========================================================================
// YamlToJson
// ===========================================================================

TEST_CASE("YamlToJson: scalars keep their natural types", "[config][yaml]") {
    auto node = YAML::Load(R"(
flag: true
count: 3
ratio: 0.5
name: movies
quoted: "42"
nothing: ~
list: [1, two]
)");
    auto j = YamlToJson(node);

    CHECK(j["flag"] == true);
    CHECK(j["count"] == 3);
    CHECK(j["ratio"] == 0.5);
    CHECK(j["name"] == "movies");
    CHECK(j["quoted"] == "42");
    CHECK(j["nothing"].is_null());
    REQUIRE(j["list"].size() == 2);
    CHECK(j["list"][0] == 1);
    CHECK(j["list"][1] == "two");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: defaults", "[config][cli]") {
    const char* argv[] = {"mcp-toolhost"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.config_path == "config/server.yaml");
    CHECK(config.tools_path == "config/tools.json");
    CHECK_FALSE(config.log_file.has_value());
    CHECK(config.log_json == false);
    CHECK(config.log_level == LogLevel::Warn);
    CHECK(config.show_version == false);
}

TEST_CASE("LoadFromCli: paths and log options", "[config][cli]") {
    const char* argv[] = {
        "mcp-toolhost",
        "-c", "/etc/mcp/server.yaml",
        "--tools", "/etc/mcp/tools.json",
        "--log-file", "/tmp/mcp.log",
        "--log-json"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.config_path == "/etc/mcp/server.yaml");
    CHECK(config.tools_path == "/etc/mcp/tools.json");
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/mcp.log");
    CHECK(config.log_json == true);
}

TEST_CASE("LoadFromCli: verbosity levels", "[config][cli]") {
    const char* info_argv[] = {"mcp-toolhost", "-v"};
    auto info = LoadFromCli(2, info_argv);
    REQUIRE(info.IsOk());
    CHECK(info.Value().log_level == LogLevel::Info);

    const char* debug_argv[] = {"mcp-toolhost", "-v", "-v"};
    auto debug = LoadFromCli(3, debug_argv);
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().log_level == LogLevel::Debug);
}

TEST_CASE("LoadFromCli: --version flag", "[config][cli]") {
    const char* argv[] = {"mcp-toolhost", "--version"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().show_version == true);
}

TEST_CASE("LoadFromCli: --color with --no-color is a usage error", "[config][cli]") {
    const char* argv[] = {"mcp-toolhost", "--color", "--no-color"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Usage);
    CHECK(result.Error().ExitCode() == 1);
}

TEST_CASE("LoadFromCli: unknown argument is a usage error", "[config][cli]") {
    const char* argv[] = {"mcp-toolhost", "--bogus"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Usage);
    CHECK(result.Error().message.find("CLI parse error") == 0);
}

TEST_CASE("LoadFromCli: empty config path is rejected", "[config][cli]") {
    const char* argv[] = {"mcp-toolhost", "--config", ""};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "--config must not be empty");
}

// ===========================================================================
// ValidateServerConfig
// ===========================================================================

TEST_CASE("ValidateServerConfig: rejects empty api_key_env", "[config][validate]") {
    ServerConfig config;
    config.server_name = "S";
    config.weather.api_key_env.clear();
    auto result = ValidateServerConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "weather.api_key_env must not be empty");
}

TEST_CASE("ValidateServerConfig: https upstream needs TLS support", "[config][validate]") {
    ServerConfig config;
    config.server_name = "S";
    config.weather.base_url = "https://api.openweathermap.org";
    auto result = ValidateServerConfig(config);
    if (kTlsAvailable) {
        CHECK(result.IsOk());
    } else {
        REQUIRE(result.IsErr());
        CHECK(result.Error().message ==
              "weather.base_url uses https but this build has no TLS support");
    }
}

TEST_CASE("WeatherConfig: default endpoint uses https when TLS is built in", "[config]") {
    WeatherConfig weather;
    CHECK(weather.base_url.rfind(kTlsAvailable ? "https://" : "http://", 0) == 0);
}

TEST_CASE("ValidateServerConfig: accepts defaults with a name", "[config][validate]") {
    ServerConfig config;
    config.server_name = "S";
    CHECK(ValidateServerConfig(config).IsOk());
}
