#include <mcp_toolhost/config/config_loader.hpp>
#include <mcp_toolhost/core/log.hpp>
#include <mcp_toolhost/core/terminal.hpp>
#include <mcp_toolhost/core/version.hpp>
#include <mcp_toolhost/mcp/handler_resolver.hpp>
#include <mcp_toolhost/mcp/mcp_server.hpp>
#include <mcp_toolhost/mcp/mcp_tool_handlers.hpp>
#include <mcp_toolhost/mcp/tool_registry.hpp>
#include <mcp_toolhost/mcp/transport.hpp>
#include <mcp_toolhost/tools/movie_catalog.hpp>
#include <mcp_toolhost/tools/weather_client.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace mcp_toolhost;

namespace {

constexpr int kExitSuccess = 0;
constexpr const char* kComponent = "main";

// stdout carries protocol traffic only; everything else goes to stderr.
void PrintError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

std::unique_ptr<ILogSink> MakeLogSink(const AppConfig& app) {
    if (app.log_file) {
        auto sink = std::make_unique<FileSink>(*app.log_file, app.log_json);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "Warning: cannot open log file " << *app.log_file
                  << ", logging to stderr\n";
    }
    if (app.log_json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ConsoleSink>(
        ResolveLogColor(app.force_color, app.force_no_color));
}

void ReportCoverage(const ToolRegistry& registry, const HandlerResolver& resolver) {
    auto coverage = CheckCoverage(registry, resolver);
    for (const auto& name : coverage.unresolved_tools) {
        LogWarn(kComponent, "Tool '" + name +
                                "' is listed but has no handler; calls will fail");
    }
    for (const auto& name : coverage.unlisted_handlers) {
        LogWarn(kComponent, "Handler '" + name +
                                "' is registered but not in the tool list");
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    // Step 1: CLI (argparse handles --help itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto& app = cli_result.Value();

    if (app.show_version) {
        std::cout << "mcp-toolhost " << kVersion << "\n";
        return kExitSuccess;
    }

    // Step 2: logging.
    InitGlobalLogger(MakeLogSink(app), app.log_level);
    LogInfo(kComponent, std::string("mcp-toolhost ") + kVersion + " starting");

    // Step 3: server config and tool list.
    auto server_config = LoadServerConfig(app.config_path);
    if (server_config.IsErr()) {
        LogError(kComponent, server_config.Error().ToString());
        PrintError(server_config.Error());
        return server_config.Error().ExitCode();
    }

    auto registry = ToolRegistry::Load(app.tools_path);
    if (registry.IsErr()) {
        LogError(kComponent, registry.Error().ToString());
        PrintError(registry.Error());
        return registry.Error().ExitCode();
    }
    LogInfo(kComponent, "Loaded " + std::to_string(registry.Value().Size()) +
                            " tools from " + app.tools_path);

    // Step 4: handlers. Catalog and weather client outlive the server.
    auto catalog = MovieCatalog::WithDefaultProgram();
    HttpWeatherClient weather(server_config.Value().weather);

    HandlerResolver resolver;
    RegisterBuiltinTools(resolver, catalog, weather);
    ReportCoverage(registry.Value(), resolver);

    // Step 5: serve on stdio until end of input or shutdown.
    StreamTransport transport(std::cin, std::cout);
    McpServer server(std::move(server_config).Value(),
                     std::move(registry).Value(),
                     std::move(resolver),
                     transport);
    server.Run();

    LogInfo(kComponent, "Stopped");
    return kExitSuccess;
}
