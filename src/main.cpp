#include <cowgnition/config/config_loader.hpp>
#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/terminal.hpp>
#include <cowgnition/core/version.hpp>
#include <cowgnition/mcp/connection_server.hpp>
#include <cowgnition/mcp/lifecycle.hpp>
#include <cowgnition/mcp/resource_registry.hpp>
#include <cowgnition/mcp/tool_registry.hpp>
#include <cowgnition/schema/schema_validator.hpp>
#include <cowgnition/transport/http_transport.hpp>
#include <cowgnition/transport/stdio_transport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitSessionFailed = 1;

constexpr const char* kComponent = "main";

volatile std::sig_atomic_t g_signal = 0;

extern "C" void HandleSignal(int signal) {
    g_signal = signal;
}

std::shared_ptr<cowgnition::Logger> MakeLogger(const cowgnition::AppConfig& config,
                                               std::string& error) {
    using namespace cowgnition;

    const auto level = ParseLogLevel(config.logging.level).value_or(LogLevel::Info);
    const bool json = config.logging.format == "json";

    std::unique_ptr<ILogSink> sink;
    if (config.logging.file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.logging.file, json);
        if (!file->IsOpen()) {
            error = "Cannot open log file: " + *config.logging.file;
            return nullptr;
        }
        sink = std::move(file);
    } else if (json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(
            ResolveLogColor(config.logging.force_color, config.logging.no_color));
    }
    return std::make_shared<Logger>(std::move(sink), level);
}

cowgnition::ConnectionServerOptions MakeServerOptions(const cowgnition::AppConfig& config) {
    cowgnition::ConnectionServerOptions options;
    options.request_timeout = std::chrono::milliseconds(config.server.request_timeout_ms);
    options.shutdown_timeout = std::chrono::milliseconds(config.server.shutdown_timeout_ms);
    options.validate_incoming = config.schema.validate_incoming;
    options.validate_outgoing = config.schema.validate_outgoing;
    options.strict_outgoing = config.schema.strict_outgoing;
    options.skip_methods = {config.schema.skip_methods.begin(),
                            config.schema.skip_methods.end()};
    return options;
}

// Server status, exposed both as a tool and as a resource.
nlohmann::json ServerStatus(const cowgnition::AppConfig& config,
                            const cowgnition::SchemaValidator& validator,
                            const cowgnition::ISession* session) {
    nlohmann::json status = {
        {"name", config.server.name},
        {"version", cowgnition::kVersion},
        {"transport", config.server.transport},
        {"schemaVersion", validator.GetSchemaVersion()},
        {"schemaOrigin", validator.SchemaOrigin()},
    };
    if (session != nullptr) {
        status["state"] = cowgnition::ToString(session->CurrentState());
        status["protocolVersion"] = session->ProtocolVersion();
        status["client"] = session->ClientInfo();
    }
    return status;
}

cowgnition::Result<void, cowgnition::Error> RegisterBuiltins(
    cowgnition::ToolRegistry& tools, cowgnition::ResourceRegistry& resources,
    const cowgnition::AppConfig& config,
    std::shared_ptr<const cowgnition::SchemaValidator> validator) {
    using namespace cowgnition;

    auto status_tool = tools.Register(
        "getServerStatus", "Report server version, schema and session state",
        {{"type", "object"}, {"properties", nlohmann::json::object()},
         {"additionalProperties", false}},
        [config, validator](RequestContext& ctx, const nlohmann::json&) {
            return ToolResult::Text(
                ServerStatus(config, *validator, ctx.session.get()).dump(2));
        });
    if (status_tool.IsErr()) {
        return status_tool;
    }

    return resources.Register(
        ResourceDescriptor{"cowgnition://server/status", "Server status",
                           "Server version, schema and session state",
                           "application/json"},
        [config, validator](RequestContext& ctx) {
            return Result<std::string, Error>::Ok(
                ServerStatus(config, *validator, ctx.session.get()).dump(2));
        });
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace cowgnition;

    auto config_result = ResolveConfig(argc, argv);
    if (config_result.IsErr()) {
        std::cerr << "Error: " << config_result.Error().message << "\n";
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    std::string logger_error;
    auto logger = MakeLogger(config, logger_error);
    if (!logger) {
        std::cerr << "Error: " << logger_error << "\n";
        return Error{"main", logger_error, ErrorCategory::Config}.ExitCode();
    }
    logger->Info(kComponent, std::string(kProjectName) + " " + kVersion + " starting (" +
                                 config.server.transport + " transport)");

    // Signals only set a flag; the watcher turns it into a cancellation.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    CancellationSource root;
    std::atomic<bool> finished{false};
    std::thread watcher([&root, &finished, logger] {
        while (!finished.load()) {
            if (g_signal != 0) {
                logger->Info(kComponent, "Received signal " + std::to_string(g_signal) +
                                             ", shutting down");
                root.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    auto stop_watcher = [&finished, &watcher] {
        finished = true;
        if (watcher.joinable()) watcher.join();
    };

    // -- Schema --
    auto validator = std::make_shared<SchemaValidator>(
        SchemaSourceOptions{config.schema.override_uri,
                            std::chrono::seconds(config.schema.fetch_timeout_seconds)},
        std::make_shared<HttpSchemaFetcher>(), logger);
    auto initialized = validator->Initialize(root.Token());
    if (initialized.IsErr()) {
        logger->Error(kComponent, "Schema validator failed to initialize: " +
                                      initialized.Error().ToString());
        stop_watcher();
        return initialized.Error().ExitCode();
    }

    // -- Routes --
    auto tools = std::make_shared<ToolRegistry>();
    auto resources = std::make_shared<ResourceRegistry>();
    auto builtins = RegisterBuiltins(*tools, *resources, config, validator);
    ServerInfo info{config.server.name, kVersion, config.server.instructions};
    auto router = builtins.IsErr()
                      ? Result<std::shared_ptr<const Router>, Error>::Err(builtins.Error())
                      : BuildRouter(info, {tools, resources}, logger);
    if (router.IsErr()) {
        logger->Error(kComponent, "Route registration failed: " + router.Error().ToString());
        stop_watcher();
        auto shutdown = validator->Shutdown();
        if (shutdown.IsErr()) {
            logger->Warn(kComponent, "Schema validator shutdown: " + shutdown.Error().message);
        }
        return router.Error().ExitCode();
    }
    const auto routes = std::move(router).Value();
    const auto options = MakeServerOptions(config);

    // -- Serve --
    std::atomic<bool> session_failed{false};
    auto serving = std::async(std::launch::async, [&]() -> Result<void, Error> {
        if (config.server.transport == "http") {
            HttpTransportOptions http;
            http.host = config.server.host;
            http.port = config.server.port;
            http.path = config.server.http_path;
            http.session_idle_timeout =
                std::chrono::seconds(config.server.session_idle_timeout_seconds);
            HttpTransport transport(
                http,
                [&] { return std::make_unique<ConnectionServer>(routes, validator, options, logger); },
                logger);
            return transport.Serve(root.Token());
        }

        if (IsStdinTty()) {
            logger->Warn(kComponent, "stdin is a terminal; expecting one JSON-RPC message per line");
        }
        StdioTransport transport(std::cin, std::cout, kDefaultMaxMessageBytes, logger);
        ConnectionServer server(routes, validator, options, logger);
        auto served = server.Serve(transport, root.Token());
        session_failed = server.CurrentState() == ProtocolState::Failed;
        return served;
    });

    auto served = serving.get();
    stop_watcher();

    auto shutdown = validator->Shutdown();
    if (shutdown.IsErr()) {
        logger->Warn(kComponent, "Schema validator shutdown: " + shutdown.Error().message);
    }

    if (served.IsErr()) {
        logger->Error(kComponent, "Server stopped: " + served.Error().ToString());
        return served.Error().ExitCode();
    }
    if (session_failed) {
        logger->Error(kComponent, "Session ended after a protocol violation");
        return kExitSessionFailed;
    }
    logger->Info(kComponent, "Shutdown complete");
    return kExitSuccess;
}
