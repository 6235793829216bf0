#include <cowgnition/config/config_loader.hpp>

#include <cowgnition/core/log.hpp>
#include <cowgnition/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstring>
#include <vector>

namespace cowgnition {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_path = std::string(file_path);

    try {
        // -- Server --
        if (const auto server = root["server"]) {
            ReadScalar(server, "name", config.server.name);
            ReadScalar(server, "transport", config.server.transport);
            ReadScalar(server, "host", config.server.host);
            ReadScalar(server, "port", config.server.port);
            ReadScalar(server, "http_path", config.server.http_path);
            ReadScalar(server, "request_timeout_ms", config.server.request_timeout_ms);
            ReadScalar(server, "shutdown_timeout_ms", config.server.shutdown_timeout_ms);
            ReadScalar(server, "session_idle_timeout_seconds",
                       config.server.session_idle_timeout_seconds);
            ReadScalar(server, "instructions", config.server.instructions);
        }

        // -- Schema --
        if (const auto schema = root["schema"]) {
            ReadScalar(schema, "override_uri", config.schema.override_uri);
            ReadScalar(schema, "fetch_timeout_seconds", config.schema.fetch_timeout_seconds);
            ReadScalar(schema, "validate_incoming", config.schema.validate_incoming);
            ReadScalar(schema, "validate_outgoing", config.schema.validate_outgoing);
            ReadScalar(schema, "strict_outgoing", config.schema.strict_outgoing);
            if (schema["skip_methods"]) {
                config.schema.skip_methods.clear();
                for (const auto& method : schema["skip_methods"]) {
                    config.schema.skip_methods.push_back(method.as<std::string>());
                }
            }
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadScalar(logging, "level", config.logging.level);
            ReadScalar(logging, "format", config.logging.format);
            if (logging["file"]) {
                config.logging.file = logging["file"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    std::vector<const char*> args(argv, argv + argc);
    if (args.size() > 1 && std::strcmp(args[1], "serve") == 0) {
        args.erase(args.begin() + 1);
    }

    argparse::ArgumentParser program("cowgnition", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Server
    program.add_argument("--transport")
        .help("Transport: stdio or http");
    program.add_argument("--host")
        .help("HTTP listen address");
    program.add_argument("--port")
        .help("HTTP listen port")
        .scan<'i', int>();
    program.add_argument("--http-path")
        .help("HTTP endpoint path");
    program.add_argument("--request-timeout")
        .help("Per-request timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--shutdown-timeout")
        .help("Grace period for in-flight requests at shutdown, in milliseconds")
        .scan<'i', int>();
    program.add_argument("--session-idle-timeout")
        .help("Close HTTP sessions idle for this many seconds")
        .scan<'i', int>();

    // Schema
    program.add_argument("--schema")
        .help("MCP schema override: file path, file:// or http(s):// URL");
    program.add_argument("--no-validate-incoming")
        .help("Skip schema validation of client messages")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-validate-outgoing")
        .help("Skip schema validation of server responses")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--strict-outgoing")
        .help("Replace invalid server responses with an internal error")
        .default_value(false)
        .implicit_value(true);

    // Logging
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-format")
        .help("console or json");
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(static_cast<int>(args.size()), args.data());
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }

    // Server
    if (auto val = program.present("--transport")) {
        config.server.transport = *val;
    }
    if (auto val = program.present("--host")) {
        config.server.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        config.server.port = *val;
    }
    if (auto val = program.present("--http-path")) {
        config.server.http_path = *val;
    }
    if (auto val = program.present<int>("--request-timeout")) {
        config.server.request_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--shutdown-timeout")) {
        config.server.shutdown_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--session-idle-timeout")) {
        config.server.session_idle_timeout_seconds = *val;
    }

    // Schema
    if (auto val = program.present("--schema")) {
        config.schema.override_uri = *val;
    }
    if (program.get<bool>("--no-validate-incoming")) {
        config.schema.validate_incoming = false;
    }
    if (program.get<bool>("--no-validate-outgoing")) {
        config.schema.validate_outgoing = false;
    }
    if (program.get<bool>("--strict-outgoing")) {
        config.schema.strict_outgoing = true;
    }

    // Logging
    if (auto val = program.present("--log-level")) {
        config.logging.level = *val;
    }
    if (auto val = program.present("--log-format")) {
        config.logging.format = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }
    config.logging.force_color = program.get<bool>("--color");
    config.logging.no_color = program.get<bool>("--no-color");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = base;

    const auto& s = cli_overrides.server;
    if (s.name != defaults.server.name) merged.server.name = s.name;
    if (s.transport != defaults.server.transport) merged.server.transport = s.transport;
    if (s.host != defaults.server.host) merged.server.host = s.host;
    if (s.port != defaults.server.port) merged.server.port = s.port;
    if (s.http_path != defaults.server.http_path) merged.server.http_path = s.http_path;
    if (s.request_timeout_ms != defaults.server.request_timeout_ms) {
        merged.server.request_timeout_ms = s.request_timeout_ms;
    }
    if (s.shutdown_timeout_ms != defaults.server.shutdown_timeout_ms) {
        merged.server.shutdown_timeout_ms = s.shutdown_timeout_ms;
    }
    if (s.session_idle_timeout_seconds != defaults.server.session_idle_timeout_seconds) {
        merged.server.session_idle_timeout_seconds = s.session_idle_timeout_seconds;
    }
    if (!s.instructions.empty()) merged.server.instructions = s.instructions;

    const auto& sc = cli_overrides.schema;
    if (!sc.override_uri.empty()) merged.schema.override_uri = sc.override_uri;
    if (sc.fetch_timeout_seconds != defaults.schema.fetch_timeout_seconds) {
        merged.schema.fetch_timeout_seconds = sc.fetch_timeout_seconds;
    }
    if (!sc.validate_incoming) merged.schema.validate_incoming = false;
    if (!sc.validate_outgoing) merged.schema.validate_outgoing = false;
    if (sc.strict_outgoing) merged.schema.strict_outgoing = true;
    if (sc.skip_methods != defaults.schema.skip_methods) {
        merged.schema.skip_methods = sc.skip_methods;
    }

    const auto& l = cli_overrides.logging;
    if (l.level != defaults.logging.level) merged.logging.level = l.level;
    if (l.format != defaults.logging.format) merged.logging.format = l.format;
    if (l.file.has_value()) merged.logging.file = l.file;
    if (l.force_color) merged.logging.force_color = true;
    if (l.no_color) merged.logging.no_color = true;

    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyEnvOverrides(AppConfig config) {
    if (auto val = GetEnv("COWGNITION_SCHEMA_URI")) {
        config.schema.override_uri = *val;
    }
    if (auto val = GetEnv("COWGNITION_LOG_LEVEL")) {
        config.logging.level = *val;
    }
    if (auto val = GetEnv("COWGNITION_TRANSPORT")) {
        config.server.transport = *val;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.server.transport != "stdio" && config.server.transport != "http") {
        return Result<void, Error>::Err(MakeConfigError(
            "Unknown transport '" + config.server.transport + "' (expected stdio or http)"));
    }
    if (config.server.port < 0 || config.server.port > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.server.port)));
    }
    if (config.server.http_path.empty() || config.server.http_path.front() != '/') {
        return Result<void, Error>::Err(MakeConfigError(
            "HTTP path must start with '/', got '" + config.server.http_path + "'"));
    }
    if (config.server.request_timeout_ms <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Request timeout must be positive, got " +
            std::to_string(config.server.request_timeout_ms)));
    }
    if (config.server.shutdown_timeout_ms < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Shutdown timeout must not be negative, got " +
            std::to_string(config.server.shutdown_timeout_ms)));
    }
    if (config.server.session_idle_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Session idle timeout must be positive, got " +
            std::to_string(config.server.session_idle_timeout_seconds)));
    }
    if (config.schema.fetch_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Schema fetch timeout must be positive, got " +
            std::to_string(config.schema.fetch_timeout_seconds)));
    }
    if (!ParseLogLevel(config.logging.level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + config.logging.level));
    }
    if (config.logging.format != "console" && config.logging.format != "json") {
        return Result<void, Error>::Err(MakeConfigError(
            "Unknown log format '" + config.logging.format + "' (expected console or json)"));
    }
    if (config.logging.force_color && config.logging.no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig base;
    if (cli.Value().config_path.has_value()) {
        auto yaml = LoadFromYaml(*cli.Value().config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        base = std::move(yaml).Value();
    }

    auto merged = MergeConfigs(ApplyEnvOverrides(std::move(base)), cli.Value());
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

} // namespace cowgnition
