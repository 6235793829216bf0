#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cowgnition {

struct ServerConfig {
    std::string name = "CowGnition MCP Server";
    std::string transport = "stdio";  // stdio | http
    std::string host = "127.0.0.1";
    int port = 8080;
    std::string http_path = "/mcp";
    int request_timeout_ms = 30000;
    int shutdown_timeout_ms = 5000;
    int session_idle_timeout_seconds = 1800;  // http only
    std::string instructions;
};

struct SchemaConfig {
    std::string override_uri;  // empty: embedded schema
    int fetch_timeout_seconds = 30;
    bool validate_incoming = true;
    bool validate_outgoing = true;
    bool strict_outgoing = false;
    std::vector<std::string> skip_methods{"ping"};
};

struct LoggingConfig {
    std::string level = "info";
    std::string format = "console";  // console | json
    std::optional<std::string> file;
    bool force_color = false;
    bool no_color = false;
};

struct AppConfig {
    ServerConfig server;
    SchemaConfig schema;
    LoggingConfig logging;
    std::optional<std::string> config_path;
};

} // namespace cowgnition
