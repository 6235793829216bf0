#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>
#include <cowgnition/mcp/connection_server.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace cowgnition {

struct HttpTransportOptions {
    std::string host = "127.0.0.1";
    int port = 8080;  // 0 binds an ephemeral port
    std::string path = "/mcp";
    std::size_t max_sessions = 64;
    std::size_t max_payload_bytes = 10 * 1024 * 1024;
    // Sessions without traffic for this long are closed. Zero keeps them.
    std::chrono::milliseconds session_idle_timeout{std::chrono::minutes(30)};
};

// Outcome of one HTTP exchange, independent of the socket layer.
struct HttpExchange {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::string session_id;  // set on the response header when not empty
};

using ConnectionFactory = std::function<std::unique_ptr<ConnectionServer>()>;

// ---------------------------------------------------------------------------
// HttpTransport — one JSON-RPC message per POST, sessions keyed by the
// Mcp-Session-Id header.
//
// An initialize request without a session id opens a session and returns
// the new id. Other requests must name a live session: a missing header is
// 400, an unknown id 404. Requests answer 200 with the response body,
// notifications 202 with an empty body. DELETE ends a session, as does a
// session reaching Terminated or Failed or going idle past
// session_idle_timeout.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(HttpTransportOptions options, ConnectionFactory factory,
                  std::shared_ptr<Logger> logger);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// Listen until `token` is cancelled. New POSTs are then refused while
    /// every session drains, and the listener stops once responses to the
    /// requests already accepted are written. Failing to bind is a
    /// Transport error.
    [[nodiscard]] Result<void, Error> Serve(const CancellationToken& token);

    [[nodiscard]] HttpExchange HandlePost(const std::string& session_id,
                                          const std::string& body);

    [[nodiscard]] HttpExchange HandleDelete(const std::string& session_id);

    /// Close sessions idle for longer than session_idle_timeout. Sessions
    /// with a request in progress are kept. Returns the number closed.
    std::size_t EvictIdle();

    [[nodiscard]] std::size_t SessionCount() const;

    /// Port actually bound, valid once Serve is listening.
    [[nodiscard]] int BoundPort() const;

    /// True once Serve is accepting connections.
    [[nodiscard]] bool IsListening() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cowgnition
