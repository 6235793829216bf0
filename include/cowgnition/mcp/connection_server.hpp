#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>
#include <cowgnition/jsonrpc/message.hpp>
#include <cowgnition/mcp/router.hpp>
#include <cowgnition/mcp/session.hpp>
#include <cowgnition/mcp/state_machine.hpp>
#include <cowgnition/schema/schema_validator.hpp>
#include <cowgnition/transport/transport.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace cowgnition {

struct ConnectionServerOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds shutdown_timeout{5000};
    bool validate_incoming = true;
    bool validate_outgoing = true;
    // Replace a response that fails outgoing validation with an internal
    // error instead of sending it with a warning.
    bool strict_outgoing = false;
    std::set<std::string> skip_methods{"ping"};
};

class McpSession;

// ---------------------------------------------------------------------------
// ConnectionServer — the per-session protocol engine.
//
// Each message goes through decode, schema validation, state authorization
// and router dispatch. Failures local to one message become JSON-RPC error
// responses; only transport failures end the loop with an error.
//
// HandleMessage may be called concurrently (HTTP); Serve drives a
// sequential stream transport (stdio) and answers in arrival order.
//
// Request tokens descend from a per-session source that only Drain (or
// the destructor) cancels, so a shutdown signal stops intake without
// interrupting work that finishes within shutdown_timeout.
// ---------------------------------------------------------------------------
class ConnectionServer {
public:
    ConnectionServer(std::shared_ptr<const Router> router,
                     std::shared_ptr<ISchemaValidator> validator,
                     ConnectionServerOptions options,
                     std::shared_ptr<Logger> logger);
    ~ConnectionServer();

    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    /// Process one raw message. Returns the encoded response, or nullopt
    /// for notifications, responses and undecodable messages without id.
    [[nodiscard]] std::optional<std::string> HandleMessage(std::string_view raw);

    /// Read and answer messages until exit, end of stream or cancellation.
    /// Once `token` fires no further message is read; a request already
    /// being handled gets shutdown_timeout to finish before it is cancelled.
    [[nodiscard]] Result<void, Error> Serve(ITransport& transport,
                                            const CancellationToken& token);

    /// Wait up to shutdown_timeout for running requests and handler
    /// threads, then cancel whatever is left. Returns false if anything
    /// had to be cancelled.
    bool Drain();

    [[nodiscard]] ProtocolState CurrentState() const;

    /// True once the session reached Terminated or Failed.
    [[nodiscard]] bool IsDone() const;

    [[nodiscard]] std::shared_ptr<ISession> Session() const;

    [[nodiscard]] std::size_t InFlightCount() const;

    /// Requests between receipt and response.
    [[nodiscard]] std::size_t ActiveRequests() const;

private:
    std::optional<Response> HandleRequest(const Request& request,
                                          const nlohmann::json& document);
    void HandleNotification(const Notification& notification,
                            const nlohmann::json& document);

    std::optional<Error> ValidateIncoming(const std::string& method,
                                          const nlohmann::json& document) const;
    Response ValidateOutgoing(const std::string& method, Response response) const;

    Result<nlohmann::json, Error> Dispatch(const nlohmann::json& id,
                                           const std::string& method,
                                           const nlohmann::json& params,
                                           MessageKind kind,
                                           const CancellationToken& token);

    // Apply a lifecycle event, logging when it does not apply.
    bool Apply(LifecycleEvent event);

    // Cancel every request and handler of this session.
    void ForceCancel();

    std::shared_ptr<const Router> router_;
    std::shared_ptr<ISchemaValidator> validator_;
    ConnectionServerOptions options_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<McpSession> session_;
    std::shared_ptr<WaitGroup> in_flight_;
    CancellationSource force_;
    WaitGroup requests_;
};

} // namespace cowgnition
