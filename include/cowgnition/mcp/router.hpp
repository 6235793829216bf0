#pragma once

#include <cowgnition/core/cancellation.hpp>
#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>
#include <cowgnition/jsonrpc/message.hpp>
#include <cowgnition/mcp/session.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace cowgnition {

// ---------------------------------------------------------------------------
// RequestContext — what a handler gets besides its params.
//
// token is cancelled when the request times out, when the client sends
// $/cancelRequest for it, or when the server shuts down. Handlers doing
// slow work should poll it.
// ---------------------------------------------------------------------------
struct RequestContext {
    nlohmann::json id;  // null for notifications
    std::string method;
    CancellationToken token;
    std::shared_ptr<ISession> session;
    std::shared_ptr<Logger> logger;
};

using RequestHandler =
    std::function<Result<nlohmann::json, Error>(RequestContext&, const nlohmann::json&)>;
using NotificationHandler =
    std::function<Result<void, Error>(RequestContext&, const nlohmann::json&)>;
using RouteHandler = std::variant<RequestHandler, NotificationHandler>;

// ---------------------------------------------------------------------------
// Router — method name to handler.
//
// Routes are added during startup; the server then holds the router as
// std::shared_ptr<const Router>, so dispatch reads an immutable map and
// needs no locking.
// ---------------------------------------------------------------------------
class Router {
public:
    explicit Router(std::shared_ptr<Logger> logger = nullptr);

    /// Register a handler. Fails on an empty method, an empty handler, or
    /// a method that is already registered; the first registration stays.
    [[nodiscard]] Result<void, Error> AddRoute(const std::string& method,
                                               RouteHandler handler);

    [[nodiscard]] Result<void, Error> AddRequestRoute(const std::string& method,
                                                      RequestHandler handler);
    [[nodiscard]] Result<void, Error> AddNotificationRoute(const std::string& method,
                                                           NotificationHandler handler);

    [[nodiscard]] bool HasRoute(std::string_view method) const;

    /// Registered method names, sorted.
    [[nodiscard]] std::vector<std::string> Methods() const;

    /// Invoke the handler for ctx.method.
    ///
    /// An unknown method is a MethodNotFound error and nothing runs. A
    /// request sent to a notification route (or the reverse) is rejected
    /// before invocation. With a positive timeout the handler runs on a
    /// worker thread; when the deadline passes its token is cancelled and
    /// a Timeout error returned while the worker finishes in the background
    /// (counted in `in_flight` when given). Cancelling ctx.token while the
    /// worker runs returns a Cancelled error the same way. Notifications
    /// yield a null value.
    [[nodiscard]] Result<nlohmann::json, Error> Dispatch(
        RequestContext& ctx,
        const nlohmann::json& params,
        MessageKind kind,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
        const std::shared_ptr<WaitGroup>& in_flight = nullptr) const;

private:
    std::map<std::string, RouteHandler, std::less<>> routes_;
    std::shared_ptr<Logger> logger_;
};

} // namespace cowgnition
