#include <cowgnition/mcp/router.hpp>

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "router";

Error MakeRouteError(const std::string& message) {
    return Error{"AddRoute", message, ErrorCategory::Config};
}

// Result slot shared between the dispatching thread and a worker.
struct PendingResult {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Result<nlohmann::json, Error>> result;
    bool cancelled = false;
};

Result<nlohmann::json, Error> Invoke(const RouteHandler& handler,
                                     RequestContext& ctx,
                                     const nlohmann::json& params) {
    try {
        if (const auto* request = std::get_if<RequestHandler>(&handler)) {
            return (*request)(ctx, params);
        }
        const auto& notification = std::get<NotificationHandler>(handler);
        auto r = notification(ctx, params);
        if (r.IsErr()) {
            return Result<nlohmann::json, Error>::Err(std::move(r).Error());
        }
        return Result<nlohmann::json, Error>::Ok(nlohmann::json(nullptr));
    } catch (const std::exception& e) {
        return Result<nlohmann::json, Error>::Err(Error{
            ctx.method, std::string("Handler threw: ") + e.what(),
            ErrorCategory::Handler});
    }
}

} // anonymous namespace

Router::Router(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : MakeNullLogger()) {}

Result<void, Error> Router::AddRoute(const std::string& method, RouteHandler handler) {
    if (method.empty()) {
        return Result<void, Error>::Err(MakeRouteError("Method name must not be empty"));
    }
    const bool empty_handler = std::visit(
        [](const auto& fn) { return !static_cast<bool>(fn); }, handler);
    if (empty_handler) {
        return Result<void, Error>::Err(
            MakeRouteError("No handler supplied for method '" + method + "'"));
    }
    if (routes_.count(method) > 0) {
        return Result<void, Error>::Err(
            MakeRouteError("Method '" + method + "' is already registered"));
    }
    routes_.emplace(method, std::move(handler));
    logger_->Debug(kComponent, "Registered route " + method);
    return Result<void, Error>::Ok();
}

Result<void, Error> Router::AddRequestRoute(const std::string& method,
                                            RequestHandler handler) {
    return AddRoute(method, RouteHandler(std::in_place_index<0>, std::move(handler)));
}

Result<void, Error> Router::AddNotificationRoute(const std::string& method,
                                                 NotificationHandler handler) {
    return AddRoute(method, RouteHandler(std::in_place_index<1>, std::move(handler)));
}

bool Router::HasRoute(std::string_view method) const {
    return routes_.find(method) != routes_.end();
}

std::vector<std::string> Router::Methods() const {
    std::vector<std::string> methods;
    methods.reserve(routes_.size());
    for (const auto& [name, handler] : routes_) {
        methods.push_back(name);
    }
    return methods;
}

Result<nlohmann::json, Error> Router::Dispatch(
    RequestContext& ctx,
    const nlohmann::json& params,
    MessageKind kind,
    std::chrono::milliseconds timeout,
    const std::shared_ptr<WaitGroup>& in_flight) const {
    auto it = routes_.find(ctx.method);
    if (it == routes_.end()) {
        return Result<nlohmann::json, Error>::Err(Error{
            "Dispatch", "Method not found: " + ctx.method,
            ErrorCategory::MethodNotFound, std::nullopt,
            nlohmann::json{{"method", ctx.method}}});
    }

    const bool is_request_route = std::holds_alternative<RequestHandler>(it->second);
    if (kind == MessageKind::Request && !is_request_route) {
        return Result<nlohmann::json, Error>::Err(Error{
            "Dispatch",
            "Method '" + ctx.method + "' is a notification and cannot be called as a request",
            ErrorCategory::MethodNotFound});
    }
    if (kind == MessageKind::Notification && is_request_route) {
        return Result<nlohmann::json, Error>::Err(Error{
            "Dispatch",
            "Method '" + ctx.method + "' is a request and was sent as a notification",
            ErrorCategory::InvalidRequest});
    }

    if (timeout <= std::chrono::milliseconds::zero()) {
        return Invoke(it->second, ctx, params);
    }

    // The worker gets its own context whose token this call can cancel.
    CancellationSource deadline(ctx.token);
    RequestContext worker_ctx = ctx;
    worker_ctx.token = deadline.Token();

    auto pending = std::make_shared<PendingResult>();
    if (in_flight) {
        in_flight->Add();
    }
    std::thread([pending, in_flight, handler = it->second,
                 worker_ctx, params]() mutable {
        auto result = Invoke(handler, worker_ctx, params);
        {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->result = std::move(result);
        }
        pending->cv.notify_all();
        if (in_flight) {
            in_flight->Done();
        }
    }).detach();

    // Registered on the per-call source so callbacks never pile up on a
    // long-lived parent token.
    deadline.Token().OnCancel([weak = std::weak_ptr<PendingResult>(pending)] {
        if (auto p = weak.lock()) {
            {
                std::lock_guard<std::mutex> lock(p->mutex);
                p->cancelled = true;
            }
            p->cv.notify_all();
        }
    });

    const auto expires_at = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(pending->mutex);
    pending->cv.wait_until(lock, expires_at, [&pending] {
        return pending->result.has_value() || pending->cancelled;
    });
    if (!pending->result.has_value()) {
        const bool cancelled = pending->cancelled;
        // Cancelling runs the callback above, which takes the same mutex.
        lock.unlock();
        deadline.Cancel();
        if (cancelled) {
            logger_->Info(kComponent, "Request '" + ctx.method + "' cancelled");
            return Result<nlohmann::json, Error>::Err(Error{
                "Dispatch", "Request cancelled", ErrorCategory::Cancelled,
                std::nullopt, nlohmann::json{{"method", ctx.method}}});
        }
        logger_->Warn(kComponent, "Request '" + ctx.method + "' exceeded " +
                                      std::to_string(timeout.count()) + " ms");
        return Result<nlohmann::json, Error>::Err(Error{
            "Dispatch",
            "Request timed out after " + std::to_string(timeout.count()) + " ms",
            ErrorCategory::Timeout, std::nullopt,
            nlohmann::json{{"method", ctx.method},
                           {"timeoutMs", timeout.count()}}});
    }
    return std::move(*pending->result);
}

} // namespace cowgnition
