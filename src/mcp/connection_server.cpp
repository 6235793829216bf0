#include <cowgnition/mcp/connection_server.hpp>

#include <cowgnition/jsonrpc/error_codes.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <thread>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "server";

// Time granted to force-cancelled handlers to unwind.
constexpr std::chrono::milliseconds kUnwindTimeout{500};

std::string IdKey(const nlohmann::json& id) {
    return id.dump();
}

std::string Truncate(std::string_view text, std::size_t limit = 200) {
    if (text.size() <= limit) return std::string(text);
    return std::string(text.substr(0, limit)) + "...";
}

class ScopedWork {
public:
    explicit ScopedWork(WaitGroup& group) : group_(group) { group_.Add(); }
    ~ScopedWork() { group_.Done(); }

    ScopedWork(const ScopedWork&) = delete;
    ScopedWork& operator=(const ScopedWork&) = delete;

private:
    WaitGroup& group_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// McpSession — state machine, client identity and in-flight requests of
// one connection.
// ---------------------------------------------------------------------------
class McpSession : public ISession {
public:
    explicit McpSession(std::shared_ptr<Logger> logger)
        : machine_(std::move(logger)) {}

    [[nodiscard]] ProtocolState CurrentState() const override {
        return machine_.CurrentState();
    }

    bool CancelRequest(const nlohmann::json& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(IdKey(id));
        if (it == in_flight_.end()) {
            return false;
        }
        it->second->Cancel();
        return true;
    }

    void SetClientInfo(const nlohmann::json& client_info,
                       const nlohmann::json& capabilities,
                       const std::string& protocol_version) override {
        std::lock_guard<std::mutex> lock(mutex_);
        client_info_ = client_info;
        client_capabilities_ = capabilities;
        protocol_version_ = protocol_version;
    }

    [[nodiscard]] nlohmann::json ClientInfo() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_info_;
    }

    [[nodiscard]] std::string ProtocolVersion() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return protocol_version_;
    }

    StateMachine& Machine() { return machine_; }

    /// False when a request with this id is already running.
    bool Track(const nlohmann::json& id, std::shared_ptr<CancellationSource> source) {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_.emplace(IdKey(id), std::move(source)).second;
    }

    void Untrack(const nlohmann::json& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(IdKey(id));
    }

    std::size_t CancelAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, source] : in_flight_) {
            source->Cancel();
        }
        return in_flight_.size();
    }

private:
    StateMachine machine_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CancellationSource>> in_flight_;
    nlohmann::json client_info_ = nlohmann::json::object();
    nlohmann::json client_capabilities_ = nlohmann::json::object();
    std::string protocol_version_;
};

// ---------------------------------------------------------------------------
// ConnectionServer
// ---------------------------------------------------------------------------
ConnectionServer::ConnectionServer(std::shared_ptr<const Router> router,
                                   std::shared_ptr<ISchemaValidator> validator,
                                   ConnectionServerOptions options,
                                   std::shared_ptr<Logger> logger)
    : router_(std::move(router)),
      validator_(std::move(validator)),
      options_(std::move(options)),
      logger_(logger ? std::move(logger) : MakeNullLogger()),
      session_(std::make_shared<McpSession>(logger_)),
      in_flight_(std::make_shared<WaitGroup>()) {}

ConnectionServer::~ConnectionServer() {
    ForceCancel();
}

void ConnectionServer::ForceCancel() {
    auto cancelled = session_->CancelAll();
    force_.Cancel();
    if (cancelled > 0) {
        logger_->Info(kComponent, "Cancelled " + std::to_string(cancelled) +
                                      " in-flight request(s)");
    }
}

ProtocolState ConnectionServer::CurrentState() const {
    return session_->CurrentState();
}

bool ConnectionServer::IsDone() const {
    return IsTerminal(CurrentState());
}

std::shared_ptr<ISession> ConnectionServer::Session() const {
    return session_;
}

std::size_t ConnectionServer::InFlightCount() const {
    return in_flight_->Count();
}

std::size_t ConnectionServer::ActiveRequests() const {
    return requests_.Count();
}

bool ConnectionServer::Apply(LifecycleEvent event) {
    auto r = session_->Machine().Transition(event);
    if (r.IsErr()) {
        logger_->Warn(kComponent, r.Error().message);
        return false;
    }
    return true;
}

std::optional<std::string> ConnectionServer::HandleMessage(std::string_view raw) {
    auto decoded = Decode(raw);
    if (decoded.IsErr()) {
        auto failure = std::move(decoded).Error();
        if (!failure.id_recovered) {
            logger_->Warn(kComponent, "Dropping undecodable message: " +
                                          failure.error.message + " [" + Truncate(raw) + "]");
            return std::nullopt;
        }
        logger_->Warn(kComponent, "Rejecting message " + failure.id.dump() + ": " +
                                      failure.error.message);
        return Encode(MakeErrorResponse(failure.id, failure.error));
    }

    auto message = std::move(decoded).Value();
    if (const auto* request = std::get_if<Request>(&message.message)) {
        ScopedWork active(requests_);
        auto response = HandleRequest(*request, message.document);
        if (!response) {
            return std::nullopt;
        }
        return Encode(*response);
    }
    if (const auto* notification = std::get_if<Notification>(&message.message)) {
        HandleNotification(*notification, message.document);
        return std::nullopt;
    }
    const auto& response = std::get<Response>(message.message);
    logger_->Debug(kComponent, "Ignoring client response for id " + response.id.dump());
    return std::nullopt;
}

std::optional<Error> ConnectionServer::ValidateIncoming(const std::string& method,
                                                        const nlohmann::json& document) const {
    if (!options_.validate_incoming || !validator_ || options_.skip_methods.count(method) > 0) {
        return std::nullopt;
    }
    auto outcome = validator_->Validate(document, MessageDirection::Incoming);
    if (outcome.Passed()) {
        return std::nullopt;
    }
    auto error = outcome.ToError();
    logger_->Warn(kComponent, "Incoming '" + method + "' failed schema validation: " +
                                  outcome.violations.front().message);
    return error;
}

Response ConnectionServer::ValidateOutgoing(const std::string& method, Response response) const {
    if (!options_.validate_outgoing || !validator_ || options_.skip_methods.count(method) > 0) {
        return response;
    }
    auto outcome = validator_->Validate(ToJson(response), MessageDirection::Outgoing, method);
    if (outcome.Passed()) {
        return response;
    }
    logger_->Warn(kComponent, "Outgoing response to '" + method +
                                  "' failed schema validation: " +
                                  outcome.violations.front().message);
    if (!options_.strict_outgoing) {
        return response;
    }
    auto list = nlohmann::json::array();
    for (const auto& v : outcome.violations) list.push_back(v.ToJson());
    return MakeErrorResponse(response.id, jsonrpc::kInternalError,
                             "Server produced an invalid response",
                             {{"method", method}, {"violations", std::move(list)}});
}

Result<nlohmann::json, Error> ConnectionServer::Dispatch(const nlohmann::json& id,
                                                         const std::string& method,
                                                         const nlohmann::json& params,
                                                         MessageKind kind,
                                                         const CancellationToken& token) {
    RequestContext ctx{id, method, token, session_, logger_};
    return router_->Dispatch(ctx, params, kind, options_.request_timeout, in_flight_);
}

std::optional<Response> ConnectionServer::HandleRequest(const Request& request,
                                                        const nlohmann::json& document) {
    const auto& method = request.method;
    const bool is_initialize = method == "initialize";
    logger_->Debug(kComponent, "-> " + method + " id=" + request.id.dump());

    if (auto invalid = ValidateIncoming(method, document)) {
        if (is_initialize && CurrentState() == ProtocolState::Uninitialized) {
            Apply(LifecycleEvent::InitializeFailed);
        }
        return MakeErrorResponse(request.id, *invalid);
    }

    auto authorized = session_->Machine().Authorize(method);
    if (authorized.IsErr()) {
        logger_->Warn(kComponent, authorized.Error().message);
        return MakeErrorResponse(request.id, authorized.Error());
    }

    auto source = std::make_shared<CancellationSource>(force_.Token());
    if (!session_->Track(request.id, source)) {
        return MakeErrorResponse(request.id, jsonrpc::kInvalidRequest,
                                 "Request id " + request.id.dump() + " is already in flight");
    }
    auto result = Dispatch(request.id, method, request.params, MessageKind::Request,
                           source->Token());
    session_->Untrack(request.id);

    if (result.IsOk() && source->IsCancelled()) {
        result = Result<nlohmann::json, Error>::Err(
            Error{method, "Request cancelled", ErrorCategory::Cancelled});
    }

    if (result.IsErr()) {
        auto error = std::move(result).Error();
        if (is_initialize) {
            Apply(LifecycleEvent::InitializeFailed);
        }
        if (error.category == ErrorCategory::Handler || error.category == ErrorCategory::Internal) {
            logger_->Error(kComponent, "'" + method + "' failed: " + error.ToString());
        } else {
            logger_->Info(kComponent, "'" + method + "' returned error: " + error.message);
        }
        return MakeErrorResponse(request.id, error);
    }

    if (is_initialize && !Apply(LifecycleEvent::InitializeSucceeded)) {
        return MakeErrorResponse(
            request.id,
            Error{"initialize", "Session already initialized; 'initialize' is only accepted once",
                  ErrorCategory::StateViolation});
    }
    if (method == "shutdown") {
        Apply(LifecycleEvent::ShutdownRequested);
    }

    return ValidateOutgoing(method, MakeResultResponse(request.id, std::move(result).Value()));
}

void ConnectionServer::HandleNotification(const Notification& notification,
                                          const nlohmann::json& document) {
    const auto& method = notification.method;
    logger_->Debug(kComponent, "-> " + method + " (notification)");

    if (ValidateIncoming(method, document)) {
        return;
    }

    auto authorized = session_->Machine().Authorize(method);
    if (authorized.IsErr()) {
        logger_->Warn(kComponent, authorized.Error().message);
        if (method == "exit") {
            logger_->Error(kComponent, "exit received outside shutdown; failing session");
            Apply(LifecycleEvent::ProtocolViolation);
        }
        return;
    }

    auto result = Dispatch(nullptr, method, notification.params,
                           MessageKind::Notification, force_.Token());
    if (result.IsErr()) {
        logger_->Warn(kComponent, "Notification '" + method + "' failed: " +
                                      result.Error().message);
        return;
    }

    if (method == "notifications/initialized") {
        Apply(LifecycleEvent::ClientInitialized);
    } else if (method == "exit") {
        Apply(LifecycleEvent::ExitReceived);
    }
}

bool ConnectionServer::Drain() {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + options_.shutdown_timeout;
    auto remaining = [&deadline] {
        return std::max(std::chrono::milliseconds(0),
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - Clock::now()));
    };

    if (requests_.WaitFor(remaining()) && in_flight_->WaitFor(remaining())) {
        return true;
    }

    logger_->Warn(kComponent, std::to_string(requests_.Count()) + " request(s) and " +
                                  std::to_string(in_flight_->Count()) +
                                  " handler(s) still running after " +
                                  std::to_string(options_.shutdown_timeout.count()) +
                                  " ms; cancelling");
    ForceCancel();
    if (!requests_.WaitFor(kUnwindTimeout) || !in_flight_->WaitFor(kUnwindTimeout)) {
        logger_->Warn(kComponent, "Handlers ignored cancellation; abandoning them");
    }
    return false;
}

Result<void, Error> ConnectionServer::Serve(ITransport& transport,
                                            const CancellationToken& token) {
    logger_->Info(kComponent, "Session started");

    // Force-cancels a request still running shutdown_timeout after the
    // caller's token fired. Both sources outlive the thread.
    CancellationSource finished;
    CancellationSource wake(token);
    std::thread grace([this, &finished, &wake] {
        wake.Token().Wait();
        if (finished.IsCancelled()) {
            return;
        }
        logger_->Info(kComponent, "Shutdown requested; waiting up to " +
                                      std::to_string(options_.shutdown_timeout.count()) +
                                      " ms for the current request");
        if (!finished.Token().WaitFor(options_.shutdown_timeout)) {
            ForceCancel();
        }
    });
    auto stop_grace = [&finished, &wake, &grace] {
        finished.Cancel();
        wake.Cancel();
        grace.join();
    };

    while (!IsDone()) {
        if (token.IsCancelled()) {
            logger_->Info(kComponent, "Shutdown requested, leaving serve loop");
            break;
        }
        auto raw = transport.Read(token);
        if (raw.IsErr()) {
            auto error = std::move(raw).Error();
            if (error.category == ErrorCategory::EndOfStream) {
                logger_->Info(kComponent, "Client closed the stream");
                break;
            }
            if (error.category == ErrorCategory::Cancelled) {
                logger_->Info(kComponent, "Shutdown requested, leaving serve loop");
                break;
            }
            if (error.category == ErrorCategory::Decode) {
                logger_->Warn(kComponent, "Dropping frame: " + error.message);
                continue;
            }
            logger_->Error(kComponent, "Transport read failed: " + error.ToString());
            Apply(LifecycleEvent::TransportError);
            stop_grace();
            Drain();
            return Result<void, Error>::Err(std::move(error));
        }

        auto response = HandleMessage(raw.Value());
        if (!response) {
            continue;
        }
        auto written = transport.Write(*response);
        if (written.IsErr()) {
            logger_->Error(kComponent, "Transport write failed: " + written.Error().ToString());
            Apply(LifecycleEvent::TransportError);
            stop_grace();
            Drain();
            return written;
        }
    }

    stop_grace();
    Drain();
    logger_->Info(kComponent, std::string("Session ended in state ") + ToString(CurrentState()));
    return Result<void, Error>::Ok();
}

} // namespace cowgnition
