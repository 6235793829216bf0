#include <cowgnition/mcp/state_machine.hpp>

#include <optional>
#include <string>

namespace cowgnition {

namespace {

constexpr const char* kComponent = "lifecycle";

Error MakeStateError(const std::string& operation, const std::string& message) {
    return Error{operation, message, ErrorCategory::StateViolation};
}

// Target state for an event, or nullopt when the event is not valid in `from`.
std::optional<ProtocolState> Next(ProtocolState from, LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::InitializeSucceeded:
            if (from == ProtocolState::Uninitialized) return ProtocolState::Initializing;
            return std::nullopt;
        case LifecycleEvent::InitializeFailed:
            if (from == ProtocolState::Uninitialized ||
                from == ProtocolState::Initializing) {
                return ProtocolState::Uninitialized;
            }
            return std::nullopt;
        case LifecycleEvent::ClientInitialized:
            if (from == ProtocolState::Initializing) return ProtocolState::Initialized;
            return std::nullopt;
        case LifecycleEvent::ShutdownRequested:
            if (from == ProtocolState::Initialized) return ProtocolState::ShuttingDown;
            return std::nullopt;
        case LifecycleEvent::ExitReceived:
            if (from == ProtocolState::ShuttingDown) return ProtocolState::Terminated;
            return std::nullopt;
        case LifecycleEvent::TransportError:
            if (!IsTerminal(from)) return ProtocolState::Terminated;
            return std::nullopt;
        case LifecycleEvent::ProtocolViolation:
            if (!IsTerminal(from)) return ProtocolState::Failed;
            return std::nullopt;
    }
    return std::nullopt;
}

} // anonymous namespace

const char* ToString(ProtocolState state) {
    switch (state) {
        case ProtocolState::Uninitialized: return "Uninitialized";
        case ProtocolState::Initializing:  return "Initializing";
        case ProtocolState::Initialized:   return "Initialized";
        case ProtocolState::ShuttingDown:  return "ShuttingDown";
        case ProtocolState::Terminated:    return "Terminated";
        case ProtocolState::Failed:        return "Failed";
    }
    return "Unknown";
}

const char* ToString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::InitializeSucceeded: return "InitializeSucceeded";
        case LifecycleEvent::InitializeFailed:    return "InitializeFailed";
        case LifecycleEvent::ClientInitialized:   return "ClientInitialized";
        case LifecycleEvent::ShutdownRequested:   return "ShutdownRequested";
        case LifecycleEvent::ExitReceived:        return "ExitReceived";
        case LifecycleEvent::TransportError:      return "TransportError";
        case LifecycleEvent::ProtocolViolation:   return "ProtocolViolation";
    }
    return "Unknown";
}

bool IsTerminal(ProtocolState state) {
    return state == ProtocolState::Terminated || state == ProtocolState::Failed;
}

StateMachine::StateMachine(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : MakeNullLogger()) {}

Result<void, Error> StateMachine::AuthorizeIn(ProtocolState state,
                                              std::string_view method) {
    const std::string name(method);

    if (method == "ping") {
        return Result<void, Error>::Ok();
    }
    if (IsTerminal(state)) {
        return Result<void, Error>::Err(MakeStateError(
            "Authorize", "Session is " + std::string(ToString(state)) +
                             "; '" + name + "' is not accepted"));
    }
    // Uninitialized admits only ping and initialize.
    if ((method == "$/cancelRequest" || method == "notifications/cancelled") &&
        state != ProtocolState::Uninitialized) {
        return Result<void, Error>::Ok();
    }

    std::optional<ProtocolState> required;
    if (method == "initialize") {
        required = ProtocolState::Uninitialized;
    } else if (method == "notifications/initialized") {
        required = ProtocolState::Initializing;
    } else if (method == "shutdown") {
        required = ProtocolState::Initialized;
    } else if (method == "exit") {
        required = ProtocolState::ShuttingDown;
    } else {
        required = ProtocolState::Initialized;
    }

    if (state == *required) {
        return Result<void, Error>::Ok();
    }

    std::string message;
    if (method == "initialize") {
        message = "Session already initialized; 'initialize' is only accepted once";
    } else if (state == ProtocolState::Uninitialized ||
               state == ProtocolState::Initializing) {
        message = "'" + name + "' is not allowed before initialization completes" +
                  " (state " + ToString(state) + ")";
    } else {
        message = "'" + name + "' is not allowed in state " + ToString(state);
    }
    return Result<void, Error>::Err(MakeStateError("Authorize", message));
}

Result<void, Error> StateMachine::Authorize(std::string_view method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return AuthorizeIn(state_, method);
}

Result<ProtocolState, Error> StateMachine::Transition(LifecycleEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = Next(state_, event);
    if (!next.has_value()) {
        return Result<ProtocolState, Error>::Err(MakeStateError(
            "Transition", std::string("Event ") + ToString(event) +
                              " is not valid in state " + ToString(state_)));
    }
    if (*next != state_) {
        logger_->Debug(kComponent, std::string(ToString(state_)) + " -> " +
                                       ToString(*next) + " on " + ToString(event));
    }
    state_ = *next;
    return Result<ProtocolState, Error>::Ok(state_);
}

ProtocolState StateMachine::CurrentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace cowgnition
