#pragma once

#include <cowgnition/core/log.hpp>
#include <cowgnition/core/result.hpp>

#include <memory>
#include <mutex>
#include <string_view>

namespace cowgnition {

// ---------------------------------------------------------------------------
// ProtocolState — lifecycle of one MCP session.
//
//   Uninitialized -> Initializing -> Initialized -> ShuttingDown -> Terminated
//
// Failed is reached on an unrecoverable protocol violation. Terminated and
// Failed are terminal.
// ---------------------------------------------------------------------------
enum class ProtocolState {
    Uninitialized,
    Initializing,
    Initialized,
    ShuttingDown,
    Terminated,
    Failed,
};

enum class LifecycleEvent {
    InitializeSucceeded,  // initialize answered with capabilities
    InitializeFailed,     // initialize rejected; retry allowed
    ClientInitialized,    // notifications/initialized received
    ShutdownRequested,    // shutdown answered
    ExitReceived,         // exit received while shutting down
    TransportError,       // channel failed; forced termination
    ProtocolViolation,    // unrecoverable misuse of the protocol
};

[[nodiscard]] const char* ToString(ProtocolState state);
[[nodiscard]] const char* ToString(LifecycleEvent event);

[[nodiscard]] bool IsTerminal(ProtocolState state);

// ---------------------------------------------------------------------------
// StateMachine — authorizes methods and applies lifecycle transitions.
//
// One instance per session. All access is serialized by a single mutex so
// concurrent requests observe a consistent state.
// ---------------------------------------------------------------------------
class StateMachine {
public:
    explicit StateMachine(std::shared_ptr<Logger> logger = nullptr);

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    /// Ok if `method` may be dispatched in the current state, otherwise a
    /// StateViolation error. Whether the method has a route is not
    /// considered here.
    [[nodiscard]] Result<void, Error> Authorize(std::string_view method) const;

    /// Apply an event. Invalid transitions leave the state unchanged and
    /// return a StateViolation error naming both state and event.
    [[nodiscard]] Result<ProtocolState, Error> Transition(LifecycleEvent event);

    [[nodiscard]] ProtocolState CurrentState() const;

private:
    static Result<void, Error> AuthorizeIn(ProtocolState state,
                                           std::string_view method);

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    ProtocolState state_ = ProtocolState::Uninitialized;
};

} // namespace cowgnition
