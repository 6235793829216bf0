#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

namespace cowgnition {

namespace detail {
struct CancellationState;
} // namespace detail

// ---------------------------------------------------------------------------
// CancellationToken — read side of a cooperative cancellation signal.
//
// Copies share the same signal. A default-constructed token is never
// cancelled. Long-running work polls IsCancelled(), blocks in WaitFor(),
// or registers a callback with OnCancel().
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool IsCancelled() const;

    /// Block for up to `timeout`. Returns true as soon as the token is
    /// cancelled, false if the timeout elapsed first.
    bool WaitFor(std::chrono::milliseconds timeout) const;

    /// Block until cancelled. Returns at once for a token that can never
    /// be cancelled.
    void Wait() const;

    /// Run `callback` once when the token is cancelled: immediately on the
    /// calling thread if it already is, otherwise on the thread that
    /// cancels. Callbacks must not block. A token that can never be
    /// cancelled drops the callback.
    void OnCancel(std::function<void()> callback) const;

    [[nodiscard]] bool CanBeCancelled() const { return state_ != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// ---------------------------------------------------------------------------
// CancellationSource — write side. A source linked to a parent token is
// cancelled when the parent is (root context -> session -> request).
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);

    void Cancel();
    [[nodiscard]] bool IsCancelled() const;
    [[nodiscard]] CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// ---------------------------------------------------------------------------
// WaitGroup — counts outstanding work so shutdown can wait for it.
// ---------------------------------------------------------------------------
class WaitGroup {
public:
    void Add(std::size_t n = 1);
    void Done();

    /// Wait until the count drops to zero or `timeout` elapses.
    /// Returns true if all work finished.
    bool WaitFor(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t Count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t count_ = 0;
};

} // namespace cowgnition
