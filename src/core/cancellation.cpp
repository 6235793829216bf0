#include <cowgnition/core/cancellation.hpp>

#include <algorithm>
#include <thread>
#include <vector>

namespace cowgnition {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::vector<std::weak_ptr<CancellationState>> children;
    std::vector<std::function<void()>> callbacks;
};

} // namespace detail

namespace {

void CancelState(const std::shared_ptr<detail::CancellationState>& state) {
    std::vector<std::weak_ptr<detail::CancellationState>> children;
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) return;
        state->cancelled = true;
        children.swap(state->children);
        callbacks.swap(state->callbacks);
    }
    state->cv.notify_all();

    // Outside the lock: a callback may inspect or link to this state.
    for (auto& callback : callbacks) {
        callback();
    }

    for (const auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            CancelState(child);
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
bool CancellationToken::IsCancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout,
                               [this] { return state_->cancelled; });
}

void CancellationToken::Wait() const {
    if (!state_) return;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->cancelled; });
}

void CancellationToken::OnCancel(std::function<void()> callback) const {
    if (!state_ || !callback) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    if (!parent.state_) return;

    bool parent_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        parent_cancelled = parent.state_->cancelled;
        if (!parent_cancelled) {
            auto& children = parent.state_->children;
            children.erase(
                std::remove_if(children.begin(), children.end(),
                               [](const auto& w) { return w.expired(); }),
                children.end());
            children.push_back(state_);
        }
    }
    if (parent_cancelled) {
        CancelState(state_);
    }
}

void CancellationSource::Cancel() {
    CancelState(state_);
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

// ---------------------------------------------------------------------------
// WaitGroup
// ---------------------------------------------------------------------------
void WaitGroup::Add(std::size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_ += n;
}

void WaitGroup::Done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (count_ > 0) {
            --count_;
        }
    }
    cv_.notify_all();
}

bool WaitGroup::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return count_ == 0; });
}

std::size_t WaitGroup::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace cowgnition
