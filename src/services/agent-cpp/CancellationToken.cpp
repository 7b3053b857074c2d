#include "CancellationToken.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace {
using detail::CancellationState;
using Clock = std::chrono::steady_clock;

// Linked parents only propagate explicit cancellation, so deadlines on a parent are
// observed by polling in slices of this size.
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

void Fire(const std::shared_ptr<CancellationState>& state, CancellationReason reason) {
    std::vector<std::weak_ptr<CancellationState>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->reason != CancellationReason::None) {
            return;
        }
        state->reason = reason;
        children = state->children;
    }
    state->signal.notify_all();

    for (const auto& weakChild : children) {
        if (auto child = weakChild.lock()) {
            Fire(child, reason);
        }
    }
}

CancellationReason Check(const std::shared_ptr<CancellationState>& state) {
    if (!state) {
        return CancellationReason::None;
    }

    std::vector<std::shared_ptr<CancellationState>> parents;
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->reason != CancellationReason::None) {
            return state->reason;
        }
        expired = state->deadline.has_value() && Clock::now() >= *state->deadline;
        if (!expired) {
            parents = state->parents;
        }
    }

    if (expired) {
        Fire(state, CancellationReason::TimedOut);
    } else {
        for (const auto& parent : parents) {
            const CancellationReason parentReason = Check(parent);
            if (parentReason != CancellationReason::None) {
                Fire(state, parentReason);
                break;
            }
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    return state->reason;
}
} // namespace

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::CanBeCancelled() const {
    return state_ != nullptr;
}

bool CancellationToken::IsCancellationRequested() const {
    return Check(state_) != CancellationReason::None;
}

CancellationReason CancellationToken::Reason() const {
    return Check(state_);
}

void CancellationToken::ThrowIfCancelled() const {
    switch (Check(state_)) {
    case CancellationReason::None:
        return;
    case CancellationReason::TimedOut:
        throw OperationTimedOutError();
    case CancellationReason::Requested:
        throw OperationCancelledError();
    }
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    const auto end = Clock::now() + duration;
    if (!state_) {
        std::this_thread::sleep_until(end);
        return false;
    }

    while (true) {
        if (Check(state_) != CancellationReason::None) {
            return true;
        }

        const auto now = Clock::now();
        if (now >= end) {
            return false;
        }

        auto wake = std::min(end, now + kWaitSlice);
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->deadline.has_value()) {
            wake = std::min(wake, *state_->deadline);
        }
        state_->signal.wait_until(lock, wake, [this] {
            return state_->reason != CancellationReason::None;
        });
    }
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource CancellationSource::CreateLinked(const CancellationToken& parent) {
    CancellationSource source;
    source.LinkTo(parent);
    return source;
}

CancellationSource CancellationSource::CreateLinked(const CancellationToken& first, const CancellationToken& second) {
    CancellationSource source;
    source.LinkTo(first);
    source.LinkTo(second);
    return source;
}

void CancellationSource::Cancel() {
    Fire(state_, CancellationReason::Requested);
}

void CancellationSource::CancelAfter(std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const auto deadline = Clock::now() + delay;
        if (!state_->deadline.has_value() || deadline < *state_->deadline) {
            state_->deadline = deadline;
        }
    }
    state_->signal.notify_all();
}

bool CancellationSource::IsCancellationRequested() const {
    return Check(state_) != CancellationReason::None;
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

void CancellationSource::LinkTo(const CancellationToken& parent) {
    if (!parent.state_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->parents.push_back(parent.state_);
    }

    CancellationReason parentReason = CancellationReason::None;
    {
        std::lock_guard<std::mutex> lock(parent.state_->mutex);
        auto& children = parent.state_->children;
        children.erase(
            std::remove_if(children.begin(), children.end(), [](const auto& child) { return child.expired(); }),
            children.end());
        children.push_back(state_);
        parentReason = parent.state_->reason;
    }

    if (parentReason != CancellationReason::None) {
        Fire(state_, parentReason);
    }
}
