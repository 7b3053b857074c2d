#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class OperationCancelledError : public std::runtime_error {
public:
    explicit OperationCancelledError(const std::string& message = "Operation was cancelled")
        : std::runtime_error(message) {}
};

// Raised when an internal deadline fired rather than the caller's signal.
class OperationTimedOutError : public std::runtime_error {
public:
    explicit OperationTimedOutError(const std::string& message = "Operation timed out")
        : std::runtime_error(message) {}
};

enum class CancellationReason {
    None,
    Requested,
    TimedOut
};

namespace detail {
struct CancellationState {
    std::mutex mutex;
    std::condition_variable signal;
    CancellationReason reason = CancellationReason::None;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::vector<std::shared_ptr<CancellationState>> parents;
    std::vector<std::weak_ptr<CancellationState>> children;
};
} // namespace detail

class CancellationToken {
public:
    // A default token never fires.
    CancellationToken() = default;

    bool CanBeCancelled() const;
    bool IsCancellationRequested() const;
    CancellationReason Reason() const;
    void ThrowIfCancelled() const;

    // Sleeps for the given duration or until the token fires. Returns true if it fired.
    bool WaitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    // Fires when this source is cancelled or when any of the parents fire, whichever comes first.
    static CancellationSource CreateLinked(const CancellationToken& parent);
    static CancellationSource CreateLinked(const CancellationToken& first, const CancellationToken& second);

    void Cancel();
    void CancelAfter(std::chrono::milliseconds delay);
    bool IsCancellationRequested() const;
    CancellationToken Token() const;

private:
    void LinkTo(const CancellationToken& parent);

    std::shared_ptr<detail::CancellationState> state_;
};
