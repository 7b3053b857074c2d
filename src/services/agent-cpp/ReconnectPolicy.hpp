#pragma once

#include <chrono>
#include <functional>

// Exponential backoff with up to 20% jitter: min(base * 2^attempt, max) * (1 + jitter * 0.2).
class ReconnectPolicy {
public:
    // Returns a value in [0, 1). Defaults to a thread-local uniform distribution.
    using JitterSource = std::function<double()>;

    static constexpr double kMaxJitterFraction = 0.2;

    ReconnectPolicy(
        std::chrono::milliseconds baseDelay,
        std::chrono::milliseconds maxDelay,
        JitterSource jitter = JitterSource());

    std::chrono::milliseconds NextDelay(int previousAttempts) const;

    std::chrono::milliseconds BaseDelay() const { return baseDelay_; }
    std::chrono::milliseconds MaxDelay() const { return maxDelay_; }

private:
    std::chrono::milliseconds baseDelay_;
    std::chrono::milliseconds maxDelay_;
    JitterSource jitter_;
};
