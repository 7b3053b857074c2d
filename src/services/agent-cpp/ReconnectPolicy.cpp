#include "ReconnectPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace {
double DefaultJitter() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}
} // namespace

ReconnectPolicy::ReconnectPolicy(
    std::chrono::milliseconds baseDelay,
    std::chrono::milliseconds maxDelay,
    JitterSource jitter)
    : baseDelay_(baseDelay),
      maxDelay_(std::max(maxDelay, baseDelay)),
      jitter_(jitter ? std::move(jitter) : JitterSource(DefaultJitter)) {}

std::chrono::milliseconds ReconnectPolicy::NextDelay(int previousAttempts) const {
    const int attempt = std::max(previousAttempts, 0);
    const double base = static_cast<double>(baseDelay_.count());
    const double max = static_cast<double>(maxDelay_.count());

    // 2^attempt overflows long before it matters; anything past the cap is the cap.
    const double exponential = attempt >= 62 ? max : base * std::ldexp(1.0, attempt);
    const double capped = std::min(exponential, max);

    const double jitter = std::clamp(jitter_(), 0.0, 1.0);
    const double delay = capped * (1.0 + jitter * kMaxJitterFraction);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(delay)));
}
