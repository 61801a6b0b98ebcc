// retry_backoff.h
#pragma once
#include <chrono>

/// Exponential retry delay: initial, 2x, 4x, ... capped at `max`.
/// Not thread-safe; owned by the one loop that retries.
class RetryBackoff {
public:
    RetryBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max);

    /// Record a failure and return the delay to wait before the next attempt.
    std::chrono::milliseconds nextDelay();

    /// Forget the failure streak.
    void reset();

    /// Consecutive failures since the last reset.
    int failures() const { return failures_; }

    std::chrono::milliseconds maxDelay() const { return max_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds current_;
    int failures_ = 0;
};
