// retry_backoff.cpp
#include "retry_backoff.h"
#include <algorithm>

RetryBackoff::RetryBackoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
    : initial_(std::max(initial, std::chrono::milliseconds(1))),
      max_(std::max(max, initial_)),
      current_(initial_)
{
}

std::chrono::milliseconds RetryBackoff::nextDelay() {
    std::chrono::milliseconds delay = current_;
    ++failures_;
    // Double for the next failure, without overflowing past the cap.
    if (current_ < max_) {
        current_ = (current_ > max_ / 2) ? max_ : current_ * 2;
    }
    return delay;
}

void RetryBackoff::reset() {
    current_ = initial_;
    failures_ = 0;
}
