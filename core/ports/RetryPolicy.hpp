#pragma once

#include <chrono>

namespace deebot::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

} // namespace deebot::ports
