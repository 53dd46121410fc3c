#pragma once

#include "../ports/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace deebot::adapters {

// Delay for attempt n is base * multiplier^(n-1), capped. maxAttempts == 0
// retries forever.
class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::seconds(60),
                                int maxAttempts = 0)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        double delay = static_cast<double>(baseDelay_.count()) *
                       std::pow(multiplier_, std::max(attemptCount, 1) - 1);
        delay = std::min(delay, static_cast<double>(maxDelay_.count()));
        return std::chrono::milliseconds(static_cast<long long>(delay));
    }

    bool shouldRetry(int attemptCount) const override {
        return maxAttempts_ <= 0 || attemptCount < maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

} // namespace deebot::adapters
