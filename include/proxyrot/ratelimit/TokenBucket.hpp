#pragma once

#include <chrono>

namespace proxyrot::ratelimit {

// Lazily refilled bucket. Not synchronized; owners guard it.
class TokenBucket {
public:
    TokenBucket(double maxTokens, std::chrono::milliseconds window, std::chrono::steady_clock::time_point now);

    bool tryConsume(std::chrono::steady_clock::time_point now);
    void refund();
    std::chrono::milliseconds waitTime(std::chrono::steady_clock::time_point now);
    double tokens(std::chrono::steady_clock::time_point now);
    void reset(std::chrono::steady_clock::time_point now);

    double maxTokens() const noexcept { return maxTokens_; }
    std::chrono::steady_clock::time_point lastRefillAt() const noexcept { return lastRefill_; }

private:
    void refill(std::chrono::steady_clock::time_point now);

    double maxTokens_;
    std::chrono::milliseconds window_;
    double tokens_;
    std::chrono::steady_clock::time_point lastRefill_;
};

} // namespace proxyrot::ratelimit
