#include "proxyrot/ratelimit/TokenBucket.hpp"

#include <algorithm>
#include <cmath>

namespace proxyrot::ratelimit {

TokenBucket::TokenBucket(double maxTokens, std::chrono::milliseconds window, std::chrono::steady_clock::time_point now)
    : maxTokens_(std::max(0.0, maxTokens))
    , window_(window.count() > 0 ? window : std::chrono::milliseconds{1})
    , tokens_(maxTokens_)
    , lastRefill_(now) {}

void TokenBucket::refill(std::chrono::steady_clock::time_point now) {
    if (now <= lastRefill_) {
        // Clock went backwards or did not move: nothing accrues.
        return;
    }
    const double elapsedMs = std::chrono::duration<double, std::milli>(now - lastRefill_).count();
    const double added = elapsedMs / static_cast<double>(window_.count()) * maxTokens_;
    tokens_ = std::min(maxTokens_, tokens_ + added);
    lastRefill_ = now;
}

bool TokenBucket::tryConsume(std::chrono::steady_clock::time_point now) {
    refill(now);
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

void TokenBucket::refund() {
    tokens_ = std::min(maxTokens_, tokens_ + 1.0);
}

std::chrono::milliseconds TokenBucket::waitTime(std::chrono::steady_clock::time_point now) {
    refill(now);
    if (tokens_ >= 1.0) {
        return std::chrono::milliseconds{0};
    }
    if (maxTokens_ <= 0.0) {
        return window_;
    }
    const double perMs = maxTokens_ / static_cast<double>(window_.count());
    const double needed = 1.0 - tokens_;
    return std::chrono::milliseconds{static_cast<long long>(std::ceil(needed / perMs))};
}

double TokenBucket::tokens(std::chrono::steady_clock::time_point now) {
    refill(now);
    return tokens_;
}

void TokenBucket::reset(std::chrono::steady_clock::time_point now) {
    tokens_ = maxTokens_;
    lastRefill_ = now;
}

} // namespace proxyrot::ratelimit
