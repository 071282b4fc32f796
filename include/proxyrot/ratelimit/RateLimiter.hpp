#pragma once

#include "proxyrot/ratelimit/TokenBucket.hpp"
#include "proxyrot/util/Clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

namespace proxyrot::ratelimit {

struct ClassLimits {
    std::uint32_t maxRequests{30};
    std::chrono::milliseconds window{60000};
    std::chrono::milliseconds minDelay{2000};
    std::uint32_t maxConcurrent{3};
};

struct GlobalLimits {
    std::uint32_t maxRequests{100};
    std::chrono::milliseconds window{60000};
    std::uint32_t maxConcurrent{10};
};

struct RateLimiterConfig {
    GlobalLimits global;
    ClassLimits defaultClass;
    std::map<std::string, ClassLimits> classes;

    // Conservative search-engine budgets.
    static RateLimiterConfig defaults();
};

enum class LimitReason {
    engineLimit,
    globalLimit,
    concurrentLimit,
    minDelay
};

const char* toString(LimitReason reason);

struct LimitDecision {
    bool allowed{false};
    std::chrono::milliseconds waitTime{0};
    std::optional<LimitReason> reason;
    std::string destinationClass;
};

struct BucketStatus {
    std::uint32_t activeRequests{};
    double tokensAvailable{};
    std::optional<std::chrono::steady_clock::time_point> lastRequestStartedAt;
};

class RateLimiter {
public:
    static constexpr std::chrono::milliseconds kDefaultWaitTimeout{30000};
    static constexpr std::chrono::milliseconds kMaxPollInterval{5000};
    static constexpr std::chrono::milliseconds kConcurrencyRetry{1000};

    RateLimiter(RateLimiterConfig config, const util::Clock& clock);

    // An empty class only consults the global bucket.
    LimitDecision checkLimit(const std::string& destinationClass);
    void startRequest(const std::string& destinationClass);
    void endRequest(const std::string& destinationClass);

    // checkLimit and, when allowed, startRequest under the same locks.
    LimitDecision tryAcquire(const std::string& destinationClass);

    // The timeout is measured on the real steady clock, not the injected one.
    void waitForLimit(const std::string& destinationClass,
                      std::chrono::milliseconds timeout = kDefaultWaitTimeout,
                      std::stop_token stop = {});

    template <typename Fn>
    std::invoke_result_t<Fn&> executeWithLimit(const std::string& destinationClass,
                                               Fn&& fn,
                                               std::chrono::milliseconds timeout = kDefaultWaitTimeout,
                                               std::stop_token stop = {});

    BucketStatus status(const std::string& destinationClass);
    BucketStatus globalStatus();
    void updateClassLimits(const std::string& destinationClass, ClassLimits limits);
    void reset();

private:
    struct Bucket {
        Bucket(ClassLimits l, std::chrono::steady_clock::time_point now)
            : limits(l)
            , tokens(static_cast<double>(l.maxRequests), l.window, now) {}

        std::mutex mutex;
        ClassLimits limits;
        TokenBucket tokens;
        std::atomic<std::uint32_t> active{0};
        std::optional<std::chrono::steady_clock::time_point> lastStartedAt;
    };

    struct GlobalBucket {
        GlobalBucket(GlobalLimits l, std::chrono::steady_clock::time_point now)
            : limits(l)
            , tokens(static_cast<double>(l.maxRequests), l.window, now) {}

        std::mutex mutex;
        GlobalLimits limits;
        TokenBucket tokens;
        std::atomic<std::uint32_t> active{0};
    };

    std::shared_ptr<Bucket> bucketFor(const std::string& destinationClass);
    LimitDecision checkLocked(Bucket& bucket, const std::string& destinationClass,
                              std::chrono::steady_clock::time_point now);
    LimitDecision checkGlobalLocked(std::chrono::steady_clock::time_point now);
    void startLocked(Bucket* bucket, std::chrono::steady_clock::time_point now);
    LimitDecision admit(const std::string& destinationClass, bool start);
    void waitUntilAdmitted(const std::string& destinationClass,
                           std::chrono::milliseconds timeout,
                           std::stop_token stop,
                           bool start);
    static bool decrementNonNegative(std::atomic<std::uint32_t>& counter);
    void notifyWaiters();

    RateLimiterConfig config_;
    const util::Clock& clock_;
    std::shared_mutex bucketsMutex_;
    std::unordered_map<std::string, std::shared_ptr<Bucket>> buckets_;
    GlobalBucket global_;

    std::mutex waitMutex_;
    std::condition_variable_any waitCv_;
    std::uint64_t releaseGeneration_{0};
};

// Holds one active-request slot for the lifetime of the guard.
class ActiveRequestGuard {
public:
    ActiveRequestGuard(RateLimiter& limiter, std::string destinationClass)
        : limiter_(limiter)
        , destinationClass_(std::move(destinationClass)) {
        limiter_.startRequest(destinationClass_);
    }

    // Takes over a slot already started by tryAcquire.
    ActiveRequestGuard(RateLimiter& limiter, std::string destinationClass, std::adopt_lock_t)
        : limiter_(limiter)
        , destinationClass_(std::move(destinationClass)) {}

    ~ActiveRequestGuard() {
        limiter_.endRequest(destinationClass_);
    }

    ActiveRequestGuard(const ActiveRequestGuard&) = delete;
    ActiveRequestGuard& operator=(const ActiveRequestGuard&) = delete;

private:
    RateLimiter& limiter_;
    std::string destinationClass_;
};

template <typename Fn>
std::invoke_result_t<Fn&> RateLimiter::executeWithLimit(const std::string& destinationClass,
                                                        Fn&& fn,
                                                        std::chrono::milliseconds timeout,
                                                        std::stop_token stop) {
    waitUntilAdmitted(destinationClass, timeout, std::move(stop), true);
    ActiveRequestGuard guard(*this, destinationClass, std::adopt_lock);
    return std::invoke(fn);
}

} // namespace proxyrot::ratelimit
