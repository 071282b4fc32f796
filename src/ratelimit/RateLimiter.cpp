#include "proxyrot/ratelimit/RateLimiter.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <vector>

namespace proxyrot::ratelimit {
namespace {

ClassLimits makeLimits(std::uint32_t maxRequests, long long minDelayMs, std::uint32_t maxConcurrent) {
    ClassLimits limits;
    limits.maxRequests = maxRequests;
    limits.window = std::chrono::milliseconds{60000};
    limits.minDelay = std::chrono::milliseconds{minDelayMs};
    limits.maxConcurrent = maxConcurrent;
    return limits;
}

LimitDecision deny(LimitReason reason, std::chrono::milliseconds waitTime, const std::string& destinationClass) {
    LimitDecision decision;
    decision.allowed = false;
    decision.reason = reason;
    decision.waitTime = std::max(std::chrono::milliseconds{0}, waitTime);
    decision.destinationClass = destinationClass;
    return decision;
}

} // namespace

const char* toString(LimitReason reason) {
    switch (reason) {
    case LimitReason::engineLimit:     return "engine_limit";
    case LimitReason::globalLimit:     return "global_limit";
    case LimitReason::concurrentLimit: return "concurrent_limit";
    case LimitReason::minDelay:        return "min_delay";
    }
    return "engine_limit";
}

RateLimiterConfig RateLimiterConfig::defaults() {
    RateLimiterConfig config;
    config.classes.emplace("google", makeLimits(30, 2000, 3));
    config.classes.emplace("bing", makeLimits(40, 1500, 5));
    config.classes.emplace("duckduckgo", makeLimits(30, 2000, 3));
    config.classes.emplace("yahoo", makeLimits(30, 2000, 3));
    config.classes.emplace("brave", makeLimits(40, 1500, 5));
    return config;
}

RateLimiter::RateLimiter(RateLimiterConfig config, const util::Clock& clock)
    : config_(std::move(config))
    , clock_(clock)
    , global_(config_.global, clock_.now()) {
    const auto now = clock_.now();
    for (const auto& [name, limits] : config_.classes) {
        buckets_.emplace(name, std::make_shared<Bucket>(limits, now));
    }
}

std::shared_ptr<RateLimiter::Bucket> RateLimiter::bucketFor(const std::string& destinationClass) {
    {
        std::shared_lock lock(bucketsMutex_);
        auto it = buckets_.find(destinationClass);
        if (it != buckets_.end()) {
            return it->second;
        }
    }
    std::unique_lock lock(bucketsMutex_);
    auto [it, inserted] = buckets_.try_emplace(destinationClass, nullptr);
    if (inserted) {
        it->second = std::make_shared<Bucket>(config_.defaultClass, clock_.now());
        util::log(util::LogLevel::debug, "Created rate bucket for class " + destinationClass + " from defaults");
    }
    return it->second;
}

LimitDecision RateLimiter::checkGlobalLocked(std::chrono::steady_clock::time_point now) {
    if (global_.active.load() >= global_.limits.maxConcurrent) {
        return deny(LimitReason::concurrentLimit, kConcurrencyRetry, {});
    }
    if (!global_.tokens.tryConsume(now)) {
        return deny(LimitReason::globalLimit, global_.tokens.waitTime(now), {});
    }
    LimitDecision decision;
    decision.allowed = true;
    return decision;
}

LimitDecision RateLimiter::checkLocked(Bucket& bucket,
                                       const std::string& destinationClass,
                                       std::chrono::steady_clock::time_point now) {
    if (bucket.active.load() >= bucket.limits.maxConcurrent) {
        return deny(LimitReason::concurrentLimit, kConcurrencyRetry, destinationClass);
    }
    if (global_.active.load() >= global_.limits.maxConcurrent) {
        return deny(LimitReason::concurrentLimit, kConcurrencyRetry, destinationClass);
    }

    if (bucket.lastStartedAt) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *bucket.lastStartedAt);
        if (elapsed.count() < 0) {
            elapsed = std::chrono::milliseconds{0};
        }
        if (elapsed < bucket.limits.minDelay) {
            return deny(LimitReason::minDelay, bucket.limits.minDelay - elapsed, destinationClass);
        }
    }

    if (!bucket.tokens.tryConsume(now)) {
        return deny(LimitReason::engineLimit, bucket.tokens.waitTime(now), destinationClass);
    }
    if (!global_.tokens.tryConsume(now)) {
        bucket.tokens.refund();
        return deny(LimitReason::globalLimit, global_.tokens.waitTime(now), destinationClass);
    }

    LimitDecision decision;
    decision.allowed = true;
    decision.destinationClass = destinationClass;
    return decision;
}

void RateLimiter::startLocked(Bucket* bucket, std::chrono::steady_clock::time_point now) {
    if (bucket) {
        bucket->active.fetch_add(1);
        bucket->lastStartedAt = now;
    }
    global_.active.fetch_add(1);
}

LimitDecision RateLimiter::admit(const std::string& destinationClass, bool start) {
    if (destinationClass.empty()) {
        std::scoped_lock lock(global_.mutex);
        const auto now = clock_.now();
        auto decision = checkGlobalLocked(now);
        if (decision.allowed && start) {
            startLocked(nullptr, now);
        }
        return decision;
    }
    auto bucket = bucketFor(destinationClass);
    std::scoped_lock lock(bucket->mutex, global_.mutex);
    const auto now = clock_.now();
    auto decision = checkLocked(*bucket, destinationClass, now);
    if (decision.allowed && start) {
        startLocked(bucket.get(), now);
    }
    return decision;
}

LimitDecision RateLimiter::checkLimit(const std::string& destinationClass) {
    return admit(destinationClass, false);
}

LimitDecision RateLimiter::tryAcquire(const std::string& destinationClass) {
    return admit(destinationClass, true);
}

void RateLimiter::startRequest(const std::string& destinationClass) {
    const auto now = clock_.now();
    if (destinationClass.empty()) {
        std::scoped_lock lock(global_.mutex);
        startLocked(nullptr, now);
        return;
    }
    auto bucket = bucketFor(destinationClass);
    std::scoped_lock lock(bucket->mutex, global_.mutex);
    startLocked(bucket.get(), now);
}

bool RateLimiter::decrementNonNegative(std::atomic<std::uint32_t>& counter) {
    auto current = counter.load();
    while (current > 0) {
        if (counter.compare_exchange_weak(current, current - 1)) {
            return true;
        }
    }
    return false;
}

void RateLimiter::endRequest(const std::string& destinationClass) {
    if (destinationClass.empty()) {
        decrementNonNegative(global_.active);
        notifyWaiters();
        return;
    }
    std::shared_ptr<Bucket> bucket;
    {
        std::shared_lock lock(bucketsMutex_);
        auto it = buckets_.find(destinationClass);
        if (it != buckets_.end()) {
            bucket = it->second;
        }
    }
    if (!bucket) {
        util::log(util::LogLevel::warn, "endRequest for unknown class " + destinationClass + " ignored");
        return;
    }
    if (!decrementNonNegative(bucket->active)) {
        util::log(util::LogLevel::debug, "endRequest for idle class " + destinationClass + " ignored");
        return;
    }
    decrementNonNegative(global_.active);
    notifyWaiters();
}

void RateLimiter::notifyWaiters() {
    {
        std::scoped_lock lock(waitMutex_);
        ++releaseGeneration_;
    }
    waitCv_.notify_all();
}

void RateLimiter::waitForLimit(const std::string& destinationClass,
                               std::chrono::milliseconds timeout,
                               std::stop_token stop) {
    waitUntilAdmitted(destinationClass, timeout, std::move(stop), false);
}

void RateLimiter::waitUntilAdmitted(const std::string& destinationClass,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token stop,
                                    bool start) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (stop.stop_requested()) {
            throw WaitCancelledError("Wait for rate limit on '" + destinationClass + "' cancelled");
        }
        auto decision = admit(destinationClass, start);
        if (decision.allowed) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw WaitTimeoutError("Timeout waiting for '" + destinationClass + "' rate limit (" +
                                   std::to_string(timeout.count()) + "ms)");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto pause = std::min({decision.waitTime, kMaxPollInterval, remaining});
        pause = std::max(pause, std::chrono::milliseconds{1});

        std::unique_lock lock(waitMutex_);
        const auto generation = releaseGeneration_;
        waitCv_.wait_for(lock, stop, pause, [this, generation] { return releaseGeneration_ != generation; });
    }
}

BucketStatus RateLimiter::status(const std::string& destinationClass) {
    if (destinationClass.empty()) {
        return globalStatus();
    }
    auto bucket = bucketFor(destinationClass);
    std::scoped_lock lock(bucket->mutex);
    BucketStatus status;
    status.activeRequests = bucket->active.load();
    status.tokensAvailable = bucket->tokens.tokens(clock_.now());
    status.lastRequestStartedAt = bucket->lastStartedAt;
    return status;
}

BucketStatus RateLimiter::globalStatus() {
    std::scoped_lock lock(global_.mutex);
    BucketStatus status;
    status.activeRequests = global_.active.load();
    status.tokensAvailable = global_.tokens.tokens(clock_.now());
    return status;
}

void RateLimiter::updateClassLimits(const std::string& destinationClass, ClassLimits limits) {
    auto bucket = bucketFor(destinationClass);
    std::scoped_lock lock(bucket->mutex);
    bucket->limits = limits;
    bucket->tokens = TokenBucket(static_cast<double>(limits.maxRequests), limits.window, clock_.now());
    util::log(util::LogLevel::info, "Rate limits updated for class " + destinationClass);
}

void RateLimiter::reset() {
    std::vector<std::shared_ptr<Bucket>> buckets;
    {
        std::shared_lock lock(bucketsMutex_);
        for (const auto& [name, bucket] : buckets_) {
            buckets.push_back(bucket);
        }
    }
    const auto now = clock_.now();
    for (auto& bucket : buckets) {
        std::scoped_lock lock(bucket->mutex);
        bucket->tokens.reset(now);
        bucket->active.store(0);
        bucket->lastStartedAt.reset();
    }
    {
        std::scoped_lock lock(global_.mutex);
        global_.tokens.reset(now);
        global_.active.store(0);
    }
    notifyWaiters();
}

} // namespace proxyrot::ratelimit
