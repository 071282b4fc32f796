#pragma once

#include "proxyrot/config/EngineSettings.hpp"
#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/ratelimit/RateLimiter.hpp"
#include "proxyrot/rotation/ProxySelector.hpp"
#include "proxyrot/service/Providers.hpp"
#include "proxyrot/session/StickySessionTable.hpp"
#include "proxyrot/util/Clock.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace proxyrot::service {

struct AcquireRequest {
    std::string domain;
    std::string destinationClass;
    std::optional<std::string> targetGroup;
    std::optional<std::string> region;
    std::string url;
};

struct Outcome {
    bool success{true};
    std::optional<std::chrono::milliseconds> latency;
    std::uint64_t bytes{};
};

class RotationCoordinator;

// One admitted request on one proxy. Must not outlive its coordinator.
class ProxyLease {
public:
    ProxyLease(ProxyLease&& other) noexcept;
    ProxyLease& operator=(ProxyLease&& other) noexcept;
    ProxyLease(const ProxyLease&) = delete;
    ProxyLease& operator=(const ProxyLease&) = delete;
    ~ProxyLease();

    const model::Proxy& proxy() const noexcept { return proxy_; }
    const std::optional<model::RotationEvent>& rotation() const noexcept { return rotation_; }
    const std::optional<std::string>& firedRuleId() const noexcept { return firedRuleId_; }
    const std::string& destinationClass() const noexcept { return destinationClass_; }
    bool released() const noexcept { return released_; }

    // Only the first call has any effect.
    void release(const Outcome& outcome);

private:
    friend class RotationCoordinator;

    ProxyLease(RotationCoordinator& coordinator,
               rotation::Selection selection,
               std::string configKey,
               std::string destinationClass);

    void abandon() noexcept;

    RotationCoordinator* coordinator_{nullptr};
    model::Proxy proxy_;
    std::optional<model::RotationEvent> rotation_;
    std::optional<std::string> firedRuleId_;
    std::string configKey_;
    std::string destinationClass_;
    bool released_{true};
};

class RotationCoordinator {
public:
    RotationCoordinator(ConfigProvider& configs,
                        ProxyPoolProvider& pool,
                        const util::Clock& clock,
                        const config::EngineSettings& settings,
                        UsageStatsSink* usage = nullptr,
                        RotationEventSink* events = nullptr);

    // Throws InvalidConfigError, NoAvailableProxyError or RateLimitExceededError.
    ProxyLease acquire(const AcquireRequest& request);
    // Throws CircuitOpenError when the proxy's breaker is open.
    ProxyLease acquireSpecific(const std::string& proxyId, const AcquireRequest& request);

    void proxyRemoved(const std::string& proxyId);
    void forceRotation(const std::optional<std::string>& targetGroup);

    ratelimit::RateLimiter& limiter() noexcept { return limiter_; }
    health::CircuitBreakerTracker& breakers() noexcept { return breakers_; }
    session::StickySessionTable& stickySessions() noexcept { return sticky_; }
    rotation::ProxySelector& selector() noexcept { return selector_; }

private:
    friend class ProxyLease;

    void admit(const std::string& destinationClass);
    void complete(const ProxyLease& lease, const Outcome& outcome);
    void abandon(const ProxyLease& lease) noexcept;
    void emitRotation(const model::RotationEvent& event);

    ConfigProvider& configs_;
    ProxyPoolProvider& pool_;
    const util::Clock& clock_;
    UsageStatsSink* usage_;
    RotationEventSink* events_;

    health::CircuitBreakerTracker breakers_;
    session::StickySessionTable sticky_;
    ratelimit::RateLimiter limiter_;
    rotation::ProxySelector selector_;
};

} // namespace proxyrot::service
