#include "proxyrot/service/RotationCoordinator.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <utility>

namespace proxyrot::service {
namespace {

std::string describeGroup(const std::optional<std::string>& targetGroup) {
    return targetGroup ? "'" + *targetGroup + "'" : std::string{"<default>"};
}

} // namespace

ProxyLease::ProxyLease(RotationCoordinator& coordinator,
                       rotation::Selection selection,
                       std::string configKey,
                       std::string destinationClass)
    : coordinator_(&coordinator)
    , proxy_(std::move(selection.proxy))
    , rotation_(std::move(selection.rotation))
    , firedRuleId_(std::move(selection.firedRuleId))
    , configKey_(std::move(configKey))
    , destinationClass_(std::move(destinationClass))
    , released_(false) {}

ProxyLease::ProxyLease(ProxyLease&& other) noexcept
    : coordinator_(other.coordinator_)
    , proxy_(std::move(other.proxy_))
    , rotation_(std::move(other.rotation_))
    , firedRuleId_(std::move(other.firedRuleId_))
    , configKey_(std::move(other.configKey_))
    , destinationClass_(std::move(other.destinationClass_))
    , released_(std::exchange(other.released_, true)) {}

ProxyLease& ProxyLease::operator=(ProxyLease&& other) noexcept {
    if (this != &other) {
        abandon();
        coordinator_ = other.coordinator_;
        proxy_ = std::move(other.proxy_);
        rotation_ = std::move(other.rotation_);
        firedRuleId_ = std::move(other.firedRuleId_);
        configKey_ = std::move(other.configKey_);
        destinationClass_ = std::move(other.destinationClass_);
        released_ = std::exchange(other.released_, true);
    }
    return *this;
}

ProxyLease::~ProxyLease() {
    abandon();
}

void ProxyLease::release(const Outcome& outcome) {
    if (released_ || !coordinator_) {
        return;
    }
    released_ = true;
    coordinator_->complete(*this, outcome);
}

void ProxyLease::abandon() noexcept {
    if (released_ || !coordinator_) {
        return;
    }
    released_ = true;
    coordinator_->abandon(*this);
}

RotationCoordinator::RotationCoordinator(ConfigProvider& configs,
                                         ProxyPoolProvider& pool,
                                         const util::Clock& clock,
                                         const config::EngineSettings& settings,
                                         UsageStatsSink* usage,
                                         RotationEventSink* events)
    : configs_(configs)
    , pool_(pool)
    , clock_(clock)
    , usage_(usage)
    , events_(events)
    , breakers_(settings.breaker, clock)
    , sticky_(clock)
    , limiter_(settings.rateLimits, clock)
    , selector_(breakers_, sticky_, clock, settings.seed) {}

ProxyLease RotationCoordinator::acquire(const AcquireRequest& request) {
    auto config = configs_.getActiveConfig(request.targetGroup);
    if (!config) {
        throw InvalidConfigError("No active rotation config for group " + describeGroup(request.targetGroup));
    }
    auto pool = pool_.listEnabled(request.targetGroup);

    rotation::SelectionContext context;
    context.domain = request.domain;
    context.destinationClass = request.destinationClass;
    context.region = request.region;
    context.url = request.url;
    auto selection = selector_.propose(pool, *config, context);

    admit(request.destinationClass);
    selector_.commit(selection);
    if (selection.rotation) {
        emitRotation(*selection.rotation);
    }
    return ProxyLease(*this, std::move(selection), rotation::ProxySelector::configKey(*config), request.destinationClass);
}

ProxyLease RotationCoordinator::acquireSpecific(const std::string& proxyId, const AcquireRequest& request) {
    auto pool = pool_.listEnabled(request.targetGroup);
    auto it = std::find_if(pool.begin(), pool.end(), [&proxyId](const model::Proxy& proxy) { return proxy.id == proxyId; });
    if (it == pool.end() || it->status == model::ProxyStatus::disabled) {
        throw NoAvailableProxyError("Proxy " + proxyId + " is not available in group " + describeGroup(request.targetGroup));
    }
    if (breakers_.isOpen(proxyId)) {
        throw CircuitOpenError(proxyId);
    }

    auto config = configs_.getActiveConfig(request.targetGroup);
    admit(request.destinationClass);

    rotation::Selection selection;
    selection.proxy = *it;
    model::RotationEvent event;
    event.timestamp = clock_.wallNow();
    event.newProxyId = proxyId;
    event.reason = model::RotationReason::manual;
    event.domain = request.domain;
    event.configId = config ? config->id : std::string{};
    selection.rotation = event;
    emitRotation(event);
    return ProxyLease(*this, std::move(selection), config ? rotation::ProxySelector::configKey(*config) : std::string{},
                      request.destinationClass);
}

void RotationCoordinator::admit(const std::string& destinationClass) {
    auto decision = limiter_.tryAcquire(destinationClass);
    if (!decision.allowed) {
        const std::string reason = decision.reason ? ratelimit::toString(*decision.reason) : "rate_limited";
        throw RateLimitExceededError("Rate limit reached for '" + destinationClass + "' (" + reason + ")",
                                     decision.waitTime, reason);
    }
}

void RotationCoordinator::complete(const ProxyLease& lease, const Outcome& outcome) {
    const auto& proxyId = lease.proxy().id;
    breakers_.reportOutcome(proxyId, outcome.success);
    limiter_.endRequest(lease.destinationClass());

    if (!outcome.success) {
        if (!lease.configKey_.empty()) {
            selector_.reportFailure(lease.configKey_, proxyId);
        }
        if (breakers_.isOpen(proxyId)) {
            auto dropped = sticky_.invalidateByProxy(proxyId);
            if (dropped > 0) {
                util::log(util::LogLevel::info, "Dropped " + std::to_string(dropped) +
                                                    " sticky sessions bound to failing proxy " + proxyId);
            }
        }
    }

    if (!usage_) {
        return;
    }
    try {
        usage_->recordOutcome(proxyId, outcome.success, outcome.latency, outcome.bytes);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to record usage for proxy " + proxyId + ": " + ex.what());
    }
}

void RotationCoordinator::abandon(const ProxyLease& lease) noexcept {
    limiter_.endRequest(lease.destinationClass());
    util::log(util::LogLevel::warn, "Lease on proxy " + lease.proxy().id + " dropped without an outcome");
}

void RotationCoordinator::emitRotation(const model::RotationEvent& event) {
    util::log(util::LogLevel::info, "Rotation " + (event.previousProxyId.empty() ? std::string{"-"} : event.previousProxyId) +
                                        " -> " + event.newProxyId + " (" + model::toString(event.reason) + ")");
    if (!events_) {
        return;
    }
    try {
        events_->record(event);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Failed to record rotation event: "} + ex.what());
    }
}

void RotationCoordinator::proxyRemoved(const std::string& proxyId) {
    auto dropped = sticky_.invalidateByProxy(proxyId);
    util::log(util::LogLevel::info, "Proxy " + proxyId + " left the pool, dropped " + std::to_string(dropped) +
                                        " sticky sessions");
}

void RotationCoordinator::forceRotation(const std::optional<std::string>& targetGroup) {
    auto config = configs_.getActiveConfig(targetGroup);
    if (!config) {
        throw InvalidConfigError("No active rotation config for group " + describeGroup(targetGroup));
    }
    selector_.forceRotation(rotation::ProxySelector::configKey(*config));
}

} // namespace proxyrot::service
