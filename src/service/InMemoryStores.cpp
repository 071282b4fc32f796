#include "proxyrot/service/InMemoryStores.hpp"

#include <algorithm>

namespace proxyrot::service {
namespace {

constexpr double kSuccessRateSmoothing = 0.1;

std::string groupKey(const std::optional<std::string>& targetGroup) {
    return targetGroup.value_or("");
}

} // namespace

void StaticConfigProvider::setActive(model::RotationConfig config) {
    std::scoped_lock lock(mutex_);
    auto key = groupKey(config.targetGroup);
    configs_.insert_or_assign(std::move(key), std::move(config));
}

void StaticConfigProvider::removeActive(const std::optional<std::string>& targetGroup) {
    std::scoped_lock lock(mutex_);
    configs_.erase(groupKey(targetGroup));
}

std::optional<model::RotationConfig> StaticConfigProvider::getActiveConfig(
    const std::optional<std::string>& targetGroup) {
    std::scoped_lock lock(mutex_);
    auto it = configs_.find(groupKey(targetGroup));
    if (it == configs_.end() || !it->second.enabled) {
        return std::nullopt;
    }
    return it->second;
}

void StaticProxyPool::upsert(model::Proxy proxy) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(),
                           [&proxy](const model::Proxy& existing) { return existing.id == proxy.id; });
    if (it != proxies_.end()) {
        *it = std::move(proxy);
    } else {
        proxies_.push_back(std::move(proxy));
    }
}

bool StaticProxyPool::remove(const std::string& proxyId) {
    std::scoped_lock lock(mutex_);
    return std::erase_if(proxies_, [&proxyId](const model::Proxy& proxy) { return proxy.id == proxyId; }) > 0;
}

void StaticProxyPool::replaceAll(std::vector<model::Proxy> proxies) {
    std::scoped_lock lock(mutex_);
    proxies_ = std::move(proxies);
}

std::optional<model::Proxy> StaticProxyPool::find(const std::string& proxyId) const {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(),
                           [&proxyId](const model::Proxy& proxy) { return proxy.id == proxyId; });
    if (it == proxies_.end()) {
        return std::nullopt;
    }
    return *it;
}

void StaticProxyPool::applyOutcome(const std::string& proxyId,
                                   bool success,
                                   std::optional<std::chrono::milliseconds> latency) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(proxies_.begin(), proxies_.end(),
                           [&proxyId](const model::Proxy& proxy) { return proxy.id == proxyId; });
    if (it == proxies_.end()) {
        return;
    }
    ++it->totalRequests;
    const double sample = success ? 100.0 : 0.0;
    it->successRate = std::clamp(it->successRate + (sample - it->successRate) * kSuccessRateSmoothing, 0.0, 100.0);
    if (latency) {
        const auto measured = static_cast<double>(latency->count());
        it->latencyMs = it->latencyMs ? (*it->latencyMs + measured) / 2.0 : measured;
    }
}

std::vector<model::Proxy> StaticProxyPool::listEnabled(const std::optional<std::string>& targetGroup) {
    std::scoped_lock lock(mutex_);
    std::vector<model::Proxy> enabled;
    for (const auto& proxy : proxies_) {
        if (proxy.status == model::ProxyStatus::disabled) {
            continue;
        }
        if (targetGroup && proxy.rotationGroup != targetGroup) {
            continue;
        }
        enabled.push_back(proxy);
    }
    return enabled;
}

MemoryUsageStats::MemoryUsageStats(StaticProxyPool* pool)
    : pool_(pool) {}

void MemoryUsageStats::recordOutcome(const std::string& proxyId,
                                     bool success,
                                     std::optional<std::chrono::milliseconds> latency,
                                     std::uint64_t bytes) {
    {
        std::scoped_lock lock(mutex_);
        auto& usage = usage_[proxyId];
        if (success) {
            ++usage.successes;
        } else {
            ++usage.failures;
        }
        usage.bytes += bytes;
        if (latency) {
            usage.totalLatency += *latency;
            ++usage.latencySamples;
        }
    }
    if (pool_) {
        pool_->applyOutcome(proxyId, success, latency);
    }
}

std::optional<ProxyUsage> MemoryUsageStats::usageFor(const std::string& proxyId) const {
    std::scoped_lock lock(mutex_);
    if (auto it = usage_.find(proxyId); it != usage_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::unordered_map<std::string, ProxyUsage> MemoryUsageStats::all() const {
    std::scoped_lock lock(mutex_);
    return usage_;
}

MemoryEventLog::MemoryEventLog(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void MemoryEventLog::record(const model::RotationEvent& event) {
    std::scoped_lock lock(mutex_);
    if (events_.size() >= capacity_) {
        events_.erase(events_.begin());
    }
    events_.push_back(event);
}

std::vector<model::RotationEvent> MemoryEventLog::events() const {
    std::scoped_lock lock(mutex_);
    return events_;
}

void MemoryEventLog::clear() {
    std::scoped_lock lock(mutex_);
    events_.clear();
}

} // namespace proxyrot::service
