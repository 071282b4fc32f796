#pragma once

#include "proxyrot/service/Providers.hpp"

#include <map>
#include <mutex>
#include <unordered_map>

namespace proxyrot::service {

class StaticConfigProvider : public ConfigProvider {
public:
    // Replaces the active config for its target group.
    void setActive(model::RotationConfig config);
    void removeActive(const std::optional<std::string>& targetGroup);

    std::optional<model::RotationConfig> getActiveConfig(const std::optional<std::string>& targetGroup) override;

private:
    std::mutex mutex_;
    std::map<std::string, model::RotationConfig> configs_;
};

class StaticProxyPool : public ProxyPoolProvider {
public:
    void upsert(model::Proxy proxy);
    bool remove(const std::string& proxyId);
    void replaceAll(std::vector<model::Proxy> proxies);
    std::optional<model::Proxy> find(const std::string& proxyId) const;

    // Feedback from released leases so least-used and fastest see live numbers.
    void applyOutcome(const std::string& proxyId, bool success, std::optional<std::chrono::milliseconds> latency);

    std::vector<model::Proxy> listEnabled(const std::optional<std::string>& targetGroup) override;

private:
    mutable std::mutex mutex_;
    std::vector<model::Proxy> proxies_;
};

struct ProxyUsage {
    std::uint64_t successes{};
    std::uint64_t failures{};
    std::uint64_t bytes{};
    std::chrono::milliseconds totalLatency{0};
    std::uint64_t latencySamples{};
};

class MemoryUsageStats : public UsageStatsSink {
public:
    // Outcomes are also forwarded to the pool when one is attached.
    explicit MemoryUsageStats(StaticProxyPool* pool = nullptr);

    void recordOutcome(const std::string& proxyId,
                       bool success,
                       std::optional<std::chrono::milliseconds> latency,
                       std::uint64_t bytes) override;

    std::optional<ProxyUsage> usageFor(const std::string& proxyId) const;
    std::unordered_map<std::string, ProxyUsage> all() const;

private:
    StaticProxyPool* pool_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProxyUsage> usage_;
};

class MemoryEventLog : public RotationEventSink {
public:
    explicit MemoryEventLog(std::size_t capacity = 1000);

    void record(const model::RotationEvent& event) override;
    std::vector<model::RotationEvent> events() const;
    void clear();

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<model::RotationEvent> events_;
};

} // namespace proxyrot::service
