#pragma once

#include "proxyrot/model/Proxy.hpp"
#include "proxyrot/model/RotationConfig.hpp"
#include "proxyrot/model/RotationEvent.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proxyrot::service {

class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    // The single active config for the group, or the ungrouped one for nullopt.
    virtual std::optional<model::RotationConfig> getActiveConfig(const std::optional<std::string>& targetGroup) = 0;
};

class ProxyPoolProvider {
public:
    virtual ~ProxyPoolProvider() = default;

    virtual std::vector<model::Proxy> listEnabled(const std::optional<std::string>& targetGroup) = 0;
};

class UsageStatsSink {
public:
    virtual ~UsageStatsSink() = default;

    virtual void recordOutcome(const std::string& proxyId,
                               bool success,
                               std::optional<std::chrono::milliseconds> latency,
                               std::uint64_t bytes) = 0;
};

class RotationEventSink {
public:
    virtual ~RotationEventSink() = default;

    virtual void record(const model::RotationEvent& event) = 0;
};

} // namespace proxyrot::service
