#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace proxyrot::model {

enum class ProxyStatus {
    active,
    failed,
    checking,
    disabled
};

struct Proxy {
    std::string id;
    std::string host;
    std::uint16_t port{};
    double weight{1.0};
    std::optional<std::string> rotationGroup;
    std::optional<std::string> region;
    ProxyStatus status{ProxyStatus::active};
    std::optional<double> latencyMs;
    double successRate{100.0};
    std::uint64_t totalRequests{};
};

const char* toString(ProxyStatus status);
std::optional<ProxyStatus> parseProxyStatus(std::string_view text);

// Clamp to the [0, 100] range accepted for selection weights.
double clampWeight(double weight);

} // namespace proxyrot::model
