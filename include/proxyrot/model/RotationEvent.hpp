#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace proxyrot::model {

enum class RotationReason {
    scheduled,
    failure,
    manual,
    startup,
    ruleTriggered,
    ttlExpired,
    cooldown
};

struct RotationEvent {
    std::chrono::system_clock::time_point timestamp{};
    std::string previousProxyId;
    std::string newProxyId;
    RotationReason reason{RotationReason::scheduled};
    std::string domain;
    std::string configId;
};

const char* toString(RotationReason reason);
std::optional<RotationReason> parseRotationReason(std::string_view text);

} // namespace proxyrot::model
