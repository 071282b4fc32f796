#pragma once

#include "proxyrot/model/Proxy.hpp"
#include "proxyrot/model/RotationConfig.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace proxyrot::test {

model::Proxy makeProxy(const std::string& id,
                       double weight = 1.0,
                       std::optional<std::string> region = std::nullopt);

std::vector<model::Proxy> makePool(std::initializer_list<std::string> ids);

model::RotationConfig makeConfig(const std::string& id, model::StrategyParams params);

// Wall-clock instant on 2024-01-07 (a Sunday) at the given UTC hour.
std::chrono::system_clock::time_point utcSundayAt(int hour);

} // namespace proxyrot::test
