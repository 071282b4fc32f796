#pragma once

#include "proxyrot/model/Proxy.hpp"
#include "proxyrot/model/RotationConfig.hpp"

#include <boost/json.hpp>

#include <vector>

namespace proxyrot::config {

// Decoding throws InvalidStrategyError for an unknown or missing strategy and
// InvalidConfigError for malformed parameters. Regex conditions are compiled
// and rules are ordered by descending priority.
model::RotationConfig parseRotationConfig(const boost::json::value& json);
boost::json::object serializeRotationConfig(const model::RotationConfig& config);

model::StrategyParams parseStrategyParams(model::Strategy strategy, const boost::json::object& params);
boost::json::object serializeStrategyParams(const model::StrategyParams& params);

model::Rule parseRule(const boost::json::object& json);
boost::json::object serializeRule(const model::Rule& rule);
void compileRule(model::Rule& rule);
void sortRules(std::vector<model::Rule>& rules);

model::Proxy parseProxy(const boost::json::object& json);
boost::json::object serializeProxy(const model::Proxy& proxy);
std::vector<model::Proxy> parseProxyList(const boost::json::value& json);

} // namespace proxyrot::config
