#pragma once

#include "proxyrot/model/RotationConfig.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace proxyrot::rotation {

struct RuleContext {
    std::string domain;
    std::string url;
    std::string destinationClass;
    std::chrono::system_clock::time_point wallTime{};
    double poolFailureRate{};
};

struct RuleEvaluation {
    const model::Rule* fired{nullptr};
    std::vector<std::string> matchedRuleIds;
};

class RuleEngine {
public:
    // Rules run by descending priority. The first match fires; later rules are
    // still evaluated for the log unless the fired rule stops on match.
    static RuleEvaluation evaluate(const std::vector<model::Rule>& rules, const RuleContext& context);

    static bool matches(const model::Rule& rule, const RuleContext& context);
    static bool evaluateCondition(const model::RuleCondition& condition, const RuleContext& context);
};

std::string extractPath(const std::string& url);

} // namespace proxyrot::rotation
