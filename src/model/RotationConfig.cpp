#include "proxyrot/model/RotationConfig.hpp"

#include <array>
#include <utility>

namespace proxyrot::model {
namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::array<std::pair<std::string_view, Enum>, N>& table, std::string_view text) {
    for (const auto& [name, value] : table) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename Enum, std::size_t N>
const char* nameOf(const std::array<std::pair<std::string_view, Enum>, N>& table, Enum value) {
    for (const auto& [name, entry] : table) {
        if (entry == value) {
            return name.data();
        }
    }
    return "";
}

constexpr std::array<std::pair<std::string_view, Strategy>, 10> kStrategies{{
    {"round-robin", Strategy::roundRobin},
    {"random", Strategy::random},
    {"least-used", Strategy::leastUsed},
    {"fastest", Strategy::fastest},
    {"sticky-session", Strategy::stickySession},
    {"geographic", Strategy::geographic},
    {"failure-aware", Strategy::failureAware},
    {"time-based", Strategy::timeBased},
    {"weighted", Strategy::weighted},
    {"custom", Strategy::custom},
}};

constexpr std::array<std::pair<std::string_view, SubStrategy>, 5> kSubStrategies{{
    {"round-robin", SubStrategy::roundRobin},
    {"random", SubStrategy::random},
    {"least-used", SubStrategy::leastUsed},
    {"fastest", SubStrategy::fastest},
    {"weighted", SubStrategy::weighted},
}};

constexpr std::array<std::pair<std::string_view, RuleField>, 7> kFields{{
    {"domain", RuleField::domain},
    {"url", RuleField::url},
    {"path", RuleField::path},
    {"time_hour", RuleField::timeHour},
    {"time_day", RuleField::timeDay},
    {"destination_class", RuleField::destinationClass},
    {"proxy_failure_rate", RuleField::proxyFailureRate},
}};

constexpr std::array<std::pair<std::string_view, RuleOperator>, 11> kOperators{{
    {"equals", RuleOperator::equals},
    {"not_equals", RuleOperator::notEquals},
    {"contains", RuleOperator::contains},
    {"not_contains", RuleOperator::notContains},
    {"starts_with", RuleOperator::startsWith},
    {"ends_with", RuleOperator::endsWith},
    {"matches_regex", RuleOperator::matchesRegex},
    {"greater_than", RuleOperator::greaterThan},
    {"less_than", RuleOperator::lessThan},
    {"in_list", RuleOperator::inList},
    {"not_in_list", RuleOperator::notInList},
}};

constexpr std::array<std::pair<std::string_view, RuleActionType>, 5> kActions{{
    {"use_proxy", RuleActionType::useProxy},
    {"use_region", RuleActionType::useRegion},
    {"exclude_proxy", RuleActionType::excludeProxy},
    {"exclude_region", RuleActionType::excludeRegion},
    {"apply_strategy", RuleActionType::applyStrategy},
}};

} // namespace

Strategy strategyOf(const StrategyParams& params) {
    return std::visit(Overloaded{
                          [](const RoundRobinParams&) { return Strategy::roundRobin; },
                          [](const RandomParams&) { return Strategy::random; },
                          [](const LeastUsedParams&) { return Strategy::leastUsed; },
                          [](const FastestParams&) { return Strategy::fastest; },
                          [](const StickySessionParams&) { return Strategy::stickySession; },
                          [](const GeographicParams&) { return Strategy::geographic; },
                          [](const FailureAwareParams&) { return Strategy::failureAware; },
                          [](const TimeBasedParams&) { return Strategy::timeBased; },
                          [](const WeightedParams&) { return Strategy::weighted; },
                          [](const CustomParams&) { return Strategy::custom; },
                      },
                      params);
}

Strategy RotationConfig::strategy() const {
    return strategyOf(params);
}

const char* toString(Strategy strategy) { return nameOf(kStrategies, strategy); }
std::optional<Strategy> parseStrategy(std::string_view text) { return lookup(kStrategies, text); }

const char* toString(SubStrategy strategy) { return nameOf(kSubStrategies, strategy); }
std::optional<SubStrategy> parseSubStrategy(std::string_view text) { return lookup(kSubStrategies, text); }

const char* toString(RuleField field) { return nameOf(kFields, field); }
std::optional<RuleField> parseRuleField(std::string_view text) { return lookup(kFields, text); }

const char* toString(RuleOperator op) { return nameOf(kOperators, op); }
std::optional<RuleOperator> parseRuleOperator(std::string_view text) { return lookup(kOperators, text); }

const char* toString(RuleActionType type) { return nameOf(kActions, type); }
std::optional<RuleActionType> parseRuleActionType(std::string_view text) { return lookup(kActions, text); }

} // namespace proxyrot::model
