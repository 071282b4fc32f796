#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace proxyrot::model {

enum class Strategy {
    roundRobin,
    random,
    leastUsed,
    fastest,
    stickySession,
    geographic,
    failureAware,
    timeBased,
    weighted,
    custom
};

// Strategies that may be nested inside the composite ones.
enum class SubStrategy {
    roundRobin,
    random,
    leastUsed,
    fastest,
    weighted
};

enum class RuleField {
    domain,
    url,
    path,
    timeHour,
    timeDay,
    destinationClass,
    proxyFailureRate
};

enum class RuleOperator {
    equals,
    notEquals,
    contains,
    notContains,
    startsWith,
    endsWith,
    matchesRegex,
    greaterThan,
    lessThan,
    inList,
    notInList
};

enum class ConditionLogic {
    all,
    any
};

enum class RuleActionType {
    useProxy,
    useRegion,
    excludeProxy,
    excludeRegion,
    applyStrategy
};

using ConditionValue = std::variant<std::string, double, std::vector<std::string>>;

struct RuleCondition {
    RuleField field{RuleField::domain};
    RuleOperator op{RuleOperator::equals};
    ConditionValue value;
    bool caseSensitive{false};
    // Filled in by config::compileRule for matchesRegex conditions.
    std::shared_ptr<const std::regex> pattern;
};

struct RuleAction {
    RuleActionType type{RuleActionType::useProxy};
    std::string argument;
    SubStrategy strategy{SubStrategy::weighted};
};

struct Rule {
    std::string id;
    std::string name;
    int priority{0};
    bool enabled{true};
    ConditionLogic logic{ConditionLogic::all};
    std::vector<RuleCondition> conditions;
    std::vector<RuleAction> actions;
    bool stopOnMatch{true};
};

struct ScheduleWindow {
    std::string name;
    int priority{0};
    std::vector<int> daysOfWeek; // 0 = Sunday; empty means every day
    int startHour{0};
    int endHour{24};
    SubStrategy strategy{SubStrategy::weighted};
    std::vector<std::string> proxyIds;
};

struct RoundRobinParams {};
struct RandomParams {};
struct LeastUsedParams {};
struct FastestParams {};

struct WeightedParams {
    std::map<std::string, double> weights; // per-proxy overrides of Proxy::weight
};

struct FailureAwareParams {
    SubStrategy base{SubStrategy::weighted}; // weighted or random
};

struct StickySessionParams {
    std::chrono::seconds ttl{3600};
    bool refreshTtlOnUse{false};
    SubStrategy fallback{SubStrategy::weighted};
};

struct GeographicParams {
    SubStrategy strategy{SubStrategy::weighted};
    std::optional<std::string> preferredRegion;
    std::vector<std::string> excludedRegions;
};

struct TimeBasedParams {
    std::vector<ScheduleWindow> windows;
    SubStrategy defaultStrategy{SubStrategy::weighted};
    std::chrono::milliseconds holdInterval{0};
    bool rotateOnFailure{false};
};

struct CustomParams {
    std::vector<Rule> rules;
    SubStrategy fallback{SubStrategy::roundRobin};
};

using StrategyParams = std::variant<RoundRobinParams,
                                    RandomParams,
                                    LeastUsedParams,
                                    FastestParams,
                                    StickySessionParams,
                                    GeographicParams,
                                    FailureAwareParams,
                                    TimeBasedParams,
                                    WeightedParams,
                                    CustomParams>;

struct RotationConfig {
    std::string id;
    std::string name;
    std::optional<std::string> targetGroup;
    int priority{0};
    bool enabled{true};
    StrategyParams params;

    Strategy strategy() const;
};

Strategy strategyOf(const StrategyParams& params);

const char* toString(Strategy strategy);
std::optional<Strategy> parseStrategy(std::string_view text);

const char* toString(SubStrategy strategy);
std::optional<SubStrategy> parseSubStrategy(std::string_view text);

const char* toString(RuleField field);
std::optional<RuleField> parseRuleField(std::string_view text);

const char* toString(RuleOperator op);
std::optional<RuleOperator> parseRuleOperator(std::string_view text);

const char* toString(RuleActionType type);
std::optional<RuleActionType> parseRuleActionType(std::string_view text);

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace proxyrot::model
