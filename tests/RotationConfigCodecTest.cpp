#include "proxyrot/Errors.hpp"
#include "proxyrot/config/RotationConfigCodec.hpp"
#include "proxyrot/util/JsonUtil.hpp"

#include <gtest/gtest.h>

namespace proxyrot::config {
namespace {

using namespace std::chrono_literals;

model::RotationConfig parse(const std::string& payload) {
    return parseRotationConfig(util::parseJson(payload));
}

TEST(RotationConfigCodecTest, ParsesStickyConfig) {
    auto config = parse(R"({
        "id": "cfg-1",
        "name": "Search engines",
        "strategy": "sticky-session",
        "targetGroup": "search",
        "priority": 3,
        "params": {"ttlSeconds": 120, "refreshTtlOnUse": true, "fallback": "least-used"}
    })");
    EXPECT_EQ(config.id, "cfg-1");
    EXPECT_EQ(config.name, "Search engines");
    EXPECT_EQ(config.targetGroup, "search");
    EXPECT_EQ(config.priority, 3);
    EXPECT_TRUE(config.enabled);
    ASSERT_EQ(config.strategy(), model::Strategy::stickySession);
    const auto& sticky = std::get<model::StickySessionParams>(config.params);
    EXPECT_EQ(sticky.ttl, 120s);
    EXPECT_TRUE(sticky.refreshTtlOnUse);
    EXPECT_EQ(sticky.fallback, model::SubStrategy::leastUsed);
}

TEST(RotationConfigCodecTest, MissingParamsUseDefaults) {
    auto config = parse(R"({"id": "geo", "strategy": "geographic"})");
    const auto& geo = std::get<model::GeographicParams>(config.params);
    EXPECT_EQ(geo.strategy, model::SubStrategy::weighted);
    EXPECT_FALSE(geo.preferredRegion);
    EXPECT_TRUE(geo.excludedRegions.empty());
    EXPECT_EQ(config.name, "geo");
    EXPECT_FALSE(config.targetGroup);
}

TEST(RotationConfigCodecTest, UnknownOrMissingStrategyIsRejected) {
    EXPECT_THROW(parse(R"({"id": "x", "strategy": "lottery"})"), InvalidStrategyError);
    EXPECT_THROW(parse(R"({"id": "x"})"), InvalidStrategyError);
    EXPECT_THROW(parse(R"(["not", "an", "object"])"), InvalidConfigError);
}

TEST(RotationConfigCodecTest, MalformedParamsAreRejected) {
    EXPECT_THROW(parse(R"({"strategy": "sticky-session", "params": {"ttlSeconds": 0}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "sticky-session", "params": {"fallback": "geographic"}})"),
                 InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "failure-aware", "params": {"base": "fastest"}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "time-based", "params": {"holdIntervalMs": -1}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "time-based", "params": {"windows": [{"startHour": 25}]}})"),
                 InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "time-based", "params": {"windows": [{"daysOfWeek": [7]}]}})"),
                 InvalidConfigError);
    EXPECT_THROW(parse(R"({"strategy": "weighted", "params": {"weights": {"p1": "heavy"}}})"), InvalidConfigError);
}

TEST(RotationConfigCodecTest, WeightsAreClamped) {
    auto config = parse(R"({"strategy": "weighted", "params": {"weights": {"a": 150, "b": -5, "c": 42.5}}})");
    const auto& weights = std::get<model::WeightedParams>(config.params).weights;
    EXPECT_DOUBLE_EQ(weights.at("a"), 100.0);
    EXPECT_DOUBLE_EQ(weights.at("b"), 0.0);
    EXPECT_DOUBLE_EQ(weights.at("c"), 42.5);
}

TEST(RotationConfigCodecTest, TimeBasedWindows) {
    auto config = parse(R"({
        "strategy": "time-based",
        "params": {
            "defaultStrategy": "round-robin",
            "holdIntervalMs": 60000,
            "rotateOnFailure": true,
            "windows": [
                {"name": "night", "priority": 2, "daysOfWeek": [0, 6], "startHour": 22, "endHour": 6,
                 "strategy": "fastest", "proxyIds": ["p1", "p2"]}
            ]
        }
    })");
    const auto& params = std::get<model::TimeBasedParams>(config.params);
    EXPECT_EQ(params.defaultStrategy, model::SubStrategy::roundRobin);
    EXPECT_EQ(params.holdInterval, 60000ms);
    EXPECT_TRUE(params.rotateOnFailure);
    ASSERT_EQ(params.windows.size(), 1u);
    const auto& night = params.windows.front();
    EXPECT_EQ(night.name, "night");
    EXPECT_EQ(night.priority, 2);
    EXPECT_EQ(night.daysOfWeek, (std::vector<int>{0, 6}));
    EXPECT_EQ(night.startHour, 22);
    EXPECT_EQ(night.endHour, 6);
    EXPECT_EQ(night.strategy, model::SubStrategy::fastest);
    EXPECT_EQ(night.proxyIds, (std::vector<std::string>{"p1", "p2"}));
}

constexpr const char* kCustomConfig = R"({
    "id": "custom-1",
    "strategy": "custom",
    "params": {
        "fallback": "weighted",
        "rules": [
            {"id": "low", "priority": 1, "conditions": [], "actions": [{"type": "use_region", "value": "eu"}]},
            {"id": "google", "name": "Google via US", "priority": 10, "logic": "OR", "stopOnMatch": false,
             "conditions": [
                {"field": "domain", "operator": "matches_regex", "value": "GOOGLE\\.com$"},
                {"field": "destination_class", "operator": "in_list", "value": ["google", 7]}
             ],
             "actions": [
                {"type": "use_region", "value": "us"},
                {"type": "apply_strategy", "value": "fastest"}
             ]}
        ]
    }
})";

TEST(RotationConfigCodecTest, CustomRulesAreSortedAndCompiled) {
    auto config = parse(kCustomConfig);
    const auto& custom = std::get<model::CustomParams>(config.params);
    EXPECT_EQ(custom.fallback, model::SubStrategy::weighted);
    ASSERT_EQ(custom.rules.size(), 2u);
    const auto& google = custom.rules.front();
    EXPECT_EQ(google.id, "google");
    EXPECT_EQ(google.name, "Google via US");
    EXPECT_EQ(google.logic, model::ConditionLogic::any);
    EXPECT_FALSE(google.stopOnMatch);
    ASSERT_EQ(google.conditions.size(), 2u);
    ASSERT_TRUE(google.conditions[0].pattern);
    EXPECT_TRUE(std::regex_search(std::string{"www.google.com"}, *google.conditions[0].pattern));
    EXPECT_EQ(std::get<std::vector<std::string>>(google.conditions[1].value),
              (std::vector<std::string>{"google", "7"}));
    ASSERT_EQ(google.actions.size(), 2u);
    EXPECT_EQ(google.actions[1].type, model::RuleActionType::applyStrategy);
    EXPECT_EQ(google.actions[1].strategy, model::SubStrategy::fastest);
    EXPECT_EQ(custom.rules.back().id, "low");
    EXPECT_EQ(custom.rules.back().name, "low");
}

TEST(RotationConfigCodecTest, SerializedConfigParsesBack) {
    auto original = parse(kCustomConfig);
    auto reparsed = parseRotationConfig(serializeRotationConfig(original));
    EXPECT_EQ(reparsed.id, original.id);
    EXPECT_EQ(reparsed.strategy(), model::Strategy::custom);
    const auto& rules = std::get<model::CustomParams>(reparsed.params).rules;
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].id, "google");
    EXPECT_EQ(rules[0].logic, model::ConditionLogic::any);
    ASSERT_TRUE(rules[0].conditions[0].pattern);
    EXPECT_EQ(rules[0].actions[0].argument, "us");
    EXPECT_EQ(rules[0].actions[1].strategy, model::SubStrategy::fastest);
}

TEST(RotationConfigCodecTest, MalformedRulesAreRejected) {
    auto withRule = [](const std::string& rule) {
        return R"({"strategy": "custom", "params": {"rules": [)" + rule + "]}}";
    };
    EXPECT_THROW(parse(withRule(R"({"actions": []})")), InvalidConfigError);
    EXPECT_THROW(parse(withRule(R"({"id": "r", "logic": "xor"})")), InvalidConfigError);
    EXPECT_THROW(parse(withRule(R"({"id": "r", "conditions": [{"field": "domain", "operator": "matches_regex",
                                   "value": "([a-z"}]})")),
                 InvalidConfigError);
    EXPECT_THROW(parse(withRule(R"({"id": "r", "conditions": [{"field": "colour", "operator": "equals",
                                   "value": "red"}]})")),
                 InvalidConfigError);
    EXPECT_THROW(parse(withRule(R"({"id": "r", "actions": [{"type": "use_proxy"}]})")), InvalidConfigError);
    EXPECT_THROW(parse(withRule(R"({"id": "r", "actions": [{"type": "apply_strategy", "value": "custom"}]})")),
                 InvalidConfigError);
}

TEST(RotationConfigCodecTest, ParsesProxyList) {
    auto proxies = parseProxyList(util::parseJson(R"({"proxies": [
        {"id": "us-1", "host": "10.0.0.1", "port": 3128, "weight": 250, "region": "us",
         "rotationGroup": "search", "latencyMs": 120.5, "successRate": 97, "totalRequests": 40},
        {"id": "de-1", "host": "10.0.0.2", "port": 8080, "status": "disabled"}
    ]})"));
    ASSERT_EQ(proxies.size(), 2u);
    EXPECT_EQ(proxies[0].port, 3128);
    EXPECT_DOUBLE_EQ(proxies[0].weight, 100.0);
    EXPECT_EQ(proxies[0].region, "us");
    EXPECT_EQ(proxies[0].rotationGroup, "search");
    EXPECT_DOUBLE_EQ(*proxies[0].latencyMs, 120.5);
    EXPECT_DOUBLE_EQ(proxies[0].successRate, 97.0);
    EXPECT_EQ(proxies[0].totalRequests, 40u);
    EXPECT_EQ(proxies[1].status, model::ProxyStatus::disabled);
    EXPECT_DOUBLE_EQ(proxies[1].weight, 1.0);
    EXPECT_FALSE(proxies[1].latencyMs);

    EXPECT_EQ(parseProxyList(util::parseJson("[]")).size(), 0u);
    EXPECT_THROW(parseProxyList(util::parseJson(R"({"items": []})")), InvalidConfigError);
    EXPECT_THROW(parseProxyList(util::parseJson(R"([{"host": "x"}])")), InvalidConfigError);
    EXPECT_THROW(parseProxyList(util::parseJson(R"([{"id": "x", "port": 70000}])")), InvalidConfigError);
    EXPECT_THROW(parseProxyList(util::parseJson(R"([{"id": "x", "status": "zombie"}])")), InvalidConfigError);
}

} // namespace
} // namespace proxyrot::config
