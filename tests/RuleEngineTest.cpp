#include "TestSupport.hpp"

#include "proxyrot/rotation/RuleEngine.hpp"

#include <gtest/gtest.h>

namespace proxyrot::rotation {
namespace {

using model::RuleField;
using model::RuleOperator;

model::RuleCondition condition(RuleField field, RuleOperator op, model::ConditionValue value,
                               bool caseSensitive = false) {
    model::RuleCondition result;
    result.field = field;
    result.op = op;
    result.value = std::move(value);
    result.caseSensitive = caseSensitive;
    return result;
}

model::Rule rule(const std::string& id, int priority, std::vector<model::RuleCondition> conditions) {
    model::Rule result;
    result.id = id;
    result.name = id;
    result.priority = priority;
    result.conditions = std::move(conditions);
    return result;
}

class RuleEngineTest : public ::testing::Test {
protected:
    RuleContext context;

    void SetUp() override {
        context.domain = "api.example.com";
        context.url = "https://api.example.com/v1/search?q=proxy";
        context.destinationClass = "google";
        context.wallTime = test::utcSundayAt(14);
        context.poolFailureRate = 35.0;
    }

    bool check(const model::RuleCondition& cond) const {
        return RuleEngine::evaluateCondition(cond, context);
    }
};

TEST(ExtractPathTest, StripsSchemeHostAndQuery) {
    EXPECT_EQ(extractPath("https://example.com/a/b?x=1#top"), "/a/b");
    EXPECT_EQ(extractPath("https://example.com"), "/");
    EXPECT_EQ(extractPath("/relative/path?q"), "/relative/path");
    EXPECT_EQ(extractPath(""), "");
}

TEST_F(RuleEngineTest, TextOperatorsIgnoreCaseByDefault) {
    EXPECT_TRUE(check(condition(RuleField::domain, RuleOperator::equals, std::string{"API.Example.com"})));
    EXPECT_FALSE(check(condition(RuleField::domain, RuleOperator::notEquals, std::string{"api.example.com"})));
    EXPECT_TRUE(check(condition(RuleField::url, RuleOperator::contains, std::string{"/V1/"})));
    EXPECT_TRUE(check(condition(RuleField::url, RuleOperator::notContains, std::string{"bing"})));
    EXPECT_TRUE(check(condition(RuleField::domain, RuleOperator::startsWith, std::string{"api."})));
    EXPECT_TRUE(check(condition(RuleField::domain, RuleOperator::endsWith, std::string{"EXAMPLE.COM"})));
    EXPECT_TRUE(check(condition(RuleField::path, RuleOperator::equals, std::string{"/v1/search"})));
    EXPECT_TRUE(check(condition(RuleField::destinationClass, RuleOperator::equals, std::string{"Google"})));
}

TEST_F(RuleEngineTest, CaseSensitiveComparison) {
    EXPECT_FALSE(check(condition(RuleField::domain, RuleOperator::equals, std::string{"API.example.com"}, true)));
    EXPECT_TRUE(check(condition(RuleField::domain, RuleOperator::equals, std::string{"api.example.com"}, true)));
}

TEST_F(RuleEngineTest, ListOperatorsNeedAList) {
    std::vector<std::string> classes{"bing", "GOOGLE"};
    EXPECT_TRUE(check(condition(RuleField::destinationClass, RuleOperator::inList, classes)));
    EXPECT_FALSE(check(condition(RuleField::destinationClass, RuleOperator::notInList, classes)));
    EXPECT_FALSE(check(condition(RuleField::destinationClass, RuleOperator::inList, std::string{"google"})));
}

TEST_F(RuleEngineTest, NumericFieldsCompareAsNumbers) {
    EXPECT_TRUE(check(condition(RuleField::timeHour, RuleOperator::equals, 14.0)));
    EXPECT_TRUE(check(condition(RuleField::timeHour, RuleOperator::equals, std::string{"14"})));
    EXPECT_TRUE(check(condition(RuleField::timeHour, RuleOperator::greaterThan, 9.0)));
    EXPECT_TRUE(check(condition(RuleField::timeHour, RuleOperator::lessThan, 18.0)));
    EXPECT_TRUE(check(condition(RuleField::timeDay, RuleOperator::equals, 0.0)));
    EXPECT_TRUE(check(condition(RuleField::proxyFailureRate, RuleOperator::greaterThan, 30.0)));
    EXPECT_FALSE(check(condition(RuleField::proxyFailureRate, RuleOperator::lessThan, 30.0)));
    EXPECT_FALSE(check(condition(RuleField::domain, RuleOperator::greaterThan, 1.0)));
}

TEST_F(RuleEngineTest, RegexNeedsCompiledPattern) {
    auto cond = condition(RuleField::domain, RuleOperator::matchesRegex, std::string{"^api\\..*\\.com$"});
    EXPECT_FALSE(check(cond));
    cond.pattern = std::make_shared<const std::regex>(std::string{"^api\\..*\\.com$"});
    EXPECT_TRUE(check(cond));
}

TEST_F(RuleEngineTest, LogicAllAndAny) {
    auto r = rule("r", 0,
                  {condition(RuleField::domain, RuleOperator::contains, std::string{"example"}),
                   condition(RuleField::destinationClass, RuleOperator::equals, std::string{"bing"})});
    EXPECT_FALSE(RuleEngine::matches(r, context));
    r.logic = model::ConditionLogic::any;
    EXPECT_TRUE(RuleEngine::matches(r, context));
    EXPECT_TRUE(RuleEngine::matches(rule("empty", 0, {}), context));
}

TEST_F(RuleEngineTest, HighestPriorityFiresFirst) {
    std::vector<model::Rule> rules{
        rule("low", 1, {condition(RuleField::domain, RuleOperator::contains, std::string{"example"})}),
        rule("high", 10, {condition(RuleField::domain, RuleOperator::contains, std::string{"api"})}),
        rule("miss", 50, {condition(RuleField::domain, RuleOperator::contains, std::string{"nowhere"})}),
    };
    auto evaluation = RuleEngine::evaluate(rules, context);
    ASSERT_NE(evaluation.fired, nullptr);
    EXPECT_EQ(evaluation.fired->id, "high");
    EXPECT_EQ(evaluation.matchedRuleIds, std::vector<std::string>{"high"});

    rules[1].stopOnMatch = false;
    evaluation = RuleEngine::evaluate(rules, context);
    EXPECT_EQ(evaluation.fired->id, "high");
    EXPECT_EQ(evaluation.matchedRuleIds, (std::vector<std::string>{"high", "low"}));
}

TEST_F(RuleEngineTest, EqualPriorityKeepsDeclarationOrder) {
    std::vector<model::Rule> rules{rule("first", 5, {}), rule("second", 5, {})};
    EXPECT_EQ(RuleEngine::evaluate(rules, context).fired->id, "first");
}

TEST_F(RuleEngineTest, DisabledRulesAreSkipped) {
    std::vector<model::Rule> rules{rule("off", 10, {}), rule("on", 1, {})};
    rules[0].enabled = false;
    EXPECT_EQ(RuleEngine::evaluate(rules, context).fired->id, "on");

    rules[1].enabled = false;
    auto evaluation = RuleEngine::evaluate(rules, context);
    EXPECT_EQ(evaluation.fired, nullptr);
    EXPECT_TRUE(evaluation.matchedRuleIds.empty());
}

} // namespace
} // namespace proxyrot::rotation
