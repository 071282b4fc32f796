#include "proxyrot/rotation/RuleEngine.hpp"
#include "proxyrot/rotation/TimeSchedule.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <sstream>

namespace proxyrot::rotation {
namespace {

using model::RuleField;
using model::RuleOperator;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool isNumericField(RuleField field) {
    return field == RuleField::timeHour || field == RuleField::timeDay || field == RuleField::proxyFailureRate;
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::optional<double> toNumber(const std::string& text) {
    double value = 0.0;
    auto begin = text.data();
    auto end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

double numericField(RuleField field, const RuleContext& context) {
    switch (field) {
    case RuleField::timeHour:
        return civilTimeUtc(context.wallTime).hour;
    case RuleField::timeDay:
        return civilTimeUtc(context.wallTime).dayOfWeek;
    case RuleField::proxyFailureRate:
        return context.poolFailureRate;
    default:
        return 0.0;
    }
}

std::string textField(RuleField field, const RuleContext& context) {
    switch (field) {
    case RuleField::domain:
        return context.domain;
    case RuleField::url:
        return context.url;
    case RuleField::path:
        return extractPath(context.url);
    case RuleField::destinationClass:
        return context.destinationClass;
    case RuleField::timeHour:
    case RuleField::timeDay:
    case RuleField::proxyFailureRate:
        return formatNumber(numericField(field, context));
    }
    return {};
}

std::optional<double> fieldAsNumber(RuleField field, const RuleContext& context) {
    if (isNumericField(field)) {
        return numericField(field, context);
    }
    return toNumber(textField(field, context));
}

std::optional<double> valueAsNumber(const model::ConditionValue& value) {
    if (auto number = std::get_if<double>(&value)) {
        return *number;
    }
    if (auto text = std::get_if<std::string>(&value)) {
        return toNumber(*text);
    }
    return std::nullopt;
}

std::string valueAsText(const model::ConditionValue& value) {
    if (auto number = std::get_if<double>(&value)) {
        return formatNumber(*number);
    }
    if (auto text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return {};
}

bool inList(const model::ConditionValue& value, const std::string& fieldText, bool caseSensitive) {
    auto list = std::get_if<std::vector<std::string>>(&value);
    if (!list) {
        return false;
    }
    return std::any_of(list->begin(), list->end(), [&](const std::string& item) {
        return (caseSensitive ? item : lower(item)) == fieldText;
    });
}

} // namespace

std::string extractPath(const std::string& url) {
    if (url.empty()) {
        return {};
    }
    std::string_view view = url;
    if (auto scheme = view.find("://"); scheme != std::string_view::npos) {
        view.remove_prefix(scheme + 3);
        auto slash = view.find('/');
        if (slash == std::string_view::npos) {
            return "/";
        }
        view.remove_prefix(slash);
    }
    if (auto query = view.find_first_of("?#"); query != std::string_view::npos) {
        view = view.substr(0, query);
    }
    return std::string(view);
}

bool RuleEngine::evaluateCondition(const model::RuleCondition& condition, const RuleContext& context) {
    const bool caseSensitive = condition.caseSensitive;
    const std::string rawField = textField(condition.field, context);
    const std::string fieldText = caseSensitive ? rawField : lower(rawField);
    const std::string rawValue = valueAsText(condition.value);
    const std::string valueText = caseSensitive ? rawValue : lower(rawValue);

    switch (condition.op) {
    case RuleOperator::equals:
    case RuleOperator::notEquals: {
        bool equal = false;
        auto lhs = isNumericField(condition.field) ? fieldAsNumber(condition.field, context) : std::nullopt;
        auto rhs = valueAsNumber(condition.value);
        if (lhs && rhs) {
            equal = *lhs == *rhs;
        } else {
            equal = fieldText == valueText;
        }
        return condition.op == RuleOperator::equals ? equal : !equal;
    }
    case RuleOperator::contains:
        return fieldText.find(valueText) != std::string::npos;
    case RuleOperator::notContains:
        return fieldText.find(valueText) == std::string::npos;
    case RuleOperator::startsWith:
        return fieldText.starts_with(valueText);
    case RuleOperator::endsWith:
        return fieldText.ends_with(valueText);
    case RuleOperator::matchesRegex:
        if (!condition.pattern) {
            util::log(util::LogLevel::warn, "Regex condition without compiled pattern: " + rawValue);
            return false;
        }
        return std::regex_search(rawField, *condition.pattern);
    case RuleOperator::greaterThan:
    case RuleOperator::lessThan: {
        auto lhs = fieldAsNumber(condition.field, context);
        auto rhs = valueAsNumber(condition.value);
        if (!lhs || !rhs) {
            return false;
        }
        return condition.op == RuleOperator::greaterThan ? *lhs > *rhs : *lhs < *rhs;
    }
    case RuleOperator::inList:
        return inList(condition.value, fieldText, caseSensitive);
    case RuleOperator::notInList:
        return !inList(condition.value, fieldText, caseSensitive);
    }
    return false;
}

bool RuleEngine::matches(const model::Rule& rule, const RuleContext& context) {
    if (rule.conditions.empty()) {
        return true;
    }
    auto check = [&context](const model::RuleCondition& condition) { return evaluateCondition(condition, context); };
    if (rule.logic == model::ConditionLogic::all) {
        return std::all_of(rule.conditions.begin(), rule.conditions.end(), check);
    }
    return std::any_of(rule.conditions.begin(), rule.conditions.end(), check);
}

RuleEvaluation RuleEngine::evaluate(const std::vector<model::Rule>& rules, const RuleContext& context) {
    std::vector<const model::Rule*> ordered;
    ordered.reserve(rules.size());
    for (const auto& rule : rules) {
        if (rule.enabled) {
            ordered.push_back(&rule);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const model::Rule* lhs, const model::Rule* rhs) {
        return lhs->priority > rhs->priority;
    });

    RuleEvaluation evaluation;
    for (const auto* rule : ordered) {
        if (!matches(*rule, context)) {
            continue;
        }
        evaluation.matchedRuleIds.push_back(rule->id);
        if (!evaluation.fired) {
            evaluation.fired = rule;
            if (rule->stopOnMatch) {
                break;
            }
        } else {
            util::log(util::LogLevel::debug, "Rule " + rule->id + " also matched for " + context.domain);
        }
    }
    return evaluation;
}

} // namespace proxyrot::rotation
