#include "proxyrot/config/RotationConfigCodec.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/util/JsonUtil.hpp"

#include <algorithm>
#include <cmath>

namespace proxyrot::config {
namespace {

using util::readBool;
using util::readInteger;
using util::readNumber;
using util::readString;

const boost::json::object& requireObject(const boost::json::value& value, const std::string& what) {
    if (!value.is_object()) {
        throw InvalidConfigError(what + " must be a JSON object");
    }
    return value.as_object();
}

const boost::json::object* optionalObject(const boost::json::object& obj, std::string_view key) {
    auto it = obj.if_contains(key);
    if (!it || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw InvalidConfigError(std::string(key) + " must be a JSON object");
    }
    return &it->as_object();
}

std::vector<std::string> readStringList(const boost::json::object& obj, std::string_view key) {
    std::vector<std::string> values;
    auto it = obj.if_contains(key);
    if (!it || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        throw InvalidConfigError(std::string(key) + " must be an array of strings");
    }
    for (const auto& item : it->as_array()) {
        if (!item.is_string()) {
            throw InvalidConfigError(std::string(key) + " must be an array of strings");
        }
        values.emplace_back(item.as_string());
    }
    return values;
}

model::SubStrategy readSubStrategy(const boost::json::object& obj, std::string_view key, model::SubStrategy fallback) {
    auto text = readString(obj, key);
    if (!text) {
        if (obj.if_contains(key) && !obj.at(key).is_null()) {
            throw InvalidConfigError(std::string(key) + " must be a strategy name");
        }
        return fallback;
    }
    auto parsed = model::parseSubStrategy(*text);
    if (!parsed) {
        throw InvalidConfigError("Unsupported sub-strategy '" + *text + "' for " + std::string(key));
    }
    return *parsed;
}

int readHour(const boost::json::object& obj, std::string_view key, int fallback) {
    auto value = readInteger(obj, key);
    if (!value) {
        return fallback;
    }
    if (*value < 0 || *value > 24) {
        throw InvalidConfigError(std::string(key) + " must be within 0..24");
    }
    return static_cast<int>(*value);
}

boost::json::array toJsonArray(const std::vector<std::string>& values) {
    boost::json::array array;
    for (const auto& value : values) {
        array.emplace_back(value);
    }
    return array;
}

model::ScheduleWindow parseWindow(const boost::json::value& json) {
    const auto& obj = requireObject(json, "schedule window");
    model::ScheduleWindow window;
    window.name = readString(obj, "name").value_or("");
    window.priority = static_cast<int>(readInteger(obj, "priority").value_or(0));
    window.startHour = readHour(obj, "startHour", 0);
    window.endHour = readHour(obj, "endHour", 24);
    window.strategy = readSubStrategy(obj, "strategy", model::SubStrategy::weighted);
    window.proxyIds = readStringList(obj, "proxyIds");
    if (auto it = obj.if_contains("daysOfWeek"); it && !it->is_null()) {
        if (!it->is_array()) {
            throw InvalidConfigError("daysOfWeek must be an array");
        }
        for (const auto& day : it->as_array()) {
            if (!day.is_int64() || day.as_int64() < 0 || day.as_int64() > 6) {
                throw InvalidConfigError("daysOfWeek entries must be within 0..6");
            }
            window.daysOfWeek.push_back(static_cast<int>(day.as_int64()));
        }
    }
    return window;
}

boost::json::object serializeWindow(const model::ScheduleWindow& window) {
    boost::json::array days;
    for (int day : window.daysOfWeek) {
        days.emplace_back(day);
    }
    return boost::json::object{
        {"name", window.name},
        {"priority", window.priority},
        {"daysOfWeek", std::move(days)},
        {"startHour", window.startHour},
        {"endHour", window.endHour},
        {"strategy", model::toString(window.strategy)},
        {"proxyIds", toJsonArray(window.proxyIds)},
    };
}

model::ConditionValue parseConditionValue(const boost::json::object& obj) {
    auto it = obj.if_contains("value");
    if (!it) {
        throw InvalidConfigError("Rule condition requires a value");
    }
    if (it->is_string()) {
        return std::string(it->as_string());
    }
    if (it->is_number()) {
        return it->to_number<double>();
    }
    if (it->is_array()) {
        std::vector<std::string> list;
        for (const auto& item : it->as_array()) {
            if (item.is_string()) {
                list.emplace_back(item.as_string());
            } else if (item.is_number()) {
                list.push_back(util::stringifyJson(item));
            } else {
                throw InvalidConfigError("Rule condition list values must be strings or numbers");
            }
        }
        return list;
    }
    throw InvalidConfigError("Rule condition value must be a string, number or list");
}

model::RuleCondition parseCondition(const boost::json::value& json) {
    const auto& obj = requireObject(json, "rule condition");
    model::RuleCondition condition;
    auto field = readString(obj, "field");
    auto parsedField = field ? model::parseRuleField(*field) : std::nullopt;
    if (!parsedField) {
        throw InvalidConfigError("Unsupported rule field '" + field.value_or("") + "'");
    }
    condition.field = *parsedField;
    auto op = readString(obj, "operator");
    auto parsedOp = op ? model::parseRuleOperator(*op) : std::nullopt;
    if (!parsedOp) {
        throw InvalidConfigError("Unsupported rule operator '" + op.value_or("") + "'");
    }
    condition.op = *parsedOp;
    condition.value = parseConditionValue(obj);
    condition.caseSensitive = readBool(obj, "caseSensitive").value_or(false);
    return condition;
}

boost::json::object serializeCondition(const model::RuleCondition& condition) {
    boost::json::value value = std::visit(
        model::Overloaded{
            [](const std::string& text) { return boost::json::value(text); },
            [](double number) { return boost::json::value(number); },
            [](const std::vector<std::string>& list) { return boost::json::value(toJsonArray(list)); },
        },
        condition.value);
    return boost::json::object{
        {"field", model::toString(condition.field)},
        {"operator", model::toString(condition.op)},
        {"value", std::move(value)},
        {"caseSensitive", condition.caseSensitive},
    };
}

model::RuleAction parseAction(const boost::json::value& json) {
    const auto& obj = requireObject(json, "rule action");
    model::RuleAction action;
    auto type = readString(obj, "type");
    auto parsedType = type ? model::parseRuleActionType(*type) : std::nullopt;
    if (!parsedType) {
        throw InvalidConfigError("Unsupported rule action '" + type.value_or("") + "'");
    }
    action.type = *parsedType;
    if (action.type == model::RuleActionType::applyStrategy) {
        action.strategy = readSubStrategy(obj, "value", model::SubStrategy::weighted);
        action.argument = model::toString(action.strategy);
        return action;
    }
    auto argument = readString(obj, "value");
    if (!argument || argument->empty()) {
        throw InvalidConfigError(std::string{"Rule action '"} + model::toString(action.type) + "' requires a value");
    }
    action.argument = *argument;
    return action;
}

boost::json::object serializeAction(const model::RuleAction& action) {
    if (action.type == model::RuleActionType::applyStrategy) {
        return boost::json::object{{"type", model::toString(action.type)}, {"value", model::toString(action.strategy)}};
    }
    return boost::json::object{{"type", model::toString(action.type)}, {"value", action.argument}};
}

} // namespace

void compileRule(model::Rule& rule) {
    for (auto& condition : rule.conditions) {
        if (condition.op != model::RuleOperator::matchesRegex) {
            condition.pattern.reset();
            continue;
        }
        auto text = std::get_if<std::string>(&condition.value);
        if (!text) {
            throw InvalidConfigError("Rule " + rule.id + " has a non-string regex");
        }
        auto flags = std::regex::ECMAScript;
        if (!condition.caseSensitive) {
            flags |= std::regex::icase;
        }
        try {
            condition.pattern = std::make_shared<const std::regex>(*text, flags);
        } catch (const std::regex_error& ex) {
            throw InvalidConfigError("Rule " + rule.id + " has an invalid regex '" + *text + "': " + ex.what());
        }
    }
}

void sortRules(std::vector<model::Rule>& rules) {
    std::stable_sort(rules.begin(), rules.end(), [](const model::Rule& lhs, const model::Rule& rhs) {
        return lhs.priority > rhs.priority;
    });
}

model::Rule parseRule(const boost::json::object& obj) {
    model::Rule rule;
    rule.id = readString(obj, "id").value_or("");
    if (rule.id.empty()) {
        throw InvalidConfigError("Rule requires an id");
    }
    rule.name = readString(obj, "name").value_or(rule.id);
    rule.priority = static_cast<int>(readInteger(obj, "priority").value_or(0));
    rule.enabled = readBool(obj, "enabled").value_or(true);
    rule.stopOnMatch = readBool(obj, "stopOnMatch").value_or(true);
    if (auto logic = readString(obj, "logic")) {
        if (*logic == "all" || *logic == "and" || *logic == "AND") {
            rule.logic = model::ConditionLogic::all;
        } else if (*logic == "any" || *logic == "or" || *logic == "OR") {
            rule.logic = model::ConditionLogic::any;
        } else {
            throw InvalidConfigError("Unsupported condition logic '" + *logic + "' in rule " + rule.id);
        }
    }
    if (auto it = obj.if_contains("conditions"); it && it->is_array()) {
        for (const auto& item : it->as_array()) {
            rule.conditions.push_back(parseCondition(item));
        }
    }
    if (auto it = obj.if_contains("actions"); it && it->is_array()) {
        for (const auto& item : it->as_array()) {
            rule.actions.push_back(parseAction(item));
        }
    }
    compileRule(rule);
    return rule;
}

boost::json::object serializeRule(const model::Rule& rule) {
    boost::json::array conditions;
    for (const auto& condition : rule.conditions) {
        conditions.emplace_back(serializeCondition(condition));
    }
    boost::json::array actions;
    for (const auto& action : rule.actions) {
        actions.emplace_back(serializeAction(action));
    }
    return boost::json::object{
        {"id", rule.id},
        {"name", rule.name},
        {"priority", rule.priority},
        {"enabled", rule.enabled},
        {"logic", rule.logic == model::ConditionLogic::all ? "all" : "any"},
        {"conditions", std::move(conditions)},
        {"actions", std::move(actions)},
        {"stopOnMatch", rule.stopOnMatch},
    };
}

model::StrategyParams parseStrategyParams(model::Strategy strategy, const boost::json::object& params) {
    switch (strategy) {
    case model::Strategy::roundRobin:
        return model::RoundRobinParams{};
    case model::Strategy::random:
        return model::RandomParams{};
    case model::Strategy::leastUsed:
        return model::LeastUsedParams{};
    case model::Strategy::fastest:
        return model::FastestParams{};
    case model::Strategy::weighted: {
        model::WeightedParams weighted;
        if (auto weights = optionalObject(params, "weights")) {
            for (const auto& [id, value] : *weights) {
                if (!value.is_number()) {
                    throw InvalidConfigError("Weight for proxy " + std::string(id) + " must be numeric");
                }
                weighted.weights[std::string(id)] = model::clampWeight(value.to_number<double>());
            }
        }
        return weighted;
    }
    case model::Strategy::failureAware: {
        model::FailureAwareParams failureAware;
        failureAware.base = readSubStrategy(params, "base", model::SubStrategy::weighted);
        if (failureAware.base != model::SubStrategy::weighted && failureAware.base != model::SubStrategy::random) {
            throw InvalidConfigError("failure-aware base must be weighted or random");
        }
        return failureAware;
    }
    case model::Strategy::stickySession: {
        model::StickySessionParams sticky;
        if (auto ttl = readInteger(params, "ttlSeconds")) {
            if (*ttl <= 0) {
                throw InvalidConfigError("ttlSeconds must be positive");
            }
            sticky.ttl = std::chrono::seconds{*ttl};
        }
        sticky.refreshTtlOnUse = readBool(params, "refreshTtlOnUse").value_or(false);
        sticky.fallback = readSubStrategy(params, "fallback", model::SubStrategy::weighted);
        return sticky;
    }
    case model::Strategy::geographic: {
        model::GeographicParams geographic;
        geographic.strategy = readSubStrategy(params, "strategy", model::SubStrategy::weighted);
        if (auto region = readString(params, "preferredRegion"); region && !region->empty()) {
            geographic.preferredRegion = std::move(region);
        }
        geographic.excludedRegions = readStringList(params, "excludedRegions");
        return geographic;
    }
    case model::Strategy::timeBased: {
        model::TimeBasedParams timeBased;
        timeBased.defaultStrategy = readSubStrategy(params, "defaultStrategy", model::SubStrategy::weighted);
        if (auto hold = readInteger(params, "holdIntervalMs")) {
            if (*hold < 0) {
                throw InvalidConfigError("holdIntervalMs must not be negative");
            }
            timeBased.holdInterval = std::chrono::milliseconds{*hold};
        }
        timeBased.rotateOnFailure = readBool(params, "rotateOnFailure").value_or(false);
        if (auto it = params.if_contains("windows"); it && it->is_array()) {
            for (const auto& item : it->as_array()) {
                timeBased.windows.push_back(parseWindow(item));
            }
        }
        return timeBased;
    }
    case model::Strategy::custom: {
        model::CustomParams custom;
        custom.fallback = readSubStrategy(params, "fallback", model::SubStrategy::roundRobin);
        if (auto it = params.if_contains("rules"); it && it->is_array()) {
            for (const auto& item : it->as_array()) {
                custom.rules.push_back(parseRule(requireObject(item, "rule")));
            }
        }
        sortRules(custom.rules);
        return custom;
    }
    }
    throw InvalidStrategyError("Unsupported rotation strategy");
}

boost::json::object serializeStrategyParams(const model::StrategyParams& params) {
    return std::visit(
        model::Overloaded{
            [](const model::RoundRobinParams&) { return boost::json::object{}; },
            [](const model::RandomParams&) { return boost::json::object{}; },
            [](const model::LeastUsedParams&) { return boost::json::object{}; },
            [](const model::FastestParams&) { return boost::json::object{}; },
            [](const model::WeightedParams& weighted) {
                boost::json::object weights;
                for (const auto& [id, weight] : weighted.weights) {
                    weights[id] = weight;
                }
                return boost::json::object{{"weights", std::move(weights)}};
            },
            [](const model::FailureAwareParams& failureAware) {
                return boost::json::object{{"base", model::toString(failureAware.base)}};
            },
            [](const model::StickySessionParams& sticky) {
                return boost::json::object{
                    {"ttlSeconds", sticky.ttl.count()},
                    {"refreshTtlOnUse", sticky.refreshTtlOnUse},
                    {"fallback", model::toString(sticky.fallback)},
                };
            },
            [](const model::GeographicParams& geographic) {
                boost::json::object obj{
                    {"strategy", model::toString(geographic.strategy)},
                    {"excludedRegions", toJsonArray(geographic.excludedRegions)},
                };
                if (geographic.preferredRegion) {
                    obj["preferredRegion"] = *geographic.preferredRegion;
                }
                return obj;
            },
            [](const model::TimeBasedParams& timeBased) {
                boost::json::array windows;
                for (const auto& window : timeBased.windows) {
                    windows.emplace_back(serializeWindow(window));
                }
                return boost::json::object{
                    {"windows", std::move(windows)},
                    {"defaultStrategy", model::toString(timeBased.defaultStrategy)},
                    {"holdIntervalMs", timeBased.holdInterval.count()},
                    {"rotateOnFailure", timeBased.rotateOnFailure},
                };
            },
            [](const model::CustomParams& custom) {
                boost::json::array rules;
                for (const auto& rule : custom.rules) {
                    rules.emplace_back(serializeRule(rule));
                }
                return boost::json::object{
                    {"rules", std::move(rules)},
                    {"fallback", model::toString(custom.fallback)},
                };
            },
        },
        params);
}

model::RotationConfig parseRotationConfig(const boost::json::value& json) {
    const auto& obj = requireObject(json, "rotation config");
    auto strategyName = readString(obj, "strategy");
    if (!strategyName) {
        throw InvalidStrategyError("Rotation config is missing a strategy");
    }
    auto strategy = model::parseStrategy(*strategyName);
    if (!strategy) {
        throw InvalidStrategyError("Unsupported rotation strategy '" + *strategyName + "'");
    }

    model::RotationConfig config;
    config.id = readString(obj, "id").value_or("");
    config.name = readString(obj, "name").value_or(config.id);
    if (auto group = readString(obj, "targetGroup"); group && !group->empty()) {
        config.targetGroup = std::move(group);
    }
    config.priority = static_cast<int>(readInteger(obj, "priority").value_or(0));
    config.enabled = readBool(obj, "enabled").value_or(true);

    static const boost::json::object kEmpty;
    const auto* params = optionalObject(obj, "params");
    config.params = parseStrategyParams(*strategy, params ? *params : kEmpty);
    return config;
}

boost::json::object serializeRotationConfig(const model::RotationConfig& config) {
    boost::json::object obj{
        {"id", config.id},
        {"name", config.name},
        {"strategy", model::toString(config.strategy())},
        {"priority", config.priority},
        {"enabled", config.enabled},
        {"params", serializeStrategyParams(config.params)},
    };
    if (config.targetGroup) {
        obj["targetGroup"] = *config.targetGroup;
    }
    return obj;
}

model::Proxy parseProxy(const boost::json::object& obj) {
    model::Proxy proxy;
    proxy.id = readString(obj, "id").value_or("");
    if (proxy.id.empty()) {
        throw InvalidConfigError("Proxy entry requires an id");
    }
    proxy.host = readString(obj, "host").value_or("");
    if (auto port = readInteger(obj, "port")) {
        if (*port < 0 || *port > 65535) {
            throw InvalidConfigError("Proxy " + proxy.id + " has an invalid port");
        }
        proxy.port = static_cast<std::uint16_t>(*port);
    }
    proxy.weight = model::clampWeight(readNumber(obj, "weight").value_or(1.0));
    if (auto group = readString(obj, "rotationGroup"); group && !group->empty()) {
        proxy.rotationGroup = std::move(group);
    }
    if (auto region = readString(obj, "region"); region && !region->empty()) {
        proxy.region = std::move(region);
    }
    if (auto status = readString(obj, "status")) {
        auto parsed = model::parseProxyStatus(*status);
        if (!parsed) {
            throw InvalidConfigError("Proxy " + proxy.id + " has unknown status '" + *status + "'");
        }
        proxy.status = *parsed;
    }
    proxy.latencyMs = readNumber(obj, "latencyMs");
    proxy.successRate = std::clamp(readNumber(obj, "successRate").value_or(100.0), 0.0, 100.0);
    if (auto total = readInteger(obj, "totalRequests"); total && *total > 0) {
        proxy.totalRequests = static_cast<std::uint64_t>(*total);
    }
    return proxy;
}

boost::json::object serializeProxy(const model::Proxy& proxy) {
    boost::json::object obj{
        {"id", proxy.id},
        {"host", proxy.host},
        {"port", proxy.port},
        {"weight", proxy.weight},
        {"status", model::toString(proxy.status)},
        {"successRate", proxy.successRate},
        {"totalRequests", proxy.totalRequests},
    };
    if (proxy.rotationGroup) obj["rotationGroup"] = *proxy.rotationGroup;
    if (proxy.region) obj["region"] = *proxy.region;
    if (proxy.latencyMs) obj["latencyMs"] = *proxy.latencyMs;
    return obj;
}

std::vector<model::Proxy> parseProxyList(const boost::json::value& json) {
    const boost::json::array* items = nullptr;
    if (json.is_array()) {
        items = &json.as_array();
    } else if (json.is_object()) {
        if (auto it = json.as_object().if_contains("proxies"); it && it->is_array()) {
            items = &it->as_array();
        }
    }
    if (!items) {
        throw InvalidConfigError("Proxy list must be an array or an object with a proxies array");
    }
    std::vector<model::Proxy> proxies;
    proxies.reserve(items->size());
    for (const auto& item : *items) {
        proxies.push_back(parseProxy(requireObject(item, "proxy entry")));
    }
    return proxies;
}

} // namespace proxyrot::config
