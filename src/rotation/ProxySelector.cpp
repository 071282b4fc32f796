#include "proxyrot/rotation/ProxySelector.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/rotation/RuleEngine.hpp"
#include "proxyrot/rotation/TimeSchedule.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace proxyrot::rotation {
namespace {

using model::Proxy;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

bool inRegion(const Proxy& proxy, std::string_view region) {
    return proxy.region && equalsIgnoreCase(*proxy.region, region);
}

std::optional<Proxy> findById(const std::vector<Proxy>& proxies, const std::string& id) {
    auto it = std::find_if(proxies.begin(), proxies.end(), [&id](const Proxy& proxy) { return proxy.id == id; });
    if (it == proxies.end()) {
        return std::nullopt;
    }
    return *it;
}

double clampRate(double rate) {
    return std::clamp(rate, 0.0, 100.0);
}

} // namespace

ProxySelector::ProxySelector(health::CircuitBreakerTracker& breakers,
                             session::StickySessionTable& sticky,
                             const util::Clock& clock,
                             std::optional<std::uint64_t> seed)
    : breakers_(breakers)
    , sticky_(sticky)
    , clock_(clock)
    , rng_(seed ? *seed : std::random_device{}()) {}

std::string ProxySelector::configKey(const model::RotationConfig& config) {
    if (!config.id.empty()) {
        return config.id;
    }
    return "group:" + config.targetGroup.value_or("");
}

std::vector<Proxy> ProxySelector::filterHealthy(const std::vector<Proxy>& pool) {
    std::vector<Proxy> healthy;
    healthy.reserve(pool.size());
    for (const auto& proxy : pool) {
        if (proxy.status == model::ProxyStatus::disabled) {
            continue;
        }
        if (breakers_.isOpen(proxy.id)) {
            continue;
        }
        healthy.push_back(proxy);
    }
    return healthy;
}

Selection ProxySelector::next(const std::vector<Proxy>& pool,
                              const model::RotationConfig& config,
                              const SelectionContext& context) {
    auto selection = propose(pool, config, context);
    commit(selection);
    return selection;
}

Selection ProxySelector::propose(const std::vector<Proxy>& pool,
                                 const model::RotationConfig& config,
                                 const SelectionContext& context) {
    const auto key = configKey(config);
    auto healthy = filterHealthy(pool);
    if (healthy.empty()) {
        throw NoAvailableProxyError("No available proxy for rotation config '" + key + "' (" +
                                    std::to_string(pool.size()) + " candidates)");
    }

    const std::string groupCursor = "rr:" + config.targetGroup.value_or("");
    Pick pick = std::visit(
        model::Overloaded{
            [&](const model::RoundRobinParams&) { return Pick{pickRoundRobin(healthy, groupCursor)}; },
            [&](const model::RandomParams&) { return Pick{pickRandom(healthy)}; },
            [&](const model::LeastUsedParams&) { return Pick{pickLeastUsed(healthy)}; },
            [&](const model::FastestParams&) { return Pick{pickFastest(healthy)}; },
            [&](const model::StickySessionParams& params) { return selectSticky(healthy, config, params, context); },
            [&](const model::GeographicParams& params) { return selectGeographic(healthy, config, params, context); },
            [&](const model::FailureAwareParams& params) {
                if (params.base == model::SubStrategy::random) {
                    return Pick{pickWeighted(healthy, [](const Proxy& proxy) { return clampRate(proxy.successRate); })};
                }
                return Pick{pickWeighted(healthy, [](const Proxy& proxy) {
                    return model::clampWeight(proxy.weight) * clampRate(proxy.successRate) / 100.0;
                })};
            },
            [&](const model::TimeBasedParams& params) { return selectTimeBased(healthy, config, params); },
            [&](const model::WeightedParams& params) {
                return Pick{pickWeighted(healthy, [&params](const Proxy& proxy) {
                    auto it = params.weights.find(proxy.id);
                    return model::clampWeight(it != params.weights.end() ? it->second : proxy.weight);
                })};
            },
            [&](const model::CustomParams& params) { return selectCustom(healthy, config, params, context); },
        },
        config.params);

    Selection selection;
    selection.proxy = pick.proxy;
    selection.sticky = pick.sticky;
    selection.firedRuleId = pick.firedRuleId;
    selection.configKey = key;
    selection.binding = pick.binding;
    selection.hold = pick.hold;
    selection.rotation = pick.sticky ? pick.stickyRotation : proposeRotation(key, config, context, pick);
    util::log(util::LogLevel::trace,
              "Selected proxy " + selection.proxy.id + " via " + model::toString(config.strategy()) +
                  " for " + (context.domain.empty() ? std::string{"<none>"} : context.domain));
    return selection;
}

void ProxySelector::commit(Selection& selection) {
    if (selection.binding) {
        const auto& binding = *selection.binding;
        if (binding.rebind) {
            sticky_.upsert(binding.domain, selection.configKey, binding.proxyId, binding.ttl);
            sticky_.touch(binding.domain, selection.configKey);
        } else {
            sticky_.touch(binding.domain, selection.configKey,
                          binding.refreshTtl ? std::optional<std::chrono::seconds>{binding.ttl} : std::nullopt);
        }
    }
    if (selection.hold) {
        std::scoped_lock lock(holdMutex_);
        holds_[selection.configKey] = Hold{*selection.hold, std::nullopt};
    }
    if (selection.sticky) {
        return;
    }

    std::scoped_lock lock(lastMutex_);
    auto& last = lastByConfig_[selection.configKey];
    if (last == selection.proxy.id) {
        selection.rotation.reset();
        return;
    }
    auto previous = std::exchange(last, selection.proxy.id);
    if (selection.rotation && selection.rotation->previousProxyId != previous) {
        selection.rotation->previousProxyId = previous;
        if (previous.empty()) {
            selection.rotation->reason = model::RotationReason::startup;
        }
    }
}

std::optional<model::RotationEvent> ProxySelector::proposeRotation(const std::string& configKey,
                                                                   const model::RotationConfig& config,
                                                                   const SelectionContext& context,
                                                                   const Pick& pick) {
    std::string previous;
    {
        std::scoped_lock lock(lastMutex_);
        if (auto it = lastByConfig_.find(configKey); it != lastByConfig_.end()) {
            previous = it->second;
        }
        if (previous == pick.proxy.id) {
            return std::nullopt;
        }
    }

    model::RotationEvent event;
    event.timestamp = clock_.wallNow();
    event.previousProxyId = previous;
    event.newProxyId = pick.proxy.id;
    event.domain = context.domain;
    event.configId = config.id;
    if (previous.empty()) {
        event.reason = model::RotationReason::startup;
    } else if (pick.reason) {
        event.reason = *pick.reason;
    } else if (pick.firedRuleId) {
        event.reason = model::RotationReason::ruleTriggered;
    } else if (breakers_.isOpen(previous)) {
        event.reason = model::RotationReason::failure;
    } else {
        event.reason = model::RotationReason::scheduled;
    }
    return event;
}

ProxySelector::Pick ProxySelector::selectSticky(const std::vector<Proxy>& healthy,
                                                const model::RotationConfig& config,
                                                const model::StickySessionParams& params,
                                                const SelectionContext& context) {
    const auto key = configKey(config);
    const std::string cursorKey = "sticky:" + key;
    if (context.domain.empty()) {
        util::log(util::LogLevel::debug, "Sticky selection without domain, using fallback strategy");
        return Pick{pickSub(params.fallback, healthy, cursorKey)};
    }

    std::string previous;
    model::RotationReason reason = model::RotationReason::failure;
    if (auto live = sticky_.get(context.domain, key)) {
        if (auto proxy = findById(healthy, live->proxyId)) {
            Pick pick{*proxy};
            pick.sticky = true;
            pick.binding = StickyBinding{context.domain, proxy->id, params.ttl, false, params.refreshTtlOnUse};
            return pick;
        }
        previous = live->proxyId;
    } else if (auto stale = sticky_.peek(context.domain, key); stale && stale->expiresAt <= clock_.now()) {
        previous = stale->proxyId;
        reason = model::RotationReason::ttlExpired;
    }

    auto proxy = pickSub(params.fallback, healthy, cursorKey);
    Pick pick{proxy};
    pick.sticky = true;
    pick.binding = StickyBinding{context.domain, proxy.id, params.ttl, true, false};
    if (!previous.empty() && previous != proxy.id) {
        model::RotationEvent event;
        event.timestamp = clock_.wallNow();
        event.previousProxyId = previous;
        event.newProxyId = proxy.id;
        event.reason = reason;
        event.domain = context.domain;
        event.configId = config.id;
        pick.stickyRotation = std::move(event);
    }
    return pick;
}

ProxySelector::Pick ProxySelector::selectGeographic(const std::vector<Proxy>& healthy,
                                                    const model::RotationConfig& config,
                                                    const model::GeographicParams& params,
                                                    const SelectionContext& context) {
    std::vector<Proxy> candidates;
    candidates.reserve(healthy.size());
    for (const auto& proxy : healthy) {
        bool excluded = std::any_of(params.excludedRegions.begin(), params.excludedRegions.end(),
                                    [&proxy](const std::string& region) { return inRegion(proxy, region); });
        if (!excluded) {
            candidates.push_back(proxy);
        }
    }

    auto region = context.region ? context.region : params.preferredRegion;
    if (region) {
        std::erase_if(candidates, [&region](const Proxy& proxy) { return !inRegion(proxy, *region); });
        if (candidates.empty()) {
            throw NoAvailableProxyError("No available proxy in region '" + *region + "'");
        }
    } else if (candidates.empty()) {
        throw NoAvailableProxyError("Every available proxy is in an excluded region");
    }
    return Pick{pickSub(params.strategy, candidates, "geo:" + configKey(config) + ":" + region.value_or(""))};
}

ProxySelector::Pick ProxySelector::selectTimeBased(const std::vector<Proxy>& healthy,
                                                   const model::RotationConfig& config,
                                                   const model::TimeBasedParams& params) {
    const auto key = configKey(config);
    const auto now = clock_.now();
    const bool holding = params.holdInterval.count() > 0;

    std::optional<model::RotationReason> reason;
    std::string previous;
    if (holding) {
        std::scoped_lock lock(holdMutex_);
        if (auto it = holds_.find(key); it != holds_.end()) {
            const auto& hold = it->second;
            const bool due = hold.forced.has_value() || now - hold.current.since >= params.holdInterval;
            if (!due) {
                if (auto current = findById(healthy, hold.current.proxyId)) {
                    return Pick{*current};
                }
                reason = model::RotationReason::failure;
            } else {
                reason = hold.forced.value_or(model::RotationReason::scheduled);
            }
            previous = hold.current.proxyId;
        }
    }

    std::vector<Proxy> candidates = healthy;
    std::string cursorKey = "time:" + key;
    auto strategy = params.defaultStrategy;
    if (const auto* window = matchWindow(params.windows, clock_.wallNow())) {
        cursorKey += ":" + window->name;
        strategy = window->strategy;
        if (!window->proxyIds.empty()) {
            std::vector<Proxy> targeted;
            for (const auto& id : window->proxyIds) {
                if (auto proxy = findById(healthy, id)) {
                    targeted.push_back(*proxy);
                }
            }
            if (targeted.empty()) {
                util::log(util::LogLevel::warn,
                          "Schedule window '" + window->name + "' has no healthy target proxy, using the whole pool");
                strategy = params.defaultStrategy;
            } else {
                candidates = std::move(targeted);
            }
        }
    }
    if (!previous.empty() && candidates.size() > 1) {
        std::erase_if(candidates, [&previous](const Proxy& proxy) { return proxy.id == previous; });
    }

    auto proxy = pickSub(strategy, candidates, cursorKey);
    Pick pick{proxy};
    pick.reason = reason;
    if (holding) {
        pick.hold = ScheduleHold{proxy.id, now, params.rotateOnFailure};
    }
    return pick;
}

ProxySelector::Pick ProxySelector::selectCustom(const std::vector<Proxy>& healthy,
                                                const model::RotationConfig& config,
                                                const model::CustomParams& params,
                                                const SelectionContext& context) {
    const auto key = configKey(config);
    RuleContext ruleContext;
    ruleContext.domain = session::StickySessionTable::normalizeDomain(context.domain);
    ruleContext.url = context.url;
    ruleContext.destinationClass = context.destinationClass;
    ruleContext.wallTime = clock_.wallNow();
    for (const auto& proxy : healthy) {
        ruleContext.poolFailureRate = std::max(ruleContext.poolFailureRate, 100.0 - clampRate(proxy.successRate));
    }

    auto evaluation = RuleEngine::evaluate(params.rules, ruleContext);
    if (!evaluation.fired) {
        return Pick{pickSub(params.fallback, healthy, "custom:" + key)};
    }
    const auto& rule = *evaluation.fired;
    util::log(util::LogLevel::debug, "Rule " + rule.id + " fired for " + ruleContext.domain);

    std::vector<Proxy> candidates = healthy;
    std::optional<Proxy> chosen;
    std::optional<model::SubStrategy> strategy;
    for (const auto& action : rule.actions) {
        switch (action.type) {
        case model::RuleActionType::useProxy:
            chosen = findById(healthy, action.argument);
            if (!chosen) {
                util::log(util::LogLevel::debug, "Rule " + rule.id + " targets unavailable proxy " + action.argument);
            }
            break;
        case model::RuleActionType::useRegion: {
            std::vector<Proxy> regional;
            std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(regional),
                         [&action](const Proxy& proxy) { return inRegion(proxy, action.argument); });
            if (regional.empty()) {
                util::log(util::LogLevel::debug, "Rule " + rule.id + " found no proxy in region " + action.argument);
            } else {
                candidates = std::move(regional);
            }
            break;
        }
        case model::RuleActionType::excludeProxy:
            std::erase_if(candidates, [&action](const Proxy& proxy) { return proxy.id == action.argument; });
            break;
        case model::RuleActionType::excludeRegion:
            std::erase_if(candidates, [&action](const Proxy& proxy) { return inRegion(proxy, action.argument); });
            break;
        case model::RuleActionType::applyStrategy:
            strategy = action.strategy;
            break;
        }
    }

    Pick pick;
    pick.firedRuleId = rule.id;
    if (chosen && findById(candidates, chosen->id)) {
        pick.proxy = *chosen;
        return pick;
    }
    if (candidates.empty()) {
        throw NoAvailableProxyError("Rule '" + rule.id + "' left no eligible proxy");
    }
    pick.proxy = pickSub(strategy.value_or(params.fallback), candidates, "rule:" + key + ":" + rule.id);
    return pick;
}

Proxy ProxySelector::pickSub(model::SubStrategy strategy,
                             const std::vector<Proxy>& candidates,
                             const std::string& cursorKey) {
    switch (strategy) {
    case model::SubStrategy::roundRobin:
        return pickRoundRobin(candidates, cursorKey);
    case model::SubStrategy::random:
        return pickRandom(candidates);
    case model::SubStrategy::leastUsed:
        return pickLeastUsed(candidates);
    case model::SubStrategy::fastest:
        return pickFastest(candidates);
    case model::SubStrategy::weighted:
        return pickWeighted(candidates, [](const Proxy& proxy) { return model::clampWeight(proxy.weight); });
    }
    return pickRoundRobin(candidates, cursorKey);
}

std::atomic<std::uint64_t>& ProxySelector::cursor(const std::string& key) {
    {
        std::shared_lock lock(cursorsMutex_);
        if (auto it = cursors_.find(key); it != cursors_.end()) {
            return *it->second;
        }
    }
    std::unique_lock lock(cursorsMutex_);
    auto& slot = cursors_[key];
    if (!slot) {
        slot = std::make_unique<std::atomic<std::uint64_t>>(0);
    }
    return *slot;
}

Proxy ProxySelector::pickRoundRobin(const std::vector<Proxy>& candidates, const std::string& cursorKey) {
    const auto position = cursor(cursorKey).fetch_add(1, std::memory_order_relaxed);
    return candidates[position % candidates.size()];
}

Proxy ProxySelector::pickRandom(const std::vector<Proxy>& candidates) {
    std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
    std::scoped_lock lock(rngMutex_);
    return candidates[dist(rng_)];
}

Proxy ProxySelector::pickWeighted(const std::vector<Proxy>& candidates, const WeightFn& weightOf) {
    std::vector<double> cumulative;
    cumulative.reserve(candidates.size());
    double total = 0.0;
    for (const auto& proxy : candidates) {
        total += std::max(0.0, weightOf(proxy));
        cumulative.push_back(total);
    }
    if (total <= 0.0) {
        return pickRandom(candidates);
    }

    double draw = 0.0;
    {
        std::uniform_real_distribution<double> dist(0.0, total);
        std::scoped_lock lock(rngMutex_);
        draw = dist(rng_);
    }
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (cumulative[i] > draw) {
            return candidates[i];
        }
    }
    // Rounding put the draw on the upper bound: take the last weighted proxy.
    for (std::size_t i = candidates.size(); i-- > 0;) {
        if (weightOf(candidates[i]) > 0.0) {
            return candidates[i];
        }
    }
    return candidates.back();
}

Proxy ProxySelector::pickLeastUsed(const std::vector<Proxy>& candidates) const {
    return *std::min_element(candidates.begin(), candidates.end(), [](const Proxy& lhs, const Proxy& rhs) {
        if (lhs.totalRequests != rhs.totalRequests) {
            return lhs.totalRequests < rhs.totalRequests;
        }
        return lhs.id < rhs.id;
    });
}

Proxy ProxySelector::pickFastest(const std::vector<Proxy>& candidates) const {
    return *std::min_element(candidates.begin(), candidates.end(), [](const Proxy& lhs, const Proxy& rhs) {
        const double left = lhs.latencyMs.value_or(std::numeric_limits<double>::infinity());
        const double right = rhs.latencyMs.value_or(std::numeric_limits<double>::infinity());
        if (left != right) {
            return left < right;
        }
        return lhs.id < rhs.id;
    });
}

void ProxySelector::reportFailure(const std::string& configKey, const std::string& proxyId) {
    std::scoped_lock lock(holdMutex_);
    auto it = holds_.find(configKey);
    if (it == holds_.end() || it->second.current.proxyId != proxyId || !it->second.current.rotateOnFailure) {
        return;
    }
    it->second.forced = model::RotationReason::failure;
}

void ProxySelector::forceRotation(const std::string& configKey) {
    std::scoped_lock lock(holdMutex_);
    if (auto it = holds_.find(configKey); it != holds_.end()) {
        it->second.forced = model::RotationReason::manual;
    }
}

void ProxySelector::reseed(std::uint64_t seed) {
    std::scoped_lock lock(rngMutex_);
    rng_.seed(seed);
}

void ProxySelector::reset() {
    {
        std::unique_lock lock(cursorsMutex_);
        cursors_.clear();
    }
    {
        std::scoped_lock lock(lastMutex_);
        lastByConfig_.clear();
    }
    {
        std::scoped_lock lock(holdMutex_);
        holds_.clear();
    }
}

} // namespace proxyrot::rotation
