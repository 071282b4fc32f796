#pragma once

#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/model/Proxy.hpp"
#include "proxyrot/model/RotationConfig.hpp"
#include "proxyrot/model/RotationEvent.hpp"
#include "proxyrot/session/StickySessionTable.hpp"
#include "proxyrot/util/Clock.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace proxyrot::rotation {

struct SelectionContext {
    std::string domain;
    std::string destinationClass;
    std::optional<std::string> region;
    std::string url;
};

// Sticky entry written or refreshed once a selection is committed.
struct StickyBinding {
    std::string domain;
    std::string proxyId;
    std::chrono::seconds ttl{};
    bool rebind{false};
    bool refreshTtl{false};
};

struct ScheduleHold {
    std::string proxyId;
    std::chrono::steady_clock::time_point since{};
    bool rotateOnFailure{false};
};

struct Selection {
    model::Proxy proxy;
    std::optional<model::RotationEvent> rotation;
    std::optional<std::string> firedRuleId;
    bool sticky{false};

    std::string configKey;
    std::optional<StickyBinding> binding;
    std::optional<ScheduleHold> hold;
};

class ProxySelector {
public:
    ProxySelector(health::CircuitBreakerTracker& breakers,
                  session::StickySessionTable& sticky,
                  const util::Clock& clock,
                  std::optional<std::uint64_t> seed = std::nullopt);

    // Throws NoAvailableProxyError when nothing healthy is left to pick.
    Selection next(const std::vector<model::Proxy>& pool,
                   const model::RotationConfig& config,
                   const SelectionContext& context);

    // Same choice as next() without recording it. Round-robin cursors still advance.
    Selection propose(const std::vector<model::Proxy>& pool,
                      const model::RotationConfig& config,
                      const SelectionContext& context);
    // Records the last proxy, sticky binding and schedule hold of a proposal.
    // Drops the rotation event when another commit already moved to the same proxy.
    void commit(Selection& selection);

    std::vector<model::Proxy> filterHealthy(const std::vector<model::Proxy>& pool);

    // Time-based holds: rotate away from a failed proxy, or on demand.
    void reportFailure(const std::string& configKey, const std::string& proxyId);
    void forceRotation(const std::string& configKey);

    void reseed(std::uint64_t seed);
    void reset();

    static std::string configKey(const model::RotationConfig& config);

private:
    struct Pick {
        model::Proxy proxy;
        std::optional<model::RotationReason> reason;
        std::optional<model::RotationEvent> stickyRotation;
        std::optional<std::string> firedRuleId;
        bool sticky{false};
        std::optional<StickyBinding> binding;
        std::optional<ScheduleHold> hold;
    };

    struct Hold {
        ScheduleHold current;
        std::optional<model::RotationReason> forced;
    };

    using WeightFn = std::function<double(const model::Proxy&)>;

    Pick selectSticky(const std::vector<model::Proxy>& healthy,
                      const model::RotationConfig& config,
                      const model::StickySessionParams& params,
                      const SelectionContext& context);
    Pick selectGeographic(const std::vector<model::Proxy>& healthy,
                          const model::RotationConfig& config,
                          const model::GeographicParams& params,
                          const SelectionContext& context);
    Pick selectTimeBased(const std::vector<model::Proxy>& healthy,
                         const model::RotationConfig& config,
                         const model::TimeBasedParams& params);
    Pick selectCustom(const std::vector<model::Proxy>& healthy,
                      const model::RotationConfig& config,
                      const model::CustomParams& params,
                      const SelectionContext& context);

    model::Proxy pickSub(model::SubStrategy strategy,
                         const std::vector<model::Proxy>& candidates,
                         const std::string& cursorKey);
    model::Proxy pickRoundRobin(const std::vector<model::Proxy>& candidates, const std::string& cursorKey);
    model::Proxy pickRandom(const std::vector<model::Proxy>& candidates);
    model::Proxy pickWeighted(const std::vector<model::Proxy>& candidates, const WeightFn& weightOf);
    model::Proxy pickLeastUsed(const std::vector<model::Proxy>& candidates) const;
    model::Proxy pickFastest(const std::vector<model::Proxy>& candidates) const;

    std::atomic<std::uint64_t>& cursor(const std::string& key);
    std::optional<model::RotationEvent> proposeRotation(const std::string& configKey,
                                                        const model::RotationConfig& config,
                                                        const SelectionContext& context,
                                                        const Pick& pick);

    health::CircuitBreakerTracker& breakers_;
    session::StickySessionTable& sticky_;
    const util::Clock& clock_;

    std::shared_mutex cursorsMutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<std::uint64_t>>> cursors_;

    std::mutex lastMutex_;
    std::unordered_map<std::string, std::string> lastByConfig_;

    std::mutex holdMutex_;
    std::unordered_map<std::string, Hold> holds_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

} // namespace proxyrot::rotation
