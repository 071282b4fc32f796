#pragma once

#include "proxyrot/util/Clock.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace proxyrot::health {

enum class BreakerState {
    closed,
    open,
    halfOpen
};

const char* toString(BreakerState state);

struct CircuitBreakerConfig {
    std::uint32_t failureThreshold{5};
    std::chrono::milliseconds window{60000};
    std::chrono::milliseconds cooldown{30000};
    std::uint32_t successesToClose{1};
};

struct BreakerSnapshot {
    std::string proxyId;
    BreakerState state{BreakerState::closed};
    std::uint32_t failureCount{};
    std::uint32_t halfOpenSuccesses{};
    std::optional<std::chrono::steady_clock::time_point> openedAt;
};

class CircuitBreakerTracker {
public:
    CircuitBreakerTracker(CircuitBreakerConfig config, const util::Clock& clock);

    void reportOutcome(const std::string& proxyId, bool success);
    bool isOpen(const std::string& proxyId);
    BreakerSnapshot getState(const std::string& proxyId);
    std::vector<BreakerSnapshot> snapshot();

    void reset(const std::string& proxyId);
    void clear();

    const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        std::mutex mutex;
        BreakerState state{BreakerState::closed};
        // Failure times inside the sliding window, oldest first.
        std::deque<std::chrono::steady_clock::time_point> failures;
        std::optional<std::chrono::steady_clock::time_point> openedAt;
        std::uint32_t halfOpenSuccesses{};
    };

    std::shared_ptr<Entry> find(const std::string& proxyId) const;
    std::shared_ptr<Entry> findOrCreate(const std::string& proxyId);
    void refreshLocked(const std::string& proxyId, Entry& entry, std::chrono::steady_clock::time_point now);
    void pruneFailuresLocked(Entry& entry, std::chrono::steady_clock::time_point now) const;
    void transitionLocked(const std::string& proxyId, Entry& entry, BreakerState next,
                          std::chrono::steady_clock::time_point now);
    static BreakerSnapshot toSnapshot(const std::string& proxyId, const Entry& entry);

    CircuitBreakerConfig config_;
    const util::Clock& clock_;
    mutable std::shared_mutex entriesMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace proxyrot::health
