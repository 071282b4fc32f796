#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <utility>

namespace proxyrot::health {

const char* toString(BreakerState state) {
    switch (state) {
    case BreakerState::closed:   return "closed";
    case BreakerState::open:     return "open";
    case BreakerState::halfOpen: return "half-open";
    }
    return "closed";
}

CircuitBreakerTracker::CircuitBreakerTracker(CircuitBreakerConfig config, const util::Clock& clock)
    : config_(config)
    , clock_(clock) {
    if (config_.failureThreshold == 0) {
        config_.failureThreshold = 1;
    }
    if (config_.successesToClose == 0) {
        config_.successesToClose = 1;
    }
    if (config_.window.count() <= 0) {
        config_.window = std::chrono::milliseconds{60000};
    }
    if (config_.cooldown.count() < 0) {
        config_.cooldown = std::chrono::milliseconds{0};
    }
}

std::shared_ptr<CircuitBreakerTracker::Entry> CircuitBreakerTracker::find(const std::string& proxyId) const {
    std::shared_lock lock(entriesMutex_);
    auto it = entries_.find(proxyId);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<CircuitBreakerTracker::Entry> CircuitBreakerTracker::findOrCreate(const std::string& proxyId) {
    if (auto entry = find(proxyId)) {
        return entry;
    }
    std::unique_lock lock(entriesMutex_);
    auto [it, inserted] = entries_.try_emplace(proxyId, nullptr);
    if (inserted) {
        it->second = std::make_shared<Entry>();
    }
    return it->second;
}

void CircuitBreakerTracker::transitionLocked(const std::string& proxyId,
                                             Entry& entry,
                                             BreakerState next,
                                             std::chrono::steady_clock::time_point now) {
    const auto previous = entry.state;
    entry.state = next;
    switch (next) {
    case BreakerState::open:
        entry.openedAt = now;
        entry.halfOpenSuccesses = 0;
        break;
    case BreakerState::halfOpen:
        entry.halfOpenSuccesses = 0;
        break;
    case BreakerState::closed:
        entry.failures.clear();
        entry.openedAt.reset();
        entry.halfOpenSuccesses = 0;
        break;
    }
    util::log(next == BreakerState::open ? util::LogLevel::warn : util::LogLevel::info,
              "Circuit for proxy " + proxyId + " " + toString(previous) + " -> " + toString(next));
}

void CircuitBreakerTracker::pruneFailuresLocked(Entry& entry, std::chrono::steady_clock::time_point now) const {
    while (!entry.failures.empty() && now - entry.failures.front() > config_.window) {
        entry.failures.pop_front();
    }
}

void CircuitBreakerTracker::refreshLocked(const std::string& proxyId,
                                          Entry& entry,
                                          std::chrono::steady_clock::time_point now) {
    if (entry.state == BreakerState::closed) {
        pruneFailuresLocked(entry, now);
        return;
    }
    if (entry.state != BreakerState::open || !entry.openedAt) {
        return;
    }
    auto elapsed = now - *entry.openedAt;
    if (elapsed >= config_.cooldown) {
        transitionLocked(proxyId, entry, BreakerState::halfOpen, now);
    }
}

void CircuitBreakerTracker::reportOutcome(const std::string& proxyId, bool success) {
    if (proxyId.empty()) {
        util::log(util::LogLevel::warn, "Ignoring outcome report without proxy id");
        return;
    }
    auto entry = findOrCreate(proxyId);
    const auto now = clock_.now();
    std::scoped_lock lock(entry->mutex);
    refreshLocked(proxyId, *entry, now);

    switch (entry->state) {
    case BreakerState::closed:
        if (success) {
            return;
        }
        entry->failures.push_back(now);
        if (entry->failures.size() >= config_.failureThreshold) {
            transitionLocked(proxyId, *entry, BreakerState::open, now);
        }
        return;
    case BreakerState::halfOpen:
        if (!success) {
            entry->failures.push_back(now);
            transitionLocked(proxyId, *entry, BreakerState::open, now);
            return;
        }
        entry->halfOpenSuccesses += 1;
        if (entry->halfOpenSuccesses >= config_.successesToClose) {
            transitionLocked(proxyId, *entry, BreakerState::closed, now);
        }
        return;
    case BreakerState::open:
        // Late reports from requests started before the circuit opened.
        util::log(util::LogLevel::debug, "Outcome for open circuit " + proxyId + " dropped");
        return;
    }
}

bool CircuitBreakerTracker::isOpen(const std::string& proxyId) {
    auto entry = find(proxyId);
    if (!entry) {
        return false;
    }
    std::scoped_lock lock(entry->mutex);
    refreshLocked(proxyId, *entry, clock_.now());
    return entry->state == BreakerState::open;
}

BreakerSnapshot CircuitBreakerTracker::toSnapshot(const std::string& proxyId, const Entry& entry) {
    BreakerSnapshot snapshot;
    snapshot.proxyId = proxyId;
    snapshot.state = entry.state;
    snapshot.failureCount = static_cast<std::uint32_t>(entry.failures.size());
    snapshot.halfOpenSuccesses = entry.halfOpenSuccesses;
    snapshot.openedAt = entry.openedAt;
    return snapshot;
}

BreakerSnapshot CircuitBreakerTracker::getState(const std::string& proxyId) {
    auto entry = find(proxyId);
    if (!entry) {
        BreakerSnapshot snapshot;
        snapshot.proxyId = proxyId;
        return snapshot;
    }
    std::scoped_lock lock(entry->mutex);
    refreshLocked(proxyId, *entry, clock_.now());
    return toSnapshot(proxyId, *entry);
}

std::vector<BreakerSnapshot> CircuitBreakerTracker::snapshot() {
    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> copy;
    {
        std::shared_lock lock(entriesMutex_);
        copy.assign(entries_.begin(), entries_.end());
    }
    const auto now = clock_.now();
    std::vector<BreakerSnapshot> result;
    result.reserve(copy.size());
    for (auto& [proxyId, entry] : copy) {
        std::scoped_lock lock(entry->mutex);
        refreshLocked(proxyId, *entry, now);
        result.push_back(toSnapshot(proxyId, *entry));
    }
    std::sort(result.begin(), result.end(), [](const BreakerSnapshot& lhs, const BreakerSnapshot& rhs) {
        return lhs.proxyId < rhs.proxyId;
    });
    return result;
}

void CircuitBreakerTracker::reset(const std::string& proxyId) {
    std::unique_lock lock(entriesMutex_);
    entries_.erase(proxyId);
}

void CircuitBreakerTracker::clear() {
    std::unique_lock lock(entriesMutex_);
    entries_.clear();
}

} // namespace proxyrot::health
