#pragma once

#include "proxyrot/util/Clock.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proxyrot::session {

struct StickySessionEntry {
    std::string domain;
    std::string configId;
    std::string proxyId;
    bool wildcard{false};
    std::chrono::steady_clock::time_point createdAt{};
    std::chrono::steady_clock::time_point expiresAt{};
    std::uint64_t requestCount{};
};

class StickySessionTable {
public:
    explicit StickySessionTable(const util::Clock& clock);

    std::optional<StickySessionEntry> get(std::string_view domain, const std::string& configId) const;
    // Most recent entry for the domain, live or expired, without wildcard resolution.
    std::optional<StickySessionEntry> peek(std::string_view domain, const std::string& configId) const;
    StickySessionEntry upsert(std::string_view domain,
                              const std::string& configId,
                              const std::string& proxyId,
                              std::chrono::seconds ttl);
    bool touch(std::string_view domain,
               const std::string& configId,
               std::optional<std::chrono::seconds> refreshTtl = std::nullopt);

    std::size_t invalidateByProxy(const std::string& proxyId);
    bool invalidate(std::string_view domain, const std::string& configId);
    std::size_t purgeExpired();
    std::vector<StickySessionEntry> entries() const;
    std::size_t size() const;
    void clear();

    static std::string normalizeDomain(std::string_view input);
    static bool matchesWildcard(std::string_view domain, std::string_view pattern);

private:
    using Key = std::pair<std::string, std::string>; // configId, domain

    const util::Clock& clock_;
    mutable std::shared_mutex mutex_;
    std::map<Key, StickySessionEntry> entries_;
};

} // namespace proxyrot::session
