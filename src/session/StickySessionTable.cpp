#include "proxyrot/session/StickySessionTable.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace proxyrot::session {

namespace {

// Exact match first, then the longest live wildcard pattern covering the domain.
template <typename EntryMap>
auto resolveEntry(EntryMap& entries,
                  const std::string& domain,
                  const std::string& configId,
                  std::chrono::steady_clock::time_point now) -> decltype(&entries.begin()->second) {
    using Key = typename EntryMap::key_type;
    if (auto it = entries.find(Key{configId, domain}); it != entries.end() && it->second.expiresAt > now) {
        return &it->second;
    }
    decltype(&entries.begin()->second) best = nullptr;
    for (auto it = entries.lower_bound(Key{configId, std::string{}}); it != entries.end() && it->first.first == configId; ++it) {
        auto& entry = it->second;
        if (!entry.wildcard || entry.expiresAt <= now) {
            continue;
        }
        if (!StickySessionTable::matchesWildcard(domain, entry.domain)) {
            continue;
        }
        if (!best || entry.domain.size() > best->domain.size()) {
            best = &entry;
        }
    }
    return best;
}

} // namespace

StickySessionTable::StickySessionTable(const util::Clock& clock)
    : clock_(clock) {}

std::string StickySessionTable::normalizeDomain(std::string_view input) {
    std::string_view view = input;
    if (auto scheme = view.find("://"); scheme != std::string_view::npos) {
        view.remove_prefix(scheme + 3);
    }
    if (auto at = view.find('@'); at != std::string_view::npos && view.find('/') > at) {
        view.remove_prefix(at + 1);
    }
    if (auto slash = view.find_first_of("/?#"); slash != std::string_view::npos) {
        view = view.substr(0, slash);
    }
    if (auto colon = view.rfind(':'); colon != std::string_view::npos && view.find(']') == std::string_view::npos) {
        view = view.substr(0, colon);
    }
    while (!view.empty() && view.back() == '.') {
        view.remove_suffix(1);
    }
    std::string domain(view);
    std::transform(domain.begin(), domain.end(), domain.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return domain;
}

bool StickySessionTable::matchesWildcard(std::string_view domain, std::string_view pattern) {
    if (pattern.size() > 2 && pattern.substr(0, 2) == "*.") {
        auto base = pattern.substr(2);
        if (domain == base) {
            return true;
        }
        return domain.size() > base.size() &&
               domain.substr(domain.size() - base.size()) == base &&
               domain[domain.size() - base.size() - 1] == '.';
    }
    return domain == pattern;
}

std::optional<StickySessionEntry> StickySessionTable::get(std::string_view domain, const std::string& configId) const {
    const auto normalized = normalizeDomain(domain);
    std::shared_lock lock(mutex_);
    if (auto entry = resolveEntry(entries_, normalized, configId, clock_.now())) {
        return *entry;
    }
    return std::nullopt;
}

std::optional<StickySessionEntry> StickySessionTable::peek(std::string_view domain, const std::string& configId) const {
    const auto normalized = normalizeDomain(domain);
    std::shared_lock lock(mutex_);
    if (auto it = entries_.find(Key{configId, normalized}); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

StickySessionEntry StickySessionTable::upsert(std::string_view domain,
                                              const std::string& configId,
                                              const std::string& proxyId,
                                              std::chrono::seconds ttl) {
    const bool wildcard = domain.find('*') != std::string_view::npos;
    std::string key;
    if (wildcard) {
        key = std::string(domain);
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    } else {
        key = normalizeDomain(domain);
    }
    const auto now = clock_.now();

    std::unique_lock lock(mutex_);
    auto& entry = entries_[Key{configId, key}];
    if (entry.proxyId != proxyId || entry.expiresAt <= now) {
        entry.requestCount = 0;
        entry.createdAt = now;
    }
    entry.domain = key;
    entry.configId = configId;
    entry.proxyId = proxyId;
    entry.wildcard = wildcard;
    entry.expiresAt = now + ttl;
    return entry;
}

bool StickySessionTable::touch(std::string_view domain,
                               const std::string& configId,
                               std::optional<std::chrono::seconds> refreshTtl) {
    const auto normalized = normalizeDomain(domain);
    const auto now = clock_.now();
    std::unique_lock lock(mutex_);
    auto entry = resolveEntry(entries_, normalized, configId, now);
    if (!entry) {
        return false;
    }
    entry->requestCount += 1;
    if (refreshTtl) {
        entry->expiresAt = now + *refreshTtl;
    }
    return true;
}

std::size_t StickySessionTable::invalidateByProxy(const std::string& proxyId) {
    std::unique_lock lock(mutex_);
    auto removed = std::erase_if(entries_, [&proxyId](const auto& item) { return item.second.proxyId == proxyId; });
    if (removed > 0) {
        util::log(util::LogLevel::info,
                  "Dropped " + std::to_string(removed) + " sticky session(s) bound to proxy " + proxyId);
    }
    return removed;
}

bool StickySessionTable::invalidate(std::string_view domain, const std::string& configId) {
    std::string key = domain.find('*') != std::string_view::npos ? std::string(domain) : normalizeDomain(domain);
    std::unique_lock lock(mutex_);
    return entries_.erase(Key{configId, key}) > 0;
}

std::size_t StickySessionTable::purgeExpired() {
    const auto now = clock_.now();
    std::unique_lock lock(mutex_);
    return std::erase_if(entries_, [now](const auto& item) { return item.second.expiresAt <= now; });
}

std::vector<StickySessionEntry> StickySessionTable::entries() const {
    std::shared_lock lock(mutex_);
    std::vector<StickySessionEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

std::size_t StickySessionTable::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void StickySessionTable::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace proxyrot::session
