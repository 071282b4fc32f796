#pragma once

#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/ratelimit/RateLimiter.hpp"
#include "proxyrot/repository/DatabaseConfig.hpp"
#include "proxyrot/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace proxyrot::config {

struct EngineSettings {
    health::CircuitBreakerConfig breaker;
    ratelimit::RateLimiterConfig rateLimits{ratelimit::RateLimiterConfig::defaults()};
    std::chrono::seconds maintenanceInterval{60};
    std::optional<std::uint64_t> seed;
    util::LogLevel logLevel{util::LogLevel::info};
    std::optional<repository::DatabaseConfig> database;
};

// Throws InvalidConfigError on out-of-range values.
EngineSettings parseEngineSettings(const boost::json::object& json);

// Reads the file when present, then applies PROXYROT_* environment overrides.
// A malformed file is logged and ignored.
EngineSettings loadEngineSettings(const std::filesystem::path& path);
void applyEnvironmentOverrides(EngineSettings& settings);

} // namespace proxyrot::config
