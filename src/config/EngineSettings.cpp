#include "proxyrot/config/EngineSettings.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/util/JsonUtil.hpp"

#include <cstdlib>
#include <string>

namespace proxyrot::config {
namespace {

using util::readInteger;

std::uint32_t readPositive(const boost::json::object& obj, std::string_view key, std::uint32_t fallback) {
    auto value = readInteger(obj, key);
    if (!value) {
        return fallback;
    }
    if (*value <= 0) {
        throw InvalidConfigError(std::string(key) + " must be positive");
    }
    return static_cast<std::uint32_t>(*value);
}

std::chrono::milliseconds readDuration(const boost::json::object& obj,
                                       std::string_view key,
                                       std::chrono::milliseconds fallback,
                                       bool allowZero) {
    auto value = readInteger(obj, key);
    if (!value) {
        return fallback;
    }
    if (*value < 0 || (*value == 0 && !allowZero)) {
        throw InvalidConfigError(std::string(key) + " is out of range");
    }
    return std::chrono::milliseconds{*value};
}

ratelimit::ClassLimits parseClassLimits(const boost::json::object& obj, const ratelimit::ClassLimits& base) {
    ratelimit::ClassLimits limits = base;
    limits.maxRequests = readPositive(obj, "maxRequests", base.maxRequests);
    limits.window = readDuration(obj, "windowMs", base.window, false);
    limits.minDelay = readDuration(obj, "minDelayMs", base.minDelay, true);
    limits.maxConcurrent = readPositive(obj, "maxConcurrent", base.maxConcurrent);
    return limits;
}

std::optional<std::int64_t> envInteger(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    char* end = nullptr;
    auto parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        util::log(util::LogLevel::warn, std::string{"Ignoring non-numeric "} + name + "=" + value);
        return std::nullopt;
    }
    return parsed;
}

} // namespace

EngineSettings parseEngineSettings(const boost::json::object& json) {
    EngineSettings settings;

    if (auto level = util::readString(json, "logLevel")) {
        auto parsed = util::parseLogLevel(*level);
        if (!parsed) {
            throw InvalidConfigError("Unknown log level '" + *level + "'");
        }
        settings.logLevel = *parsed;
    }
    if (auto seed = readInteger(json, "seed")) {
        settings.seed = static_cast<std::uint64_t>(*seed);
    }
    if (auto interval = readInteger(json, "maintenanceIntervalSeconds")) {
        if (*interval <= 0) {
            throw InvalidConfigError("maintenanceIntervalSeconds must be positive");
        }
        settings.maintenanceInterval = std::chrono::seconds{*interval};
    }

    if (auto it = json.if_contains("circuitBreaker"); it && it->is_object()) {
        const auto& obj = it->as_object();
        settings.breaker.failureThreshold = readPositive(obj, "failureThreshold", settings.breaker.failureThreshold);
        settings.breaker.window = readDuration(obj, "windowMs", settings.breaker.window, false);
        settings.breaker.cooldown = readDuration(obj, "cooldownMs", settings.breaker.cooldown, true);
        settings.breaker.successesToClose = readPositive(obj, "successesToClose", settings.breaker.successesToClose);
    }

    if (auto it = json.if_contains("rateLimits"); it && it->is_object()) {
        const auto& limits = it->as_object();
        auto& config = settings.rateLimits;
        if (auto global = limits.if_contains("global"); global && global->is_object()) {
            const auto& obj = global->as_object();
            config.global.maxRequests = readPositive(obj, "maxRequests", config.global.maxRequests);
            config.global.window = readDuration(obj, "windowMs", config.global.window, false);
            config.global.maxConcurrent = readPositive(obj, "maxConcurrent", config.global.maxConcurrent);
        }
        if (auto fallback = limits.if_contains("defaultClass"); fallback && fallback->is_object()) {
            config.defaultClass = parseClassLimits(fallback->as_object(), config.defaultClass);
        }
        if (auto classes = limits.if_contains("classes"); classes && classes->is_object()) {
            for (const auto& [name, value] : classes->as_object()) {
                if (!value.is_object()) {
                    throw InvalidConfigError("Limits for class " + std::string(name) + " must be an object");
                }
                auto existing = config.classes.find(std::string(name));
                const auto& base = existing != config.classes.end() ? existing->second : config.defaultClass;
                config.classes[std::string(name)] = parseClassLimits(value.as_object(), base);
            }
        }
    }

    if (auto it = json.if_contains("database"); it && it->is_object()) {
        settings.database = repository::loadConfig(it->as_object());
    }
    return settings;
}

void applyEnvironmentOverrides(EngineSettings& settings) {
    if (const char* value = std::getenv("PROXYROT_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            settings.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, std::string{"Ignoring unknown PROXYROT_LOG_LEVEL="} + value);
        }
    }
    if (auto value = envInteger("PROXYROT_SEED")) settings.seed = static_cast<std::uint64_t>(*value);
    if (auto value = envInteger("PROXYROT_BREAKER_THRESHOLD"); value && *value > 0) {
        settings.breaker.failureThreshold = static_cast<std::uint32_t>(*value);
    }
    if (auto value = envInteger("PROXYROT_BREAKER_COOLDOWN_MS"); value && *value >= 0) {
        settings.breaker.cooldown = std::chrono::milliseconds{*value};
    }
    if (auto value = envInteger("PROXYROT_GLOBAL_MAX_REQUESTS"); value && *value > 0) {
        settings.rateLimits.global.maxRequests = static_cast<std::uint32_t>(*value);
    }
    if (auto value = envInteger("PROXYROT_GLOBAL_MAX_CONCURRENT"); value && *value > 0) {
        settings.rateLimits.global.maxConcurrent = static_cast<std::uint32_t>(*value);
    }
    if (auto value = envInteger("PROXYROT_MAINTENANCE_INTERVAL_SECONDS"); value && *value > 0) {
        settings.maintenanceInterval = std::chrono::seconds{*value};
    }

    const char* host = std::getenv("PROXYROT_DB_HOST");
    if (host && !settings.database) {
        settings.database.emplace();
    }
    if (settings.database) {
        auto& db = *settings.database;
        if (host) db.host = host;
        if (auto value = envInteger("PROXYROT_DB_PORT")) db.port = static_cast<std::uint16_t>(*value);
        if (const char* value = std::getenv("PROXYROT_DB_USER")) db.user = value;
        if (const char* value = std::getenv("PROXYROT_DB_PASSWORD")) db.password = value;
        if (const char* value = std::getenv("PROXYROT_DB_NAME")) db.database = value;
        if (auto value = envInteger("PROXYROT_DB_POOL_SIZE"); value && *value > 0) {
            db.poolSize = static_cast<unsigned int>(*value);
        }
    }
}

EngineSettings loadEngineSettings(const std::filesystem::path& path) {
    EngineSettings settings;
    try {
        if (auto json = util::readJsonFile(path)) {
            if (json->is_object()) {
                settings = parseEngineSettings(json->as_object());
            } else {
                util::log(util::LogLevel::warn, "Engine settings in " + path.string() + " are not a JSON object");
            }
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to load engine settings from " + path.string() + ": " + ex.what());
        settings = EngineSettings{};
    }
    applyEnvironmentOverrides(settings);
    return settings;
}

} // namespace proxyrot::config
