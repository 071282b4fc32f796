#include "proxyrot/Errors.hpp"
#include "proxyrot/config/EngineSettings.hpp"
#include "proxyrot/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include <unistd.h>

namespace proxyrot::config {
namespace {

using namespace std::chrono_literals;

EngineSettings parse(const std::string& payload) {
    return parseEngineSettings(util::parseJson(payload).as_object());
}

class EngineSettingsTest : public ::testing::Test {
protected:
    static constexpr const char* kVariables[] = {
        "PROXYROT_LOG_LEVEL",           "PROXYROT_SEED",
        "PROXYROT_BREAKER_THRESHOLD",   "PROXYROT_BREAKER_COOLDOWN_MS",
        "PROXYROT_GLOBAL_MAX_REQUESTS", "PROXYROT_GLOBAL_MAX_CONCURRENT",
        "PROXYROT_MAINTENANCE_INTERVAL_SECONDS",
        "PROXYROT_DB_HOST",             "PROXYROT_DB_PORT",
        "PROXYROT_DB_USER",             "PROXYROT_DB_PASSWORD",
        "PROXYROT_DB_NAME",             "PROXYROT_DB_POOL_SIZE",
    };

    std::filesystem::path path{std::filesystem::temp_directory_path() /
                               ("proxyrot-settings-" + std::to_string(::getpid()) + ".json")};

    void SetUp() override { clearEnvironment(); }

    void TearDown() override {
        clearEnvironment();
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    static void clearEnvironment() {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
    }

    void writeFile(const std::string& content) {
        std::ofstream ofs(path);
        ofs << content;
    }
};

TEST_F(EngineSettingsTest, EmptyObjectKeepsDefaults) {
    auto settings = parse("{}");
    EXPECT_EQ(settings.breaker.failureThreshold, 5u);
    EXPECT_EQ(settings.breaker.window, 60000ms);
    EXPECT_EQ(settings.breaker.cooldown, 30000ms);
    EXPECT_EQ(settings.breaker.successesToClose, 1u);
    EXPECT_EQ(settings.rateLimits.global.maxRequests, 100u);
    EXPECT_EQ(settings.rateLimits.global.maxConcurrent, 10u);
    EXPECT_EQ(settings.rateLimits.classes.count("google"), 1u);
    EXPECT_EQ(settings.rateLimits.classes.at("bing").maxConcurrent, 5u);
    EXPECT_EQ(settings.maintenanceInterval, 60s);
    EXPECT_EQ(settings.logLevel, util::LogLevel::info);
    EXPECT_FALSE(settings.seed);
    EXPECT_FALSE(settings.database);
}

TEST_F(EngineSettingsTest, ParsesAllSections) {
    auto settings = parse(R"({
        "logLevel": "debug",
        "seed": 42,
        "maintenanceIntervalSeconds": 15,
        "circuitBreaker": {"failureThreshold": 3, "windowMs": 10000, "cooldownMs": 0, "successesToClose": 2},
        "rateLimits": {
            "global": {"maxRequests": 500, "windowMs": 30000, "maxConcurrent": 20},
            "defaultClass": {"maxRequests": 10, "minDelayMs": 0},
            "classes": {
                "google": {"maxRequests": 5},
                "scraper": {"maxConcurrent": 1}
            }
        },
        "database": {"host": "db.internal", "port": 33061, "user": "rotator", "database": "rotation", "poolSize": 8}
    })");
    EXPECT_EQ(settings.logLevel, util::LogLevel::debug);
    EXPECT_EQ(settings.seed, 42u);
    EXPECT_EQ(settings.maintenanceInterval, 15s);
    EXPECT_EQ(settings.breaker.failureThreshold, 3u);
    EXPECT_EQ(settings.breaker.window, 10000ms);
    EXPECT_EQ(settings.breaker.cooldown, 0ms);
    EXPECT_EQ(settings.breaker.successesToClose, 2u);

    const auto& limits = settings.rateLimits;
    EXPECT_EQ(limits.global.maxRequests, 500u);
    EXPECT_EQ(limits.global.window, 30000ms);
    EXPECT_EQ(limits.global.maxConcurrent, 20u);
    EXPECT_EQ(limits.defaultClass.maxRequests, 10u);
    EXPECT_EQ(limits.defaultClass.minDelay, 0ms);

    const auto& google = limits.classes.at("google");
    EXPECT_EQ(google.maxRequests, 5u);
    EXPECT_EQ(google.minDelay, 2000ms);
    EXPECT_EQ(google.maxConcurrent, 3u);
    const auto& scraper = limits.classes.at("scraper");
    EXPECT_EQ(scraper.maxRequests, 10u);
    EXPECT_EQ(scraper.maxConcurrent, 1u);

    ASSERT_TRUE(settings.database);
    EXPECT_EQ(settings.database->host, "db.internal");
    EXPECT_EQ(settings.database->port, 33061);
    EXPECT_EQ(settings.database->user, "rotator");
    EXPECT_EQ(settings.database->database, "rotation");
    EXPECT_EQ(settings.database->charset, "utf8mb4");
    EXPECT_EQ(settings.database->poolSize, 8u);
}

TEST_F(EngineSettingsTest, RejectsInvalidValues) {
    EXPECT_THROW(parse(R"({"logLevel": "loud"})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"maintenanceIntervalSeconds": 0})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"circuitBreaker": {"failureThreshold": 0}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"circuitBreaker": {"windowMs": 0}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"rateLimits": {"global": {"maxConcurrent": -1}}})"), InvalidConfigError);
    EXPECT_THROW(parse(R"({"rateLimits": {"classes": {"google": 5}}})"), InvalidConfigError);
}

TEST_F(EngineSettingsTest, EnvironmentOverridesFile) {
    writeFile(R"({"seed": 1, "circuitBreaker": {"failureThreshold": 3}})");
    ::setenv("PROXYROT_SEED", "7", 1);
    ::setenv("PROXYROT_BREAKER_THRESHOLD", "9", 1);
    ::setenv("PROXYROT_BREAKER_COOLDOWN_MS", "1500", 1);
    ::setenv("PROXYROT_GLOBAL_MAX_CONCURRENT", "4", 1);
    ::setenv("PROXYROT_LOG_LEVEL", "warn", 1);

    auto settings = loadEngineSettings(path);
    EXPECT_EQ(settings.seed, 7u);
    EXPECT_EQ(settings.breaker.failureThreshold, 9u);
    EXPECT_EQ(settings.breaker.cooldown, 1500ms);
    EXPECT_EQ(settings.rateLimits.global.maxConcurrent, 4u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::warn);
}

TEST_F(EngineSettingsTest, InvalidEnvironmentValuesAreIgnored) {
    ::setenv("PROXYROT_BREAKER_THRESHOLD", "many", 1);
    ::setenv("PROXYROT_GLOBAL_MAX_REQUESTS", "0", 1);
    ::setenv("PROXYROT_LOG_LEVEL", "shouty", 1);

    EngineSettings settings;
    applyEnvironmentOverrides(settings);
    EXPECT_EQ(settings.breaker.failureThreshold, 5u);
    EXPECT_EQ(settings.rateLimits.global.maxRequests, 100u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::info);
}

TEST_F(EngineSettingsTest, DatabaseHostInEnvironmentEnablesDatabase) {
    ::setenv("PROXYROT_DB_HOST", "mysql.local", 1);
    ::setenv("PROXYROT_DB_PORT", "3307", 1);
    ::setenv("PROXYROT_DB_PASSWORD", "secret", 1);

    EngineSettings settings;
    applyEnvironmentOverrides(settings);
    ASSERT_TRUE(settings.database);
    EXPECT_EQ(settings.database->host, "mysql.local");
    EXPECT_EQ(settings.database->port, 3307);
    EXPECT_EQ(settings.database->password, "secret");
    EXPECT_EQ(settings.database->database, "proxyrot");
}

TEST_F(EngineSettingsTest, MissingOrMalformedFileFallsBackToDefaults) {
    auto missing = loadEngineSettings(path);
    EXPECT_EQ(missing.breaker.failureThreshold, 5u);

    writeFile("{ not json");
    auto malformed = loadEngineSettings(path);
    EXPECT_EQ(malformed.breaker.failureThreshold, 5u);

    writeFile(R"({"circuitBreaker": {"failureThreshold": -2}})");
    auto invalid = loadEngineSettings(path);
    EXPECT_EQ(invalid.breaker.failureThreshold, 5u);
}

} // namespace
} // namespace proxyrot::config
