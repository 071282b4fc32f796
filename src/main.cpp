#include "proxyrot/Errors.hpp"
#include "proxyrot/config/EngineSettings.hpp"
#include "proxyrot/config/RotationConfigCodec.hpp"
#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/repository/ProxyRepository.hpp"
#include "proxyrot/repository/RotationConfigRepository.hpp"
#include "proxyrot/repository/RotationEventsRepository.hpp"
#include "proxyrot/repository/UsageStatsRepository.hpp"
#include "proxyrot/service/InMemoryStores.hpp"
#include "proxyrot/service/MaintenanceService.hpp"
#include "proxyrot/service/RotationCoordinator.hpp"
#include "proxyrot/util/Clock.hpp"
#include "proxyrot/util/JsonUtil.hpp"
#include "proxyrot/util/Logging.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {
using namespace proxyrot;

struct Target {
    std::string domain;
    std::string destinationClass;
};

const std::vector<Target> kTargets{
    {"www.google.com", "google"},
    {"duckduckgo.com", "duckduckgo"},
    {"www.bing.com", "bing"},
    {"search.brave.com", "brave"},
    {"shop.example.com", ""},
};

struct SimulationTotals {
    std::atomic<std::uint64_t> completed{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> rateLimited{0};
    std::atomic<std::uint64_t> unavailable{0};
};

class OutcomeModel {
public:
    explicit OutcomeModel(std::uint64_t seed)
        : rng_(seed) {}

    service::Outcome next(const model::Proxy& proxy) {
        std::scoped_lock lock(mutex_);
        std::uniform_real_distribution<double> roll(0.0, 100.0);
        std::normal_distribution<double> jitter(0.0, 0.2);
        service::Outcome outcome;
        outcome.success = roll(rng_) < proxy.successRate;
        const double base = proxy.latencyMs.value_or(250.0);
        outcome.latency = std::chrono::milliseconds{static_cast<long>(std::max(1.0, base * (1.0 + jitter(rng_))))};
        outcome.bytes = outcome.success ? 48 * 1024 : 0;
        return outcome;
    }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

unsigned int readRequestCount() {
    if (const char* value = std::getenv("PROXYROT_SIM_REQUESTS")) {
        auto parsed = std::strtoul(value, nullptr, 10);
        if (parsed > 0) {
            return static_cast<unsigned int>(parsed);
        }
    }
    return 200;
}

void simulateRequest(service::RotationCoordinator& coordinator,
                     OutcomeModel& outcomes,
                     SimulationTotals& totals,
                     const Target& target) {
    service::AcquireRequest request;
    request.domain = target.domain;
    request.destinationClass = target.destinationClass;
    request.url = "https://" + target.domain + "/search?q=proxyrot";
    try {
        auto lease = coordinator.acquire(request);
        auto outcome = outcomes.next(lease.proxy());
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        lease.release(outcome);
        ++(outcome.success ? totals.completed : totals.failed);
    } catch (const RateLimitExceededError& ex) {
        ++totals.rateLimited;
        util::log(util::LogLevel::debug, std::string{ex.what()} + ", retry in " + std::to_string(ex.waitTime().count()) + "ms");
    } catch (const NoAvailableProxyError& ex) {
        ++totals.unavailable;
        util::log(util::LogLevel::warn, ex.what());
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace proxyrot;
    const std::filesystem::path settingsPath = argc > 1 ? argv[1] : "data/engine.json";
    const std::filesystem::path rotationPath = argc > 2 ? argv[2] : "data/rotation.json";
    const std::filesystem::path proxiesPath = argc > 3 ? argv[3] : "data/proxies.json";

    auto settings = config::loadEngineSettings(settingsPath);
    util::initLogging(settings.logLevel);

    util::SystemClock clock;
    boost::asio::io_context io;
    boost::asio::thread_pool workerPool(std::max(2u, std::thread::hardware_concurrency()));

    service::StaticConfigProvider staticConfigs;
    service::StaticProxyPool staticPool;
    service::MemoryUsageStats memoryUsage{&staticPool};
    service::MemoryEventLog memoryEvents;

    std::unique_ptr<repository::MySqlConnectionPool> connectionPool;
    std::unique_ptr<repository::RotationConfigRepository> configRepository;
    std::unique_ptr<repository::ProxyRepository> proxyRepository;
    std::unique_ptr<repository::UsageStatsRepository> usageRepository;
    std::unique_ptr<repository::RotationEventsRepository> eventsRepository;

    service::ConfigProvider* configs = &staticConfigs;
    service::ProxyPoolProvider* pool = &staticPool;
    service::UsageStatsSink* usage = &memoryUsage;
    service::RotationEventSink* events = &memoryEvents;

    try {
        if (settings.database) {
            const auto& db = *settings.database;
            util::log(util::LogLevel::info, "Connecting MySQL: " + db.host + ":" + std::to_string(db.port) + "/" + db.database);
            connectionPool = std::make_unique<repository::MySqlConnectionPool>(db);
            configRepository = std::make_unique<repository::RotationConfigRepository>(*connectionPool);
            proxyRepository = std::make_unique<repository::ProxyRepository>(*connectionPool);
            usageRepository = std::make_unique<repository::UsageStatsRepository>(*connectionPool, workerPool, clock);
            eventsRepository = std::make_unique<repository::RotationEventsRepository>(*connectionPool, workerPool);
            configs = configRepository.get();
            pool = proxyRepository.get();
            usage = usageRepository.get();
            events = eventsRepository.get();
        } else {
            auto rotationJson = util::readJsonFile(rotationPath);
            if (!rotationJson) {
                util::log(util::LogLevel::error, "Rotation config not found: " + rotationPath.string());
                return EXIT_FAILURE;
            }
            staticConfigs.setActive(config::parseRotationConfig(*rotationJson));
            auto proxiesJson = util::readJsonFile(proxiesPath);
            if (!proxiesJson) {
                util::log(util::LogLevel::error, "Proxy list not found: " + proxiesPath.string());
                return EXIT_FAILURE;
            }
            staticPool.replaceAll(config::parseProxyList(*proxiesJson));
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Startup failed: "} + ex.what());
        return EXIT_FAILURE;
    }

    service::RotationCoordinator coordinator{*configs, *pool, clock, settings, usage, events};
    service::MaintenanceService maintenance{io, coordinator.stickySessions(), coordinator.breakers()};
    maintenance.start(settings.maintenanceInterval);
    std::thread ioThread([&io]() { io.run(); });

    OutcomeModel outcomes{settings.seed.value_or(std::random_device{}())};
    SimulationTotals totals;
    const auto requestCount = readRequestCount();
    util::log(util::LogLevel::info, "Simulating " + std::to_string(requestCount) + " requests");
    for (unsigned int i = 0; i < requestCount; ++i) {
        const auto& target = kTargets[i % kTargets.size()];
        boost::asio::post(workerPool, [&coordinator, &outcomes, &totals, &target]() {
            try {
                simulateRequest(coordinator, outcomes, totals, target);
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::error, std::string{"Simulated request failed: "} + ex.what());
            }
        });
    }
    workerPool.join();

    maintenance.stop();
    io.stop();
    ioThread.join();
    maintenance.runOnce();

    util::log(util::LogLevel::info, "Completed " + std::to_string(totals.completed.load()) + ", failed " +
                                        std::to_string(totals.failed.load()) + ", rate limited " +
                                        std::to_string(totals.rateLimited.load()) + ", unavailable " +
                                        std::to_string(totals.unavailable.load()));
    if (!settings.database) {
        for (const auto& [proxyId, stats] : memoryUsage.all()) {
            util::log(util::LogLevel::info, "  " + proxyId + ": " + std::to_string(stats.successes) + " ok / " +
                                                std::to_string(stats.failures) + " failed");
        }
        util::log(util::LogLevel::info, std::to_string(memoryEvents.events().size()) + " rotation events recorded");
    }
    return EXIT_SUCCESS;
}
