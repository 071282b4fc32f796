#pragma once

#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/service/Providers.hpp"
#include "proxyrot/util/Clock.hpp"

#include <boost/asio/thread_pool.hpp>

namespace proxyrot::repository {

// Hourly aggregates in proxy_usage_stats. Writes run on the worker pool,
// which must be joined before this object is destroyed.
class UsageStatsRepository : public service::UsageStatsSink {
public:
    UsageStatsRepository(MySqlConnectionPool& pool, boost::asio::thread_pool& workers, const util::Clock& clock);

    void recordOutcome(const std::string& proxyId,
                       bool success,
                       std::optional<std::chrono::milliseconds> latency,
                       std::uint64_t bytes) override;

    // Synchronous upsert, used by the posted task.
    void upsert(const std::string& proxyId,
                const std::string& bucket,
                bool success,
                std::optional<std::chrono::milliseconds> latency,
                std::uint64_t bytes);

private:
    MySqlConnectionPool& pool_;
    boost::asio::thread_pool& workers_;
    const util::Clock& clock_;
};

} // namespace proxyrot::repository
