#include "proxyrot/repository/UsageStatsRepository.hpp"
#include "proxyrot/repository/SqlUtils.hpp"
#include "proxyrot/util/Logging.hpp"

#include <boost/asio/post.hpp>

namespace proxyrot::repository {
namespace {

// avg/min/max are assigned before total_requests so they read the old count.
constexpr const char* kUpsertWithLatency =
    "INSERT INTO proxy_usage_stats (id, proxy_id, time_bucket, total_requests, successful_requests, "
    "failed_requests, avg_latency_ms, min_latency_ms, max_latency_ms, bytes_received) "
    "VALUES (?, ?, ?, 1, ?, ?, ?, ?, ?, ?) "
    "ON DUPLICATE KEY UPDATE "
    "avg_latency_ms = (COALESCE(avg_latency_ms, 0) * total_requests + VALUES(avg_latency_ms)) / (total_requests + 1), "
    "min_latency_ms = LEAST(COALESCE(min_latency_ms, VALUES(min_latency_ms)), VALUES(min_latency_ms)), "
    "max_latency_ms = GREATEST(COALESCE(max_latency_ms, VALUES(max_latency_ms)), VALUES(max_latency_ms)), "
    "total_requests = total_requests + 1, "
    "successful_requests = successful_requests + VALUES(successful_requests), "
    "failed_requests = failed_requests + VALUES(failed_requests), "
    "bytes_received = bytes_received + VALUES(bytes_received), "
    "updated_at = CURRENT_TIMESTAMP";

constexpr const char* kUpsertWithoutLatency =
    "INSERT INTO proxy_usage_stats (id, proxy_id, time_bucket, total_requests, successful_requests, "
    "failed_requests, bytes_received) "
    "VALUES (?, ?, ?, 1, ?, ?, ?) "
    "ON DUPLICATE KEY UPDATE "
    "total_requests = total_requests + 1, "
    "successful_requests = successful_requests + VALUES(successful_requests), "
    "failed_requests = failed_requests + VALUES(failed_requests), "
    "bytes_received = bytes_received + VALUES(bytes_received), "
    "updated_at = CURRENT_TIMESTAMP";

} // namespace

UsageStatsRepository::UsageStatsRepository(MySqlConnectionPool& pool,
                                           boost::asio::thread_pool& workers,
                                           const util::Clock& clock)
    : pool_(pool)
    , workers_(workers)
    , clock_(clock) {}

void UsageStatsRepository::recordOutcome(const std::string& proxyId,
                                         bool success,
                                         std::optional<std::chrono::milliseconds> latency,
                                         std::uint64_t bytes) {
    auto bucket = hourBucket(clock_.wallNow());
    boost::asio::post(workers_, [this, proxyId, bucket = std::move(bucket), success, latency, bytes]() {
        try {
            upsert(proxyId, bucket, success, latency, bytes);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Dropped usage sample for proxy " + proxyId + ": " + ex.what());
        }
    });
}

void UsageStatsRepository::upsert(const std::string& proxyId,
                                  const std::string& bucket,
                                  bool success,
                                  std::optional<std::chrono::milliseconds> latency,
                                  std::uint64_t bytes) {
    auto session = pool_.acquire();
    const std::string rowId = proxyId + "@" + bucket;
    const int successes = success ? 1 : 0;
    const int failures = success ? 0 : 1;
    try {
        if (latency) {
            const auto ms = static_cast<double>(latency->count());
            session->sql(kUpsertWithLatency)
                .bind(rowId, proxyId, bucket, successes, failures, ms, ms, ms, bytes)
                .execute();
        } else {
            session->sql(kUpsertWithoutLatency)
                .bind(rowId, proxyId, bucket, successes, failures, bytes)
                .execute();
        }
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Upsert usage stats failed: "} + err.what());
        throw;
    }
}

} // namespace proxyrot::repository
