#include "proxyrot/repository/ProxyRepository.hpp"
#include "proxyrot/repository/SqlUtils.hpp"
#include "proxyrot/util/Logging.hpp"

#include <algorithm>

namespace proxyrot::repository {

ProxyRepository::ProxyRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

model::Proxy ProxyRepository::mapRow(mysqlx::Row row) {
    model::Proxy proxy;
    proxy.id = readString(row[0]);
    proxy.host = readString(row[1]);
    proxy.port = static_cast<std::uint16_t>(readInteger(row[2]));
    proxy.weight = model::clampWeight(readDouble(row[3]).value_or(1.0));
    proxy.rotationGroup = readOptionalString(row[4]);
    proxy.region = readOptionalString(row[5]);
    auto status = readString(row[6]);
    proxy.status = model::parseProxyStatus(status).value_or(model::ProxyStatus::active);
    proxy.latencyMs = readDouble(row[7]);
    proxy.successRate = std::clamp(readDouble(row[8]).value_or(100.0), 0.0, 100.0);
    proxy.totalRequests = static_cast<std::uint64_t>(std::max<std::int64_t>(0, readInteger(row[9])));
    return proxy;
}

std::vector<model::Proxy> ProxyRepository::listEnabled(const std::optional<std::string>& targetGroup) {
    std::vector<model::Proxy> proxies;
    auto session = pool_.acquire();
    try {
        std::string sql =
            "SELECT id, host, port, weight, rotation_group, region, status, latency, success_rate, total_requests "
            "FROM proxies WHERE status <> 'disabled'";
        if (targetGroup) {
            sql += " AND rotation_group = ?";
        }
        sql += " ORDER BY id";
        auto stmt = session->sql(sql);
        if (targetGroup) {
            stmt.bind(*targetGroup);
        }
        auto rows = stmt.execute();
        for (mysqlx::Row row : rows) {
            proxies.push_back(mapRow(row));
        }
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Query proxies failed: "} + err.what());
        throw;
    }
    return proxies;
}

} // namespace proxyrot::repository
