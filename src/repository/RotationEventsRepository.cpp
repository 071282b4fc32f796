#include "proxyrot/repository/RotationEventsRepository.hpp"
#include "proxyrot/repository/SqlUtils.hpp"
#include "proxyrot/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace proxyrot::repository {
namespace {

std::string nextEventId(const model::RotationEvent& event) {
    static std::atomic<std::uint64_t> sequence{0};
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(event.timestamp.time_since_epoch()).count();
    return "evt-" + std::to_string(micros) + "-" + std::to_string(sequence.fetch_add(1));
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        util::log(util::LogLevel::warn, "Failed to parse datetime text: " + text);
        return {};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

RotationEventsRepository::RotationEventsRepository(MySqlConnectionPool& pool, boost::asio::thread_pool& workers)
    : pool_(pool)
    , workers_(workers) {}

void RotationEventsRepository::record(const model::RotationEvent& event) {
    boost::asio::post(workers_, [this, event]() {
        try {
            insert(event);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, std::string{"Dropped rotation event: "} + ex.what());
        }
    });
}

void RotationEventsRepository::insert(const model::RotationEvent& event) {
    auto session = pool_.acquire();
    try {
        mysqlx::Schema schema = session->getSchema(pool_.schemaName());
        mysqlx::Table table = schema.getTable("rotation_events");
        table.insert("id", "timestamp", "config_id", "previous_proxy_id", "new_proxy_id", "reason", "domain")
            .values(nextEventId(event),
                    formatTimestamp(event.timestamp),
                    nullable(event.configId),
                    nullable(event.previousProxyId),
                    nullable(event.newProxyId),
                    model::toString(event.reason),
                    nullable(event.domain))
            .execute();
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Insert rotation event failed: "} + err.what());
        throw;
    }
}

std::vector<model::RotationEvent> RotationEventsRepository::findRecent(const std::string& configId, std::size_t limit) {
    std::vector<model::RotationEvent> events;
    auto session = pool_.acquire();
    try {
        auto rows = session
                        ->sql("SELECT DATE_FORMAT(timestamp, '%Y-%m-%d %H:%i:%s'), previous_proxy_id, new_proxy_id, "
                              "reason, domain, config_id FROM rotation_events WHERE config_id = ? "
                              "ORDER BY timestamp DESC LIMIT ?")
                        .bind(configId, limit)
                        .execute();
        for (mysqlx::Row row : rows) {
            model::RotationEvent event;
            event.timestamp = parseTimestamp(readString(row[0]));
            event.previousProxyId = readString(row[1]);
            event.newProxyId = readString(row[2]);
            auto reason = readString(row[3]);
            event.reason = model::parseRotationReason(reason).value_or(model::RotationReason::scheduled);
            event.domain = readString(row[4]);
            event.configId = readString(row[5]);
            events.push_back(std::move(event));
        }
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Query rotation events failed: "} + err.what());
        throw;
    }
    return events;
}

} // namespace proxyrot::repository
