#pragma once

#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/service/Providers.hpp"

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <vector>

namespace proxyrot::repository {

class RotationEventsRepository : public service::RotationEventSink {
public:
    RotationEventsRepository(MySqlConnectionPool& pool, boost::asio::thread_pool& workers);

    void record(const model::RotationEvent& event) override;

    void insert(const model::RotationEvent& event);
    std::vector<model::RotationEvent> findRecent(const std::string& configId, std::size_t limit);

private:
    MySqlConnectionPool& pool_;
    boost::asio::thread_pool& workers_;
};

} // namespace proxyrot::repository
