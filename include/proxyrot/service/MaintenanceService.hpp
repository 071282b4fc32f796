#pragma once

#include "proxyrot/health/CircuitBreakerTracker.hpp"
#include "proxyrot/session/StickySessionTable.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <memory>

namespace proxyrot::service {

struct MaintenanceReport {
    std::size_t purgedSessions{};
    std::size_t liveSessions{};
    std::size_t openBreakers{};
    std::size_t halfOpenBreakers{};
};

// Periodic housekeeping on an io_context: purges expired sticky sessions and
// logs a breaker summary.
class MaintenanceService {
public:
    MaintenanceService(boost::asio::io_context& io,
                       session::StickySessionTable& sticky,
                       health::CircuitBreakerTracker& breakers);

    void start(std::chrono::seconds cadence);
    void stop();

    // One pass, outside the timer.
    MaintenanceReport runOnce();

private:
    void doTick();

    boost::asio::io_context& io_;
    session::StickySessionTable& sticky_;
    health::CircuitBreakerTracker& breakers_;
    std::chrono::seconds cadence_{0};
    std::unique_ptr<boost::asio::steady_timer> timer_;
};

} // namespace proxyrot::service
