#include "proxyrot/service/MaintenanceService.hpp"
#include "proxyrot/util/Logging.hpp"

#include <string>

namespace proxyrot::service {

MaintenanceService::MaintenanceService(boost::asio::io_context& io,
                                       session::StickySessionTable& sticky,
                                       health::CircuitBreakerTracker& breakers)
    : io_(io)
    , sticky_(sticky)
    , breakers_(breakers) {}

void MaintenanceService::start(std::chrono::seconds cadence) {
    cadence_ = cadence;
    timer_ = std::make_unique<boost::asio::steady_timer>(io_);
    timer_->expires_after(cadence_);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            doTick();
        }
    });
}

void MaintenanceService::stop() {
    if (timer_) {
        timer_->cancel();
    }
}

MaintenanceReport MaintenanceService::runOnce() {
    MaintenanceReport report;
    report.purgedSessions = sticky_.purgeExpired();
    report.liveSessions = sticky_.size();
    for (const auto& breaker : breakers_.snapshot()) {
        if (breaker.state == health::BreakerState::open) {
            ++report.openBreakers;
        } else if (breaker.state == health::BreakerState::halfOpen) {
            ++report.halfOpenBreakers;
        }
    }

    if (report.purgedSessions > 0) {
        util::log(util::LogLevel::debug, "Purged " + std::to_string(report.purgedSessions) + " expired sticky sessions");
    }
    auto level = report.openBreakers > 0 ? util::LogLevel::warn : util::LogLevel::info;
    util::log(level, "Maintenance: " + std::to_string(report.liveSessions) + " sticky sessions, " +
                         std::to_string(report.openBreakers) + " open / " +
                         std::to_string(report.halfOpenBreakers) + " half-open breakers");
    return report;
}

void MaintenanceService::doTick() {
    try {
        runOnce();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Maintenance pass failed: "} + ex.what());
    }
    timer_->expires_after(cadence_);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            doTick();
        }
    });
}

} // namespace proxyrot::service
