#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/util/Logging.hpp"

#include <utility>

namespace proxyrot::repository {

MySqlConnectionPool::Lease::Lease(MySqlConnectionPool& pool, std::unique_ptr<mysqlx::Session> session) noexcept
    : pool_(&pool)
    , session_(std::move(session)) {}

MySqlConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , session_(std::move(other.session_))
    , broken_(other.broken_) {}

MySqlConnectionPool::Lease& MySqlConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        giveBack();
        pool_ = std::exchange(other.pool_, nullptr);
        session_ = std::move(other.session_);
        broken_ = other.broken_;
    }
    return *this;
}

MySqlConnectionPool::Lease::~Lease() {
    giveBack();
}

void MySqlConnectionPool::Lease::giveBack() noexcept {
    if (pool_ && session_) {
        pool_->restore(std::move(session_), broken_);
    }
    pool_ = nullptr;
}

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config)
    : config_(std::move(config)) {
    if (config_.database.empty()) {
        throw InvalidConfigError("Database name must be provided in configuration");
    }
    if (config_.host.empty()) {
        config_.host = "127.0.0.1";
    }
    if (config_.poolSize == 0) {
        config_.poolSize = 4;
    }
    util::log(util::LogLevel::info, "MySQL pool for " + config_.user + "@" + config_.host + ":" +
                                        std::to_string(config_.port) + "/" + config_.database + " (" +
                                        std::to_string(config_.poolSize) + " sessions)");
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::openSession() {
    try {
        auto session = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, config_.host,
            mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
            mysqlx::SessionOption::USER, config_.user,
            mysqlx::SessionOption::PWD, config_.password,
            mysqlx::SessionOption::DB, config_.database);
        if (!config_.charset.empty()) {
            session->sql("SET NAMES '" + config_.charset + "'").execute();
        }
        return session;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, "Open MySQL session to " + config_.host + " failed: " + err.what());
        throw;
    }
}

MySqlConnectionPool::Lease MySqlConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(lock, timeout, [this]() { return !idle_.empty() || open_ < config_.poolSize; });
    if (!ready) {
        throw WaitTimeoutError("No MySQL session free after " + std::to_string(timeout.count()) + "ms");
    }

    if (!idle_.empty()) {
        auto session = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(session));
    }

    ++open_;
    lock.unlock();
    try {
        return Lease(*this, openSession());
    } catch (const mysqlx::Error&) {
        lock.lock();
        --open_;
        lock.unlock();
        cv_.notify_one();
        throw;
    }
}

void MySqlConnectionPool::restore(std::unique_ptr<mysqlx::Session> session, bool broken) noexcept {
    {
        std::scoped_lock lock(mutex_);
        if (broken) {
            --open_;
        } else {
            idle_.push_back(std::move(session));
        }
    }
    if (broken) {
        util::log(util::LogLevel::warn, "Closing MySQL session after a failed statement");
        session.reset();
    }
    cv_.notify_one();
}

} // namespace proxyrot::repository
