#pragma once

#include "proxyrot/repository/DatabaseConfig.hpp"

#include <mysqlx/xdevapi.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proxyrot::repository {

// Bounded set of X DevAPI sessions shared by the repositories.
class MySqlConnectionPool {
public:
    static constexpr std::chrono::milliseconds kDefaultAcquireTimeout{10000};

    // One checked-out session. It goes back to the pool on destruction
    // unless markBroken() was called, in which case it is closed instead.
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        mysqlx::Session* operator->() const noexcept { return session_.get(); }
        mysqlx::Session& operator*() const noexcept { return *session_; }

        void markBroken() noexcept { broken_ = true; }

    private:
        friend class MySqlConnectionPool;
        Lease(MySqlConnectionPool& pool, std::unique_ptr<mysqlx::Session> session) noexcept;
        void giveBack() noexcept;

        MySqlConnectionPool* pool_;
        std::unique_ptr<mysqlx::Session> session_;
        bool broken_{false};
    };

    // Throws InvalidConfigError when no database name is configured.
    explicit MySqlConnectionPool(DatabaseConfig config);

    MySqlConnectionPool(const MySqlConnectionPool&) = delete;
    MySqlConnectionPool& operator=(const MySqlConnectionPool&) = delete;

    // Throws WaitTimeoutError when every session stays checked out past the
    // timeout, and mysqlx::Error when a new session cannot be opened.
    Lease acquire(std::chrono::milliseconds timeout = kDefaultAcquireTimeout);

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    std::unique_ptr<mysqlx::Session> openSession();
    void restore(std::unique_ptr<mysqlx::Session> session, bool broken) noexcept;

    DatabaseConfig config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<mysqlx::Session>> idle_;
    std::size_t open_{};
};

} // namespace proxyrot::repository
