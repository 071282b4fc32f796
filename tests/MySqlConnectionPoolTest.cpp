#include "proxyrot/Errors.hpp"
#include "proxyrot/repository/MySqlConnectionPool.hpp"

#include <gtest/gtest.h>

namespace proxyrot::repository {
namespace {

using namespace std::chrono_literals;

DatabaseConfig unreachable() {
    DatabaseConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.poolSize = 1;
    return config;
}

TEST(MySqlConnectionPoolTest, MissingDatabaseNameIsRejected) {
    auto config = unreachable();
    config.database.clear();
    EXPECT_THROW(MySqlConnectionPool pool(config), InvalidConfigError);
}

TEST(MySqlConnectionPoolTest, FailedOpenGivesTheSlotBack) {
    MySqlConnectionPool pool(unreachable());
    EXPECT_EQ(pool.schemaName(), "proxyrot");

    EXPECT_THROW(pool.acquire(100ms), mysqlx::Error);
    // With a leaked slot this would be a WaitTimeoutError.
    EXPECT_THROW(pool.acquire(100ms), mysqlx::Error);
}

} // namespace
} // namespace proxyrot::repository
