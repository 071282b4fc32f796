#pragma once

#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/service/Providers.hpp"

#include <mysqlx/xdevapi.h>

namespace proxyrot::repository {

class ProxyRepository : public service::ProxyPoolProvider {
public:
    explicit ProxyRepository(MySqlConnectionPool& pool);

    std::vector<model::Proxy> listEnabled(const std::optional<std::string>& targetGroup) override;

private:
    static model::Proxy mapRow(mysqlx::Row row);

    MySqlConnectionPool& pool_;
};

} // namespace proxyrot::repository
