#pragma once

#include "proxyrot/repository/MySqlConnectionPool.hpp"
#include "proxyrot/service/Providers.hpp"

#include <mysqlx/xdevapi.h>

#include <vector>

namespace proxyrot::repository {

// Reads rotation_configs and proxy_rotation_rules.
class RotationConfigRepository : public service::ConfigProvider {
public:
    explicit RotationConfigRepository(MySqlConnectionPool& pool);

    std::optional<model::RotationConfig> getActiveConfig(const std::optional<std::string>& targetGroup) override;
    std::optional<model::RotationConfig> findById(const std::string& configId);

private:
    std::optional<model::RotationConfig> mapRow(mysqlx::Session& session, mysqlx::Row row);
    std::vector<model::Rule> loadRules(mysqlx::Session& session, const std::string& configId);

    MySqlConnectionPool& pool_;
};

} // namespace proxyrot::repository
