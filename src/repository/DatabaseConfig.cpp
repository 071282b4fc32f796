#include "proxyrot/repository/DatabaseConfig.hpp"
#include "proxyrot/util/JsonUtil.hpp"

namespace proxyrot::repository {

DatabaseConfig loadConfig(const boost::json::object& json) {
    DatabaseConfig cfg;
    if (auto value = util::readString(json, "host")) cfg.host = *value;
    if (auto value = util::readInteger(json, "port")) cfg.port = static_cast<std::uint16_t>(*value);
    if (auto value = util::readString(json, "user")) cfg.user = *value;
    if (auto value = util::readString(json, "password")) cfg.password = *value;
    if (auto value = util::readString(json, "database")) cfg.database = *value;
    if (auto value = util::readString(json, "charset")) cfg.charset = *value;
    if (auto value = util::readInteger(json, "poolSize"); value && *value > 0) {
        cfg.poolSize = static_cast<unsigned int>(*value);
    }
    return cfg;
}

} // namespace proxyrot::repository
