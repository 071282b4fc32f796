#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>

namespace proxyrot::repository {

struct DatabaseConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{33060};
    std::string user{"root"};
    std::string password;
    std::string database{"proxyrot"};
    std::string charset{"utf8mb4"};
    unsigned int poolSize{4};
};

// Keys missing from the object keep their defaults.
DatabaseConfig loadConfig(const boost::json::object& json);

} // namespace proxyrot::repository
