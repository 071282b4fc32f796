#pragma once

#include <mysqlx/xdevapi.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace proxyrot::repository {

std::string readString(const mysqlx::Value& value);
std::optional<std::string> readOptionalString(const mysqlx::Value& value);
std::optional<double> readDouble(const mysqlx::Value& value);
std::int64_t readInteger(const mysqlx::Value& value, std::int64_t fallback = 0);
bool readFlag(const mysqlx::Value& value, bool fallback);

// UTC "YYYY-MM-DD HH:MM:SS".
std::string formatTimestamp(std::chrono::system_clock::time_point tp);
// Start of the UTC hour containing tp.
std::string hourBucket(std::chrono::system_clock::time_point tp);

mysqlx::Value nullable(const std::string& text);

} // namespace proxyrot::repository
