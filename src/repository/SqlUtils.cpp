#include "proxyrot/repository/SqlUtils.hpp"
#include "proxyrot/util/Logging.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace proxyrot::repository {
namespace {

std::string valueToString(const mysqlx::Value& value) {
    try {
        std::ostringstream oss;
        value.print(oss);
        return oss.str();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Failed to stringify value: "} + ex.what());
        return {};
    }
}

std::tm utcTm(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

} // namespace

std::string readString(const mysqlx::Value& value) {
    if (value.isNull()) {
        return {};
    }
    try {
        return value.get<std::string>();
    } catch (const std::exception&) {
        return valueToString(value);
    }
}

std::optional<std::string> readOptionalString(const mysqlx::Value& value) {
    auto text = readString(value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<double> readDouble(const mysqlx::Value& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    try {
        return value.get<double>();
    } catch (const std::exception&) {
        try {
            return std::stod(valueToString(value));
        } catch (const std::exception& inner) {
            util::log(util::LogLevel::warn, std::string{"Failed to read double column: "} + inner.what());
            return std::nullopt;
        }
    }
}

std::int64_t readInteger(const mysqlx::Value& value, std::int64_t fallback) {
    if (value.isNull()) {
        return fallback;
    }
    try {
        return value.get<std::int64_t>();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Failed to read integer column: "} + ex.what());
        return fallback;
    }
}

bool readFlag(const mysqlx::Value& value, bool fallback) {
    if (value.isNull()) {
        return fallback;
    }
    try {
        return value.get<bool>();
    } catch (const std::exception&) {
        return readInteger(value, fallback ? 1 : 0) != 0;
    }
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto tm = utcTm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string hourBucket(std::chrono::system_clock::time_point tp) {
    auto tm = utcTm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:00:00");
    return oss.str();
}

mysqlx::Value nullable(const std::string& text) {
    if (text.empty()) {
        return mysqlx::Value();
    }
    return mysqlx::Value(text);
}

} // namespace proxyrot::repository
