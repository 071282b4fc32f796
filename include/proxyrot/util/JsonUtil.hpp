#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace proxyrot::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Missing or empty files yield nullopt; malformed content throws.
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path);

std::optional<std::string> readString(const boost::json::object& obj, std::string_view key);
std::optional<double> readNumber(const boost::json::object& obj, std::string_view key);
std::optional<std::int64_t> readInteger(const boost::json::object& obj, std::string_view key);
std::optional<bool> readBool(const boost::json::object& obj, std::string_view key);

} // namespace proxyrot::util
