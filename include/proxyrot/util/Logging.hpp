#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxyrot::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel currentLogLevel();
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

const char* toString(LogLevel level);
std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace proxyrot::util
