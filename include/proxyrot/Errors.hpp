#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace proxyrot {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NoAvailableProxyError : public Error {
public:
    using Error::Error;
};

class RateLimitExceededError : public Error {
public:
    RateLimitExceededError(const std::string& message, std::chrono::milliseconds waitTime, std::string reason)
        : Error(message)
        , waitTime_(waitTime)
        , reason_(std::move(reason)) {}

    std::chrono::milliseconds waitTime() const noexcept { return waitTime_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::chrono::milliseconds waitTime_;
    std::string reason_;
};

class CircuitOpenError : public Error {
public:
    explicit CircuitOpenError(std::string proxyId)
        : Error("Circuit open for proxy " + proxyId)
        , proxyId_(std::move(proxyId)) {}

    const std::string& proxyId() const noexcept { return proxyId_; }

private:
    std::string proxyId_;
};

class InvalidConfigError : public Error {
public:
    using Error::Error;
};

class InvalidStrategyError : public InvalidConfigError {
public:
    using InvalidConfigError::InvalidConfigError;
};

class WaitTimeoutError : public Error {
public:
    using Error::Error;
};

class WaitCancelledError : public Error {
public:
    using Error::Error;
};

} // namespace proxyrot
