#pragma once

#include <chrono>
#include <mutex>

namespace proxyrot::util {

class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual std::chrono::system_clock::time_point wallNow() const = 0;
};

class SystemClock final : public Clock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallNow() const override {
        return std::chrono::system_clock::now();
    }
};

// Moves only when told to. Both timelines advance together.
class ManualClock final : public Clock {
public:
    ManualClock()
        : steady_(std::chrono::steady_clock::time_point{} + std::chrono::hours{24})
        , wall_(std::chrono::system_clock::now()) {}

    std::chrono::steady_clock::time_point now() const override {
        std::scoped_lock lock(mutex_);
        return steady_;
    }

    std::chrono::system_clock::time_point wallNow() const override {
        std::scoped_lock lock(mutex_);
        return wall_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::scoped_lock lock(mutex_);
        steady_ += delta;
        wall_ += delta;
    }

    void setWallTime(std::chrono::system_clock::time_point wall) {
        std::scoped_lock lock(mutex_);
        wall_ = wall;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::system_clock::time_point wall_;
};

} // namespace proxyrot::util
