#pragma once

#include "proxyrot/model/RotationConfig.hpp"

#include <chrono>
#include <vector>

namespace proxyrot::rotation {

struct CivilTime {
    int hour{};
    int dayOfWeek{}; // 0 = Sunday
};

CivilTime civilTimeUtc(std::chrono::system_clock::time_point timePoint);

// start == end covers the whole day; start > end wraps past midnight.
bool windowCovers(const model::ScheduleWindow& window, const CivilTime& time);

// Highest priority covering window; declaration order breaks ties.
const model::ScheduleWindow* matchWindow(const std::vector<model::ScheduleWindow>& windows,
                                         std::chrono::system_clock::time_point timePoint);

} // namespace proxyrot::rotation
