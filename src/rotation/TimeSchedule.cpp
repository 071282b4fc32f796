#include "proxyrot/rotation/TimeSchedule.hpp"

#include <algorithm>
#include <ctime>

namespace proxyrot::rotation {

CivilTime civilTimeUtc(std::chrono::system_clock::time_point timePoint) {
    const std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return CivilTime{tm.tm_hour, tm.tm_wday};
}

bool windowCovers(const model::ScheduleWindow& window, const CivilTime& time) {
    if (!window.daysOfWeek.empty() &&
        std::find(window.daysOfWeek.begin(), window.daysOfWeek.end(), time.dayOfWeek) == window.daysOfWeek.end()) {
        return false;
    }
    if (window.startHour == window.endHour) {
        return true;
    }
    if (window.startHour < window.endHour) {
        return time.hour >= window.startHour && time.hour < window.endHour;
    }
    return time.hour >= window.startHour || time.hour < window.endHour;
}

const model::ScheduleWindow* matchWindow(const std::vector<model::ScheduleWindow>& windows,
                                         std::chrono::system_clock::time_point timePoint) {
    const auto civil = civilTimeUtc(timePoint);
    const model::ScheduleWindow* best = nullptr;
    for (const auto& window : windows) {
        if (!windowCovers(window, civil)) {
            continue;
        }
        if (!best || window.priority > best->priority) {
            best = &window;
        }
    }
    return best;
}

} // namespace proxyrot::rotation
