#include "decision/scheduleGate.hpp"

#include <ctime>

namespace motion_sentry {

ScheduleGate::ScheduleGate(const ScheduleWindow& window) : schedule(window) {}

bool ScheduleGate::isActive(std::chrono::system_clock::time_point now) const {
    return isActiveAt(localHour(now));
}

bool ScheduleGate::isActiveAt(int hour) const {
    const int start = schedule.startHour;
    const int end = schedule.endHour;

    if (start == end) return true;
    if (start < end) return hour >= start && hour < end;
    return hour >= start || hour < end;
}

int ScheduleGate::localHour(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    return local.tm_hour;
}

} // namespace motion_sentry
