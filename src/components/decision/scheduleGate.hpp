#pragma once

#include <chrono>

namespace motion_sentry {

    struct ScheduleWindow {
        int startHour;
        int endHour;
    };

    /*
        Same-day window:  start <= hour < end
        Overnight window: hour >= start || hour < end
        start == end is treated as always active.
    */
    class ScheduleGate {
        public:
            explicit ScheduleGate(const ScheduleWindow& window);

            bool isActive(std::chrono::system_clock::time_point now) const;
            bool isActiveAt(int hour) const;

            const ScheduleWindow& window() const { return schedule; }

            static int localHour(std::chrono::system_clock::time_point now);

        private:
            ScheduleWindow schedule;
    };
}
