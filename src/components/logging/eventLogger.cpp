#include "logging/eventLogger.hpp"

#include <ros/ros.h>
#include <stdexcept>

namespace motion_sentry {

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::MotionStarted:    return "motion-started";
        case EventKind::Motion:           return "motion";
        case EventKind::MotionEnded:      return "motion-ended";
        case EventKind::RecordingStarted: return "recording-started";
        case EventKind::RecordingEnded:   return "recording-ended";
    }
    return "unknown";
}

void EventLoggerFanout::attach(std::shared_ptr<EventLogger> logger) {
    if (logger) loggers.push_back(std::move(logger));
}

void EventLoggerFanout::record(const EventRecord& event) {
    for (auto& logger : loggers) {
        try {
            logger->record(event);
        } catch (const std::exception& e) {
            ROS_ERROR_STREAM_THROTTLE(5.0, "[EventLoggerFanout] Failed to record "
                                      << eventKindName(event.kind) << " event: " << e.what());
        }
    }
}

} // namespace motion_sentry
