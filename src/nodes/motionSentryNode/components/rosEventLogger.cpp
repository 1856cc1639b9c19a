#include "rosEventLogger.hpp"

#include <motion_sentry/MotionEvent.h>

namespace motion_sentry_node {

RosEventLogger::RosEventLogger(ros::NodeHandle& privateHandle, const std::string& cameraId)
    : camera(cameraId), eventCounter(0) {
    pub_events = privateHandle.advertise<motion_sentry::MotionEvent>("events", 50);
}

void RosEventLogger::record(const motion_sentry::EventRecord& event) {
    motion_sentry::MotionEvent msg;

    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::nanoseconds>(event.timestamp.time_since_epoch());
    msg.header.stamp.fromNSec(static_cast<uint64_t>(sinceEpoch.count()));
    msg.header.frame_id = "camera_link";
    msg.event_id = ++eventCounter;
    msg.kind = motion_sentry::eventKindName(event.kind);
    msg.camera_id = camera;

    for (const auto& entry : event.metadata) {
        motion_sentry::KeyValue kv;
        kv.key = entry.first;
        kv.value = entry.second;
        msg.metadata.emplace_back(kv);
    }

    pub_events.publish(msg);
}

} // namespace motion_sentry_node
