#pragma once

#include <ros/ros.h>
#include <atomic>
#include <string>

#include "logging/eventLogger.hpp"

namespace motion_sentry_node {

    /* Publishes every event as motion_sentry/MotionEvent on ~events */
    class RosEventLogger : public motion_sentry::EventLogger {
        public:
            RosEventLogger(ros::NodeHandle& privateHandle, const std::string& cameraId);

            void record(const motion_sentry::EventRecord& event) override;

        private:
            ros::Publisher pub_events;
            std::string camera;
            std::atomic<uint32_t> eventCounter;
    };
}
