#include <ros/ros.h>

#include "errors.hpp"
#include "motionSentryNode.hpp"

int main(int argc, char** argv) {
    ros::init(argc, argv, "motion_sentry_node");
    ros::NodeHandle nh;
    ros::NodeHandle private_nh("~");

    ROS_INFO("============================================================");
    ROS_INFO("MOTION SENTRY - security zone motion monitoring");
    ROS_INFO("============================================================");

    try {
        MotionSentryNode node(nh, private_nh);
        node.initializeNode();
        return node.run();
    } catch (const motion_sentry::ConfigurationError& e) {
        ROS_FATAL("Configuration error: %s", e.what());
    } catch (const motion_sentry::SourceUnavailable& e) {
        ROS_FATAL("Video source unavailable: %s", e.what());
    } catch (const motion_sentry::SourceExhausted& e) {
        ROS_FATAL("Video source ended before the first frame: %s", e.what());
    } catch (const std::exception& e) {
        ROS_FATAL("Motion sentry node failed: %s", e.what());
    }
    return 1;
}
