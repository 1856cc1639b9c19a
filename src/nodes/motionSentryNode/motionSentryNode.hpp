#pragma once

#include <ros/ros.h>
#include <image_transport/image_transport.h>
#include <std_srvs/Trigger.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "configuration/configurationParameters.hpp"
#include "source/videoSource.hpp"

namespace motion_sentry {
    class CameraSource;
    class ClipRecorder;
    class EventLoggerFanout;
    class MotionPipeline;
    struct TickResult;
}

namespace motion_sentry_node {

    struct ROSInterface {
        ros::Publisher pub_runtimeErrors;
        image_transport::Publisher pub_debugFrames;
        image_transport::Publisher pub_motionMask;
        ros::ServiceServer srv_resetBackground;
        ros::ServiceServer srv_quit;
    };

    struct Components {
        std::unique_ptr<motion_sentry::CameraSource> source;
        std::shared_ptr<motion_sentry::EventLoggerFanout> eventLogger;
        std::unique_ptr<motion_sentry::ClipRecorder> recorder;
        std::unique_ptr<motion_sentry::MotionPipeline> pipeline;
    };

    struct State {
        std::atomic<bool> quitRequested{false};
        std::optional<motion_sentry::Frame> firstFrame;
    };
}

class MotionSentryNode {
    public:
        MotionSentryNode(ros::NodeHandle& nh, ros::NodeHandle& privateHandle);
        ~MotionSentryNode();

        MotionSentryNode(const MotionSentryNode&) = delete;
        MotionSentryNode& operator=(const MotionSentryNode&) = delete;

        /* Opens the source and builds the pipeline. Throws ConfigurationError / SourceUnavailable */
        void initializeNode();

        /* Frame loop on the calling thread. Returns the process exit code */
        int run();
        void shutdown();

        /* Throws ConfigurationError when a required parameter is missing or has the wrong type */
        static void loadParameters(ros::NodeHandle& nh_priv, motion_sentry::ConfigurationParameters& parametersToLoad);

    private:
        ros::NodeHandle& nh;
        ros::NodeHandle& nh_priv;
        image_transport::ImageTransport imageTransport;
        ros::AsyncSpinner spinner;

        motion_sentry::ConfigurationParameters params;
        motion_sentry_node::ROSInterface rosInterface;
        motion_sentry_node::Components components;
        motion_sentry_node::State state;

        void initROSIO();
        void processFrame(const motion_sentry::Frame& frame);
        void publishDebugFrames(const motion_sentry::Frame& frame, const motion_sentry::TickResult& result);
        void publishError(const std::string& errorMsg);

        bool resetBackgroundCallback(std_srvs::Trigger::Request& request, std_srvs::Trigger::Response& response);
        bool quitCallback(std_srvs::Trigger::Request& request, std_srvs::Trigger::Response& response);
};
