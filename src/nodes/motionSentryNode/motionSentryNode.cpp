#include "motionSentryNode.hpp"
#include "components/debugOverlay.hpp"
#include "components/rosEventLogger.hpp"

#include <cv_bridge/cv_bridge.h>
#include <sensor_msgs/image_encodings.h>
#include <std_msgs/String.h>
#include <XmlRpcValue.h>

#include "errors.hpp"
#include "logging/fileEventLogger.hpp"
#include "pipeline/motionPipeline.hpp"
#include "recording/clipRecorder.hpp"
#include "source/cameraSource.hpp"

namespace {

template <typename T>
void requireParam(ros::NodeHandle& nh_priv, const std::string& key, T& value) {
    if (!nh_priv.hasParam(key)) {
        throw motion_sentry::ConfigurationError("missing required parameter '" + nh_priv.resolveName(key) + "'");
    }
    if (!nh_priv.getParam(key, value)) {
        throw motion_sentry::ConfigurationError("parameter '" + nh_priv.resolveName(key) + "' has the wrong type");
    }
}

std::vector<int> requireIntList(ros::NodeHandle& nh_priv, const std::string& key, size_t expectedSize) {
    std::vector<int> values;
    requireParam(nh_priv, key, values);
    if (values.size() != expectedSize) {
        throw motion_sentry::ConfigurationError("parameter '" + nh_priv.resolveName(key) + "' must hold " +
                                                std::to_string(expectedSize) + " integers");
    }
    return values;
}

}

MotionSentryNode::MotionSentryNode(ros::NodeHandle& nh, ros::NodeHandle& privateHandle)
    : nh(nh), nh_priv(privateHandle), imageTransport(privateHandle), spinner(1) {
    ROS_INFO("Initializing Motion Sentry Node...");
    loadParameters(nh_priv, params);

    for (const auto& warning : motion_sentry::validateConfiguration(params)) {
        ROS_WARN("[MotionSentryNode] %s", warning.c_str());
    }
}

MotionSentryNode::~MotionSentryNode() {
    shutdown();
}

void MotionSentryNode::loadParameters(ros::NodeHandle& nh_priv, motion_sentry::ConfigurationParameters& params) {
    XmlRpc::XmlRpcValue videoSource;
    requireParam(nh_priv, "video_source", videoSource);
    if (videoSource.getType() == XmlRpc::XmlRpcValue::TypeInt) {
        params.videoSource = std::to_string(static_cast<int>(videoSource));
    } else if (videoSource.getType() == XmlRpc::XmlRpcValue::TypeString) {
        params.videoSource = static_cast<std::string>(videoSource);
    } else {
        throw motion_sentry::ConfigurationError("parameter 'video_source' must be a device index or a path");
    }

    requireParam(nh_priv, "bg_frames", params.backgroundFrames);
    requireParam(nh_priv, "min_area", params.minArea);

    const std::vector<int> roi = requireIntList(nh_priv, "roi", 4);
    params.roi = cv::Rect(roi[0], roi[1], roi[2], roi[3]);

    const std::vector<int> afterHours = requireIntList(nh_priv, "alert_after_hours", 2);
    params.afterHoursStart = afterHours[0];
    params.afterHoursEnd = afterHours[1];

    requireParam(nh_priv, "record_duration", params.recordDurationSec);
    requireParam(nh_priv, "save_videos", params.saveVideos);
    requireParam(nh_priv, "output_fps", params.outputFps);

    nh_priv.param<int>("processing/diff_threshold", params.processing.diffThreshold, params.processing.diffThreshold);
    nh_priv.param<int>("processing/blur_kernel_size", params.processing.blurKernelSize, params.processing.blurKernelSize);
    nh_priv.param<int>("processing/dilate_iterations", params.processing.dilateIterations, params.processing.dilateIterations);
    nh_priv.param<int>("debounce/window", params.debounce.window, params.debounce.window);
    nh_priv.param<int>("debounce/required_hits", params.debounce.requiredHits, params.debounce.requiredHits);
    nh_priv.param<int>("source/empty_read_retries", params.emptyReadRetries, params.emptyReadRetries);
    nh_priv.param<double>("processing_rate", params.processingRate, params.processingRate);
    nh_priv.param<std::string>("recordings_path", params.recordingsPath, params.recordingsPath);
    nh_priv.param<std::string>("log_path", params.logPath, params.logPath);
    nh_priv.param<bool>("publish_debug_frames", params.publishDebugFrames, params.publishDebugFrames);

    ROS_INFO("Motion sentry parameters loaded.");
}

void MotionSentryNode::initializeNode() {
    initROSIO();

    components.source = std::make_unique<motion_sentry::CameraSource>(params.videoSource, params.emptyReadRetries);
    components.source->openSource();

    /* frame size from a real frame, some backends report 0x0 until the first read */
    state.firstFrame = components.source->nextFrame();
    const cv::Size frameSize = state.firstFrame->image.size();
    motion_sentry::validateRoiAgainstFrame(params.roi, frameSize);

    components.eventLogger = std::make_shared<motion_sentry::EventLoggerFanout>();
    components.eventLogger->attach(std::make_shared<motion_sentry::FileEventLogger>(params.logPath));
    components.eventLogger->attach(std::make_shared<motion_sentry_node::RosEventLogger>(nh_priv, params.videoSource));

    if (params.saveVideos) {
        components.recorder = std::make_unique<motion_sentry::ClipRecorder>(params.recordingsPath, params.outputFps, frameSize);
    }

    components.pipeline = std::make_unique<motion_sentry::MotionPipeline>(params, *components.eventLogger,
                                                                           components.recorder.get());
    spinner.start();

    ROS_INFO("Motion Sentry Node initialized. Call ~quit to stop, ~reset_background to rebuild the background model");
}

void MotionSentryNode::initROSIO() {
    rosInterface.pub_runtimeErrors = nh_priv.advertise<std_msgs::String>("runtime_errors", 10);
    if (params.publishDebugFrames) {
        rosInterface.pub_debugFrames = imageTransport.advertise("debug_image", 1);
        rosInterface.pub_motionMask = imageTransport.advertise("motion_mask", 1);
    }
    rosInterface.srv_resetBackground = nh_priv.advertiseService("reset_background", &MotionSentryNode::resetBackgroundCallback, this);
    rosInterface.srv_quit = nh_priv.advertiseService("quit", &MotionSentryNode::quitCallback, this);
}

int MotionSentryNode::run() {
    std::unique_ptr<ros::Rate> loopRate;
    if (params.processingRate > 0.0) loopRate = std::make_unique<ros::Rate>(params.processingRate);

    int exitCode = 0;

    if (state.firstFrame) {
        processFrame(*state.firstFrame);
        state.firstFrame.reset();
    }

    while (ros::ok() && !state.quitRequested) {
        motion_sentry::Frame frame;
        try {
            frame = components.source->nextFrame();
        } catch (const motion_sentry::SourceExhausted& e) {
            ROS_INFO("[MotionSentryNode] %s, stopping", e.what());
            break;
        } catch (const motion_sentry::SourceUnavailable& e) {
            publishError(e.what());
            ROS_ERROR("[MotionSentryNode] Video source lost: %s", e.what());
            exitCode = 1;
            break;
        }

        processFrame(frame);
        if (loopRate) loopRate->sleep();
    }

    shutdown();
    return exitCode;
}

void MotionSentryNode::processFrame(const motion_sentry::Frame& frame) {
    try {
        const motion_sentry::TickResult result = components.pipeline->tick(frame);
        if (params.publishDebugFrames) publishDebugFrames(frame, result);
    } catch (const cv::Exception& e) {
        publishError("OpenCV exception while processing frame: " + std::string(e.what()));
    } catch (const std::exception& e) {
        publishError("Runtime exception while processing frame: " + std::string(e.what()));
    }
}

void MotionSentryNode::publishDebugFrames(const motion_sentry::Frame& frame, const motion_sentry::TickResult& result) {
    if (rosInterface.pub_debugFrames.getNumSubscribers() == 0 && rosInterface.pub_motionMask.getNumSubscribers() == 0) {
        return;
    }

    try {
        std_msgs::Header header;
        header.stamp = ros::Time::now();
        header.frame_id = "camera_link";

        cv::Mat debugFrame = motion_sentry_node::renderDebugFrame(frame.image, result, *components.pipeline, frame.timestamp);
        rosInterface.pub_debugFrames.publish(
            cv_bridge::CvImage(header, sensor_msgs::image_encodings::BGR8, debugFrame).toImageMsg());

        const cv::Mat& mask = components.pipeline->frameProcessor().lastMask();
        if (!result.calibrating && !mask.empty()) {
            rosInterface.pub_motionMask.publish(
                cv_bridge::CvImage(header, sensor_msgs::image_encodings::MONO8, mask).toImageMsg());
        }
    } catch (const cv_bridge::Exception& e) {
        publishError("cv_bridge exception during frame publishing : " + std::string(e.what()));
    }
}

void MotionSentryNode::publishError(const std::string& errorMsg) {
    ROS_ERROR_STREAM_THROTTLE(5.0, "[MotionSentryNode] " << errorMsg);
    std_msgs::String msg;
    msg.data = errorMsg;
    rosInterface.pub_runtimeErrors.publish(msg);
}

bool MotionSentryNode::resetBackgroundCallback(std_srvs::Trigger::Request&, std_srvs::Trigger::Response& response) {
    if (!components.pipeline) {
        response.success = false;
        response.message = "pipeline not initialized";
        return true;
    }
    components.pipeline->requestBackgroundReset();
    response.success = true;
    response.message = "background model reset requested";
    return true;
}

bool MotionSentryNode::quitCallback(std_srvs::Trigger::Request&, std_srvs::Trigger::Response& response) {
    state.quitRequested = true;
    response.success = true;
    response.message = "shutting down";
    return true;
}

void MotionSentryNode::shutdown() {
    spinner.stop();

    if (components.pipeline) {
        ROS_INFO("[MotionSentryNode] Shutting down...");
        components.pipeline->shutdown(std::chrono::system_clock::now());
    }
    components.pipeline.reset();
    components.recorder.reset();
    components.eventLogger.reset();
    if (components.source) components.source->release();
    components.source.reset();
}
