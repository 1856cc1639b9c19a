#pragma once

#include <opencv2/core.hpp>
#include <chrono>

#include "pipeline/motionPipeline.hpp"

namespace motion_sentry_node {

    /*
        ROI in green (red when motion is inside it), red boxes for regions in the zone,
        yellow for the rest, status text, after-hours and REC markers.
    */
    cv::Mat renderDebugFrame(const cv::Mat& frame,
                             const motion_sentry::TickResult& result,
                             const motion_sentry::MotionPipeline& pipeline,
                             std::chrono::system_clock::time_point now);
}
