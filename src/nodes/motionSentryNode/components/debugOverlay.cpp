#include "debugOverlay.hpp"

#include <opencv2/imgproc.hpp>
#include <ctime>

namespace motion_sentry_node {

namespace {
    const cv::Scalar kRed(0, 0, 255);
    const cv::Scalar kGreen(0, 255, 0);
    const cv::Scalar kYellow(0, 255, 255);
    const cv::Scalar kWhite(255, 255, 255);
    const cv::Scalar kOrange(0, 165, 255);
}

cv::Mat renderDebugFrame(const cv::Mat& frame,
                         const motion_sentry::TickResult& result,
                         const motion_sentry::MotionPipeline& pipeline,
                         std::chrono::system_clock::time_point now) {
    cv::Mat debugFrame;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, debugFrame, cv::COLOR_GRAY2BGR);
    } else {
        debugFrame = frame.clone();
    }

    if (result.calibrating) {
        const auto& background = pipeline.backgroundModel();
        cv::putText(debugFrame,
                    "Calibrating... " + std::to_string(background.samplesCollected()) + "/" +
                        std::to_string(background.requiredSamples()),
                    cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7, kGreen, 2);
        return debugFrame;
    }

    for (const auto& region : result.regions) {
        if (pipeline.roiFilter().intersects(region)) {
            cv::rectangle(debugFrame, region.boundingBox, kRed, 2);
        } else {
            cv::rectangle(debugFrame, region.boundingBox, kYellow, 1);
        }
    }

    const cv::Rect& roi = pipeline.roiFilter().roi();
    const cv::Scalar roiColor = result.decision.motionInZone ? kRed : kGreen;
    cv::rectangle(debugFrame, roi, roiColor, 2);
    cv::putText(debugFrame, "ROI", cv::Point(roi.x + 5, roi.y + 20), cv::FONT_HERSHEY_SIMPLEX, 0.5, roiColor, 2);

    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char timestampStr[16];
    std::strftime(timestampStr, sizeof(timestampStr), "%H:%M:%S", &local);
    cv::putText(debugFrame, timestampStr, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7, kWhite, 2);

    const bool active = result.decision.state == motion_sentry::MotionState::ACTIVE;
    cv::putText(debugFrame, active ? "MOTION DETECTED!" : "No Motion", cv::Point(10, 60),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, active ? kRed : kGreen, 2);
    cv::circle(debugFrame, cv::Point(debugFrame.cols - 30, 30), 10, active ? kRed : kGreen, -1);

    if (result.decision.scheduleActive) {
        cv::putText(debugFrame, "AFTER-HOURS MODE", cv::Point(debugFrame.cols - 200, debugFrame.rows - 15),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, kOrange, 2);
    }

    if (result.recording) {
        cv::circle(debugFrame, cv::Point(30, 90), 5, kRed, -1);
        cv::putText(debugFrame, "REC", cv::Point(40, 95), cv::FONT_HERSHEY_SIMPLEX, 0.5, kRed, 2);
    }

    return debugFrame;
}

} // namespace motion_sentry_node
