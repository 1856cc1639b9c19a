#include "pipeline/motionPipeline.hpp"
#include "logging/eventLogger.hpp"
#include "recording/videoRecorder.hpp"
#include "errors.hpp"

#include <ros/ros.h>
#include <stdexcept>

namespace motion_sentry {

MotionPipeline::MotionPipeline(const ConfigurationParameters& params, EventLogger& logger, VideoRecorder* recorder)
    : background(params.backgroundFrames),
      processor(params.processing, params.minArea),
      zoneFilter(params.roi),
      schedule(ScheduleWindow{params.afterHoursStart, params.afterHoursEnd}),
      motionState(logger, params.debounce, params.saveVideos && recorder != nullptr),
      resetRequested(false) {
    if (params.saveVideos && recorder) {
        recordingController = std::make_unique<RecordingController>(
            *recorder, logger, std::chrono::duration<double>(params.recordDurationSec));
    } else if (params.saveVideos) {
        ROS_WARN("[MotionPipeline] save_videos is enabled but no recorder is attached, clips will not be written");
    }

    ROS_INFO("[MotionPipeline] Building background model from %d frames...", params.backgroundFrames);
}

MotionPipeline::~MotionPipeline() {
    try {
        shutdown(std::chrono::system_clock::now());
    } catch (const std::exception& e) {
        ROS_ERROR("[MotionPipeline] Failed to close recording during teardown: %s", e.what());
    }
}

void MotionPipeline::requestBackgroundReset() {
    resetRequested = true;
}

TickResult MotionPipeline::tick(const Frame& frame) {
    TickResult result;
    const auto now = frame.timestamp;

    if (resetRequested.exchange(false)) {
        ROS_INFO("[MotionPipeline] Resetting background model...");
        background.reset();
    }

    if (recordingController) recordingController->closeIfExpired(now);

    if (!background.isReady()) {
        calibrate(frame, result);
    } else {
        detect(frame, result);
    }

    if (recordingController && recordingController->isOpen()) {
        recordingController->submitFrame(frame.image, now);
    }
    result.recording = recordingController && recordingController->isOpen();
    return result;
}

void MotionPipeline::calibrate(const Frame& frame, TickResult& result) {
    const CalibrationStatus status = background.ingest(processor.preprocess(frame.image));

    result.calibrating = status == CalibrationStatus::Calibrating;
    result.calibrationSamples = background.samplesCollected();
    result.decision = motionState.forceIdle(frame.timestamp);

    if (result.calibrating) {
        ROS_INFO_THROTTLE(1.0, "[MotionPipeline] Calibrating... %d/%d",
                          background.samplesCollected(), background.requiredSamples());
    }
}

void MotionPipeline::detect(const Frame& frame, TickResult& result) {
    const auto now = frame.timestamp;

    try {
        result.regions = processor.process(frame.image, background);
    } catch (const NotReady&) {
        result.calibrating = true;
        result.decision = motionState.forceIdle(now);
        return;
    } catch (const std::invalid_argument& e) {
        ROS_WARN("[MotionPipeline] %s, recalibrating background", e.what());
        background.reset();
        result.calibrating = true;
        result.decision = motionState.forceIdle(now);
        return;
    }

    result.calibrationSamples = background.requiredSamples();
    result.regionsInZone = zoneFilter.filter(result.regions);
    result.decision = motionState.update(result.regionsInZone, now, schedule.isActive(now));

    if (result.decision.recordingRequested && recordingController) {
        try {
            recordingController->open(now);
        } catch (const RecordingIOError& e) {
            ROS_ERROR("[MotionPipeline] Could not start recording: %s", e.what());
        }
    }
}

void MotionPipeline::shutdown(std::chrono::system_clock::time_point now) {
    if (recordingController && recordingController->isOpen()) {
        recordingController->close(now, "shutdown");
    }
}

} // namespace motion_sentry
