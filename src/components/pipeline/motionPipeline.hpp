#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "configuration/configurationParameters.hpp"
#include "decision/motionStateMachine.hpp"
#include "decision/scheduleGate.hpp"
#include "detection/backgroundModel.hpp"
#include "detection/frameProcessor.hpp"
#include "detection/roiFilter.hpp"
#include "recording/recordingSession.hpp"
#include "source/videoSource.hpp"

namespace motion_sentry {

    class EventLogger;
    class VideoRecorder;

    struct TickResult {
        TickDecision decision;
        bool calibrating = false;
        int calibrationSamples = 0;
        std::vector<CandidateRegion> regions;         // every region passing min_area
        std::vector<CandidateRegion> regionsInZone;
        bool recording = false;
    };

    /*
        One camera stream: background model, detection, ROI gating, schedule gating,
        state machine and recording lifecycle. Processes one frame per tick() call.
    */
    class MotionPipeline {
        public:
            /* recorder may be null when save_videos is disabled */
            MotionPipeline(const ConfigurationParameters& params, EventLogger& logger, VideoRecorder* recorder);
            ~MotionPipeline();

            MotionPipeline(const MotionPipeline&) = delete;
            MotionPipeline& operator=(const MotionPipeline&) = delete;

            TickResult tick(const Frame& frame);

            /* Safe from any thread, applied at the start of the next tick */
            void requestBackgroundReset();

            /* Closes an open recording, nothing is left half written */
            void shutdown(std::chrono::system_clock::time_point now);

            const BackgroundModel& backgroundModel() const { return background; }
            const FrameProcessor& frameProcessor() const { return processor; }
            const RoiFilter& roiFilter() const { return zoneFilter; }
            const ScheduleGate& scheduleGate() const { return schedule; }
            const MotionStateMachine& stateMachine() const { return motionState; }
            const RecordingController* recording() const { return recordingController.get(); }

        private:
            BackgroundModel background;
            FrameProcessor processor;
            RoiFilter zoneFilter;
            ScheduleGate schedule;
            MotionStateMachine motionState;
            std::unique_ptr<RecordingController> recordingController;

            std::atomic<bool> resetRequested;

            void calibrate(const Frame& frame, TickResult& result);
            void detect(const Frame& frame, TickResult& result);
    };
}
