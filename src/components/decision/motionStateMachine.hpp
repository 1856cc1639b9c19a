#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <vector>

#include "configuration/configurationParameters.hpp"
#include "detection/frameProcessor.hpp"
#include "logging/eventLogger.hpp"

namespace motion_sentry {

    enum class MotionState {
        IDLE,
        ACTIVE
    };

    enum class Transition {
        None,
        Started,    // IDLE -> ACTIVE
        Ended       // ACTIVE -> IDLE
    };

    struct TickDecision {
        MotionState state = MotionState::IDLE;
        Transition transition = Transition::None;
        bool recordingRequested = false;
        bool motionInZone = false;      // raw observation, before schedule gating
        bool scheduleActive = false;
    };

    /*
        IDLE/ACTIVE decision per tick. Side effects (event records, recording requests)
        only happen while the schedule reports active monitoring hours.
    */
    class MotionStateMachine {
        public:
            MotionStateMachine(EventLogger& logger, const DebounceParameters& debounce, bool saveVideos);

            TickDecision update(const std::vector<CandidateRegion>& regionsInZone,
                                std::chrono::system_clock::time_point now,
                                bool scheduleActive);

            /* Calibration incomplete: no decision logic, state forced to IDLE */
            TickDecision forceIdle(std::chrono::system_clock::time_point now);

            MotionState state() const { return currentState; }
            std::optional<std::chrono::system_clock::time_point> lastActive() const { return lastActiveTime; }

        private:
            EventLogger& eventLogger;
            DebounceParameters debounceParams;
            bool saveVideos;

            MotionState currentState;
            std::optional<std::chrono::system_clock::time_point> lastActiveTime;
            std::deque<bool> observations;
            int observedHits;

            bool observe(bool positive);
            void refreshLastActive(std::chrono::system_clock::time_point now);
            void recordEvent(EventKind kind, std::chrono::system_clock::time_point now,
                      const std::vector<CandidateRegion>& regions) const;
    };

    const char* motionStateName(MotionState state);
}
