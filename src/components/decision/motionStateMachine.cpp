#include "decision/motionStateMachine.hpp"

#include <boost/format.hpp>
#include <ros/ros.h>

namespace motion_sentry {

const char* motionStateName(MotionState state) {
    return state == MotionState::ACTIVE ? "ACTIVE" : "IDLE";
}

MotionStateMachine::MotionStateMachine(EventLogger& logger, const DebounceParameters& debounce, bool saveVideos)
    : eventLogger(logger),
      debounceParams(debounce),
      saveVideos(saveVideos),
      currentState(MotionState::IDLE),
      observedHits(0) {
    if (debounceParams.window < 1) debounceParams.window = 1;
    if (debounceParams.requiredHits < 1) debounceParams.requiredHits = 1;
}

TickDecision MotionStateMachine::update(const std::vector<CandidateRegion>& regionsInZone,
                                        std::chrono::system_clock::time_point now,
                                        bool scheduleActive) {
    TickDecision decision;
    decision.motionInZone = !regionsInZone.empty();
    decision.scheduleActive = scheduleActive;

    const bool qualifies = observe(decision.motionInZone && scheduleActive);
    const MotionState previous = currentState;
    currentState = qualifies ? MotionState::ACTIVE : MotionState::IDLE;

    if (previous == MotionState::IDLE && currentState == MotionState::ACTIVE) {
        decision.transition = Transition::Started;
        decision.recordingRequested = saveVideos;
        ROS_WARN("[MotionStateMachine] Motion detected in ROI!");
        recordEvent(EventKind::MotionStarted, now, regionsInZone);
    } else if (previous == MotionState::ACTIVE && currentState == MotionState::IDLE) {
        decision.transition = Transition::Ended;
        ROS_INFO("[MotionStateMachine] Motion in ROI ended");
        recordEvent(EventKind::MotionEnded, now, regionsInZone);
    }

    if (previous != currentState) {
        ROS_DEBUG("[MotionStateMachine] %s -> %s", motionStateName(previous), motionStateName(currentState));
    }

    if (currentState == MotionState::ACTIVE) {
        refreshLastActive(now);
        recordEvent(EventKind::Motion, now, regionsInZone);
    }

    decision.state = currentState;
    return decision;
}

TickDecision MotionStateMachine::forceIdle(std::chrono::system_clock::time_point now) {
    TickDecision decision;

    observations.clear();
    observedHits = 0;

    if (currentState == MotionState::ACTIVE) {
        currentState = MotionState::IDLE;
        decision.transition = Transition::Ended;
        ROS_INFO("[MotionStateMachine] Forced from %s to %s while the background model calibrates",
                 motionStateName(MotionState::ACTIVE), motionStateName(currentState));
        recordEvent(EventKind::MotionEnded, now, {});
    }

    decision.state = currentState;
    return decision;
}

bool MotionStateMachine::observe(bool positive) {
    observations.push_back(positive);
    if (positive) ++observedHits;

    while (static_cast<int>(observations.size()) > debounceParams.window) {
        if (observations.front()) --observedHits;
        observations.pop_front();
    }

    return positive && observedHits >= debounceParams.requiredHits;
}

void MotionStateMachine::refreshLastActive(std::chrono::system_clock::time_point now) {
    if (!lastActiveTime || now > *lastActiveTime) lastActiveTime = now;
}

void MotionStateMachine::recordEvent(EventKind kind, std::chrono::system_clock::time_point now,
                              const std::vector<CandidateRegion>& regions) const {
    EventRecord event;
    event.timestamp = now;
    event.kind = kind;

    if (event.kind != EventKind::MotionEnded) {
        double totalArea = 0.0;
        const CandidateRegion* largest = nullptr;
        for (const auto& region : regions) {
            totalArea += region.area;
            if (!largest || region.area > largest->area) largest = &region;
        }
        event.metadata["regions"] = std::to_string(regions.size());
        event.metadata["total_area"] = (boost::format("%.0f") % totalArea).str();
        if (largest) {
            const cv::Rect& box = largest->boundingBox;
            event.metadata["largest"] = (boost::format("%d,%d,%d,%d") % box.x % box.y % box.width % box.height).str();
        }
    }

    eventLogger.record(event);
}

} // namespace motion_sentry
