#include "recording/recordingSession.hpp"
#include "logging/eventLogger.hpp"
#include "errors.hpp"

#include <boost/format.hpp>
#include <ros/ros.h>

namespace motion_sentry {

RecordingSession::RecordingSession(VideoRecorder& recorder,
                                   std::chrono::system_clock::time_point startTime,
                                   std::chrono::duration<double> plannedDuration)
    : videoRecorder(recorder),
      handle(0),
      start(startTime),
      planned(plannedDuration),
      writtenFrames(0),
      open(false) {
    handle = videoRecorder.open(start, planned);
    open = true;
}

RecordingSession::~RecordingSession() {
    try {
        close();
    } catch (const std::exception& e) {
        ROS_ERROR("[RecordingSession] Failed to release clip during teardown: %s", e.what());
    }
}

void RecordingSession::submitFrame(const cv::Mat& frame) {
    if (!open) {
        throw RecordingIOError("frame submitted to a closed recording session");
    }
    if (frame.empty()) return;

    videoRecorder.write(handle, frame);
    ++writtenFrames;
}

bool RecordingSession::isExpired(std::chrono::system_clock::time_point now) const {
    return (now - start) >= planned;
}

void RecordingSession::close() {
    if (!open) return;
    open = false;
    videoRecorder.close(handle);
}


RecordingController::RecordingController(VideoRecorder& recorder, EventLogger& logger,
                                         std::chrono::duration<double> recordDuration)
    : videoRecorder(recorder), eventLogger(logger), duration(recordDuration) {}

RecordingController::~RecordingController() {
    try {
        if (session) close(std::chrono::system_clock::now(), "shutdown");
    } catch (const std::exception& e) {
        ROS_ERROR("[RecordingController] Failed to close recording during teardown: %s", e.what());
    }
}

RecordingSession& RecordingController::open(std::chrono::system_clock::time_point now) {
    if (session) return *session;

    session = std::make_unique<RecordingSession>(videoRecorder, now, duration);
    ROS_INFO("[RecordingController] Started recording motion event (%.1f s)", duration.count());

    EventRecord event;
    event.timestamp = now;
    event.kind = EventKind::RecordingStarted;
    event.metadata["planned_duration_s"] = (boost::format("%.1f") % duration.count()).str();
    eventLogger.record(event);

    return *session;
}

bool RecordingController::closeIfExpired(std::chrono::system_clock::time_point now) {
    if (!session || !session->isExpired(now)) return false;
    close(now, "duration reached");
    return true;
}

void RecordingController::close(std::chrono::system_clock::time_point now, const std::string& reason) {
    if (!session) return;

    /* released before logging so a failing logger cannot keep the clip open */
    std::unique_ptr<RecordingSession> finished = std::move(session);
    const uint64_t frames = finished->framesWritten();
    const double elapsed = std::chrono::duration<double>(now - finished->startTime()).count();
    bool finalized = true;

    try {
        finished->close();
    } catch (const std::exception& e) {
        ROS_ERROR("[RecordingController] Failed to finalize clip: %s", e.what());
        finalized = false;
    }
    finished.reset();

    if (finalized) {
        ROS_INFO("[RecordingController] Recording saved (%lu frames, %s)",
                 static_cast<unsigned long>(frames), reason.c_str());
    }

    EventRecord event;
    event.timestamp = now;
    event.kind = EventKind::RecordingEnded;
    event.metadata["frames"] = std::to_string(frames);
    event.metadata["elapsed_s"] = (boost::format("%.1f") % elapsed).str();
    event.metadata["reason"] = finalized ? reason : "write error";
    eventLogger.record(event);
}

bool RecordingController::submitFrame(const cv::Mat& frame, std::chrono::system_clock::time_point now) {
    if (!session) return false;

    try {
        session->submitFrame(frame);
    } catch (const RecordingIOError& e) {
        ROS_ERROR("[RecordingController] %s, closing session", e.what());
        close(now, "write error");
        return false;
    }
    return true;
}

} // namespace motion_sentry
