#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "recording/videoRecorder.hpp"

namespace motion_sentry {

    class EventLogger;

    /*
        One bounded-duration clip. The recorder handle is released in close() or,
        at the latest, in the destructor.
    */
    class RecordingSession {
        public:
            RecordingSession(VideoRecorder& recorder,
                             std::chrono::system_clock::time_point startTime,
                             std::chrono::duration<double> plannedDuration);
            ~RecordingSession();

            RecordingSession(const RecordingSession&) = delete;
            RecordingSession& operator=(const RecordingSession&) = delete;

            /* Throws RecordingIOError */
            void submitFrame(const cv::Mat& frame);
            bool isExpired(std::chrono::system_clock::time_point now) const;
            /* Throws RecordingIOError when the recorder could not finish the clip */
            void close();

            bool isOpen() const { return open; }
            std::chrono::system_clock::time_point startTime() const { return start; }
            std::chrono::duration<double> plannedDuration() const { return planned; }
            /* Frames accepted by the recorder, encoding may still be pending */
            uint64_t framesWritten() const { return writtenFrames; }

        private:
            VideoRecorder& videoRecorder;
            RecorderHandle handle;
            std::chrono::system_clock::time_point start;
            std::chrono::duration<double> planned;
            uint64_t writtenFrames;
            bool open;
    };

    /* Owns the single open session of one camera stream */
    class RecordingController {
        public:
            RecordingController(VideoRecorder& recorder, EventLogger& logger,
                                std::chrono::duration<double> recordDuration);
            ~RecordingController();

            /* Returns the already open session instead of creating a second one */
            RecordingSession& open(std::chrono::system_clock::time_point now);

            bool closeIfExpired(std::chrono::system_clock::time_point now);
            void close(std::chrono::system_clock::time_point now, const std::string& reason);

            /* Write failures close the session, returns false in that case */
            bool submitFrame(const cv::Mat& frame, std::chrono::system_clock::time_point now);

            bool isOpen() const { return static_cast<bool>(session); }
            RecordingSession* current() const { return session.get(); }

        private:
            VideoRecorder& videoRecorder;
            EventLogger& eventLogger;
            std::chrono::duration<double> duration;
            std::unique_ptr<RecordingSession> session;
    };
}
