#pragma once

#include <opencv2/core.hpp>
#include <algorithm>
#include <map>
#include <vector>

#include "errors.hpp"
#include "logging/eventLogger.hpp"
#include "recording/videoRecorder.hpp"

/* Keeps every record for inspection */
class RecordingEventLogger : public motion_sentry::EventLogger {
    public:
        void record(const motion_sentry::EventRecord& event) override {
            events.push_back(event);
        }

        size_t count(motion_sentry::EventKind kind) const {
            return std::count_if(events.begin(), events.end(),
                                 [kind](const motion_sentry::EventRecord& e) { return e.kind == kind; });
        }

        std::vector<motion_sentry::EventRecord> events;
};

class FakeVideoRecorder : public motion_sentry::VideoRecorder {
    public:
        motion_sentry::RecorderHandle open(std::chrono::system_clock::time_point,
                                           std::chrono::duration<double> targetDuration) override {
            if (failOpen) throw motion_sentry::RecordingIOError("disk full");
            const motion_sentry::RecorderHandle handle = ++opened;
            openHandles[handle] = 0;
            lastTargetDuration = targetDuration;
            return handle;
        }

        void write(motion_sentry::RecorderHandle handle, const cv::Mat&) override {
            if (failWrites) throw motion_sentry::RecordingIOError("write failed");
            ++openHandles.at(handle);
            ++framesWritten;
        }

        void close(motion_sentry::RecorderHandle handle) override {
            if (openHandles.erase(handle) > 0) ++closed;
            if (failClose) throw motion_sentry::RecordingIOError("last frames were not encoded");
        }

        size_t openCount() const { return openHandles.size(); }

        int opened = 0;
        int closed = 0;
        int framesWritten = 0;
        bool failOpen = false;
        bool failWrites = false;
        bool failClose = false;
        std::chrono::duration<double> lastTargetDuration{0};
        std::map<motion_sentry::RecorderHandle, int> openHandles;
};
