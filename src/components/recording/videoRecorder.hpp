#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>

namespace motion_sentry {

    using RecorderHandle = uint64_t;

    /* Backing store behind RecordingSession */
    class VideoRecorder {
        public:
            virtual ~VideoRecorder() = default;

            /* Throws RecordingIOError when the clip cannot be created */
            virtual RecorderHandle open(std::chrono::system_clock::time_point startTime,
                                        std::chrono::duration<double> targetDuration) = 0;
            /* Throws RecordingIOError when the clip can no longer be written */
            virtual void write(RecorderHandle handle, const cv::Mat& frame) = 0;
            /* Throws RecordingIOError when frames of the clip were lost */
            virtual void close(RecorderHandle handle) = 0;
    };
}
