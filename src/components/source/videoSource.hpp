#pragma once

#include <opencv2/core.hpp>
#include <chrono>

namespace motion_sentry {

    struct Frame {
        cv::Mat image;
        std::chrono::system_clock::time_point timestamp;
    };

    enum class ReadStatus {
        Frame,
        Empty,          // momentary empty read, retryable for live sources
        EndOfStream     // terminal for file sources
    };

    class VideoSource {
        public:
            virtual ~VideoSource() = default;

            virtual ReadStatus read(Frame& frame) = 0;
            virtual bool isLive() const = 0;
            virtual cv::Size frameSize() const = 0;
            virtual double nominalFps() const = 0;
    };
}
