#pragma once

#include <opencv2/videoio.hpp>
#include <boost/filesystem.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "recording/videoRecorder.hpp"
#include "ThreadSafeQueue.hpp"

namespace motion_sentry {

    namespace clip_internal {
        struct ActiveClip {
            boost::filesystem::path path;
            cv::VideoWriter writer;
            ThreadSafeQueue<cv::Mat> pendingFrames;
            std::thread writerThread;
            std::atomic<bool> failed{false};
            std::string failure;
            std::mutex failureMutex;

            explicit ActiveClip(size_t queueSize) : pendingFrames(queueSize) {}
        };
    }

    /*
        Writes motion_YYYYmmdd_HHMMSS.avi clips. Encoding happens on a per-clip worker
        fed through a FIFO, so frames reach the file in submission order.
    */
    class ClipRecorder : public VideoRecorder {
        public:
            ClipRecorder(const std::string& recordingsPath, double outputFps, const cv::Size& frameSize,
                         size_t queueSize = 64);
            ~ClipRecorder() override;

            ClipRecorder(const ClipRecorder&) = delete;
            ClipRecorder& operator=(const ClipRecorder&) = delete;

            RecorderHandle open(std::chrono::system_clock::time_point startTime,
                                std::chrono::duration<double> targetDuration) override;
            void write(RecorderHandle handle, const cv::Mat& frame) override;
            void close(RecorderHandle handle) override;

            std::string clipPath(RecorderHandle handle) const;

        private:
            boost::filesystem::path directory;
            double fps;
            cv::Size size;
            size_t frameQueueSize;

            std::map<RecorderHandle, std::unique_ptr<clip_internal::ActiveClip>> clips;
            mutable std::mutex clipsMutex;
            RecorderHandle nextHandle;

            boost::filesystem::path nextClipPath(std::chrono::system_clock::time_point startTime) const;
            void writeLoop(clip_internal::ActiveClip& clip);
            void finish(clip_internal::ActiveClip& clip);
    };
}
