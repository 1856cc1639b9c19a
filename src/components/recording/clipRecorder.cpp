#include "recording/clipRecorder.hpp"
#include "errors.hpp"

#include <boost/format.hpp>
#include <opencv2/imgproc.hpp>
#include <ros/ros.h>
#include <ctime>
#include <vector>

namespace motion_sentry {

ClipRecorder::ClipRecorder(const std::string& recordingsPath, double outputFps, const cv::Size& frameSize,
                           size_t queueSize)
    : directory(recordingsPath), fps(outputFps), size(frameSize), frameQueueSize(queueSize), nextHandle(1) {
    if (!boost::filesystem::exists(directory)) boost::filesystem::create_directories(directory);
    ROS_INFO_STREAM("[ClipRecorder] Clips go to " << directory.string() << " at " << fps << " fps, "
                    << size.width << "x" << size.height);
}

ClipRecorder::~ClipRecorder() {
    std::vector<RecorderHandle> handles;
    {
        std::lock_guard<std::mutex> lock(clipsMutex);
        for (const auto& entry : clips) handles.push_back(entry.first);
    }
    for (RecorderHandle handle : handles) {
        try {
            close(handle);
        } catch (const RecordingIOError& e) {
            ROS_ERROR("[ClipRecorder] %s", e.what());
        }
    }
}

RecorderHandle ClipRecorder::open(std::chrono::system_clock::time_point startTime,
                                  std::chrono::duration<double> targetDuration) {
    auto clip = std::make_unique<clip_internal::ActiveClip>(frameQueueSize);
    clip->path = nextClipPath(startTime);

    try {
        clip->writer.open(clip->path.string(), cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, size, true);
    } catch (const cv::Exception& e) {
        throw RecordingIOError("cannot create clip " + clip->path.string() + ": " + e.what());
    }
    if (!clip->writer.isOpened()) {
        throw RecordingIOError("cannot create clip " + clip->path.string());
    }

    clip_internal::ActiveClip& active = *clip;
    active.writerThread = std::thread(&ClipRecorder::writeLoop, this, std::ref(active));

    std::lock_guard<std::mutex> lock(clipsMutex);
    const RecorderHandle handle = nextHandle++;
    clips.emplace(handle, std::move(clip));

    ROS_INFO_STREAM("[ClipRecorder] Recording " << active.path.string() << " (up to "
                    << targetDuration.count() << " s)");
    return handle;
}

void ClipRecorder::write(RecorderHandle handle, const cv::Mat& frame) {
    clip_internal::ActiveClip* clip = nullptr;
    {
        std::lock_guard<std::mutex> lock(clipsMutex);
        auto it = clips.find(handle);
        if (it == clips.end()) {
            throw RecordingIOError((boost::format("unknown recording handle %d") % handle).str());
        }
        clip = it->second.get();
    }

    if (clip->failed) {
        std::lock_guard<std::mutex> lock(clip->failureMutex);
        throw RecordingIOError("writing " + clip->path.string() + " failed: " + clip->failure);
    }
    if (!clip->pendingFrames.push(frame.clone())) {
        throw RecordingIOError("clip " + clip->path.string() + " is no longer accepting frames");
    }
}

void ClipRecorder::close(RecorderHandle handle) {
    std::unique_ptr<clip_internal::ActiveClip> clip;
    {
        std::lock_guard<std::mutex> lock(clipsMutex);
        auto it = clips.find(handle);
        if (it == clips.end()) return;
        clip = std::move(it->second);
        clips.erase(it);
    }
    finish(*clip);
}

std::string ClipRecorder::clipPath(RecorderHandle handle) const {
    std::lock_guard<std::mutex> lock(clipsMutex);
    auto it = clips.find(handle);
    return it == clips.end() ? std::string() : it->second->path.string();
}

boost::filesystem::path ClipRecorder::nextClipPath(std::chrono::system_clock::time_point startTime) const {
    const std::time_t t = std::chrono::system_clock::to_time_t(startTime);
    std::tm local{};
    localtime_r(&t, &local);
    char timestampStr[32];
    std::strftime(timestampStr, sizeof(timestampStr), "%Y%m%d_%H%M%S", &local);

    boost::filesystem::path path = directory / (boost::format("motion_%s.avi") % timestampStr).str();
    for (int suffix = 1; boost::filesystem::exists(path); ++suffix) {
        path = directory / (boost::format("motion_%s_%d.avi") % timestampStr % suffix).str();
    }
    return path;
}

void ClipRecorder::writeLoop(clip_internal::ActiveClip& clip) {
    while (auto frame = clip.pendingFrames.pop()) {
        if (clip.failed) continue;

        try {
            cv::Mat output = *frame;
            if (output.channels() == 1) {
                cv::cvtColor(output, output, cv::COLOR_GRAY2BGR);
            } else if (output.channels() == 4) {
                cv::cvtColor(output, output, cv::COLOR_BGRA2BGR);
            } else if (output.channels() != 3) {
                CV_Error(cv::Error::StsBadArg,
                         (boost::format("unsupported frame with %d channels") % output.channels()).str());
            }
            if (output.size() != size) cv::resize(output, output, size);
            clip.writer.write(output);
        } catch (const cv::Exception& e) {
            std::lock_guard<std::mutex> lock(clip.failureMutex);
            clip.failure = e.what();
            clip.failed = true;
            ROS_ERROR("[ClipRecorder] Failed to write frame to %s: %s", clip.path.string().c_str(), e.what());
        }
    }
}

void ClipRecorder::finish(clip_internal::ActiveClip& clip) {
    clip.pendingFrames.stopWaitingThreads();
    if (clip.writerThread.joinable()) clip.writerThread.join();
    clip.writer.release();

    if (clip.failed) {
        std::lock_guard<std::mutex> lock(clip.failureMutex);
        throw RecordingIOError("clip " + clip.path.string() + " is incomplete: " + clip.failure);
    }
    ROS_INFO_STREAM("[ClipRecorder] Recording saved: " << clip.path.string());
}

} // namespace motion_sentry
