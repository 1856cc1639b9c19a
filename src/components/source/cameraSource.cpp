#include "source/cameraSource.hpp"
#include "errors.hpp"

#include <ros/ros.h>
#include <algorithm>
#include <cctype>
#include <thread>

namespace motion_sentry {

namespace {
    constexpr double kFallbackFps = 30.0;

    bool isDeviceIndex(const std::string& source) {
        return !source.empty() && std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c); });
    }
}

CameraSource::CameraSource(const std::string& videoSource, int emptyReadRetries)
    : sourceSpec(videoSource),
      kind(classify(videoSource)),
      maxEmptyReads(emptyReadRetries),
      consecutiveEmptyReads(0) {
    ROS_INFO("[CameraSource] Initializing with video source: %s", sourceSpec.c_str());
}

CameraSource::~CameraSource() {
    release();
}

SourceKind CameraSource::classify(const std::string& videoSource) {
    if (isDeviceIndex(videoSource) || videoSource.rfind("/dev/video", 0) == 0) return SourceKind::Device;
    if (videoSource.find("://") != std::string::npos) return SourceKind::Stream;
    return SourceKind::File;
}

void CameraSource::openSource() {
    if (!openDevice()) {
        throw SourceUnavailable("cannot open video source: " + sourceSpec);
    }
    const cv::Size size = frameSize();
    ROS_INFO("[CameraSource] Video capture initialized: %dx%d @ %.1ffps", size.width, size.height, nominalFps());
}

bool CameraSource::openDevice() {
    if (cap.isOpened()) cap.release();

    if (isDeviceIndex(sourceSpec)) {
        return cap.open(std::stoi(sourceSpec));
    }
    return cap.open(sourceSpec);
}

bool CameraSource::reconnect() {
    ROS_INFO("[CameraSource] Attempting to reconnect to video source: %s", sourceSpec.c_str());
    if (openDevice()) {
        ROS_INFO("[CameraSource] Successfully reconnected to video source");
        return true;
    }
    ROS_ERROR("[CameraSource] Failed to reconnect to video source");
    return false;
}

ReadStatus CameraSource::read(Frame& frame) {
    if (!cap.isOpened()) {
        return isLive() ? ReadStatus::Empty : ReadStatus::EndOfStream;
    }

    cv::Mat image;
    const bool grabbed = cap.read(image);
    if (!grabbed || image.empty()) {
        return isLive() ? ReadStatus::Empty : ReadStatus::EndOfStream;
    }

    frame.image = image;
    frame.timestamp = std::chrono::system_clock::now();
    return ReadStatus::Frame;
}

Frame CameraSource::nextFrame() {
    Frame frame;
    while (true) {
        switch (read(frame)) {
            case ReadStatus::Frame:
                consecutiveEmptyReads = 0;
                return frame;

            case ReadStatus::EndOfStream:
                throw SourceExhausted("end of video file " + sourceSpec);

            case ReadStatus::Empty:
                ++consecutiveEmptyReads;
                ROS_WARN_THROTTLE(1.0, "[CameraSource] Failed to grab frame (%d/%d)",
                                  consecutiveEmptyReads, maxEmptyReads);
                if (consecutiveEmptyReads > maxEmptyReads) {
                    throw SourceUnavailable("video source " + sourceSpec + " stopped delivering frames");
                }
                if (consecutiveEmptyReads == std::max(1, maxEmptyReads / 2)) reconnect();
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                break;
        }
    }
}

cv::Size CameraSource::frameSize() const {
    return cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                    static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
}

double CameraSource::nominalFps() const {
    const double fps = cap.get(cv::CAP_PROP_FPS);
    return fps > 0.0 ? fps : kFallbackFps;
}

void CameraSource::release() {
    if (cap.isOpened()) {
        cap.release();
        ROS_INFO("[CameraSource] Released video source");
    }
}

} // namespace motion_sentry
