#ifndef MOTION_SENTRY_MOCK_FRAMES_HPP
#define MOTION_SENTRY_MOCK_FRAMES_HPP

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <chrono>
#include <ctime>

/*
    Deterministic synthetic scenes for the detection tests: a uniform background with
    optional bright squares painted on top.
*/
class MockFrames {
private:
    int width_;
    int height_;
    cv::Mat background_;

public:
    MockFrames(int width = 640, int height = 480, int intensity = 128) : width_(width), height_(height) {
        background_ = cv::Mat(height_, width_, CV_8UC3, cv::Scalar(intensity, intensity, intensity));
    }

    cv::Mat background() const {
        return background_.clone();
    }

    /* Filled square, top-left at (x, y), `side` pixels wide */
    cv::Mat withSquare(int x, int y, int side, int intensity = 255) const {
        cv::Mat frame = background_.clone();
        cv::rectangle(frame, cv::Rect(x, y, side, side), cv::Scalar(intensity, intensity, intensity), cv::FILLED);
        return frame;
    }

    cv::Mat withRect(const cv::Rect& rect, int intensity = 255) const {
        cv::Mat frame = background_.clone();
        cv::rectangle(frame, rect, cv::Scalar(intensity, intensity, intensity), cv::FILLED);
        return frame;
    }

    int width() const { return width_; }
    int height() const { return height_; }

    /* Today's date at the given local wall-clock hour */
    static std::chrono::system_clock::time_point atLocalHour(int hour, int minute = 0, int second = 0) {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        local.tm_hour = hour;
        local.tm_min = minute;
        local.tm_sec = second;
        local.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&local));
    }
};

#endif  // MOTION_SENTRY_MOCK_FRAMES_HPP
