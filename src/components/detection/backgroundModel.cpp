#include "detection/backgroundModel.hpp"
#include "errors.hpp"

#include <opencv2/imgproc.hpp>
#include <ros/ros.h>
#include <algorithm>

namespace motion_sentry {

cv::Mat toGray8(const cv::Mat& frame) {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = frame.clone();
    }

    if (gray.depth() == CV_16U) {
        gray.convertTo(gray, CV_8U, 1.0 / 256.0);
    } else if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

BackgroundModel::BackgroundModel(int requiredSamples) : sampleQuota(requiredSamples) {
    if (sampleQuota < 1) {
        throw ConfigurationError("BackgroundModel needs at least one calibration frame");
    }
    samples.reserve(sampleQuota);
}

CalibrationStatus BackgroundModel::ingest(const cv::Mat& frame) {
    if (isReady()) return CalibrationStatus::Ready;
    if (frame.empty()) {
        ROS_WARN_THROTTLE(5.0, "[BackgroundModel] Empty frame ignored during calibration");
        return CalibrationStatus::Calibrating;
    }

    cv::Mat gray = toGray8(frame);

    if (!samples.empty() && samples.front().size() != gray.size()) {
        ROS_WARN("[BackgroundModel] Sample size changed from %dx%d to %dx%d, restarting calibration",
                 samples.front().cols, samples.front().rows, gray.cols, gray.rows);
        samples.clear();
    }

    samples.push_back(gray);
    if (static_cast<int>(samples.size()) < sampleQuota) {
        return CalibrationStatus::Calibrating;
    }

    referenceImage = computeMedian();
    samples.clear();
    ROS_INFO("[BackgroundModel] Background model created from %d frames", sampleQuota);
    return CalibrationStatus::Ready;
}

bool BackgroundModel::isReady() const {
    return !referenceImage.empty();
}

const cv::Mat& BackgroundModel::reference() const {
    if (!isReady()) {
        throw NotReady("background model is calibrating (" + std::to_string(samples.size()) + "/" +
                       std::to_string(sampleQuota) + " frames)");
    }
    return referenceImage;
}

void BackgroundModel::reset() {
    if (!isReady() && samples.empty()) return;

    samples.clear();
    referenceImage.release();
    ROS_INFO("[BackgroundModel] Reset, collecting %d new calibration frames", sampleQuota);
}

int BackgroundModel::samplesCollected() const {
    return isReady() ? sampleQuota : static_cast<int>(samples.size());
}

cv::Mat BackgroundModel::computeMedian() const {
    const int rows = samples.front().rows;
    const int cols = samples.front().cols * samples.front().channels();
    const size_t count = samples.size();
    const size_t mid = count / 2;

    cv::Mat median(samples.front().size(), samples.front().type());
    std::vector<uchar> stack(count);
    std::vector<const uchar*> sampleRows(count);

    for (int r = 0; r < rows; ++r) {
        for (size_t i = 0; i < count; ++i) sampleRows[i] = samples[i].ptr<uchar>(r);
        uchar* out = median.ptr<uchar>(r);

        for (int c = 0; c < cols; ++c) {
            for (size_t i = 0; i < count; ++i) stack[i] = sampleRows[i][c];

            std::nth_element(stack.begin(), stack.begin() + mid, stack.end());
            int value = stack[mid];
            if (count % 2 == 0) {
                /* even count: mean of the two middle samples, truncated */
                const int lower = *std::max_element(stack.begin(), stack.begin() + mid);
                value = (lower + value) / 2;
            }
            out[c] = static_cast<uchar>(value);
        }
    }

    return median;
}

} // namespace motion_sentry
