#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace motion_sentry {

    /*
        Single-channel CV_8U copy of a BGR, BGRA or grayscale frame. 16-bit input is scaled
        down by 256, other depths are saturated.
    */
    cv::Mat toGray8(const cv::Mat& frame);

    enum class CalibrationStatus {
        Calibrating,
        Ready
    };

    /*
        Reference "empty scene" built as the per-pixel median of a fixed number of
        calibration samples. Frozen once ready until reset().
    */
    class BackgroundModel {
        public:
            explicit BackgroundModel(int requiredSamples);

            CalibrationStatus ingest(const cv::Mat& frame);
            bool isReady() const;

            /* Throws NotReady while calibrating */
            const cv::Mat& reference() const;
            void reset();

            int samplesCollected() const;
            int requiredSamples() const { return sampleQuota; }

        private:
            int sampleQuota;
            std::vector<cv::Mat> samples;
            cv::Mat referenceImage;

            cv::Mat computeMedian() const;
    };
}
