#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "configuration/configurationParameters.hpp"

namespace motion_sentry {

    class BackgroundModel;

    struct CandidateRegion {
        cv::Rect boundingBox;
        double area;              // contour area, pixel^2
    };

    /*
        grayscale -> blur -> |frame - background| -> threshold -> dilate -> contours -> area filter
    */
    class FrameProcessor {
        public:
            FrameProcessor(const ProcessingParameters& parameters, double minArea);

            /*
                Grayscale + blur. The background model is fed this same output so that
                both sides of the difference went through identical smoothing.
            */
            cv::Mat preprocess(const cv::Mat& frame) const;

            /* Throws NotReady while the background is calibrating */
            std::vector<CandidateRegion> process(const cv::Mat& frame, const BackgroundModel& background);

            const cv::Mat& lastMask() const { return motionMask; }
            double minimumArea() const { return minArea; }

            static std::vector<CandidateRegion> discardSmallRegions(std::vector<CandidateRegion> regions, double minArea);

        private:
            ProcessingParameters params;
            double minArea;
            cv::Mat dilateKernel;
            cv::Mat motionMask;
    };
}
