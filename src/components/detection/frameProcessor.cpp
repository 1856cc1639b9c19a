#include "detection/frameProcessor.hpp"
#include "detection/backgroundModel.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>

namespace motion_sentry {

FrameProcessor::FrameProcessor(const ProcessingParameters& parameters, double minArea)
    : params(parameters), minArea(minArea) {
    /* 3x3 rectangle, what cv::dilate uses when handed an empty kernel */
    dilateKernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
}

cv::Mat FrameProcessor::preprocess(const cv::Mat& frame) const {
    if (frame.empty()) return cv::Mat();

    cv::Mat gray = toGray8(frame);

    if (params.blurKernelSize > 1) {
        cv::GaussianBlur(gray, gray, cv::Size(params.blurKernelSize, params.blurKernelSize), 0);
    }
    return gray;
}

std::vector<CandidateRegion> FrameProcessor::process(const cv::Mat& frame, const BackgroundModel& background) {
    const cv::Mat& reference = background.reference();

    cv::Mat gray = preprocess(frame);
    if (gray.size() != reference.size()) {
        throw std::invalid_argument("frame size does not match the background reference");
    }

    cv::Mat frameDelta;
    cv::absdiff(reference, gray, frameDelta);
    cv::threshold(frameDelta, motionMask, params.diffThreshold, 255, cv::THRESH_BINARY);

    if (params.dilateIterations > 0) {
        cv::dilate(motionMask, motionMask, dilateKernel, cv::Point(-1, -1), params.dilateIterations);
    }

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(motionMask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<CandidateRegion> regions;
    regions.reserve(contours.size());
    for (const auto& contour : contours) {
        regions.push_back(CandidateRegion{cv::boundingRect(contour), cv::contourArea(contour)});
    }

    return discardSmallRegions(std::move(regions), minArea);
}

std::vector<CandidateRegion> FrameProcessor::discardSmallRegions(std::vector<CandidateRegion> regions, double minArea) {
    regions.erase(std::remove_if(regions.begin(), regions.end(),
                                 [minArea](const CandidateRegion& region) { return region.area < minArea; }),
                  regions.end());
    return regions;
}

} // namespace motion_sentry
