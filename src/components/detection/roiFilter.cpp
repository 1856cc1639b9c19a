#include "detection/roiFilter.hpp"

#include <ros/ros.h>

namespace motion_sentry {

RoiFilter::RoiFilter(const cv::Rect& roi) : zone(roi) {}

std::vector<CandidateRegion> RoiFilter::filter(const std::vector<CandidateRegion>& regions) const {
    std::vector<CandidateRegion> inZone;
    for (const auto& region : regions) {
        if (intersects(region)) inZone.push_back(region);
    }
    return inZone;
}

bool RoiFilter::intersects(const CandidateRegion& region) const {
    return (region.boundingBox & zone).area() > 0;
}

void RoiFilter::setRoi(const cv::Rect& roi) {
    zone = roi;
    ROS_INFO("[RoiFilter] ROI set to [%d, %d, %d, %d]", zone.x, zone.y, zone.width, zone.height);
}

bool RoiFilter::roiWithinFrame(const cv::Rect& roi, const cv::Size& frameSize) {
    const cv::Rect frameBounds(0, 0, frameSize.width, frameSize.height);
    return roi.area() > 0 && (roi & frameBounds) == roi;
}

} // namespace motion_sentry
