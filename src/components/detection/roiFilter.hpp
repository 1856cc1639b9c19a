#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "detection/frameProcessor.hpp"

namespace motion_sentry {

    /*
        Keeps regions whose bounding box intersects the zone. Partial entries count,
        regions are passed through unclipped.
    */
    class RoiFilter {
        public:
            explicit RoiFilter(const cv::Rect& roi);

            std::vector<CandidateRegion> filter(const std::vector<CandidateRegion>& regions) const;
            bool intersects(const CandidateRegion& region) const;

            void setRoi(const cv::Rect& roi);
            const cv::Rect& roi() const { return zone; }

            static bool roiWithinFrame(const cv::Rect& roi, const cv::Size& frameSize);

        private:
            cv::Rect zone;
    };
}
