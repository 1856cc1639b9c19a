#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace motion_sentry {

    struct ProcessingParameters {
        int diffThreshold = 25;       // |diff| above this marks a motion pixel
        int blurKernelSize = 21;      // odd, 1 disables the blur
        int dilateIterations = 2;
    };

    struct DebounceParameters {
        int window = 10;              // observations kept in the sliding window
        int requiredHits = 1;         // positive observations needed to count as motion
    };

    struct ConfigurationParameters {
        std::string videoSource;      // device index, /dev/video path, stream URL or file
        int backgroundFrames = 0;
        double minArea = 0.0;         // pixel^2
        cv::Rect roi;
        int afterHoursStart = 0;
        int afterHoursEnd = 0;
        double recordDurationSec = 0.0;
        bool saveVideos = true;
        double outputFps = 0.0;

        ProcessingParameters processing;
        DebounceParameters debounce;

        int emptyReadRetries = 10;
        double processingRate = 0.0;  // Hz, 0 = unthrottled
        std::string recordingsPath = "data/recordings";
        std::string logPath = "data/logs/motion_log.txt";
        bool publishDebugFrames = true;
    };

    /*
        Throws ConfigurationError listing every violation.
        Returns non-fatal warnings (e.g. a degenerate schedule window).
    */
    std::vector<std::string> validateConfiguration(const ConfigurationParameters& params);

    void validateRoiAgainstFrame(const cv::Rect& roi, const cv::Size& frameSize);
}
