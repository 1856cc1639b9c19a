#include "configuration/configurationParameters.hpp"
#include "detection/roiFilter.hpp"
#include "errors.hpp"

#include <boost/format.hpp>
#include <sstream>

namespace motion_sentry {

std::vector<std::string> validateConfiguration(const ConfigurationParameters& params) {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    if (params.videoSource.empty())
        errors.emplace_back("video_source must not be empty");
    if (params.backgroundFrames < 1)
        errors.emplace_back((boost::format("bg_frames must be >= 1 (got %d)") % params.backgroundFrames).str());
    if (params.minArea <= 0.0)
        errors.emplace_back((boost::format("min_area must be positive (got %g)") % params.minArea).str());
    if (params.roi.x < 0 || params.roi.y < 0 || params.roi.width <= 0 || params.roi.height <= 0)
        errors.emplace_back((boost::format("roi [%d,%d,%d,%d] must have a non-negative origin and a positive size")
                             % params.roi.x % params.roi.y % params.roi.width % params.roi.height).str());
    if (params.afterHoursStart < 0 || params.afterHoursStart >= 24)
        errors.emplace_back((boost::format("alert_after_hours start must be in [0,24) (got %d)") % params.afterHoursStart).str());
    if (params.afterHoursEnd < 0 || params.afterHoursEnd > 24)
        errors.emplace_back((boost::format("alert_after_hours end must be in [0,24] (got %d)") % params.afterHoursEnd).str());
    if (params.recordDurationSec <= 0.0)
        errors.emplace_back((boost::format("record_duration must be positive (got %g)") % params.recordDurationSec).str());
    if (params.outputFps <= 0.0)
        errors.emplace_back((boost::format("output_fps must be positive (got %g)") % params.outputFps).str());

    const ProcessingParameters& processing = params.processing;
    if (processing.diffThreshold < 0 || processing.diffThreshold > 255)
        errors.emplace_back((boost::format("processing/diff_threshold must be in [0,255] (got %d)") % processing.diffThreshold).str());
    if (processing.blurKernelSize < 1 || processing.blurKernelSize % 2 == 0)
        errors.emplace_back((boost::format("processing/blur_kernel_size must be odd and positive (got %d)") % processing.blurKernelSize).str());
    if (processing.dilateIterations < 0)
        errors.emplace_back((boost::format("processing/dilate_iterations must be >= 0 (got %d)") % processing.dilateIterations).str());

    const DebounceParameters& debounce = params.debounce;
    if (debounce.window < 1)
        errors.emplace_back((boost::format("debounce/window must be >= 1 (got %d)") % debounce.window).str());
    if (debounce.requiredHits < 1 || debounce.requiredHits > debounce.window)
        errors.emplace_back((boost::format("debounce/required_hits must be in [1, window] (got %d)") % debounce.requiredHits).str());

    if (params.emptyReadRetries < 0)
        errors.emplace_back((boost::format("source/empty_read_retries must be >= 0 (got %d)") % params.emptyReadRetries).str());
    if (params.processingRate < 0.0)
        errors.emplace_back((boost::format("processing_rate must be >= 0 (got %g)") % params.processingRate).str());
    if (params.saveVideos && params.recordingsPath.empty())
        errors.emplace_back("recordings_path must not be empty when save_videos is enabled");
    if (params.logPath.empty())
        errors.emplace_back("log_path must not be empty");

    if (!errors.empty()) {
        std::ostringstream joined;
        joined << "Invalid configuration:";
        for (const auto& error : errors) joined << "\n  - " << error;
        throw ConfigurationError(joined.str());
    }

    if (params.afterHoursStart == params.afterHoursEnd) {
        warnings.emplace_back((boost::format("alert_after_hours [%d,%d] has equal bounds, monitoring is treated as always active")
                               % params.afterHoursStart % params.afterHoursEnd).str());
    }

    return warnings;
}

void validateRoiAgainstFrame(const cv::Rect& roi, const cv::Size& frameSize) {
    if (!RoiFilter::roiWithinFrame(roi, frameSize)) {
        throw ConfigurationError((boost::format("roi [%d,%d,%d,%d] does not lie inside the %dx%d frame")
                                  % roi.x % roi.y % roi.width % roi.height
                                  % frameSize.width % frameSize.height).str());
    }
}

} // namespace motion_sentry
