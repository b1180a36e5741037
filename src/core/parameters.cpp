/**
 * TrackSense - Parameter Validation
 */

#include "tracksense/types.h"
#include <cmath>

namespace tracksense {

Status AnalysisParameters::validate() const {
    if (min_peaks < 1) {
        return input_error("min_peaks must be at least 1");
    }
    if (max_peaks && *max_peaks < min_peaks) {
        return input_error("max_peaks (" + std::to_string(*max_peaks)
            + ") must not be below min_peaks (" + std::to_string(min_peaks) + ")");
    }
    if (window_size <= 0) {
        return input_error("window_size must be positive");
    }
    if (hop_length <= 0) {
        return input_error("hop_length must be positive");
    }
    if (!std::isfinite(min_gap_seconds) || min_gap_seconds < 0.0f) {
        return input_error("min_gap_seconds must be a finite, non-negative number");
    }
    if (!std::isfinite(short_ma_sec) || short_ma_sec <= 0.0f) {
        return input_error("short_ma_sec must be a finite, positive number");
    }
    if (!std::isfinite(long_ma_sec) || long_ma_sec <= 0.0f) {
        return input_error("long_ma_sec must be a finite, positive number");
    }
    return Unit{};
}

} // namespace tracksense
