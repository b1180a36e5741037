/**
 * TrackSense - Adaptive Boundary Detector
 *
 * Finds the instants where the energy trend of a track turns, using a
 * short-minus-long moving-average oscillator normalized by a robust z-score.
 */

#ifndef TRACKSENSE_BOUNDARY_DETECTOR_H
#define TRACKSENSE_BOUNDARY_DETECTOR_H

#include "tracksense/types.h"
#include "peak_finder.h"
#include <utility>

namespace tracksense {

class AdaptiveBoundaryDetector {
public:
    static constexpr float kMadScale = 1.4826f;
    static constexpr float kEpsilon = 1e-8f;
    static constexpr float kZSmoothingSigma = 1.0f;
    static constexpr float kGlobalMadFactor = 0.8f;
    static constexpr float kEnergyStdFactor = 0.5f;
    static constexpr float kEnergyPercentile = 70.0f;
    static constexpr float kMinProminence = 0.1f;
    static constexpr float kBeatFraction = 0.3f;
    static constexpr float kFallbackSpacingSec = 0.5f;
    static constexpr float kEdgeToleranceSec = 1.0f;

    AdaptiveBoundaryDetector() = default;

    /**
     * Estimate the tempo of `audio`, then detect boundaries on `profile`.
     */
    Result<BoundaryDetection> detect(const EnergyProfile& profile,
                                     const AudioBuffer& audio,
                                     const AnalysisParameters& params) const;

    /**
     * Detect boundaries with an already known tempo (BPM, <= 0 when unknown).
     */
    Result<BoundaryDetection> detect(const EnergyProfile& profile,
                                     float tempo,
                                     const AnalysisParameters& params) const;

    // Pipeline steps, exposed for testing

    /**
     * Short and long trend windows in frames; long always exceeds short.
     */
    static std::pair<int, int> trend_windows(float short_sec, float long_sec,
                                             int sample_rate, int hop_length);

    static std::vector<float> energy_trend(const std::vector<float>& smoothed_db,
                                           int short_frames, int long_frames);

    /**
     * (x - median) / (1.4826 * MAD + eps)
     */
    static std::vector<float> robust_zscore(const std::vector<float>& x);

    /**
     * min(global threshold, high-energy threshold). The high-energy threshold
     * only participates when some frame is above the 70th percentile of rms_db.
     */
    static float adaptive_threshold(const std::vector<float>& z,
                                    const std::vector<float>& rms_db);

    static int min_peak_distance(float tempo, int sample_rate, int hop_length,
                                 float min_gap_seconds);

    /**
     * Keep the `max_peaks` most prominent peaks, ordered by position.
     */
    static std::vector<Peak> limit_peaks(std::vector<Peak> peaks, int max_peaks);

    static std::vector<float> anchor_boundaries(std::vector<float> peak_times,
                                                float last_time);
};

} // namespace tracksense

#endif // TRACKSENSE_BOUNDARY_DETECTOR_H
