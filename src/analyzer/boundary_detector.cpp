/**
 * TrackSense - Adaptive Boundary Detector Implementation
 */

#include "boundary_detector.h"
#include "tempo_tracker.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>
#include <limits>

namespace tracksense {

namespace {
    // Frames spanned by a duration, saturated to [1, INT_MAX - 1].
    int seconds_to_frames(double seconds, double frames_per_sec, bool round) {
        double frames = seconds * frames_per_sec;
        frames = round ? std::round(frames) : std::floor(frames);
        if (!(frames >= 1.0)) return 1;
        const double limit = static_cast<double>(std::numeric_limits<int>::max() - 1);
        return frames >= limit ? static_cast<int>(limit) : static_cast<int>(frames);
    }
}

Result<BoundaryDetection> AdaptiveBoundaryDetector::detect(const EnergyProfile& profile,
                                                           const AudioBuffer& audio,
                                                           const AnalysisParameters& params) const {
    TempoTracker tracker;
    auto envelope = tracker.compute_onset_envelope(audio, params.window_size, params.hop_length);
    if (!envelope.ok()) {
        return envelope.failure();
    }

    float tempo = tracker.estimate_tempo(envelope.value(), audio.sample_rate, params.hop_length);
    return detect(profile, tempo, params);
}

Result<BoundaryDetection> AdaptiveBoundaryDetector::detect(const EnergyProfile& profile,
                                                           float tempo,
                                                           const AnalysisParameters& params) const {
    if (profile.size() == 0 || profile.times.size() != profile.size()) {
        return input_error("Energy profile is empty or misaligned");
    }
    if (profile.sample_rate <= 0 || profile.hop_length <= 0) {
        return input_error("Energy profile has no valid sample rate / hop length");
    }

    BoundaryDetection detection;
    detection.tempo = std::isfinite(tempo) ? tempo : 0.0f;
    detection.max_peaks = params.resolved_max_peaks();

    // 1-2. Detrended energy oscillator
    auto [short_frames, long_frames] = trend_windows(params.short_ma_sec, params.long_ma_sec,
                                                     profile.sample_rate, profile.hop_length);
    std::vector<float> trend = energy_trend(profile.smoothed_db, short_frames, long_frames);

    // 3. Robust normalization
    std::vector<float> z = utils::gaussian_filter1d(robust_zscore(trend), kZSmoothingSigma);

    // 4. Adaptive threshold
    detection.threshold = adaptive_threshold(z, profile.rms_db);

    // 5. Tempo-aware spacing
    int distance = min_peak_distance(detection.tempo, profile.sample_rate,
                                     profile.hop_length, params.min_gap_seconds);

    // 6. Peaks
    PeakCriteria criteria;
    criteria.height = detection.threshold;
    criteria.distance = distance;
    criteria.prominence = kMinProminence;
    std::vector<Peak> peaks = find_peaks(z, criteria);

    size_t found = peaks.size();

    // 7. Cap by prominence
    peaks = limit_peaks(std::move(peaks), detection.max_peaks);

    std::vector<float> peak_times;
    peak_times.reserve(peaks.size());
    for (const auto& peak : peaks) {
        float t = profile.times[peak.index];
        peak_times.push_back(t);
        detection.peaks.push_back(BoundaryCandidate{t, peak.prominence});
    }

    // 8. Track edges
    if (params.include_boundaries) {
        detection.boundaries = anchor_boundaries(std::move(peak_times), profile.last_time());
    } else {
        detection.boundaries = std::move(peak_times);
    }

    TRACKSENSE_LOG_INFO("Boundary", "windows=" << short_frames << "/" << long_frames
        << " frames, tempo=" << detection.tempo << " BPM, threshold=" << detection.threshold
        << ", distance=" << distance << " frames, peaks=" << found
        << " (kept " << detection.peaks.size() << "), boundaries=" << detection.boundaries.size());

    return detection;
}

std::pair<int, int> AdaptiveBoundaryDetector::trend_windows(float short_sec, float long_sec,
                                                            int sample_rate, int hop_length) {
    const double frames_per_sec = static_cast<double>(sample_rate) / hop_length;
    int short_frames = std::min(seconds_to_frames(short_sec, frames_per_sec, true),
                                std::numeric_limits<int>::max() - 2);
    int long_frames = std::max(short_frames + 1,
                               seconds_to_frames(long_sec, frames_per_sec, true));
    return {short_frames, long_frames};
}

std::vector<float> AdaptiveBoundaryDetector::energy_trend(const std::vector<float>& smoothed_db,
                                                          int short_frames, int long_frames) {
    std::vector<float> short_ma = utils::moving_average(smoothed_db, short_frames);
    std::vector<float> long_ma = utils::moving_average(smoothed_db, long_frames);

    std::vector<float> trend(smoothed_db.size());
    for (size_t i = 0; i < trend.size(); ++i) {
        trend[i] = short_ma[i] - long_ma[i];
    }
    return trend;
}

std::vector<float> AdaptiveBoundaryDetector::robust_zscore(const std::vector<float>& x) {
    double med = utils::median(x);
    double mad = utils::median_abs_deviation(x);
    double scale = kMadScale * mad + kEpsilon;

    std::vector<float> z(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        z[i] = static_cast<float>((x[i] - med) / scale);
    }
    return z;
}

float AdaptiveBoundaryDetector::adaptive_threshold(const std::vector<float>& z,
                                                   const std::vector<float>& rms_db) {
    double global = utils::median(z)
                  + kGlobalMadFactor * utils::median_abs_deviation(z) * kMadScale;

    double cutoff = utils::percentile(rms_db, kEnergyPercentile);
    std::vector<float> loud;
    size_t n = std::min(z.size(), rms_db.size());
    for (size_t i = 0; i < n; ++i) {
        if (rms_db[i] > cutoff) loud.push_back(z[i]);
    }

    if (loud.empty()) {
        return static_cast<float>(global);
    }

    double energy = utils::median(loud) + kEnergyStdFactor * utils::stddev(loud);
    TRACKSENSE_LOG_DEBUG("Boundary", "global threshold=" << global
        << ", high-energy threshold=" << energy << " over " << loud.size() << " frames");

    return static_cast<float>(std::min(global, energy));
}

int AdaptiveBoundaryDetector::min_peak_distance(float tempo, int sample_rate, int hop_length,
                                                float min_gap_seconds) {
    const double frames_per_sec = static_cast<double>(sample_rate) / hop_length;

    double spacing_sec = tempo > 0.0f ? kBeatFraction * 60.0 / tempo : kFallbackSpacingSec;
    int distance = seconds_to_frames(spacing_sec, frames_per_sec, false);
    int gap_frames = seconds_to_frames(min_gap_seconds, frames_per_sec, false);
    return std::max(distance, gap_frames);
}

std::vector<Peak> AdaptiveBoundaryDetector::limit_peaks(std::vector<Peak> peaks, int max_peaks) {
    if (max_peaks < 0 || peaks.size() <= static_cast<size_t>(max_peaks)) {
        return peaks;
    }

    std::stable_sort(peaks.begin(), peaks.end(), [](const Peak& a, const Peak& b) {
        return a.prominence > b.prominence;
    });
    peaks.resize(max_peaks);
    std::sort(peaks.begin(), peaks.end(), [](const Peak& a, const Peak& b) {
        return a.index < b.index;
    });
    return peaks;
}

std::vector<float> AdaptiveBoundaryDetector::anchor_boundaries(std::vector<float> peak_times,
                                                               float last_time) {
    const bool no_peaks = peak_times.empty();

    if (no_peaks || peak_times.front() > kEdgeToleranceSec) {
        peak_times.insert(peak_times.begin(), 0.0f);
    }
    if ((no_peaks || peak_times.back() < last_time - kEdgeToleranceSec)
        && last_time > peak_times.back()) {
        peak_times.push_back(last_time);
    }
    return peak_times;
}

} // namespace tracksense
