/**
 * TrackSense - Feature Extractor
 */

#ifndef TRACKSENSE_FEATURE_EXTRACTOR_H
#define TRACKSENSE_FEATURE_EXTRACTOR_H

#include "tracksense/types.h"

namespace tracksense {

struct Spectrogram;

/**
 * Spectral, rhythmic, tonal and energy descriptors for a whole track.
 *
 * Per-frame arrays share the framing of the energy profile; the global block
 * summarizes them. Degenerate input (silence, very short buffers) produces
 * zeros rather than NaN.
 */
class FeatureExtractor {
public:
    static constexpr int kMfccCount = 13;
    static constexpr int kMelBands = 40;
    static constexpr int kChromaBins = 12;
    static constexpr int kTonnetzDims = 6;
    static constexpr float kRolloffPercent = 0.85f;

    FeatureExtractor() = default;

    Result<FeatureBundle> extract(const AudioBuffer& audio, int window_size, int hop_length) const;

    // Per-frame building blocks

    static std::vector<float> spectral_centroid(const Spectrogram& spec);
    static std::vector<float> spectral_rolloff(const Spectrogram& spec,
                                               float roll_percent = kRolloffPercent);
    static std::vector<float> spectral_bandwidth(const Spectrogram& spec,
                                                 const std::vector<float>& centroids);

    /**
     * MFCCs from a dB mel spectrogram (frame-major, n_frames * kMelBands).
     */
    static std::vector<std::vector<float>> compute_mfcc(const std::vector<float>& log_mel,
                                                        int n_frames);

    static std::vector<float> zero_crossing_rate(const std::vector<float>& samples,
                                                 int window_size, int hop_length);

    /**
     * Pitch-class power per frame, each frame scaled so its largest bin is 1.
     */
    static std::vector<std::vector<float>> compute_chroma(const Spectrogram& spec);

    static std::vector<std::vector<float>> compute_tonnetz(
        const std::vector<std::vector<float>>& chroma);

    static GlobalFeatures summarize(const FrameFeatures& frames, float tempo,
                                    float duration, int sample_rate);
};

} // namespace tracksense

#endif // TRACKSENSE_FEATURE_EXTRACTOR_H
