/**
 * TrackSense - Energy Profile Builder
 */

#ifndef TRACKSENSE_ENERGY_PROFILE_H
#define TRACKSENSE_ENERGY_PROFILE_H

#include "tracksense/types.h"

namespace tracksense {

/**
 * Frame-wise RMS energy in dB relative to the track peak, plus a Gaussian-smoothed copy.
 */
class EnergyProfileBuilder {
public:
    static constexpr float kAmplitudeFloor = 1e-5f;
    static constexpr float kTopDb = 80.0f;
    static constexpr float kSmoothingSigma = 1.5f;

    EnergyProfileBuilder() = default;

    /**
     * Build the profile for a mono waveform.
     * A silent waveform yields a flat 0 dB profile.
     */
    Result<EnergyProfile> build(const AudioBuffer& audio, int window_size, int hop_length) const;

    /**
     * Linear RMS of every frame (frame_count() entries).
     */
    static std::vector<float> frame_rms(const std::vector<float>& samples,
                                        int window_size, int hop_length);

    /**
     * RMS of a run of samples.
     */
    static float compute_rms(const float* samples, size_t count);

    /**
     * 20*log10(rms / max_rms) with amplitude floor and top_db clipping; non-finite
     * values are replaced by the smallest finite value.
     */
    static std::vector<float> amplitude_to_db(const std::vector<float>& rms);
};

} // namespace tracksense

#endif // TRACKSENSE_ENERGY_PROFILE_H
