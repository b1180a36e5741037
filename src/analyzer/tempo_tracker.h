/**
 * TrackSense - Tempo and Beat Tracker
 */

#ifndef TRACKSENSE_TEMPO_TRACKER_H
#define TRACKSENSE_TEMPO_TRACKER_H

#include "tracksense/types.h"

namespace tracksense {

struct BeatTrack {
    float tempo = 0.0f;                 // BPM, 0 when no rhythmic content
    std::vector<int> beat_frames;
};

/**
 * Onset-envelope based tempo estimation, dynamic-programming beat tracking and
 * onset picking. Stateless; frame indices follow the engine framing.
 */
class TempoTracker {
public:
    static constexpr int kMelBands = 40;
    static constexpr float kTightness = 100.0f;
    static constexpr float kStartBpm = 120.0f;

    TempoTracker() = default;

    /**
     * Onset strength envelope of a waveform (one value per frame).
     */
    Result<std::vector<float>> compute_onset_envelope(const AudioBuffer& audio,
                                                      int window_size,
                                                      int hop_length) const;

    /**
     * Onset strength from a dB-scaled mel spectrogram (frame-major, n_frames * n_mels):
     * mean over bands of the positive frame-to-frame difference; frame 0 is 0.
     */
    static std::vector<float> onset_strength(const std::vector<float>& log_mel,
                                             int n_frames, int n_mels);

    /**
     * Global tempo in BPM, 0 when the envelope carries no energy.
     */
    float estimate_tempo(const std::vector<float>& onset_envelope,
                         int sample_rate, int hop_length) const;

    /**
     * Beat frame indices for a given tempo.
     */
    std::vector<int> track_beats(const std::vector<float>& onset_envelope, float tempo,
                                 int sample_rate, int hop_length) const;

    /**
     * Tempo plus beats.
     */
    BeatTrack track(const std::vector<float>& onset_envelope,
                    int sample_rate, int hop_length) const;

    /**
     * Onset times in seconds.
     */
    std::vector<float> detect_onsets(const std::vector<float>& onset_envelope,
                                     int sample_rate, int hop_length) const;

private:
    // Index of the last cumulative-score peak worth starting the backtrace from
    static int last_beat(const std::vector<float>& cumscore);

    // Drop weak leading/trailing beats
    static std::vector<int> trim_beats(const std::vector<float>& localscore,
                                       const std::vector<int>& beats);
};

} // namespace tracksense

#endif // TRACKSENSE_TEMPO_TRACKER_H
