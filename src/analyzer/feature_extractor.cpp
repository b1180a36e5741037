/**
 * TrackSense - Feature Extractor Implementation
 */

#include "feature_extractor.h"
#include "energy_profile.h"
#include "spectrum.h"
#include "tempo_tracker.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>

namespace tracksense {

namespace {
    // Chroma frequency range, A4 reference
    constexpr float kChromaMinHz = 20.0f;
    constexpr float kChromaMaxHz = 5000.0f;
    constexpr float kA4Freq = 440.0f;
    constexpr int kA4Midi = 69;

    std::vector<float> row_means(const std::vector<std::vector<float>>& rows) {
        std::vector<float> means;
        means.reserve(rows.size());
        for (const auto& row : rows) {
            means.push_back(static_cast<float>(utils::mean(row)));
        }
        return means;
    }

    void sanitize_rows(std::vector<std::vector<float>>& rows) {
        for (auto& row : rows) utils::sanitize(row);
    }
}

Result<FeatureBundle> FeatureExtractor::extract(const AudioBuffer& audio,
                                                int window_size, int hop_length) const {
    if (audio.samples.empty()) {
        return input_error("Empty audio buffer");
    }
    if (audio.sample_rate <= 0 || window_size <= 0 || hop_length <= 0) {
        return input_error("Invalid framing parameters");
    }

    FeatureBundle bundle;
    bundle.window_size = window_size;
    bundle.hop_length = hop_length;
    bundle.n_mfcc = kMfccCount;
    bundle.n_mels = kMelBands;

    FrameFeatures& frames = bundle.segment_features;

    // Spectral shape
    Stft stft(window_size);
    Spectrogram spec = stft.compute(audio, hop_length);

    frames.spectral_centroids = spectral_centroid(spec);
    frames.spectral_rolloff = spectral_rolloff(spec);
    frames.spectral_bandwidth = spectral_bandwidth(spec, frames.spectral_centroids);

    // Log-mel feeds both MFCC and the onset envelope
    MelFilterbank mel_bank(audio.sample_rate, window_size, kMelBands);
    std::vector<float> log_mel = mel_bank.apply(spec);
    power_to_db(log_mel);

    frames.mfccs = compute_mfcc(log_mel, spec.n_frames);

    // Time-domain descriptors
    frames.zcr = zero_crossing_rate(audio.samples, window_size, hop_length);
    frames.rms = EnergyProfileBuilder::frame_rms(audio.samples, window_size, hop_length);

    // Tonal
    frames.chroma = compute_chroma(spec);
    frames.tonnetz = compute_tonnetz(frames.chroma);

    // Rhythm
    TempoTracker tracker;
    std::vector<float> envelope = TempoTracker::onset_strength(log_mel, spec.n_frames, kMelBands);
    BeatTrack beats = tracker.track(envelope, audio.sample_rate, hop_length);
    frames.beats = beats.beat_frames;
    frames.onset_times = tracker.detect_onsets(envelope, audio.sample_rate, hop_length);

    utils::sanitize(frames.spectral_centroids);
    utils::sanitize(frames.spectral_rolloff);
    utils::sanitize(frames.spectral_bandwidth);
    utils::sanitize(frames.zcr);
    utils::sanitize(frames.rms);
    utils::sanitize(frames.onset_times);
    sanitize_rows(frames.mfccs);
    sanitize_rows(frames.chroma);
    sanitize_rows(frames.tonnetz);

    bundle.global_features = summarize(frames, beats.tempo, audio.duration_seconds(),
                                       audio.sample_rate);

    TRACKSENSE_LOG_INFO("Features", frames.frame_count() << " frames, tempo="
        << bundle.global_features.tempo << " BPM, beats=" << bundle.global_features.num_beats
        << ", onsets=" << bundle.global_features.num_onsets);

    return bundle;
}

std::vector<float> FeatureExtractor::spectral_centroid(const Spectrogram& spec) {
    std::vector<float> centroids(spec.n_frames, 0.0f);

    for (int f = 0; f < spec.n_frames; ++f) {
        const float* mag = spec.frame(f);
        double weighted = 0.0;
        double total = 0.0;
        for (int k = 0; k < spec.n_bins; ++k) {
            weighted += static_cast<double>(spec.bin_frequency(k)) * mag[k];
            total += mag[k];
        }
        centroids[f] = total > 0.0 ? static_cast<float>(weighted / total) : 0.0f;
    }
    return centroids;
}

std::vector<float> FeatureExtractor::spectral_rolloff(const Spectrogram& spec, float roll_percent) {
    std::vector<float> rolloff(spec.n_frames, 0.0f);

    for (int f = 0; f < spec.n_frames; ++f) {
        const float* mag = spec.frame(f);
        double total = 0.0;
        for (int k = 0; k < spec.n_bins; ++k) total += mag[k];

        const double threshold = roll_percent * total;
        double cumulative = 0.0;
        for (int k = 0; k < spec.n_bins; ++k) {
            cumulative += mag[k];
            if (cumulative >= threshold) {
                rolloff[f] = spec.bin_frequency(k);
                break;
            }
        }
    }
    return rolloff;
}

std::vector<float> FeatureExtractor::spectral_bandwidth(const Spectrogram& spec,
                                                        const std::vector<float>& centroids) {
    std::vector<float> bandwidth(spec.n_frames, 0.0f);

    for (int f = 0; f < spec.n_frames; ++f) {
        const float* mag = spec.frame(f);
        double total = 0.0;
        for (int k = 0; k < spec.n_bins; ++k) total += mag[k];
        if (total <= 0.0) continue;

        double acc = 0.0;
        for (int k = 0; k < spec.n_bins; ++k) {
            double dev = spec.bin_frequency(k) - centroids[f];
            acc += (mag[k] / total) * dev * dev;
        }
        bandwidth[f] = static_cast<float>(std::sqrt(acc));
    }
    return bandwidth;
}

std::vector<std::vector<float>> FeatureExtractor::compute_mfcc(const std::vector<float>& log_mel,
                                                               int n_frames) {
    std::vector<std::vector<float>> mfccs(kMfccCount, std::vector<float>(n_frames, 0.0f));

    for (int f = 0; f < n_frames; ++f) {
        std::vector<float> coeffs = dct_ortho(log_mel.data() + static_cast<size_t>(f) * kMelBands,
                                              kMelBands, kMfccCount);
        for (int c = 0; c < kMfccCount; ++c) {
            mfccs[c][f] = coeffs[c];
        }
    }
    return mfccs;
}

std::vector<float> FeatureExtractor::zero_crossing_rate(const std::vector<float>& samples,
                                                        int window_size, int hop_length) {
    int n_frames = frame_count(samples.size(), window_size, hop_length);
    std::vector<float> zcr(n_frames, 0.0f);
    std::vector<float> frame(window_size);

    for (int f = 0; f < n_frames; ++f) {
        copy_frame(samples, f, window_size, hop_length, frame.data());
        int crossings = 0;
        for (int i = 1; i < window_size; ++i) {
            if ((frame[i] >= 0.0f) != (frame[i - 1] >= 0.0f)) {
                ++crossings;
            }
        }
        zcr[f] = static_cast<float>(crossings) / window_size;
    }
    return zcr;
}

std::vector<std::vector<float>> FeatureExtractor::compute_chroma(const Spectrogram& spec) {
    std::vector<std::vector<float>> chroma(kChromaBins, std::vector<float>(spec.n_frames, 0.0f));

    // Frequency bins to pitch class mapping
    std::vector<int> bin_to_pitch(spec.n_bins, -1);
    for (int bin = 1; bin < spec.n_bins; ++bin) {
        float freq = spec.bin_frequency(bin);
        if (freq > kChromaMinHz && freq < kChromaMaxHz) {
            float midi_note = 12.0f * std::log2(freq / kA4Freq) + kA4Midi;
            int pitch_class = static_cast<int>(std::round(midi_note)) % 12;
            if (pitch_class < 0) pitch_class += 12;
            bin_to_pitch[bin] = pitch_class;
        }
    }

    std::vector<float> acc(kChromaBins);
    for (int f = 0; f < spec.n_frames; ++f) {
        std::fill(acc.begin(), acc.end(), 0.0f);
        const float* mag = spec.frame(f);
        for (int bin = 0; bin < spec.n_bins; ++bin) {
            int pitch_class = bin_to_pitch[bin];
            if (pitch_class >= 0) {
                acc[pitch_class] += mag[bin] * mag[bin];
            }
        }

        float peak = *std::max_element(acc.begin(), acc.end());
        if (peak <= 0.0f) continue;
        for (int p = 0; p < kChromaBins; ++p) {
            chroma[p][f] = acc[p] / peak;
        }
    }
    return chroma;
}

std::vector<std::vector<float>> FeatureExtractor::compute_tonnetz(
    const std::vector<std::vector<float>>& chroma) {
    const size_t n_frames = chroma.empty() ? 0 : chroma[0].size();
    std::vector<std::vector<float>> tonnetz(kTonnetzDims, std::vector<float>(n_frames, 0.0f));
    if (chroma.size() != static_cast<size_t>(kChromaBins)) {
        return tonnetz;
    }

    // Fifths, minor thirds, major thirds; (sin, cos) pairs
    static const float kIntervals[3] = {7.0f / 6.0f, 3.0f / 2.0f, 2.0f / 3.0f};
    static const float kRadii[3] = {1.0f, 1.0f, 0.5f};

    float basis[kTonnetzDims][kChromaBins];
    for (int d = 0; d < 3; ++d) {
        for (int p = 0; p < kChromaBins; ++p) {
            float angle = static_cast<float>(M_PI) * kIntervals[d] * p;
            basis[2 * d][p] = kRadii[d] * std::sin(angle);
            basis[2 * d + 1][p] = kRadii[d] * std::cos(angle);
        }
    }

    for (size_t f = 0; f < n_frames; ++f) {
        float total = 0.0f;
        for (int p = 0; p < kChromaBins; ++p) total += std::abs(chroma[p][f]);
        if (total <= 0.0f) continue;

        for (int d = 0; d < kTonnetzDims; ++d) {
            float acc = 0.0f;
            for (int p = 0; p < kChromaBins; ++p) {
                acc += basis[d][p] * (chroma[p][f] / total);
            }
            tonnetz[d][f] = acc;
        }
    }
    return tonnetz;
}

GlobalFeatures FeatureExtractor::summarize(const FrameFeatures& frames, float tempo,
                                           float duration, int sample_rate) {
    GlobalFeatures global;
    global.tempo = utils::finite_or(tempo, 0.0f);
    global.duration = duration;
    global.sample_rate = sample_rate;
    global.mean_spectral_centroid = static_cast<float>(utils::mean(frames.spectral_centroids));
    global.mean_spectral_rolloff = static_cast<float>(utils::mean(frames.spectral_rolloff));
    global.mean_spectral_bandwidth = static_cast<float>(utils::mean(frames.spectral_bandwidth));
    global.mean_zcr = static_cast<float>(utils::mean(frames.zcr));
    global.mean_rms = static_cast<float>(utils::mean(frames.rms));
    global.chroma_mean = row_means(frames.chroma);
    global.tonnetz_mean = row_means(frames.tonnetz);
    global.num_beats = static_cast<int>(frames.beats.size());
    global.num_onsets = static_cast<int>(frames.onset_times.size());

    global.chroma_mean.resize(kChromaBins, 0.0f);
    global.tonnetz_mean.resize(kTonnetzDims, 0.0f);
    utils::sanitize(global.chroma_mean);
    utils::sanitize(global.tonnetz_mean);
    return global;
}

} // namespace tracksense
