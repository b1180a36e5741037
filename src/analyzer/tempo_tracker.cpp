/**
 * TrackSense - Tempo and Beat Tracker Implementation
 */

#include "tempo_tracker.h"
#include "spectrum.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace tracksense {

namespace {
    constexpr float kMinBpm = 30.0f;
    constexpr float kMaxBpm = 300.0f;
    constexpr float kSilentEnvelope = 1e-6f;

    bool has_energy(const std::vector<float>& envelope) {
        double sum = 0.0;
        for (float v : envelope) sum += std::abs(v);
        return sum > kSilentEnvelope;
    }
}

Result<std::vector<float>> TempoTracker::compute_onset_envelope(const AudioBuffer& audio,
                                                                int window_size,
                                                                int hop_length) const {
    if (audio.samples.empty()) {
        return input_error("Empty audio buffer");
    }

    Stft stft(window_size);
    Spectrogram spec = stft.compute(audio, hop_length);

    MelFilterbank mel_bank(audio.sample_rate, window_size, kMelBands);
    std::vector<float> mel = mel_bank.apply(spec);
    power_to_db(mel);

    return onset_strength(mel, spec.n_frames, kMelBands);
}

std::vector<float> TempoTracker::onset_strength(const std::vector<float>& log_mel,
                                                int n_frames, int n_mels) {
    std::vector<float> envelope(n_frames, 0.0f);
    if (n_mels <= 0) return envelope;

    for (int f = 1; f < n_frames; ++f) {
        const float* cur = log_mel.data() + static_cast<size_t>(f) * n_mels;
        const float* prev = cur - n_mels;
        double flux = 0.0;
        for (int m = 0; m < n_mels; ++m) {
            float diff = cur[m] - prev[m];
            if (diff > 0) flux += diff;
        }
        envelope[f] = static_cast<float>(flux / n_mels);
    }

    return envelope;
}

float TempoTracker::estimate_tempo(const std::vector<float>& onset_envelope,
                                   int sample_rate, int hop_length) const {
    if (onset_envelope.size() < 4 || !has_energy(onset_envelope)) {
        return 0.0f;
    }

    const float frame_rate = static_cast<float>(sample_rate) / hop_length;

    // BPM range -> lag in frames
    int min_lag = static_cast<int>(std::floor(frame_rate * 60.0f / kMaxBpm));
    int max_lag = static_cast<int>(std::ceil(frame_rate * 60.0f / kMinBpm));

    max_lag = std::min(max_lag, static_cast<int>(onset_envelope.size()) - 1);
    min_lag = std::max(min_lag, 1);
    if (max_lag < min_lag) {
        return 0.0f;
    }

    // Autocorrelation weighted by a log-normal prior around the start tempo
    float best_score = -1.0f;
    int best_lag = 0;

    for (int lag = min_lag; lag <= max_lag; ++lag) {
        double corr = 0.0;
        size_t count = onset_envelope.size() - lag;

        for (size_t i = 0; i < count; ++i) {
            corr += static_cast<double>(onset_envelope[i]) * onset_envelope[i + lag];
        }
        corr /= count;

        float bpm = frame_rate * 60.0f / lag;
        float octaves = std::log2(bpm / kStartBpm);
        float prior = std::exp(-0.5f * octaves * octaves);
        float score = static_cast<float>(corr) * prior;

        if (score > best_score) {
            best_score = score;
            best_lag = lag;
        }
    }

    if (best_lag == 0 || best_score <= 0.0f) {
        return 0.0f;
    }

    // Convert lag to BPM
    return frame_rate * 60.0f / best_lag;
}

std::vector<int> TempoTracker::track_beats(const std::vector<float>& onset_envelope, float tempo,
                                           int sample_rate, int hop_length) const {
    const int n = static_cast<int>(onset_envelope.size());
    if (n == 0 || tempo <= 0.0f || !has_energy(onset_envelope)) {
        return {};
    }

    const float frame_rate = static_cast<float>(sample_rate) / hop_length;
    const int period = std::max(1, static_cast<int>(std::round(frame_rate * 60.0f / tempo)));

    // Normalize by the sample standard deviation
    double mean = utils::mean(onset_envelope);
    double var = 0.0;
    for (float v : onset_envelope) var += (v - mean) * (v - mean);
    double sd = n > 1 ? std::sqrt(var / (n - 1)) : 0.0;
    std::vector<float> onsets(n);
    for (int i = 0; i < n; ++i) {
        onsets[i] = static_cast<float>(onset_envelope[i] / (sd + 1e-12));
    }

    // Local score: onsets smoothed by a Gaussian one beat period wide
    std::vector<float> localscore(n, 0.0f);
    std::vector<float> kernel(2 * period + 1);
    for (int k = -period; k <= period; ++k) {
        float x = static_cast<float>(k) * 32.0f / period;
        kernel[k + period] = std::exp(-0.5f * x * x);
    }
    for (int i = 0; i < n; ++i) {
        double acc = 0.0;
        for (int k = -period; k <= period; ++k) {
            int j = i - k;
            if (j >= 0 && j < n) acc += kernel[k + period] * onsets[j];
        }
        localscore[i] = static_cast<float>(acc);
    }

    // Candidate predecessors lie between 2 periods and half a period back
    const int window_lo = -2 * period;
    const int window_hi = -static_cast<int>(std::round(period / 2.0f));
    std::vector<float> txwt;
    for (int d = window_lo; d <= window_hi; ++d) {
        float ratio = std::log(static_cast<float>(-d) / period);
        txwt.push_back(-kTightness * ratio * ratio);
    }

    const float max_local = *std::max_element(localscore.begin(), localscore.end());
    std::vector<float> cumscore(n, 0.0f);
    std::vector<int> backlink(n, -1);
    bool first_beat = true;

    for (int i = 0; i < n; ++i) {
        float best = -std::numeric_limits<float>::infinity();
        int best_offset = window_lo;
        for (size_t w = 0; w < txwt.size(); ++w) {
            int offset = window_lo + static_cast<int>(w);
            int idx = i + offset;
            float candidate = txwt[w] + (idx >= 0 ? cumscore[idx] : 0.0f);
            if (candidate > best) {
                best = candidate;
                best_offset = offset;
            }
        }

        cumscore[i] = localscore[i] + best;

        if (first_beat && localscore[i] < 0.01f * max_local) {
            backlink[i] = -1;
        } else {
            backlink[i] = i + best_offset;
            first_beat = false;
        }
    }

    std::vector<int> beats;
    int tail = last_beat(cumscore);
    for (int b = tail; b >= 0; b = backlink[b]) {
        beats.push_back(b);
    }
    std::reverse(beats.begin(), beats.end());

    return trim_beats(localscore, beats);
}

BeatTrack TempoTracker::track(const std::vector<float>& onset_envelope,
                              int sample_rate, int hop_length) const {
    BeatTrack result;
    result.tempo = estimate_tempo(onset_envelope, sample_rate, hop_length);
    result.beat_frames = track_beats(onset_envelope, result.tempo, sample_rate, hop_length);

    TRACKSENSE_LOG_DEBUG("Tempo", "tempo=" << result.tempo << " BPM, beats="
        << result.beat_frames.size());
    return result;
}

std::vector<float> TempoTracker::detect_onsets(const std::vector<float>& onset_envelope,
                                               int sample_rate, int hop_length) const {
    std::vector<float> onset_times;
    if (onset_envelope.empty() || !has_energy(onset_envelope)) {
        return onset_times;
    }

    const auto [min_it, max_it] = std::minmax_element(onset_envelope.begin(), onset_envelope.end());
    const float lo = *min_it;
    const float range = *max_it - lo;
    if (range <= 0.0f) {
        return onset_times;
    }

    std::vector<float> env(onset_envelope.size());
    for (size_t i = 0; i < env.size(); ++i) {
        env[i] = (onset_envelope[i] - lo) / range;
    }

    const float frame_rate = static_cast<float>(sample_rate) / hop_length;
    const int pre_max = static_cast<int>(0.03f * frame_rate);
    const int post_max = 1;
    const int pre_avg = static_cast<int>(0.10f * frame_rate);
    const int post_avg = static_cast<int>(0.10f * frame_rate) + 1;
    const int wait = static_cast<int>(0.03f * frame_rate);
    const float delta = 0.07f;

    const int n = static_cast<int>(env.size());
    int last_onset = -std::numeric_limits<int>::max() / 2;

    for (int i = 0; i < n; ++i) {
        int max_lo = std::max(0, i - pre_max);
        int max_hi = std::min(n, i + post_max);
        float local_max = *std::max_element(env.begin() + max_lo, env.begin() + max_hi);
        if (env[i] != local_max) continue;

        int avg_lo = std::max(0, i - pre_avg);
        int avg_hi = std::min(n, i + post_avg);
        float local_avg = std::accumulate(env.begin() + avg_lo, env.begin() + avg_hi, 0.0f)
                        / (avg_hi - avg_lo);
        if (env[i] < local_avg + delta) continue;

        if (i - last_onset <= wait) continue;

        last_onset = i;
        onset_times.push_back(static_cast<float>(i) / frame_rate);
    }

    return onset_times;
}

int TempoTracker::last_beat(const std::vector<float>& cumscore) {
    const int n = static_cast<int>(cumscore.size());
    std::vector<int> maxima;
    for (int i = 1; i < n; ++i) {
        bool rises = cumscore[i] > cumscore[i - 1];
        bool holds = (i == n - 1) || cumscore[i] >= cumscore[i + 1];
        if (rises && holds) maxima.push_back(i);
    }
    if (maxima.empty()) {
        return n - 1;
    }

    std::vector<float> peak_scores;
    peak_scores.reserve(maxima.size());
    for (int i : maxima) peak_scores.push_back(cumscore[i]);
    float threshold = 0.5f * static_cast<float>(utils::median(peak_scores));

    for (auto it = maxima.rbegin(); it != maxima.rend(); ++it) {
        if (cumscore[*it] >= threshold) return *it;
    }
    return maxima.back();
}

std::vector<int> TempoTracker::trim_beats(const std::vector<float>& localscore,
                                          const std::vector<int>& beats) {
    if (beats.empty()) return beats;

    // Hann(5) smoothing of the local score sampled at the beats
    static const float window[5] = {0.0f, 0.5f, 1.0f, 0.5f, 0.0f};
    const int n = static_cast<int>(beats.size());
    std::vector<float> smooth(n, 0.0f);
    for (int i = 0; i < n; ++i) {
        double acc = 0.0;
        for (int k = -2; k <= 2; ++k) {
            int j = i - k;
            if (j >= 0 && j < n) acc += window[k + 2] * localscore[beats[j]];
        }
        smooth[i] = static_cast<float>(acc);
    }

    double sq = 0.0;
    for (float v : smooth) sq += static_cast<double>(v) * v;
    float threshold = 0.5f * static_cast<float>(std::sqrt(sq / n));

    int first = 0;
    while (first < n && smooth[first] <= threshold) ++first;
    int last = n - 1;
    while (last >= first && smooth[last] <= threshold) --last;

    if (first > last) return {};
    return std::vector<int>(beats.begin() + first, beats.begin() + last + 1);
}

} // namespace tracksense
