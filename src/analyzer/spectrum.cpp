/**
 * TrackSense - Framing, STFT and Mel Utilities Implementation
 *
 * FFTs go through FFTW3 (single precision).
 */

#include "spectrum.h"
#include <fftw3.h>
#include <cmath>
#include <cstring>
#include <algorithm>
#include <limits>
#include <mutex>
#include <new>
#include <stdexcept>

namespace tracksense {

namespace {
    // FFTW's planner is not thread-safe; execution of distinct plans is.
    std::mutex& planner_mutex() {
        static std::mutex mutex;
        return mutex;
    }
}

int frame_count(size_t n_samples, int window_size, int hop_length) {
    if (window_size <= 0 || hop_length <= 0) return 0;
    if (n_samples < static_cast<size_t>(window_size)) return 1;
    return static_cast<int>((n_samples - window_size) / hop_length) + 1;
}

void copy_frame(const std::vector<float>& samples, int index,
                int window_size, int hop_length, float* out) {
    size_t start = static_cast<size_t>(index) * hop_length;
    size_t available = start < samples.size() ? samples.size() - start : 0;
    size_t count = std::min(available, static_cast<size_t>(window_size));
    if (count > 0) {
        std::memcpy(out, samples.data() + start, count * sizeof(float));
    }
    if (count < static_cast<size_t>(window_size)) {
        std::fill(out + count, out + window_size, 0.0f);
    }
}

/* ============================================================================
 * Stft
 * ============================================================================ */

class Stft::Impl {
public:
    explicit Impl(int n_fft) : n_fft_(n_fft), window_(n_fft) {
        if (n_fft <= 0) {
            throw std::invalid_argument("FFT size must be positive");
        }

        // Periodic Hann
        for (int i = 0; i < n_fft; ++i) {
            window_[i] = 0.5f - 0.5f * std::cos(2.0f * static_cast<float>(M_PI) * i / n_fft);
        }

        std::lock_guard<std::mutex> lock(planner_mutex());
        in_ = static_cast<float*>(fftwf_malloc(sizeof(float) * n_fft));
        out_ = static_cast<fftwf_complex*>(fftwf_malloc(sizeof(fftwf_complex) * (n_fft / 2 + 1)));
        if (!in_ || !out_) {
            release();
            throw std::bad_alloc();
        }
        plan_ = fftwf_plan_dft_r2c_1d(n_fft, in_, out_, FFTW_ESTIMATE);
        if (!plan_) {
            release();
            throw std::runtime_error("Failed to create FFT plan");
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(planner_mutex());
        release();
    }

    Spectrogram compute(const AudioBuffer& audio, int hop_length) {
        Spectrogram spec;
        spec.n_fft = n_fft_;
        spec.n_bins = n_fft_ / 2 + 1;
        spec.sample_rate = audio.sample_rate;
        spec.n_frames = frame_count(audio.samples.size(), n_fft_, hop_length);
        spec.magnitude.resize(static_cast<size_t>(spec.n_frames) * spec.n_bins);

        for (int f = 0; f < spec.n_frames; ++f) {
            copy_frame(audio.samples, f, n_fft_, hop_length, in_);
            for (int i = 0; i < n_fft_; ++i) {
                in_[i] *= window_[i];
            }

            fftwf_execute(plan_);

            float* row = spec.magnitude.data() + static_cast<size_t>(f) * spec.n_bins;
            for (int k = 0; k < spec.n_bins; ++k) {
                row[k] = std::sqrt(out_[k][0] * out_[k][0] + out_[k][1] * out_[k][1]);
            }
        }

        return spec;
    }

private:
    void release() {
        if (plan_) fftwf_destroy_plan(plan_);
        if (in_) fftwf_free(in_);
        if (out_) fftwf_free(out_);
        plan_ = nullptr;
        in_ = nullptr;
        out_ = nullptr;
    }

    int n_fft_;
    std::vector<float> window_;
    float* in_ = nullptr;
    fftwf_complex* out_ = nullptr;
    fftwf_plan plan_ = nullptr;
};

Stft::Stft(int n_fft) : impl_(std::make_unique<Impl>(n_fft)), n_fft_(n_fft) {}
Stft::~Stft() = default;

Spectrogram Stft::compute(const AudioBuffer& audio, int hop_length) {
    return impl_->compute(audio, hop_length);
}

/* ============================================================================
 * Mel filterbank
 * ============================================================================ */

namespace {
    constexpr double kMelLinearStep = 200.0 / 3.0;
    constexpr double kMinLogHz = 1000.0;
    constexpr double kMinLogMel = kMinLogHz / kMelLinearStep;
    const double kLogStep = std::log(6.4) / 27.0;
}

double MelFilterbank::hz_to_mel(double hz) {
    if (hz < kMinLogHz) return hz / kMelLinearStep;
    return kMinLogMel + std::log(hz / kMinLogHz) / kLogStep;
}

double MelFilterbank::mel_to_hz(double mel) {
    if (mel < kMinLogMel) return mel * kMelLinearStep;
    return kMinLogHz * std::exp(kLogStep * (mel - kMinLogMel));
}

MelFilterbank::MelFilterbank(int sample_rate, int n_fft, int n_mels)
    : n_mels_(n_mels), n_bins_(n_fft / 2 + 1) {
    weights_.assign(static_cast<size_t>(n_mels_) * n_bins_, 0.0f);

    double mel_min = hz_to_mel(0.0);
    double mel_max = hz_to_mel(sample_rate / 2.0);
    std::vector<double> edges(n_mels_ + 2);
    for (int i = 0; i < n_mels_ + 2; ++i) {
        double mel = mel_min + (mel_max - mel_min) * i / (n_mels_ + 1);
        edges[i] = mel_to_hz(mel);
    }

    for (int m = 0; m < n_mels_; ++m) {
        double left = edges[m];
        double center = edges[m + 1];
        double right = edges[m + 2];
        double enorm = 2.0 / (right - left);

        for (int k = 0; k < n_bins_; ++k) {
            double freq = static_cast<double>(k) * sample_rate / n_fft;
            double lower = (freq - left) / (center - left);
            double upper = (right - freq) / (right - center);
            double w = std::max(0.0, std::min(lower, upper));
            weights_[static_cast<size_t>(m) * n_bins_ + k] = static_cast<float>(w * enorm);
        }
    }
}

std::vector<float> MelFilterbank::apply(const Spectrogram& spec) const {
    std::vector<float> mel(static_cast<size_t>(spec.n_frames) * n_mels_, 0.0f);
    int bins = std::min(n_bins_, spec.n_bins);

    for (int f = 0; f < spec.n_frames; ++f) {
        const float* mag = spec.frame(f);
        for (int m = 0; m < n_mels_; ++m) {
            const float* w = weights_.data() + static_cast<size_t>(m) * n_bins_;
            double acc = 0.0;
            for (int k = 0; k < bins; ++k) {
                if (w[k] != 0.0f) acc += w[k] * mag[k] * mag[k];
            }
            mel[static_cast<size_t>(f) * n_mels_ + m] = static_cast<float>(acc);
        }
    }
    return mel;
}

void power_to_db(std::vector<float>& values, float amin, float top_db) {
    if (values.empty()) return;
    float max_db = -std::numeric_limits<float>::infinity();
    for (float& v : values) {
        v = 10.0f * std::log10(std::max(v, amin));
        max_db = std::max(max_db, v);
    }
    if (top_db > 0.0f) {
        float floor_db = max_db - top_db;
        for (float& v : values) v = std::max(v, floor_db);
    }
}

std::vector<float> dct_ortho(const float* in, int n, int n_out) {
    std::vector<float> out(n_out, 0.0f);
    if (n <= 0) return out;
    const double scale0 = std::sqrt(1.0 / n);
    const double scale = std::sqrt(2.0 / n);
    for (int k = 0; k < n_out; ++k) {
        double acc = 0.0;
        for (int i = 0; i < n; ++i) {
            acc += in[i] * std::cos(M_PI * k * (2.0 * i + 1.0) / (2.0 * n));
        }
        out[k] = static_cast<float>(acc * (k == 0 ? scale0 : scale));
    }
    return out;
}

} // namespace tracksense
