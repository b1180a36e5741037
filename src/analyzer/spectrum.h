/**
 * TrackSense - Framing, STFT and Mel Utilities
 */

#ifndef TRACKSENSE_SPECTRUM_H
#define TRACKSENSE_SPECTRUM_H

#include "tracksense/types.h"
#include <memory>
#include <vector>

namespace tracksense {

/**
 * Number of analysis frames for a signal.
 * floor((n - window) / hop) + 1 when n >= window, otherwise one zero-padded frame.
 * Every frame-aligned array in the engine uses this count.
 */
int frame_count(size_t n_samples, int window_size, int hop_length);

/**
 * Copy frame `index` into `out` (window_size floats), zero padding past the end.
 */
void copy_frame(const std::vector<float>& samples, int index,
                int window_size, int hop_length, float* out);

/**
 * Magnitude spectrogram, frame-major.
 */
struct Spectrogram {
    int n_frames = 0;
    int n_bins = 0;
    int n_fft = 0;
    int sample_rate = 0;
    std::vector<float> magnitude;       // n_frames * n_bins

    const float* frame(int i) const { return magnitude.data() + static_cast<size_t>(i) * n_bins; }

    float bin_frequency(int bin) const {
        return static_cast<float>(bin) * sample_rate / n_fft;
    }
};

/**
 * Short-time Fourier transform over a periodic Hann window (FFTW, single precision).
 * One instance is not shareable between threads; separate instances are.
 */
class Stft {
public:
    explicit Stft(int n_fft);
    ~Stft();

    // Non-copyable
    Stft(const Stft&) = delete;
    Stft& operator=(const Stft&) = delete;

    Spectrogram compute(const AudioBuffer& audio, int hop_length);

    int n_fft() const { return n_fft_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    int n_fft_;
};

/**
 * Slaney-style mel filterbank (area normalized), n_mels x (n_fft / 2 + 1).
 */
class MelFilterbank {
public:
    MelFilterbank(int sample_rate, int n_fft, int n_mels);

    int n_mels() const { return n_mels_; }

    /**
     * Mel power spectrogram (frame-major, n_frames * n_mels) from magnitudes.
     */
    std::vector<float> apply(const Spectrogram& spec) const;

    static double hz_to_mel(double hz);
    static double mel_to_hz(double mel);

private:
    int n_mels_;
    int n_bins_;
    std::vector<float> weights_;        // n_mels * n_bins
};

/**
 * 10 * log10(max(x, amin)), then clipped below at max - top_db. In place.
 */
void power_to_db(std::vector<float>& values, float amin = 1e-10f, float top_db = 80.0f);

/**
 * Orthonormal DCT-II of `in` (length n), first n_out coefficients.
 */
std::vector<float> dct_ortho(const float* in, int n, int n_out);

} // namespace tracksense

#endif // TRACKSENSE_SPECTRUM_H
