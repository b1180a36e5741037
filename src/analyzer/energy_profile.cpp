/**
 * TrackSense - Energy Profile Builder Implementation
 */

#include "energy_profile.h"
#include "spectrum.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>
#include <limits>

namespace tracksense {

Result<EnergyProfile> EnergyProfileBuilder::build(const AudioBuffer& audio,
                                                  int window_size,
                                                  int hop_length) const {
    if (audio.samples.empty()) {
        return input_error("Empty audio buffer");
    }
    if (audio.sample_rate <= 0 || window_size <= 0 || hop_length <= 0) {
        return input_error("Invalid framing parameters");
    }

    EnergyProfile profile;
    profile.sample_rate = audio.sample_rate;
    profile.hop_length = hop_length;

    profile.rms = frame_rms(audio.samples, window_size, hop_length);
    profile.rms_db = amplitude_to_db(profile.rms);
    profile.smoothed_db = utils::gaussian_filter1d(profile.rms_db, kSmoothingSigma);

    profile.times.resize(profile.rms.size());
    for (size_t i = 0; i < profile.times.size(); ++i) {
        profile.times[i] = static_cast<float>(i) * hop_length / audio.sample_rate;
    }

    TRACKSENSE_LOG_DEBUG("Energy", profile.size() << " frames, window=" << window_size
        << " hop=" << hop_length);
    return profile;
}

std::vector<float> EnergyProfileBuilder::frame_rms(const std::vector<float>& samples,
                                                   int window_size, int hop_length) {
    int n_frames = frame_count(samples.size(), window_size, hop_length);
    std::vector<float> rms(n_frames, 0.0f);
    std::vector<float> frame(window_size);

    for (int f = 0; f < n_frames; ++f) {
        copy_frame(samples, f, window_size, hop_length, frame.data());
        rms[f] = compute_rms(frame.data(), frame.size());
    }
    return rms;
}

float EnergyProfileBuilder::compute_rms(const float* samples, size_t count) {
    if (count == 0 || !samples) {
        return 0.0f;
    }

    double sum_sq = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum_sq += static_cast<double>(samples[i]) * samples[i];
    }

    return static_cast<float>(std::sqrt(sum_sq / count));
}

std::vector<float> EnergyProfileBuilder::amplitude_to_db(const std::vector<float>& rms) {
    std::vector<float> db(rms.size(), 0.0f);
    if (rms.empty()) return db;

    float max_rms = *std::max_element(rms.begin(), rms.end());
    double ref_db = 20.0 * std::log10(std::max(max_rms, kAmplitudeFloor));

    float max_db = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < rms.size(); ++i) {
        db[i] = static_cast<float>(20.0 * std::log10(std::max(rms[i], kAmplitudeFloor)) - ref_db);
        if (std::isfinite(db[i])) max_db = std::max(max_db, db[i]);
    }

    float min_finite = std::numeric_limits<float>::infinity();
    for (float& v : db) {
        if (std::isfinite(v)) {
            v = std::max(v, max_db - kTopDb);
            min_finite = std::min(min_finite, v);
        }
    }

    utils::sanitize(db, std::isfinite(min_finite) ? min_finite : 0.0f);
    return db;
}

} // namespace tracksense
