/**
 * TrackSense - Visualization Trace Builder Implementation
 */

#include "visualization_trace.h"
#include "../core/log.h"

namespace tracksense {

Result<VisualizationTrace> VisualizationTraceBuilder::build(const FeatureBundle& features,
                                                            int sample_rate,
                                                            float duration) const {
    const FrameFeatures& frames = features.segment_features;
    const size_t n = frames.frame_count();

    if (sample_rate <= 0 || features.hop_length <= 0) {
        return input_error("Invalid sample rate or hop length for visualization");
    }
    if (frames.spectral_centroids.size() != n || frames.spectral_rolloff.size() != n) {
        return ResultError{ErrorKind::Computation, "visualization",
            "Spectral descriptors are not frame-aligned"};
    }
    for (const auto& row : frames.mfccs) {
        if (row.size() != n) {
            return ResultError{ErrorKind::Computation, "visualization",
                "MFCC rows are not frame-aligned"};
        }
    }

    VisualizationTrace trace;
    trace.times = frame_times(n, sample_rate, features.hop_length);
    trace.spectral_centroids = frames.spectral_centroids;
    trace.spectral_rolloff = frames.spectral_rolloff;
    trace.mfccs = frames.mfccs;
    trace.rms = frames.rms;
    trace.duration = duration;
    trace.sample_rate = sample_rate;
    trace.hop_length = features.hop_length;

    TRACKSENSE_LOG_DEBUG("Visualization", n << " frames, " << trace.mfccs.size() << " MFCC rows");
    return trace;
}

std::vector<float> VisualizationTraceBuilder::frame_times(size_t n_frames, int sample_rate,
                                                          int hop_length) {
    std::vector<float> times(n_frames);
    for (size_t i = 0; i < n_frames; ++i) {
        times[i] = static_cast<float>(i) * hop_length / sample_rate;
    }
    return times;
}

} // namespace tracksense
