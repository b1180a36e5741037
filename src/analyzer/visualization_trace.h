/**
 * TrackSense - Visualization Trace Builder
 */

#ifndef TRACKSENSE_VISUALIZATION_TRACE_H
#define TRACKSENSE_VISUALIZATION_TRACE_H

#include "tracksense/types.h"

namespace tracksense {

/**
 * Renderer-facing projection of the per-frame features: times, centroid,
 * rolloff, MFCCs and RMS, all frame-aligned.
 */
class VisualizationTraceBuilder {
public:
    VisualizationTraceBuilder() = default;

    Result<VisualizationTrace> build(const FeatureBundle& features, int sample_rate,
                                     float duration) const;

    /**
     * times[i] = i * hop_length / sample_rate
     */
    static std::vector<float> frame_times(size_t n_frames, int sample_rate, int hop_length);
};

} // namespace tracksense

#endif // TRACKSENSE_VISUALIZATION_TRACE_H
