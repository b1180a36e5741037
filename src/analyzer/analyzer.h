/**
 * TrackSense - Analysis Pipeline
 */

#ifndef TRACKSENSE_ANALYZER_H
#define TRACKSENSE_ANALYZER_H

#include "tracksense/types.h"
#include <string>
#include <memory>

namespace tracksense {

/**
 * Runs energy profile, boundary detection, segmentation, feature extraction,
 * visualization and compilation over one waveform.
 *
 * Feature extraction runs on a worker thread while boundaries are detected.
 * The instance holds no per-run state; concurrent analyze() calls on
 * separate waveforms are safe.
 */
class Analyzer {
public:
    explicit Analyzer(std::string engine_version = kEngineVersion);
    ~Analyzer();

    // Non-copyable
    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    /**
     * Full pipeline. Progress is reported at 30 (segmentation), 50 (features),
     * 70 (visualization) and 90 (compile) from the calling thread.
     */
    Result<AnalysisResult> analyze(const AudioBuffer& audio,
                                   const AnalysisParameters& params,
                                   const ProgressCallback& progress = nullptr) const;

    /**
     * Individual stages.
     */
    Result<EnergyProfile> build_energy_profile(const AudioBuffer& audio,
                                               const AnalysisParameters& params) const;
    Result<BoundaryDetection> detect_boundaries(const EnergyProfile& profile,
                                                const AudioBuffer& audio,
                                                const AnalysisParameters& params) const;
    std::vector<Segment> assemble_segments(const BoundaryDetection& detection) const;
    Result<FeatureBundle> extract_features(const AudioBuffer& audio,
                                           const AnalysisParameters& params) const;
    Result<VisualizationTrace> build_visualization(const FeatureBundle& features,
                                                   const AudioBuffer& audio) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracksense

#endif // TRACKSENSE_ANALYZER_H
