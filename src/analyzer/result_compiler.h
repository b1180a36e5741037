/**
 * TrackSense - Analysis Result Compiler
 */

#ifndef TRACKSENSE_RESULT_COMPILER_H
#define TRACKSENSE_RESULT_COMPILER_H

#include "tracksense/types.h"
#include <chrono>

namespace tracksense {

/**
 * Everything the upstream stages produced for one run.
 */
struct PipelineOutputs {
    std::vector<Segment> segments;
    BoundaryDetection segmentation;
    FeatureBundle features;
    VisualizationTrace visualization;
};

class AnalysisResultCompiler {
public:
    explicit AnalysisResultCompiler(std::string engine_version);

    /**
     * Stamp id, timestamp and elapsed time, and merge the stage outputs.
     * Fails with ErrorKind::Computation if any value is NaN or infinite.
     */
    Result<AnalysisResult> compile(PipelineOutputs outputs,
                                   const AnalysisParameters& params,
                                   std::chrono::system_clock::time_point started_at,
                                   std::chrono::steady_clock::duration elapsed) const;

    /**
     * Name of the first field holding a non-finite value, empty when clean.
     */
    static std::string find_non_finite(const AnalysisResult& result);

private:
    std::string engine_version_;
};

} // namespace tracksense

#endif // TRACKSENSE_RESULT_COMPILER_H
