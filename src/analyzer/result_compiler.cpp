/**
 * TrackSense - Analysis Result Compiler Implementation
 */

#include "result_compiler.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <cmath>

namespace tracksense {

namespace {
    bool finite_rows(const std::vector<std::vector<float>>& rows) {
        for (const auto& row : rows) {
            if (!utils::all_finite(row)) return false;
        }
        return true;
    }
}

AnalysisResultCompiler::AnalysisResultCompiler(std::string engine_version)
    : engine_version_(std::move(engine_version)) {}

Result<AnalysisResult> AnalysisResultCompiler::compile(
    PipelineOutputs outputs,
    const AnalysisParameters& params,
    std::chrono::system_clock::time_point started_at,
    std::chrono::steady_clock::duration elapsed) const {

    AnalysisResult result;
    result.analysis_id = utils::generate_uuid();
    result.timestamp = utils::iso8601_utc(started_at);
    result.analysis_type = params.analysis_type;
    result.segments = std::move(outputs.segments);
    result.segmentation = std::move(outputs.segmentation);
    result.features = std::move(outputs.features);
    result.visualization_data = std::move(outputs.visualization);
    result.parameters = params;

    result.metadata.engine_version = engine_version_;
    result.metadata.duration_seconds = std::chrono::duration<double>(elapsed).count();
    result.metadata.status = "completed";

    std::string bad_field = find_non_finite(result);
    if (!bad_field.empty()) {
        TRACKSENSE_LOG_ERROR("Compile", "non-finite value in " << bad_field);
        return ResultError{ErrorKind::Computation, "compile",
            "Non-finite value in " + bad_field};
    }

    return result;
}

std::string AnalysisResultCompiler::find_non_finite(const AnalysisResult& result) {
    for (const auto& seg : result.segments) {
        if (!std::isfinite(seg.start_time) || !std::isfinite(seg.end_time)
            || !std::isfinite(seg.duration)) {
            return "segments";
        }
    }

    const auto& seg = result.segmentation;
    if (!utils::all_finite(seg.boundaries)) return "segmentation.boundaries";
    if (!std::isfinite(seg.tempo)) return "segmentation.tempo";
    if (!std::isfinite(seg.threshold)) return "segmentation.threshold";

    const auto& global = result.features.global_features;
    const float scalars[] = {
        global.tempo, global.duration, global.mean_spectral_centroid,
        global.mean_spectral_rolloff, global.mean_spectral_bandwidth,
        global.mean_zcr, global.mean_rms
    };
    for (float v : scalars) {
        if (!std::isfinite(v)) return "features.global_features";
    }
    if (!utils::all_finite(global.chroma_mean)) return "features.global_features.chroma_mean";
    if (!utils::all_finite(global.tonnetz_mean)) return "features.global_features.tonnetz_mean";

    const auto& frames = result.features.segment_features;
    if (!utils::all_finite(frames.spectral_centroids)) return "features.segment_features.spectral_centroids";
    if (!utils::all_finite(frames.spectral_rolloff)) return "features.segment_features.spectral_rolloff";
    if (!utils::all_finite(frames.spectral_bandwidth)) return "features.segment_features.spectral_bandwidth";
    if (!utils::all_finite(frames.zcr)) return "features.segment_features.zcr";
    if (!utils::all_finite(frames.rms)) return "features.segment_features.rms";
    if (!utils::all_finite(frames.onset_times)) return "features.segment_features.onset_times";
    if (!finite_rows(frames.mfccs)) return "features.segment_features.mfccs";
    if (!finite_rows(frames.chroma)) return "features.segment_features.chroma";
    if (!finite_rows(frames.tonnetz)) return "features.segment_features.tonnetz";

    const auto& vis = result.visualization_data;
    if (!utils::all_finite(vis.times)) return "visualization_data.times";
    if (!utils::all_finite(vis.spectral_centroids)) return "visualization_data.spectral_centroids";
    if (!utils::all_finite(vis.spectral_rolloff)) return "visualization_data.spectral_rolloff";
    if (!utils::all_finite(vis.rms)) return "visualization_data.rms";
    if (!finite_rows(vis.mfccs)) return "visualization_data.mfccs";
    if (!std::isfinite(vis.duration)) return "visualization_data.duration";

    const auto& p = result.parameters;
    if (!std::isfinite(p.min_gap_seconds) || !std::isfinite(p.short_ma_sec)
        || !std::isfinite(p.long_ma_sec)) {
        return "parameters";
    }
    if (!std::isfinite(result.metadata.duration_seconds)) return "metadata.duration_seconds";

    return {};
}

} // namespace tracksense
