/**
 * TrackSense - JSON Serialization Implementation
 */

#include "serialization.h"
#include <fstream>

namespace tracksense {

using nlohmann::json;

void to_json(json& j, const AnalysisParameters& params) {
    j = json{
        {"min_peaks", params.min_peaks},
        {"max_peaks", params.max_peaks ? json(*params.max_peaks) : json(nullptr)},
        {"window_size", params.window_size},
        {"hop_length", params.hop_length},
        {"min_gap_seconds", params.min_gap_seconds},
        {"short_ma_sec", params.short_ma_sec},
        {"long_ma_sec", params.long_ma_sec},
        {"include_boundaries", params.include_boundaries},
        {"analysis_type", params.analysis_type}
    };
}

void to_json(json& j, const Segment& segment) {
    j = json{
        {"start_time", segment.start_time},
        {"end_time", segment.end_time},
        {"duration", segment.duration},
        {"segment_index", segment.segment_index}
    };
}

void to_json(json& j, const BoundaryDetection& detection) {
    j = json{
        {"boundaries", detection.boundaries},
        {"tempo", detection.tempo},
        {"threshold", detection.threshold},
        {"total_segments", detection.boundaries.empty() ? 0 : detection.boundaries.size() - 1},
        {"max_peaks", detection.max_peaks}
    };
}

void to_json(json& j, const GlobalFeatures& global) {
    j = json{
        {"tempo", global.tempo},
        {"duration", global.duration},
        {"sample_rate", global.sample_rate},
        {"mean_spectral_centroid", global.mean_spectral_centroid},
        {"mean_spectral_rolloff", global.mean_spectral_rolloff},
        {"mean_spectral_bandwidth", global.mean_spectral_bandwidth},
        {"mean_zcr", global.mean_zcr},
        {"mean_rms", global.mean_rms},
        {"chroma_mean", global.chroma_mean},
        {"tonnetz_mean", global.tonnetz_mean},
        {"num_beats", global.num_beats},
        {"num_onsets", global.num_onsets}
    };
}

void to_json(json& j, const FrameFeatures& frames) {
    j = json{
        {"spectral_centroids", frames.spectral_centroids},
        {"spectral_rolloff", frames.spectral_rolloff},
        {"spectral_bandwidth", frames.spectral_bandwidth},
        {"mfccs", frames.mfccs},
        {"zcr", frames.zcr},
        {"rms", frames.rms},
        {"chroma", frames.chroma},
        {"tonnetz", frames.tonnetz},
        {"beats", frames.beats},
        {"onset_times", frames.onset_times}
    };
}

void to_json(json& j, const FeatureBundle& bundle) {
    j = json{
        {"global_features", bundle.global_features},
        {"segment_features", bundle.segment_features},
        {"extraction_parameters", {
            {"window_size", bundle.window_size},
            {"hop_length", bundle.hop_length},
            {"n_mfcc", bundle.n_mfcc},
            {"n_mels", bundle.n_mels}
        }}
    };
}

void to_json(json& j, const VisualizationTrace& trace) {
    j = json{
        {"times", trace.times},
        {"spectral_centroids", trace.spectral_centroids},
        {"spectral_rolloff", trace.spectral_rolloff},
        {"mfccs", trace.mfccs},
        {"rms", trace.rms},
        {"duration", trace.duration},
        {"sample_rate", trace.sample_rate},
        {"hop_length", trace.hop_length}
    };
}

void to_json(json& j, const AnalysisMetadata& metadata) {
    j = json{
        {"engine_version", metadata.engine_version},
        {"duration_seconds", metadata.duration_seconds},
        {"status", metadata.status}
    };
}

void to_json(json& j, const AnalysisResult& result) {
    j = json{
        {"analysis_id", result.analysis_id},
        {"timestamp", result.timestamp},
        {"analysis_type", result.analysis_type},
        {"segments", result.segments},
        {"segmentation", result.segmentation},
        {"features", result.features},
        {"visualization_data", result.visualization_data},
        {"parameters", result.parameters},
        {"metadata", result.metadata}
    };
}

Result<AnalysisParameters> parameters_from_json(const json& j) {
    if (!j.is_object()) {
        return input_error("Parameters must be a JSON object");
    }

    AnalysisParameters params;
    try {
        if (j.contains("min_peaks")) params.min_peaks = j["min_peaks"].get<int>();
        if (j.contains("max_peaks")) {
            if (j["max_peaks"].is_null()) {
                params.max_peaks.reset();
            } else {
                params.max_peaks = j["max_peaks"].get<int>();
            }
        }
        if (j.contains("window_size")) params.window_size = j["window_size"].get<int>();
        if (j.contains("hop_length")) params.hop_length = j["hop_length"].get<int>();
        if (j.contains("min_gap_seconds")) params.min_gap_seconds = j["min_gap_seconds"].get<float>();
        if (j.contains("short_ma_sec")) params.short_ma_sec = j["short_ma_sec"].get<float>();
        if (j.contains("long_ma_sec")) params.long_ma_sec = j["long_ma_sec"].get<float>();
        if (j.contains("include_boundaries")) params.include_boundaries = j["include_boundaries"].get<bool>();
        if (j.contains("analysis_type")) params.analysis_type = j["analysis_type"].get<std::string>();
    } catch (const json::exception& e) {
        return input_error(std::string("Invalid parameter value: ") + e.what());
    }

    auto valid = params.validate();
    if (valid.failed()) return valid.failure();
    return params;
}

Result<AnalysisParameters> parameters_from_string(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return input_error("Parameters are not valid JSON");
    }
    return parameters_from_json(j);
}

Result<AnalysisParameters> parameters_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return input_error("Cannot open parameter file: " + path);
    }

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return input_error("Parameter file is not valid JSON: " + path);
    }
    return parameters_from_json(j);
}

std::string to_json_string(const AnalysisResult& result, int indent) {
    return json(result).dump(indent);
}

} // namespace tracksense
