/**
 * TrackSense - Internal Types
 */

#ifndef TRACKSENSE_TYPES_H
#define TRACKSENSE_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <functional>
#include <cstdint>

namespace tracksense {

inline constexpr char kEngineVersion[] = "1.0.0";

/* ============================================================================
 * Result Type
 * ============================================================================ */

enum class ErrorKind {
    Input,          // Bad file or parameters; fix and retry
    Computation,    // A numeric stage failed unexpectedly
    Storage         // Sink / database failure
};

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    ErrorKind kind = ErrorKind::Input;
    std::string stage;
    std::string message;

    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
    ResultError(ErrorKind k, std::string s, std::string m)
        : kind(k), stage(std::move(s)), message(std::move(m)) {}

    std::string describe() const {
        return stage.empty() ? message : "[" + stage + "] " + message;
    }
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const ResultError& failure() const { return std::get<ResultError>(data_); }
    const std::string& error() const { return failure().message; }
    ErrorKind error_kind() const { return failure().kind; }

    T value_or(T default_value) const {
        return ok() ? value() : default_value;
    }

private:
    std::variant<T, ResultError> data_;
};

// Result carrying no value
struct Unit {};
using Status = Result<Unit>;

inline ResultError input_error(std::string message) {
    return ResultError{ErrorKind::Input, "input", std::move(message)};
}

/* ============================================================================
 * Audio Types
 * ============================================================================ */

/**
 * Mono waveform as handed over by the audio loader.
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = 22050;

    size_t frame_count() const { return samples.size(); }

    float duration_seconds() const {
        return sample_rate > 0 ? static_cast<float>(samples.size()) / sample_rate : 0.0f;
    }
};

/* ============================================================================
 * Run Configuration
 * ============================================================================ */

struct AnalysisParameters {
    int min_peaks = 2;
    std::optional<int> max_peaks;       // nullopt = 3 * min_peaks
    int window_size = 1024;             // Samples per analysis frame
    int hop_length = 512;               // Samples between frames
    float min_gap_seconds = 2.0f;       // Minimum spacing between boundaries
    float short_ma_sec = 0.50f;         // Short energy trend window
    float long_ma_sec = 3.00f;          // Long energy trend window
    bool include_boundaries = true;     // Anchor first/last boundary to track edges
    std::string analysis_type = "comprehensive";

    /**
     * Check every field. Failures are ErrorKind::Input.
     */
    Status validate() const;

    int resolved_max_peaks() const {
        return max_peaks ? *max_peaks : min_peaks * 3;
    }
};

/* ============================================================================
 * Energy / Segmentation
 * ============================================================================ */

struct EnergyProfile {
    std::vector<float> times;           // Frame start times in seconds
    std::vector<float> rms;             // Linear RMS per frame
    std::vector<float> rms_db;          // dB relative to track peak
    std::vector<float> smoothed_db;     // Gaussian-smoothed rms_db
    int sample_rate = 0;
    int hop_length = 0;

    size_t size() const { return rms_db.size(); }
    float last_time() const { return times.empty() ? 0.0f : times.back(); }
};

struct BoundaryCandidate {
    float time = 0.0f;
    float prominence = 0.0f;
};

struct BoundaryDetection {
    std::vector<float> boundaries;      // Strictly increasing, seconds
    std::vector<BoundaryCandidate> peaks;
    float tempo = 0.0f;
    float threshold = 0.0f;
    int max_peaks = 0;
};

struct Segment {
    double start_time = 0.0;
    double end_time = 0.0;
    double duration = 0.0;
    int segment_index = 0;
};

/* ============================================================================
 * Features
 * ============================================================================ */

struct GlobalFeatures {
    float tempo = 0.0f;
    float duration = 0.0f;
    int sample_rate = 0;
    float mean_spectral_centroid = 0.0f;
    float mean_spectral_rolloff = 0.0f;
    float mean_spectral_bandwidth = 0.0f;
    float mean_zcr = 0.0f;
    float mean_rms = 0.0f;
    std::vector<float> chroma_mean;     // 12 pitch classes
    std::vector<float> tonnetz_mean;    // 6 tonal centroid dims
    int num_beats = 0;
    int num_onsets = 0;
};

/**
 * Frame-aligned descriptor arrays. Every per-frame array has frame_count() entries;
 * matrices are stored coefficient-major (mfccs[c][frame]).
 */
struct FrameFeatures {
    std::vector<float> spectral_centroids;
    std::vector<float> spectral_rolloff;
    std::vector<float> spectral_bandwidth;
    std::vector<std::vector<float>> mfccs;      // 13 x n_frames
    std::vector<float> zcr;
    std::vector<float> rms;
    std::vector<std::vector<float>> chroma;     // 12 x n_frames
    std::vector<std::vector<float>> tonnetz;    // 6 x n_frames
    std::vector<int> beats;                     // Frame indices
    std::vector<float> onset_times;             // Seconds

    size_t frame_count() const { return rms.size(); }
};

struct FeatureBundle {
    GlobalFeatures global_features;
    FrameFeatures segment_features;
    int window_size = 0;
    int hop_length = 0;
    int n_mfcc = 13;
    int n_mels = 40;
};

struct VisualizationTrace {
    std::vector<float> times;
    std::vector<float> spectral_centroids;
    std::vector<float> spectral_rolloff;
    std::vector<std::vector<float>> mfccs;
    std::vector<float> rms;
    float duration = 0.0f;
    int sample_rate = 0;
    int hop_length = 0;
};

/* ============================================================================
 * Analysis Result
 * ============================================================================ */

struct AnalysisMetadata {
    std::string engine_version;
    double duration_seconds = 0.0;      // Wall clock time of the run
    std::string status = "completed";
};

struct AnalysisResult {
    std::string analysis_id;            // UUID v4
    std::string timestamp;              // ISO-8601 UTC
    std::string analysis_type;
    std::vector<Segment> segments;
    BoundaryDetection segmentation;
    FeatureBundle features;
    VisualizationTrace visualization_data;
    AnalysisParameters parameters;
    AnalysisMetadata metadata;
};

/* ============================================================================
 * Progress
 * ============================================================================ */

/**
 * Progress callback, invoked from the calling thread at 10/30/50/70/90/100.
 */
using ProgressCallback = std::function<void(float percent, const std::string& stage)>;

} // namespace tracksense

#endif // TRACKSENSE_TYPES_H
