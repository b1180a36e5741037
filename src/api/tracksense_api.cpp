/**
 * TrackSense - C API Implementation
 */

#include "tracksense/tracksense.h"
#include "../core/log.h"
#include "../core/serialization.h"
#include "../engine/engine.h"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <new>

using namespace tracksense;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct TrackSenseEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
};

namespace {

AnalysisParameters to_cpp(const TrackSenseParams* params) {
    AnalysisParameters cpp;
    if (!params) return cpp;

    cpp.min_peaks = params->min_peaks;
    if (params->max_peaks != 0) {
        cpp.max_peaks = params->max_peaks;
    }
    cpp.window_size = params->window_size;
    cpp.hop_length = params->hop_length;
    cpp.min_gap_seconds = params->min_gap_seconds;
    cpp.short_ma_sec = params->short_ma_sec;
    cpp.long_ma_sec = params->long_ma_sec;
    cpp.include_boundaries = params->include_boundaries != 0;
    return cpp;
}

TrackSenseParams to_c(const AnalysisParameters& cpp) {
    TrackSenseParams params;
    params.min_peaks = cpp.min_peaks;
    params.max_peaks = cpp.max_peaks ? *cpp.max_peaks : 0;
    params.window_size = cpp.window_size;
    params.hop_length = cpp.hop_length;
    params.min_gap_seconds = cpp.min_gap_seconds;
    params.short_ma_sec = cpp.short_ma_sec;
    params.long_ma_sec = cpp.long_ma_sec;
    params.include_boundaries = cpp.include_boundaries ? 1 : 0;
    return params;
}

TrackSenseError error_code(const ResultError& error) {
    switch (error.kind) {
        case ErrorKind::Input:
            return error.stage == "load" ? TRACKSENSE_ERROR_DECODE_FAILED
                                         : TRACKSENSE_ERROR_INVALID_ARGUMENT;
        case ErrorKind::Computation:
            return TRACKSENSE_ERROR_ANALYSIS_FAILED;
        case ErrorKind::Storage:
            return error.stage == "output" ? TRACKSENSE_ERROR_IO_FAILED
                                           : TRACKSENSE_ERROR_DATABASE_ERROR;
    }
    return TRACKSENSE_ERROR_ANALYSIS_FAILED;
}

ProgressCallback bridge(TrackSenseProgressCallback callback, void* user_data) {
    if (!callback) return nullptr;
    return [callback, user_data](float percent, const std::string& stage) {
        callback(percent, stage.c_str(), user_data);
    };
}

TrackSenseError finish(TrackSenseEngine* engine, const Result<AnalysisResult>& result,
                       char** out_json) {
    if (result.failed()) {
        engine->last_error = result.failure().describe();
        return error_code(result.failure());
    }

    if (out_json) {
        *out_json = strdup(to_json_string(result.value()).c_str());
        if (!*out_json) {
            engine->last_error = "Out of memory";
            return TRACKSENSE_ERROR_OUT_OF_MEMORY;
        }
    }
    return TRACKSENSE_OK;
}

TrackSenseError copy_stored(TrackSenseEngine* engine, const std::optional<StoredAnalysis>& stored,
                            char** out_json) {
    if (!stored) {
        engine->last_error = "Analysis not found";
        return TRACKSENSE_ERROR_NOT_FOUND;
    }
    *out_json = strdup(stored->result_json.c_str());
    if (!*out_json) {
        engine->last_error = "Out of memory";
        return TRACKSENSE_ERROR_OUT_OF_MEMORY;
    }
    return TRACKSENSE_OK;
}

} // namespace

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

TrackSenseEngine* tracksense_create(const char* db_path) {
    if (!db_path) return nullptr;

    auto handle = new (std::nothrow) TrackSenseEngine();
    if (!handle) return nullptr;

    try {
        handle->engine = std::make_unique<Engine>(db_path);
    } catch (const std::exception& e) {
        TRACKSENSE_LOG_ERROR("API", "engine creation failed: " << e.what());
        delete handle;
        return nullptr;
    }

    if (!handle->engine->is_valid()) {
        TRACKSENSE_LOG_ERROR("API", handle->engine->error());
        delete handle;
        return nullptr;
    }

    return handle;
}

void tracksense_destroy(TrackSenseEngine* engine) {
    delete engine;
}

const char* tracksense_get_error(TrackSenseEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

const char* tracksense_version(void) {
    return kEngineVersion;
}

void tracksense_set_log_level(TrackSenseLogLevel level) {
    int value = static_cast<int>(level);
    if (value < 0) value = 0;
    if (value > 3) value = 3;
    set_log_level(static_cast<LogLevel>(value));
}

/* ============================================================================
 * Parameters
 * ============================================================================ */

TrackSenseParams tracksense_default_params(void) {
    return to_c(AnalysisParameters{});
}

TrackSenseError tracksense_params_from_json(const char* json, TrackSenseParams* out_params) {
    if (!json || !out_params) return TRACKSENSE_ERROR_INVALID_ARGUMENT;

    auto parsed = parameters_from_string(json);
    if (parsed.failed()) {
        TRACKSENSE_LOG_ERROR("API", parsed.failure().describe());
        return TRACKSENSE_ERROR_INVALID_ARGUMENT;
    }

    *out_params = to_c(parsed.value());
    return TRACKSENSE_OK;
}

/* ============================================================================
 * Analysis
 * ============================================================================ */

TrackSenseError tracksense_analyze_file(
    TrackSenseEngine* engine,
    const char* path,
    const TrackSenseParams* params,
    const char* track_ref,
    const char* output_path,
    TrackSenseProgressCallback callback,
    void* user_data,
    char** out_json
) {
    if (!engine || !engine->engine || !path) return TRACKSENSE_ERROR_INVALID_ARGUMENT;
    if (out_json) *out_json = nullptr;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        engine->last_error = std::string("File not found: ") + path;
        return TRACKSENSE_ERROR_FILE_NOT_FOUND;
    }

    AnalyzeOptions options;
    options.track_ref = track_ref ? track_ref : "";
    options.output_path = output_path ? output_path : "";
    options.progress = bridge(callback, user_data);

    try {
        auto result = engine->engine->analyze_file(path, to_cpp(params), options);
        return finish(engine, result, out_json);
    } catch (const std::bad_alloc&) {
        engine->last_error = "Out of memory";
        return TRACKSENSE_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        engine->last_error = e.what();
        return TRACKSENSE_ERROR_ANALYSIS_FAILED;
    }
}

TrackSenseError tracksense_analyze_samples(
    TrackSenseEngine* engine,
    const float* samples,
    size_t sample_count,
    int sample_rate,
    const TrackSenseParams* params,
    const char* track_ref,
    TrackSenseProgressCallback callback,
    void* user_data,
    char** out_json
) {
    if (!engine || !engine->engine || !samples || sample_count == 0 || sample_rate <= 0) {
        return TRACKSENSE_ERROR_INVALID_ARGUMENT;
    }
    if (out_json) *out_json = nullptr;

    AnalyzeOptions options;
    options.track_ref = track_ref ? track_ref : "";
    options.progress = bridge(callback, user_data);

    try {
        AudioBuffer audio;
        audio.samples.assign(samples, samples + sample_count);
        audio.sample_rate = sample_rate;

        auto result = engine->engine->analyze_samples(audio, to_cpp(params), options);
        return finish(engine, result, out_json);
    } catch (const std::bad_alloc&) {
        engine->last_error = "Out of memory";
        return TRACKSENSE_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        engine->last_error = e.what();
        return TRACKSENSE_ERROR_ANALYSIS_FAILED;
    }
}

/* ============================================================================
 * Stored Results
 * ============================================================================ */

int tracksense_get_analysis_count(TrackSenseEngine* engine) {
    if (!engine || !engine->engine) return 0;
    return engine->engine->analysis_count();
}

TrackSenseError tracksense_get_analysis(
    TrackSenseEngine* engine,
    const char* analysis_id,
    char** out_json
) {
    if (!engine || !engine->engine || !analysis_id || !out_json) {
        return TRACKSENSE_ERROR_INVALID_ARGUMENT;
    }
    *out_json = nullptr;
    return copy_stored(engine, engine->engine->get_analysis(analysis_id), out_json);
}

TrackSenseError tracksense_get_latest_analysis(
    TrackSenseEngine* engine,
    const char* track_ref,
    char** out_json
) {
    if (!engine || !engine->engine || !track_ref || !out_json) {
        return TRACKSENSE_ERROR_INVALID_ARGUMENT;
    }
    *out_json = nullptr;
    return copy_stored(engine, engine->engine->latest_analysis(track_ref), out_json);
}

TrackSenseError tracksense_delete_analysis(TrackSenseEngine* engine, const char* analysis_id) {
    if (!engine || !engine->engine || !analysis_id) return TRACKSENSE_ERROR_INVALID_ARGUMENT;

    if (!engine->engine->delete_analysis(analysis_id)) {
        engine->last_error = "Analysis not found";
        return TRACKSENSE_ERROR_NOT_FOUND;
    }
    return TRACKSENSE_OK;
}

void tracksense_free_string(char* str) {
    free(str);
}
