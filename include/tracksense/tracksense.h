/**
 * TrackSense - Public C API
 *
 * Offline music segmentation and feature extraction: segment boundaries,
 * spectral/rhythmic/tonal descriptors and a per-frame visualization trace
 * for a whole audio file, returned as a JSON document.
 */

#ifndef TRACKSENSE_H
#define TRACKSENSE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct TrackSenseEngine TrackSenseEngine;

typedef enum {
    TRACKSENSE_OK = 0,
    TRACKSENSE_ERROR_INVALID_ARGUMENT = -1,
    TRACKSENSE_ERROR_FILE_NOT_FOUND = -2,
    TRACKSENSE_ERROR_DECODE_FAILED = -3,
    TRACKSENSE_ERROR_ANALYSIS_FAILED = -4,
    TRACKSENSE_ERROR_DATABASE_ERROR = -5,
    TRACKSENSE_ERROR_IO_FAILED = -6,
    TRACKSENSE_ERROR_OUT_OF_MEMORY = -7,
    TRACKSENSE_ERROR_NOT_FOUND = -8,
} TrackSenseError;

typedef enum {
    TRACKSENSE_LOG_LEVEL_ERROR = 0,
    TRACKSENSE_LOG_LEVEL_WARN = 1,
    TRACKSENSE_LOG_LEVEL_INFO = 2,
    TRACKSENSE_LOG_LEVEL_DEBUG = 3,
} TrackSenseLogLevel;

/* Analysis parameters */
typedef struct {
    int min_peaks;              /* Minimum requested boundary peaks (>= 1) */
    int max_peaks;              /* Peak cap; 0 = 3 * min_peaks */
    int window_size;            /* Samples per analysis frame */
    int hop_length;             /* Samples between frames */
    float min_gap_seconds;      /* Minimum spacing between boundaries */
    float short_ma_sec;         /* Short energy trend window */
    float long_ma_sec;          /* Long energy trend window */
    int include_boundaries;     /* Anchor boundaries to track start/end */
} TrackSenseParams;

/* Progress callback: percent is one of 10, 30, 50, 70, 90, 100 */
typedef void (*TrackSenseProgressCallback)(
    float percent,
    const char* stage,
    void* user_data
);

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new engine instance.
 *
 * @param db_path Path to SQLite database file (created if missing, ":memory:" allowed)
 * @return Engine instance, or NULL on failure
 */
TrackSenseEngine* tracksense_create(const char* db_path);

/**
 * Destroy an engine instance and free all resources.
 */
void tracksense_destroy(TrackSenseEngine* engine);

/**
 * Get the last error message.
 */
const char* tracksense_get_error(TrackSenseEngine* engine);

/**
 * Library version string.
 */
const char* tracksense_version(void);

/**
 * Set the process-wide log level.
 */
void tracksense_set_log_level(TrackSenseLogLevel level);

/* ============================================================================
 * Parameters
 * ============================================================================ */

/**
 * Default parameters.
 */
TrackSenseParams tracksense_default_params(void);

/**
 * Parse parameters from a JSON object; missing keys keep their defaults.
 */
TrackSenseError tracksense_params_from_json(const char* json, TrackSenseParams* out_params);

/* ============================================================================
 * Analysis
 * ============================================================================ */

/**
 * Decode and analyze an audio file.
 *
 * @param engine Engine instance
 * @param path Audio file path
 * @param params Parameters, or NULL for defaults
 * @param track_ref Key under which the result is stored (NULL = path)
 * @param output_path Also write the JSON document here (NULL = don't)
 * @param callback Optional progress callback
 * @param user_data Passed to callback
 * @param out_json Receives the result document (free with tracksense_free_string); may be NULL
 * @return TRACKSENSE_OK or error code
 */
TrackSenseError tracksense_analyze_file(
    TrackSenseEngine* engine,
    const char* path,
    const TrackSenseParams* params,
    const char* track_ref,
    const char* output_path,
    TrackSenseProgressCallback callback,
    void* user_data,
    char** out_json
);

/**
 * Analyze a mono float waveform.
 *
 * @param track_ref Key under which the result is stored (NULL = not stored)
 */
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
);

/* ============================================================================
 * Stored Results
 * ============================================================================ */

/**
 * Number of stored analyses.
 */
int tracksense_get_analysis_count(TrackSenseEngine* engine);

/**
 * Fetch a stored result document by analysis id.
 */
TrackSenseError tracksense_get_analysis(
    TrackSenseEngine* engine,
    const char* analysis_id,
    char** out_json
);

/**
 * Fetch the most recent result document for a track reference.
 */
TrackSenseError tracksense_get_latest_analysis(
    TrackSenseEngine* engine,
    const char* track_ref,
    char** out_json
);

/**
 * Delete a stored analysis.
 */
TrackSenseError tracksense_delete_analysis(TrackSenseEngine* engine, const char* analysis_id);

/**
 * Free a string returned by the library.
 */
void tracksense_free_string(char* str);

#ifdef __cplusplus
}
#endif

#endif /* TRACKSENSE_H */
