/**
 * TrackSense - Result Store
 */

#ifndef TRACKSENSE_STORE_H
#define TRACKSENSE_STORE_H

#include "tracksense/types.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace tracksense {

/**
 * Destination for compiled results, keyed by a caller-supplied track reference.
 */
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual Status save(const std::string& track_ref, const AnalysisResult& result) = 0;
};

/**
 * One persisted analysis run.
 */
struct StoredAnalysis {
    std::string analysis_id;
    std::string track_ref;
    std::string timestamp;
    std::string analysis_type;
    std::string status;
    int64_t created_at = 0;             // Unix timestamp
    double duration_seconds = 0.0;
    float tempo = 0.0f;
    int segment_count = 0;
    std::vector<float> boundaries;
    std::string result_json;            // Full document
};

/**
 * SQLite-based storage for analysis results.
 */
class Store : public ResultSink {
public:
    explicit Store(const std::string& db_path);
    ~Store() override;

    // Non-copyable
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Move constructible
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /**
     * Insert a result. Re-saving an existing analysis_id replaces it.
     */
    Status save(const std::string& track_ref, const AnalysisResult& result) override;

    std::optional<StoredAnalysis> get_analysis(const std::string& analysis_id);

    /**
     * Most recent analysis of a track.
     */
    std::optional<StoredAnalysis> get_latest_for_track(const std::string& track_ref);

    /**
     * All analyses of a track, newest first.
     */
    std::vector<StoredAnalysis> get_analyses_for_track(const std::string& track_ref);

    int get_analysis_count();

    bool delete_analysis(const std::string& analysis_id);

    /**
     * Delete every analysis of a track. Returns the number removed.
     */
    int delete_track_analyses(const std::string& track_ref);

private:
    void init_schema();
    StoredAnalysis read_row(sqlite3_stmt* stmt);
    std::vector<StoredAnalysis> query(const char* sql, const std::string& arg);

    // Serialization helpers for vector fields
    static std::vector<uint8_t> serialize_floats(const std::vector<float>& data);
    static std::vector<float> deserialize_floats(const void* data, int size);

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace tracksense

#endif // TRACKSENSE_STORE_H
