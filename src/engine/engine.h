/**
 * TrackSense - Main Engine Class
 */

#ifndef TRACKSENSE_ENGINE_H
#define TRACKSENSE_ENGINE_H

#include "tracksense/types.h"
#include "../core/store.h"
#include "../decoder/decoder.h"
#include "../analyzer/analyzer.h"
#include <memory>
#include <optional>
#include <string>

namespace tracksense {

/**
 * Per-call options for Engine::analyze_*.
 */
struct AnalyzeOptions {
    std::string track_ref;              // Sink key; analyze_file defaults it to the path
    std::string output_path;            // Also write the JSON document here when set
    int target_sample_rate = 0;         // 0 = decode at the file's own rate
    bool persist = true;                // Save through the result sink
    ProgressCallback progress;          // 10/30/50/70/90/100
};

/**
 * Coordinates loading, analysis and persistence.
 */
class Engine {
public:
    explicit Engine(const std::string& db_path);
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Check if engine initialized successfully.
     */
    bool is_valid() const;

    /**
     * Get last error message.
     */
    const std::string& error() const { return last_error_; }

    /**
     * Decode `path` and run the full pipeline.
     */
    Result<AnalysisResult> analyze_file(const std::string& path,
                                        const AnalysisParameters& params,
                                        const AnalyzeOptions& options = {});

    /**
     * Decode an encoded file held in memory, then run the full pipeline.
     * Persisted only when options.track_ref is set.
     */
    Result<AnalysisResult> analyze_bytes(const uint8_t* data, size_t size,
                                         const AnalysisParameters& params,
                                         const AnalyzeOptions& options = {});

    /**
     * Run the full pipeline on an already decoded waveform. Persisted only
     * when options.track_ref is set.
     */
    Result<AnalysisResult> analyze_samples(const AudioBuffer& audio,
                                           const AnalysisParameters& params,
                                           const AnalyzeOptions& options = {});

    /**
     * Write the result document to `output_path`. The file appears atomically;
     * the scratch directory is removed on every path.
     */
    Status write_result(const AnalysisResult& result, const std::string& output_path) const;

    int analysis_count() const;
    std::optional<StoredAnalysis> get_analysis(const std::string& analysis_id);
    std::optional<StoredAnalysis> latest_analysis(const std::string& track_ref);
    bool delete_analysis(const std::string& analysis_id);

    Store& store() { return *store_; }
    const Analyzer& analyzer() const { return *analyzer_; }

private:
    Result<AnalysisResult> finish(Result<AnalysisResult> result,
                                  const std::string& track_ref,
                                  const AnalyzeOptions& options);

    std::unique_ptr<Store> store_;
    std::unique_ptr<Decoder> decoder_;
    std::unique_ptr<Analyzer> analyzer_;

    std::string last_error_;
};

} // namespace tracksense

#endif // TRACKSENSE_ENGINE_H
