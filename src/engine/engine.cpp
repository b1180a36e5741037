/**
 * TrackSense - Main Engine Implementation
 */

#include "engine.h"
#include "../core/log.h"
#include "../core/serialization.h"
#include "../core/utils.h"
#include <filesystem>
#include <fstream>

namespace tracksense {

namespace {
    ResultError output_error(const std::string& message) {
        return ResultError{ErrorKind::Storage, "output", message};
    }
}

Engine::Engine(const std::string& db_path)
    : store_(std::make_unique<Store>(db_path))
    , decoder_(std::make_unique<Decoder>())
    , analyzer_(std::make_unique<Analyzer>()) {

    if (!store_->is_open()) {
        last_error_ = "Failed to open database: " + store_->error();
    }
}

Engine::~Engine() = default;

bool Engine::is_valid() const {
    return store_ && store_->is_open();
}

Result<AnalysisResult> Engine::analyze_file(const std::string& path,
                                            const AnalysisParameters& params,
                                            const AnalyzeOptions& options) {
    // Parameters are checked before any decoding work
    auto valid = params.validate();
    if (valid.failed()) {
        last_error_ = valid.failure().describe();
        return valid.failure();
    }

    auto audio = decoder_->decode(path, options.target_sample_rate);
    if (audio.failed()) {
        last_error_ = audio.failure().describe();
        TRACKSENSE_LOG_ERROR("Engine", last_error_);
        return audio.failure();
    }
    if (options.progress) options.progress(10.0f, "load");

    TRACKSENSE_LOG_INFO("Engine", "loaded " << path << " (" << audio.value().duration_seconds()
        << " s at " << audio.value().sample_rate << " Hz)");

    auto result = analyzer_->analyze(audio.value(), params, options.progress);
    const std::string& track_ref = options.track_ref.empty() ? path : options.track_ref;
    return finish(std::move(result), track_ref, options);
}

Result<AnalysisResult> Engine::analyze_bytes(const uint8_t* data, size_t size,
                                             const AnalysisParameters& params,
                                             const AnalyzeOptions& options) {
    auto valid = params.validate();
    if (valid.failed()) {
        last_error_ = valid.failure().describe();
        return valid.failure();
    }

    auto audio = decoder_->decode_memory(data, size, options.target_sample_rate);
    if (audio.failed()) {
        last_error_ = audio.failure().describe();
        TRACKSENSE_LOG_ERROR("Engine", last_error_);
        return audio.failure();
    }
    if (options.progress) options.progress(10.0f, "load");

    TRACKSENSE_LOG_INFO("Engine", "decoded " << size << " bytes ("
        << audio.value().duration_seconds() << " s at " << audio.value().sample_rate << " Hz)");

    auto result = analyzer_->analyze(audio.value(), params, options.progress);
    return finish(std::move(result), options.track_ref, options);
}

Result<AnalysisResult> Engine::analyze_samples(const AudioBuffer& audio,
                                               const AnalysisParameters& params,
                                               const AnalyzeOptions& options) {
    if (audio.samples.empty() || audio.sample_rate <= 0) {
        ResultError error = input_error("Waveform is empty or has no sample rate");
        last_error_ = error.describe();
        return error;
    }
    if (options.progress) options.progress(10.0f, "load");

    auto result = analyzer_->analyze(audio, params, options.progress);
    return finish(std::move(result), options.track_ref, options);
}

Result<AnalysisResult> Engine::finish(Result<AnalysisResult> result,
                                      const std::string& track_ref,
                                      const AnalyzeOptions& options) {
    if (result.failed()) {
        last_error_ = result.failure().describe();
        TRACKSENSE_LOG_ERROR("Engine", "analysis failed: " << last_error_);
        return result;
    }

    if (options.persist && !track_ref.empty()) {
        if (!is_valid()) {
            last_error_ = "Engine not initialized";
            return ResultError{ErrorKind::Storage, "sink", last_error_};
        }
        auto saved = store_->save(track_ref, result.value());
        if (saved.failed()) {
            last_error_ = saved.failure().describe();
            TRACKSENSE_LOG_ERROR("Engine", last_error_);
            return saved.failure();
        }
    }

    if (!options.output_path.empty()) {
        auto written = write_result(result.value(), options.output_path);
        if (written.failed()) {
            last_error_ = written.failure().describe();
            TRACKSENSE_LOG_ERROR("Engine", last_error_);
            return written.failure();
        }
    }

    if (options.progress) options.progress(100.0f, "complete");
    return result;
}

Status Engine::write_result(const AnalysisResult& result, const std::string& output_path) const {
    namespace fs = std::filesystem;

    utils::ScopedTempDir scratch("tracksense");
    if (!scratch.valid()) {
        return output_error("Cannot create temporary directory");
    }

    fs::path staged = scratch.path() / (result.analysis_id + ".json");
    {
        std::ofstream out(staged);
        if (!out) {
            return output_error("Cannot write " + staged.string());
        }
        out << to_json_string(result, 2) << '\n';
        out.flush();
        if (!out) {
            return output_error("Write failed for " + staged.string());
        }
    }

    fs::path target(output_path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return output_error("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::rename(staged, target, ec);
    if (ec) {
        // Different filesystem; fall back to a copy
        ec.clear();
        fs::copy_file(staged, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return output_error("Cannot move result to " + output_path + ": " + ec.message());
        }
    }

    TRACKSENSE_LOG_INFO("Engine", "wrote " << output_path);
    return Unit{};
}

int Engine::analysis_count() const {
    return is_valid() ? store_->get_analysis_count() : 0;
}

std::optional<StoredAnalysis> Engine::get_analysis(const std::string& analysis_id) {
    return store_->get_analysis(analysis_id);
}

std::optional<StoredAnalysis> Engine::latest_analysis(const std::string& track_ref) {
    return store_->get_latest_for_track(track_ref);
}

bool Engine::delete_analysis(const std::string& analysis_id) {
    return store_->delete_analysis(analysis_id);
}

} // namespace tracksense
