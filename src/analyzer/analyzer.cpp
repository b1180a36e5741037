/**
 * TrackSense - Analysis Pipeline Implementation
 */

#include "analyzer.h"
#include "energy_profile.h"
#include "boundary_detector.h"
#include "segment_assembler.h"
#include "feature_extractor.h"
#include "visualization_trace.h"
#include "result_compiler.h"
#include "../core/log.h"
#include "../core/utils.h"
#include <chrono>
#include <cmath>
#include <algorithm>
#include <future>

namespace tracksense {

namespace {
    constexpr float kShortTrackSec = 2.0f;
    constexpr float kSilencePeak = 1e-4f;

    // Run one stage; failures get the stage name, exceptions become Computation errors.
    template<typename T, typename Fn>
    Result<T> run_stage(const char* stage, Fn&& fn) {
        try {
            Result<T> result = fn();
            if (result.failed()) {
                ResultError error = result.failure();
                error.stage = stage;
                return error;
            }
            return result;
        } catch (const std::exception& e) {
            return ResultError{ErrorKind::Computation, stage, e.what()};
        }
    }

    void report(const ProgressCallback& progress, float percent, const char* stage) {
        if (progress) progress(percent, stage);
    }

    void warn_if_degenerate(const AudioBuffer& audio) {
        float duration = audio.duration_seconds();
        if (duration < kShortTrackSec) {
            TRACKSENSE_LOG_WARN("Analyzer", "very short track (" << duration
                << " s), segmentation will be trivial");
        }

        float peak = 0.0f;
        for (float s : audio.samples) peak = std::max(peak, std::abs(s));
        if (peak < kSilencePeak) {
            TRACKSENSE_LOG_WARN("Analyzer", "near-silent track (peak " << peak
                << "), segmentation will be trivial");
        }
    }
}

class Analyzer::Impl {
public:
    explicit Impl(std::string engine_version) : compiler_(std::move(engine_version)) {}

    Result<AnalysisResult> analyze(const AudioBuffer& audio,
                                   const AnalysisParameters& params,
                                   const ProgressCallback& progress) const {
        auto started_at = std::chrono::system_clock::now();
        auto t0 = std::chrono::steady_clock::now();

        auto valid = params.validate();
        if (valid.failed()) {
            return valid.failure();
        }
        if (audio.samples.empty()) {
            return input_error("Audio buffer is empty");
        }
        if (audio.sample_rate <= 0) {
            return input_error("Sample rate must be positive");
        }

        warn_if_degenerate(audio);

        // Features only need the waveform; run them beside the boundary search.
        // The future is joined on every return path (std::async destructor).
        auto feature_task = std::async(std::launch::async, [this, &audio, &params]() {
            return extract_features(audio, params);
        });

        auto profile = build_energy_profile(audio, params);
        if (profile.failed()) {
            return profile.failure();
        }

        auto detection = detect_boundaries(profile.value(), audio, params);
        if (detection.failed()) {
            return detection.failure();
        }

        PipelineOutputs outputs;
        outputs.segmentation = std::move(detection.value());
        outputs.segments = assemble_segments(outputs.segmentation);
        if (outputs.segments.size() < 2) {
            TRACKSENSE_LOG_WARN("Analyzer", "only " << outputs.segments.size()
                << " segment(s) detected");
        }
        report(progress, 30.0f, "segmentation");

        auto features = feature_task.get();
        if (features.failed()) {
            return features.failure();
        }
        report(progress, 50.0f, "features");

        auto trace = build_visualization(features.value(), audio);
        if (trace.failed()) {
            return trace.failure();
        }
        outputs.features = std::move(features.value());
        outputs.visualization = std::move(trace.value());
        report(progress, 70.0f, "visualization");

        auto elapsed = std::chrono::steady_clock::now() - t0;
        auto result = run_stage<AnalysisResult>("compile", [&]() {
            return compiler_.compile(std::move(outputs), params, started_at, elapsed);
        });
        if (result.failed()) {
            return result.failure();
        }
        report(progress, 90.0f, "compile");

        TRACKSENSE_LOG_INFO("Analyzer", "analysis " << result.value().analysis_id << ": "
            << result.value().segments.size() << " segments, "
            << result.value().features.segment_features.frame_count() << " frames in "
            << result.value().metadata.duration_seconds << " s");

        return result;
    }

    Result<EnergyProfile> build_energy_profile(const AudioBuffer& audio,
                                               const AnalysisParameters& params) const {
        return run_stage<EnergyProfile>("energy_profile", [&]() {
            return energy_.build(audio, params.window_size, params.hop_length);
        });
    }

    Result<BoundaryDetection> detect_boundaries(const EnergyProfile& profile,
                                                const AudioBuffer& audio,
                                                const AnalysisParameters& params) const {
        return run_stage<BoundaryDetection>("boundary_detection", [&]() {
            return detector_.detect(profile, audio, params);
        });
    }

    std::vector<Segment> assemble_segments(const BoundaryDetection& detection) const {
        return assembler_.assemble(detection.boundaries);
    }

    Result<FeatureBundle> extract_features(const AudioBuffer& audio,
                                           const AnalysisParameters& params) const {
        return run_stage<FeatureBundle>("feature_extraction", [&]() {
            return features_.extract(audio, params.window_size, params.hop_length);
        });
    }

    Result<VisualizationTrace> build_visualization(const FeatureBundle& features,
                                                   const AudioBuffer& audio) const {
        return run_stage<VisualizationTrace>("visualization", [&]() {
            return visualization_.build(features, audio.sample_rate, audio.duration_seconds());
        });
    }

private:
    EnergyProfileBuilder energy_;
    AdaptiveBoundaryDetector detector_;
    SegmentAssembler assembler_;
    FeatureExtractor features_;
    VisualizationTraceBuilder visualization_;
    AnalysisResultCompiler compiler_;
};

Analyzer::Analyzer(std::string engine_version)
    : impl_(std::make_unique<Impl>(std::move(engine_version))) {}
Analyzer::~Analyzer() = default;

Result<AnalysisResult> Analyzer::analyze(const AudioBuffer& audio,
                                         const AnalysisParameters& params,
                                         const ProgressCallback& progress) const {
    return impl_->analyze(audio, params, progress);
}

Result<EnergyProfile> Analyzer::build_energy_profile(const AudioBuffer& audio,
                                                     const AnalysisParameters& params) const {
    return impl_->build_energy_profile(audio, params);
}

Result<BoundaryDetection> Analyzer::detect_boundaries(const EnergyProfile& profile,
                                                      const AudioBuffer& audio,
                                                      const AnalysisParameters& params) const {
    return impl_->detect_boundaries(profile, audio, params);
}

std::vector<Segment> Analyzer::assemble_segments(const BoundaryDetection& detection) const {
    return impl_->assemble_segments(detection);
}

Result<FeatureBundle> Analyzer::extract_features(const AudioBuffer& audio,
                                                 const AnalysisParameters& params) const {
    return impl_->extract_features(audio, params);
}

Result<VisualizationTrace> Analyzer::build_visualization(const FeatureBundle& features,
                                                         const AudioBuffer& audio) const {
    return impl_->build_visualization(features, audio);
}

} // namespace tracksense
