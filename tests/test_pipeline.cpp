/**
 * TrackSense - Pipeline and Engine Tests
 */

#include "test_helpers.h"
#include "../src/core/log.h"
#include "../src/core/utils.h"
#include "../src/core/serialization.h"
#include "../src/analyzer/analyzer.h"
#include "../src/analyzer/spectrum.h"
#include "../src/analyzer/segment_assembler.h"
#include "../src/analyzer/result_compiler.h"
#include "../src/decoder/decoder.h"
#include "../src/engine/engine.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace tracksense;

namespace {

AnalysisResult run(const AudioBuffer& audio, const AnalysisParameters& params = {}) {
    Analyzer analyzer;
    auto result = analyzer.analyze(audio, params);
    if (result.failed()) {
        throw std::runtime_error("Analysis failed: " + result.failure().describe());
    }
    return result.value();
}

bool has_boundary_near(const std::vector<float>& boundaries, float t, float tolerance) {
    return std::any_of(boundaries.begin(), boundaries.end(),
        [&](float b) { return std::abs(b - t) <= tolerance; });
}

} // namespace

/* ============================================================================
 * Analysis Invariants
 * ============================================================================ */

TEST(segments_are_contiguous) {
    auto audio = generate_tone_sections({0.1f, 0.8f, 0.2f, 0.9f}, 8.0f);
    auto result = run(audio);

    const auto& b = result.segmentation.boundaries;
    assert_true(result.segments.size() + 1 == b.size(), "One segment per boundary pair");
    assert_true(SegmentAssembler::is_contiguous(result.segments), "Contiguous");
    for (size_t i = 0; i < result.segments.size(); ++i) {
        const auto& seg = result.segments[i];
        assert_true(seg.segment_index == static_cast<int>(i), "Index");
        assert_near(seg.start_time, b[i], 1e-5, "Start is boundary");
        assert_near(seg.end_time, b[i + 1], 1e-5, "End is next boundary");
        assert_true(seg.duration > 0.0, "Positive duration");
    }
    assert_true(result.segmentation.peaks.size()
             <= static_cast<size_t>(result.segmentation.max_peaks), "Peak cap respected");
}

TEST(frame_arrays_share_length) {
    auto audio = generate_tone_sections({0.2f, 0.7f}, 6.0f);
    auto result = run(audio);

    size_t n = static_cast<size_t>(frame_count(audio.samples.size(), 1024, 512));
    const auto& f = result.features.segment_features;
    assert_true(f.rms.size() == n, "rms");
    assert_true(f.spectral_centroids.size() == n, "centroids");
    assert_true(f.spectral_rolloff.size() == n, "rolloff");
    assert_true(f.spectral_bandwidth.size() == n, "bandwidth");
    assert_true(f.zcr.size() == n, "zcr");
    for (const auto& row : f.mfccs) assert_true(row.size() == n, "mfcc row");
    for (const auto& row : f.chroma) assert_true(row.size() == n, "chroma row");
    for (const auto& row : f.tonnetz) assert_true(row.size() == n, "tonnetz row");

    const auto& v = result.visualization_data;
    assert_true(v.times.size() == n && v.rms.size() == n, "Visualization aligned");
    assert_true(v.spectral_centroids.size() == n && v.spectral_rolloff.size() == n,
        "Visualization spectra aligned");
    assert_near(v.times.back(), (n - 1) * 512.0 / 22050.0, 1e-4, "Last frame time");
}

TEST(idempotent) {
    auto audio = generate_tone_sections({0.1f, 0.6f, 0.3f}, 7.0f);
    auto a = run(audio);
    auto b = run(audio);

    assert_true(a.analysis_id != b.analysis_id, "Fresh identifiers");
    assert_true(a.segmentation.boundaries == b.segmentation.boundaries, "Same boundaries");
    assert_true(a.segmentation.tempo == b.segmentation.tempo, "Same tempo");
    assert_true(a.features.segment_features.mfccs == b.features.segment_features.mfccs, "Same MFCCs");
    assert_true(a.features.segment_features.onset_times == b.features.segment_features.onset_times,
        "Same onsets");
}

TEST(boundaries_anchor_to_track_edges) {
    auto audio = generate_level_sections({0.1f, 0.8f}, 15.0f);
    auto result = run(audio);

    const auto& seg = result.segmentation;
    float last = result.visualization_data.times.back();
    assert_true(!seg.boundaries.empty(), "Boundaries");
    assert_near(seg.boundaries.front(), 0.0, 1e-9, "First boundary at 0");

    bool ends_early = seg.peaks.empty() || seg.peaks.back().time < last - 1.0f;
    if (ends_early) {
        assert_near(seg.boundaries.back(), last, 1e-5, "Last boundary at final frame");
    }
    for (size_t i = 1; i < seg.boundaries.size(); ++i) {
        assert_true(seg.boundaries[i] > seg.boundaries[i - 1], "Strictly increasing");
    }
}

TEST(silent_input) {
    AudioBuffer audio;
    audio.sample_rate = 44100;
    audio.samples.assign(44100 * 5, 0.0f);

    auto result = run(audio);
    const auto& b = result.segmentation.boundaries;
    assert_true(b.size() == 2, "Whole track boundaries");
    assert_near(b.front(), 0.0, 1e-9, "Starts at zero");
    assert_near(b.back(), result.visualization_data.times.back(), 1e-6, "Ends at last frame");
    assert_true(result.segments.size() == 1, "One segment");
    assert_near(result.segmentation.tempo, 0.0, 1e-9, "No tempo");
    assert_true(AnalysisResultCompiler::find_non_finite(result).empty(), "All finite");
}

TEST(min_gap_monotonic) {
    auto audio = generate_level_sections({0.8f, 0.1f, 0.8f, 0.1f, 0.8f}, 8.0f);

    std::vector<size_t> counts;
    for (float gap : {1.0f, 2.0f, 4.0f, 8.0f, 1e8f}) {
        AnalysisParameters params;
        params.min_gap_seconds = gap;
        counts.push_back(run(audio, params).segmentation.boundaries.size());
    }

    assert_true(counts.front() >= 3, "Section changes detected");
    for (size_t i = 1; i < counts.size(); ++i) {
        assert_true(counts[i] <= counts[i - 1], "Larger gaps never add boundaries");
    }
    assert_true(counts.back() <= 3, "Huge gap leaves one peak at most");
}

TEST(two_tone_boundary) {
    auto audio = generate_tone_sections({0.1f, 0.8f}, 15.0f);
    auto result = run(audio);

    assert_true(has_boundary_near(result.segmentation.boundaries, 15.0f, 0.5f),
        "Boundary at the level change");
    assert_true(result.segments.size() >= 2, "At least two segments");
}

TEST(output_is_finite) {
    auto audio = generate_click_track(128.0f, 12.0f);
    auto result = run(audio);
    assert_true(AnalysisResultCompiler::find_non_finite(result).empty(), "All finite");
    assert_true(result.features.global_features.num_beats
             == static_cast<int>(result.features.segment_features.beats.size()), "Beat count");
    assert_true(result.features.global_features.num_onsets
             == static_cast<int>(result.features.segment_features.onset_times.size()), "Onset count");
    assert_true(result.segmentation.tempo == result.features.global_features.tempo,
        "One tempo estimate");
}

TEST(invalid_parameters_rejected) {
    auto audio = generate_sine_wave(440.0f, 2.0f);
    AnalysisParameters params;
    params.min_peaks = 5;
    params.max_peaks = 2;

    Analyzer analyzer;
    auto result = analyzer.analyze(audio, params);
    assert_true(result.failed(), "Rejected");
    assert_true(result.error_kind() == ErrorKind::Input, "Input error");
}

/* ============================================================================
 * Engine
 * ============================================================================ */

TEST(progress_sequence) {
    Engine engine(":memory:");
    assert_true(engine.is_valid(), "Engine");

    std::vector<float> seen;
    AnalyzeOptions options;
    options.progress = [&](float percent, const std::string&) { seen.push_back(percent); };

    auto result = engine.analyze_samples(generate_sine_wave(440.0f, 3.0f), AnalysisParameters{},
                                         options);
    assert_true(result.ok(), "Analysis");

    std::vector<float> expected = {10.0f, 30.0f, 50.0f, 70.0f, 90.0f, 100.0f};
    assert_true(seen == expected, "Progress milestones in order");
}

TEST(store_round_trip) {
    Engine engine(":memory:");
    assert_true(engine.is_valid(), "Engine");

    AnalyzeOptions options;
    options.track_ref = "tone";
    auto first = engine.analyze_samples(generate_sine_wave(440.0f, 3.0f), AnalysisParameters{},
                                        options);
    auto second = engine.analyze_samples(generate_sine_wave(440.0f, 3.0f), AnalysisParameters{},
                                         options);
    assert_true(first.ok() && second.ok(), "Analyses");
    assert_true(engine.analysis_count() == 2, "Two stored");

    auto stored = engine.get_analysis(first.value().analysis_id);
    assert_true(stored.has_value(), "Stored by id");
    assert_true(stored->track_ref == "tone", "Track reference");
    assert_true(stored->segment_count == static_cast<int>(first.value().segments.size()),
        "Segment count");
    assert_true(stored->boundaries == first.value().segmentation.boundaries, "Boundaries blob");

    auto doc = nlohmann::json::parse(stored->result_json);
    assert_true(doc["analysis_id"] == first.value().analysis_id, "Document id");

    auto latest = engine.latest_analysis("tone");
    assert_true(latest.has_value(), "Latest");
    assert_true(latest->analysis_id == second.value().analysis_id, "Newest first");
    assert_true(engine.store().get_analyses_for_track("tone").size() == 2, "History");

    assert_true(engine.delete_analysis(first.value().analysis_id), "Deleted");
    assert_true(!engine.get_analysis(first.value().analysis_id), "Gone");
    assert_true(engine.store().delete_track_analyses("tone") == 1, "Track history cleared");
    assert_true(engine.analysis_count() == 0, "Empty");
}

TEST(unnamed_samples_not_persisted) {
    Engine engine(":memory:");
    auto result = engine.analyze_samples(generate_sine_wave(440.0f, 2.0f), AnalysisParameters{});
    assert_true(result.ok(), "Analysis");
    assert_true(engine.analysis_count() == 0, "Nothing stored without a track reference");
}

TEST(decode_and_analyze_file) {
    utils::ScopedTempDir dir("tracksense-test");
    assert_true(dir.valid(), "Temp dir");

    auto audio = generate_tone_sections({0.1f, 0.8f}, 6.0f);
    std::string wav = (dir.path() / "tone.wav").string();
    assert_true(write_wav(wav, audio), "WAV written");

    Decoder decoder;
    auto decoded = decoder.decode(wav);
    assert_true(decoded.ok(), "Decoded");
    assert_true(decoded.value().sample_rate == 22050, "Native rate kept");
    assert_true(std::abs(static_cast<long>(decoded.value().samples.size())
                      - static_cast<long>(audio.samples.size())) <= 64, "Sample count");
    assert_near(decoded.value().samples[22050 * 9], audio.samples[22050 * 9], 1e-3, "Sample value");

    Engine engine(":memory:");
    AnalyzeOptions options;
    options.output_path = (dir.path() / "out" / "tone.json").string();
    auto result = engine.analyze_file(wav, AnalysisParameters{}, options);
    assert_true(result.ok(), "Analyzed file");
    assert_true(engine.analysis_count() == 1, "Stored under the path");
    assert_true(engine.latest_analysis(wav).has_value(), "Path is the track reference");

    std::ifstream in(options.output_path);
    assert_true(static_cast<bool>(in), "Output written");
    auto doc = nlohmann::json::parse(in);
    assert_true(doc["analysis_id"] == result.value().analysis_id, "Output document");
    assert_true(doc["segments"].size() == result.value().segments.size(), "Output segments");
}

TEST(decode_from_memory) {
    utils::ScopedTempDir dir("tracksense-test");
    assert_true(dir.valid(), "Temp dir");

    auto audio = generate_tone_sections({0.2f, 0.7f}, 4.0f);
    std::string wav = (dir.path() / "tone.wav").string();
    assert_true(write_wav(wav, audio), "WAV written");

    std::ifstream in(wav, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    assert_true(bytes.size() > 44, "WAV bytes read");

    Decoder decoder;
    auto from_path = decoder.decode(wav);
    auto from_memory = decoder.decode_memory(bytes.data(), bytes.size());
    assert_true(from_path.ok(), "Decoded from path");
    assert_true(from_memory.ok(), "Decoded from memory");
    assert_true(from_memory.value().sample_rate == from_path.value().sample_rate, "Same rate");
    assert_true(from_memory.value().samples == from_path.value().samples, "Same samples");

    auto empty = decoder.decode_memory(nullptr, 0);
    assert_true(empty.failed(), "Empty buffer rejected");
    assert_true(empty.error_kind() == ErrorKind::Input, "Input error");
    assert_true(empty.failure().stage == "load", "Load stage");

    const uint8_t junk[] = {'n', 'o', 't', ' ', 'a', 'u', 'd', 'i', 'o'};
    assert_true(decoder.decode_memory(junk, sizeof(junk)).failed(), "Undecodable bytes");

    Engine engine(":memory:");
    AnalyzeOptions options;
    options.track_ref = "memory-tone";
    std::vector<float> seen;
    options.progress = [&](float percent, const std::string&) { seen.push_back(percent); };
    auto result = engine.analyze_bytes(bytes.data(), bytes.size(), AnalysisParameters{}, options);
    assert_true(result.ok(), "Analyzed bytes");
    assert_true(engine.latest_analysis("memory-tone").has_value(), "Stored under the reference");
    assert_true(seen.size() == 6 && seen.front() == 10.0f && seen.back() == 100.0f, "Progress");

    auto reference = engine.analyze_samples(from_path.value(), AnalysisParameters{});
    assert_true(reference.ok(), "Analyzed samples");
    assert_true(result.value().segmentation.boundaries
             == reference.value().segmentation.boundaries, "Same boundaries as the file");

    auto rejected = engine.analyze_bytes(nullptr, 0, AnalysisParameters{});
    assert_true(rejected.failed() && rejected.failure().stage == "load", "Empty bytes rejected");
}

TEST(decode_errors) {
    Decoder decoder;
    auto missing = decoder.decode("/nonexistent/file.wav");
    assert_true(missing.failed(), "Missing file");
    assert_true(missing.error_kind() == ErrorKind::Input, "Input error");

    utils::ScopedTempDir dir("tracksense-test");
    std::string bogus = (dir.path() / "bogus.wav").string();
    {
        std::ofstream out(bogus);
        out << "not audio at all";
    }
    auto garbage = decoder.decode(bogus);
    assert_true(garbage.failed(), "Undecodable file");
    assert_true(garbage.failure().stage == "load", "Load stage");

    Engine engine(":memory:");
    AnalysisParameters params;
    params.window_size = 0;
    auto rejected = engine.analyze_file(bogus, params);
    assert_true(rejected.failed() && rejected.failure().stage != "load",
        "Parameters checked before decoding");
}

int main() {
    std::cout << "TrackSense - Pipeline Tests\n";
    std::cout << "===========================\n\n";

    set_log_level(LogLevel::Error);

    std::cout << "--- Analysis Invariants ---\n";
    RUN_TEST(segments_are_contiguous);
    RUN_TEST(frame_arrays_share_length);
    RUN_TEST(idempotent);
    RUN_TEST(boundaries_anchor_to_track_edges);
    RUN_TEST(silent_input);
    RUN_TEST(min_gap_monotonic);
    RUN_TEST(two_tone_boundary);
    RUN_TEST(output_is_finite);
    RUN_TEST(invalid_parameters_rejected);

    std::cout << "\n--- Engine ---\n";
    RUN_TEST(progress_sequence);
    RUN_TEST(store_round_trip);
    RUN_TEST(unnamed_samples_not_persisted);
    RUN_TEST(decode_and_analyze_file);
    RUN_TEST(decode_from_memory);
    RUN_TEST(decode_errors);

    return report("Pipeline tests");
}
