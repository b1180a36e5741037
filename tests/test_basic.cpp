/**
 * TrackSense - Basic Tests
 */

#include "tracksense/tracksense.h"
#include <iostream>
#include <cassert>
#include <cstring>
#include <string>
#include <vector>

void test_engine_creation() {
    std::cout << "Test: Engine creation... ";

    // Test with in-memory database
    TrackSenseEngine* engine = tracksense_create(":memory:");
    assert(engine != nullptr);

    int count = tracksense_get_analysis_count(engine);
    assert(count == 0);

    tracksense_destroy(engine);

    std::cout << "PASSED\n";
}

void test_version() {
    std::cout << "Test: Version string... ";

    const char* version = tracksense_version();
    assert(version != nullptr);
    assert(std::strlen(version) > 0);

    std::cout << "PASSED\n";
}

void test_default_params() {
    std::cout << "Test: Default params... ";

    TrackSenseParams params = tracksense_default_params();
    assert(params.min_peaks == 2);
    assert(params.max_peaks == 0);
    assert(params.window_size == 1024);
    assert(params.hop_length == 512);
    assert(params.min_gap_seconds == 2.0f);
    assert(params.short_ma_sec == 0.5f);
    assert(params.long_ma_sec == 3.0f);
    assert(params.include_boundaries == 1);

    std::cout << "PASSED\n";
}

void test_params_from_json() {
    std::cout << "Test: Params from JSON... ";

    TrackSenseParams params = tracksense_default_params();
    TrackSenseError err = tracksense_params_from_json(
        "{\"min_peaks\": 4, \"max_peaks\": 10, \"hop_length\": 256}", &params);
    assert(err == TRACKSENSE_OK);
    assert(params.min_peaks == 4);
    assert(params.max_peaks == 10);
    assert(params.hop_length == 256);
    assert(params.window_size == 1024);

    err = tracksense_params_from_json("not json", &params);
    assert(err == TRACKSENSE_ERROR_INVALID_ARGUMENT);

    err = tracksense_params_from_json("{\"min_peaks\": 0}", &params);
    assert(err == TRACKSENSE_ERROR_INVALID_ARGUMENT);

    std::cout << "PASSED\n";
}

void test_analyze_silence() {
    std::cout << "Test: Analyze silence... ";

    TrackSenseEngine* engine = tracksense_create(":memory:");
    assert(engine != nullptr);

    std::vector<float> samples(22050 * 5, 0.0f);
    TrackSenseParams params = tracksense_default_params();

    char* json = nullptr;
    TrackSenseError err = tracksense_analyze_samples(
        engine, samples.data(), samples.size(), 22050, &params,
        "silence", nullptr, nullptr, &json);
    assert(err == TRACKSENSE_OK);
    assert(json != nullptr);
    assert(std::string(json).find("\"segments\"") != std::string::npos);
    tracksense_free_string(json);

    assert(tracksense_get_analysis_count(engine) == 1);

    char* latest = nullptr;
    err = tracksense_get_latest_analysis(engine, "silence", &latest);
    assert(err == TRACKSENSE_OK);
    assert(latest != nullptr);
    tracksense_free_string(latest);

    tracksense_destroy(engine);

    std::cout << "PASSED\n";
}

void test_invalid_params() {
    std::cout << "Test: Invalid params... ";

    TrackSenseEngine* engine = tracksense_create(":memory:");
    assert(engine != nullptr);

    std::vector<float> samples(22050, 0.0f);
    TrackSenseParams params = tracksense_default_params();
    params.min_peaks = 4;
    params.max_peaks = 2;

    char* json = nullptr;
    TrackSenseError err = tracksense_analyze_samples(
        engine, samples.data(), samples.size(), 22050, &params,
        nullptr, nullptr, nullptr, &json);
    assert(err == TRACKSENSE_ERROR_INVALID_ARGUMENT);
    assert(json == nullptr);
    assert(std::strlen(tracksense_get_error(engine)) > 0);

    tracksense_destroy(engine);

    std::cout << "PASSED\n";
}

void test_missing_file() {
    std::cout << "Test: Missing file... ";

    TrackSenseEngine* engine = tracksense_create(":memory:");
    assert(engine != nullptr);

    char* json = nullptr;
    TrackSenseError err = tracksense_analyze_file(
        engine, "/nonexistent/track.wav", nullptr, nullptr, nullptr,
        nullptr, nullptr, &json);
    assert(err == TRACKSENSE_ERROR_FILE_NOT_FOUND);
    assert(json == nullptr);
    assert(tracksense_get_analysis_count(engine) == 0);

    tracksense_destroy(engine);

    std::cout << "PASSED\n";
}

void test_lookup_and_delete() {
    std::cout << "Test: Lookup and delete... ";

    TrackSenseEngine* engine = tracksense_create(":memory:");
    assert(engine != nullptr);

    char* json = nullptr;
    assert(tracksense_get_analysis(engine, "no-such-id", &json) == TRACKSENSE_ERROR_NOT_FOUND);
    assert(tracksense_delete_analysis(engine, "no-such-id") == TRACKSENSE_ERROR_NOT_FOUND);

    std::vector<float> samples(22050 * 3, 0.0f);
    TrackSenseParams params = tracksense_default_params();
    assert(tracksense_analyze_samples(engine, samples.data(), samples.size(), 22050,
                                      &params, "clip", nullptr, nullptr, &json) == TRACKSENSE_OK);
    std::string doc(json);
    tracksense_free_string(json);

    const std::string key = "\"analysis_id\":\"";
    size_t pos = doc.find(key);
    assert(pos != std::string::npos);
    std::string id = doc.substr(pos + key.size(), 36);

    char* stored = nullptr;
    assert(tracksense_get_analysis(engine, id.c_str(), &stored) == TRACKSENSE_OK);
    tracksense_free_string(stored);

    assert(tracksense_delete_analysis(engine, id.c_str()) == TRACKSENSE_OK);
    assert(tracksense_get_analysis_count(engine) == 0);

    tracksense_destroy(engine);

    std::cout << "PASSED\n";
}

void test_null_arguments() {
    std::cout << "Test: Null arguments... ";

    char* json = nullptr;
    assert(tracksense_analyze_samples(nullptr, nullptr, 0, 22050, nullptr,
                                      nullptr, nullptr, nullptr, &json)
           == TRACKSENSE_ERROR_INVALID_ARGUMENT);
    assert(tracksense_get_analysis_count(nullptr) == 0);
    tracksense_free_string(nullptr);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "TrackSense - Basic Tests\n";
    std::cout << "========================\n\n";

    tracksense_set_log_level(TRACKSENSE_LOG_LEVEL_ERROR);

    test_engine_creation();
    test_version();
    test_default_params();
    test_params_from_json();
    test_analyze_silence();
    test_invalid_params();
    test_missing_file();
    test_lookup_and_delete();
    test_null_arguments();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
