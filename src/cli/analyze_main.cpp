/**
 * TrackSense CLI - Analyze Tool
 *
 * Segments one audio file and extracts its features.
 *
 * Usage: tracksense-analyze [options] <audio_file>
 */

#include "tracksense/tracksense.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

void print_usage(const char* program) {
    std::string default_db = "tracksense.db";
#ifdef TRACKSENSE_DEFAULT_DB_PATH
    default_db = TRACKSENSE_DEFAULT_DB_PATH;
#endif

    std::cerr << "Usage: " << program << " [options] <audio_file>\n"
              << "\nOptions:\n"
              << "  -d, --database <path>     Database file path (default: " << default_db << ")\n"
              << "  -t, --track <ref>         Store the result under this reference (default: file path)\n"
              << "  -o, --output <file>       Write the JSON result to a file instead of stdout\n"
              << "  -p, --params <file>       Load parameters from a JSON file (flags override it)\n"
              << "  --min-peaks <n>           Minimum boundary peaks (default: 2)\n"
              << "  --max-peaks <n>           Peak cap (default: 3 x min-peaks)\n"
              << "  --window-size <samples>   Analysis frame size (default: 1024)\n"
              << "  --hop-length <samples>    Frame stride (default: 512)\n"
              << "  --min-gap <seconds>       Minimum spacing between boundaries (default: 2.0)\n"
              << "  --short-ma <seconds>      Short energy trend window (default: 0.5)\n"
              << "  --long-ma <seconds>       Long energy trend window (default: 3.0)\n"
              << "  --no-boundaries           Don't anchor boundaries to track start/end\n"
              << "  -v, --verbose             Log stage summaries\n"
              << "  -q, --quiet               Only log errors\n"
              << "  -h, --help                Show this help\n";
}

void progress_callback(float percent, const char* stage, void* user_data) {
    (void)user_data;
    std::cerr << "\r[" << static_cast<int>(percent) << "%] " << stage << "          " << std::flush;
    if (percent >= 100.0f) {
        std::cerr << std::endl;
    }
}

static bool read_file(const std::string& path, std::string& contents) {
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    contents = ss.str();
    return true;
}

static void print_segments(const std::string& json_text) {
    auto doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) return;

    const auto& seg = doc["segmentation"];
    std::fprintf(stderr, "Tempo: %.1f BPM, threshold: %.3f\n",
        seg.value("tempo", 0.0), seg.value("threshold", 0.0));
    std::fprintf(stderr, "\n  #    Start      End   Duration\n");
    for (const auto& s : doc["segments"]) {
        std::fprintf(stderr, "%3d %8.2f %8.2f %9.2f\n",
            s.value("segment_index", 0),
            s.value("start_time", 0.0),
            s.value("end_time", 0.0),
            s.value("duration", 0.0));
    }
    std::fprintf(stderr, "\n%zu segments\n", doc["segments"].size());
}

int main(int argc, char* argv[]) {
#ifdef TRACKSENSE_DEFAULT_DB_PATH
    std::string db_path = TRACKSENSE_DEFAULT_DB_PATH;
#else
    std::string db_path = "tracksense.db";
#endif
    std::string audio_path;
    std::string track_ref;
    std::string output_path;
    TrackSenseParams params = tracksense_default_params();
    TrackSenseLogLevel log_level = TRACKSENSE_LOG_LEVEL_WARN;

    // Parameter file first so flags can override it
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--params") == 0) {
            std::string contents;
            if (!read_file(argv[i + 1], contents)) {
                std::cerr << "Error: cannot read parameter file " << argv[i + 1] << "\n";
                return 1;
            }
            if (tracksense_params_from_json(contents.c_str(), &params) != TRACKSENSE_OK) {
                std::cerr << "Error: invalid parameter file " << argv[i + 1] << "\n";
                return 1;
            }
        }
    }

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            log_level = TRACKSENSE_LOG_LEVEL_INFO;
        } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            log_level = TRACKSENSE_LOG_LEVEL_ERROR;
        } else if (strcmp(arg, "--no-boundaries") == 0) {
            params.include_boundaries = 0;
        } else if (arg[0] == '-' && !has_value) {
            std::cerr << "Error: " << arg << " requires an argument\n";
            return 1;
        } else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--params") == 0) {
            ++i;
        } else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--database") == 0) {
            db_path = argv[++i];
        } else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--track") == 0) {
            track_ref = argv[++i];
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            output_path = argv[++i];
        } else if (strcmp(arg, "--min-peaks") == 0) {
            params.min_peaks = std::atoi(argv[++i]);
        } else if (strcmp(arg, "--max-peaks") == 0) {
            params.max_peaks = std::atoi(argv[++i]);
        } else if (strcmp(arg, "--window-size") == 0) {
            params.window_size = std::atoi(argv[++i]);
        } else if (strcmp(arg, "--hop-length") == 0) {
            params.hop_length = std::atoi(argv[++i]);
        } else if (strcmp(arg, "--min-gap") == 0) {
            params.min_gap_seconds = static_cast<float>(std::atof(argv[++i]));
        } else if (strcmp(arg, "--short-ma") == 0) {
            params.short_ma_sec = static_cast<float>(std::atof(argv[++i]));
        } else if (strcmp(arg, "--long-ma") == 0) {
            params.long_ma_sec = static_cast<float>(std::atof(argv[++i]));
        } else if (arg[0] != '-') {
            audio_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (audio_path.empty()) {
        std::cerr << "Error: No audio file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    tracksense_set_log_level(log_level);

    // Create engine
    TrackSenseEngine* engine = tracksense_create(db_path.c_str());
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }

    std::cerr << "Analyzing " << audio_path << "...\n";

    char* json = nullptr;
    TrackSenseError err = tracksense_analyze_file(
        engine,
        audio_path.c_str(),
        &params,
        track_ref.empty() ? nullptr : track_ref.c_str(),
        output_path.empty() ? nullptr : output_path.c_str(),
        log_level == TRACKSENSE_LOG_LEVEL_ERROR ? nullptr : progress_callback,
        nullptr,
        &json);

    if (err != TRACKSENSE_OK) {
        std::cerr << "\nError (" << err << "): " << tracksense_get_error(engine) << "\n";
        tracksense_destroy(engine);
        return 1;
    }

    print_segments(json);

    if (output_path.empty()) {
        std::cout << json << "\n";
    } else {
        std::cerr << "Result written to " << output_path << "\n";
    }

    tracksense_free_string(json);
    tracksense_destroy(engine);
    return 0;
}
