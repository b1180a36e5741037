/**
 * TrackSense - Shared Test Utilities
 */

#ifndef TRACKSENSE_TEST_HELPERS_H
#define TRACKSENSE_TEST_HELPERS_H

#include "tracksense/types.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

inline void assert_near(double actual, double expected, double tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

inline void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

inline int report(const char* title) {
    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << title << ": all tests passed!\n";
        return 0;
    }
    std::cout << title << ": " << failed_tests << " test(s) failed.\n";
    return 1;
}

/* ============================================================================
 * Synthetic Signals
 * ============================================================================ */

inline tracksense::AudioBuffer generate_sine_wave(float frequency, float duration,
                                                  float amplitude = 0.5f,
                                                  int sample_rate = 22050) {
    tracksense::AudioBuffer buffer;
    buffer.sample_rate = sample_rate;

    int num_samples = static_cast<int>(duration * sample_rate);
    buffer.samples.resize(num_samples);

    for (int i = 0; i < num_samples; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        buffer.samples[i] = static_cast<float>(amplitude * std::sin(2.0 * M_PI * frequency * t));
    }

    return buffer;
}

inline tracksense::AudioBuffer generate_click_track(float bpm, float duration,
                                                    int sample_rate = 22050) {
    tracksense::AudioBuffer buffer;
    buffer.sample_rate = sample_rate;

    int num_samples = static_cast<int>(duration * sample_rate);
    buffer.samples.resize(num_samples, 0.0f);

    float beat_interval = 60.0f / bpm;
    int samples_per_beat = static_cast<int>(beat_interval * sample_rate);
    int click_duration = sample_rate / 100;  // 10ms click

    for (int beat = 0; beat * samples_per_beat < num_samples; ++beat) {
        int start = beat * samples_per_beat;
        for (int i = 0; i < click_duration && start + i < num_samples; ++i) {
            float envelope = 1.0f - static_cast<float>(i) / click_duration;
            buffer.samples[start + i] = envelope * 0.8f;
        }
    }

    return buffer;
}

/**
 * Concatenated sine tones, one amplitude per section.
 */
inline tracksense::AudioBuffer generate_tone_sections(const std::vector<float>& amplitudes,
                                                      float section_seconds,
                                                      float frequency = 440.0f,
                                                      int sample_rate = 22050) {
    tracksense::AudioBuffer buffer;
    buffer.sample_rate = sample_rate;

    int per_section = static_cast<int>(section_seconds * sample_rate);
    buffer.samples.resize(static_cast<size_t>(per_section) * amplitudes.size());

    for (size_t s = 0; s < amplitudes.size(); ++s) {
        for (int i = 0; i < per_section; ++i) {
            size_t n = s * per_section + i;
            double t = static_cast<double>(n) / sample_rate;
            buffer.samples[n] = static_cast<float>(amplitudes[s] * std::sin(2.0 * M_PI * frequency * t));
        }
    }

    return buffer;
}

/**
 * Piecewise-constant signal, one level per section.
 */
inline tracksense::AudioBuffer generate_level_sections(const std::vector<float>& levels,
                                                       float section_seconds,
                                                       int sample_rate = 22050) {
    tracksense::AudioBuffer buffer;
    buffer.sample_rate = sample_rate;

    int per_section = static_cast<int>(section_seconds * sample_rate);
    for (float level : levels) {
        buffer.samples.insert(buffer.samples.end(), per_section, level);
    }
    return buffer;
}

/**
 * 16-bit PCM mono WAV file.
 */
inline bool write_wav(const std::string& path, const tracksense::AudioBuffer& audio) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    auto put32 = [&](uint32_t v) { out.write(reinterpret_cast<const char*>(&v), 4); };
    auto put16 = [&](uint16_t v) { out.write(reinterpret_cast<const char*>(&v), 2); };

    uint32_t data_bytes = static_cast<uint32_t>(audio.samples.size() * 2);
    out.write("RIFF", 4);
    put32(36 + data_bytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(16);
    put16(1);                                       // PCM
    put16(1);                                       // mono
    put32(static_cast<uint32_t>(audio.sample_rate));
    put32(static_cast<uint32_t>(audio.sample_rate * 2));
    put16(2);
    put16(16);
    out.write("data", 4);
    put32(data_bytes);

    for (float s : audio.samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        put16(static_cast<uint16_t>(static_cast<int16_t>(std::lround(clamped * 32767.0f))));
    }
    return static_cast<bool>(out);
}

#endif // TRACKSENSE_TEST_HELPERS_H
