/**
 * TrackSense - Utility Functions
 */

#ifndef TRACKSENSE_UTILS_H
#define TRACKSENSE_UTILS_H

#include <string>
#include <vector>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <random>
#include <numeric>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace tracksense {
namespace utils {

/* ============================================================================
 * Math Utilities
 * ============================================================================ */

inline float finite_or(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

inline void sanitize(std::vector<float>& values, float fallback = 0.0f) {
    for (float& v : values) {
        if (!std::isfinite(v)) v = fallback;
    }
}

inline bool all_finite(const std::vector<float>& values) {
    return std::all_of(values.begin(), values.end(), [](float v) { return std::isfinite(v); });
}

/* ============================================================================
 * Statistics (numpy semantics)
 * ============================================================================ */

inline double mean(const std::vector<float>& x) {
    if (x.empty()) return 0.0;
    double sum = 0.0;
    for (float v : x) sum += v;
    return sum / x.size();
}

/**
 * Population standard deviation (ddof = 0).
 */
inline double stddev(const std::vector<float>& x) {
    if (x.empty()) return 0.0;
    double m = mean(x);
    double acc = 0.0;
    for (float v : x) acc += (v - m) * (v - m);
    return std::sqrt(acc / x.size());
}

/**
 * Median; even-length input averages the two middle values.
 */
inline double median(std::vector<float> x) {
    if (x.empty()) return 0.0;
    size_t mid = x.size() / 2;
    std::nth_element(x.begin(), x.begin() + mid, x.end());
    double upper = x[mid];
    if (x.size() % 2 == 1) return upper;
    double lower = *std::max_element(x.begin(), x.begin() + mid);
    return 0.5 * (lower + upper);
}

/**
 * Median absolute deviation around the median (unscaled).
 */
inline double median_abs_deviation(const std::vector<float>& x) {
    if (x.empty()) return 0.0;
    double med = median(x);
    std::vector<float> dev(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        dev[i] = static_cast<float>(std::abs(x[i] - med));
    }
    return median(std::move(dev));
}

/**
 * Percentile in [0, 100] with linear interpolation between closest ranks.
 */
inline double percentile(std::vector<float> x, double q) {
    if (x.empty()) return 0.0;
    std::sort(x.begin(), x.end());
    double pos = (x.size() - 1) * std::max(0.0, std::min(100.0, q)) / 100.0;
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, x.size() - 1);
    double frac = pos - lo;
    return x[lo] + (x[hi] - x[lo]) * frac;
}

/* ============================================================================
 * Smoothing
 * ============================================================================ */

// Half-sample symmetric reflection (d c b a | a b c d | d c b a)
inline size_t reflect_index(long i, long n) {
    if (n == 1) return 0;
    long period = 2 * n;
    long m = i % period;
    if (m < 0) m += period;
    return static_cast<size_t>(m < n ? m : period - 1 - m);
}

/**
 * 1-D Gaussian filter, reflect boundary, kernel truncated at 4 sigma.
 */
inline std::vector<float> gaussian_filter1d(const std::vector<float>& x, double sigma) {
    if (x.empty() || sigma <= 0.0) return x;

    const long radius = static_cast<long>(4.0 * sigma + 0.5);
    std::vector<double> kernel(2 * radius + 1);
    double norm = 0.0;
    for (long k = -radius; k <= radius; ++k) {
        double w = std::exp(-0.5 * (k * k) / (sigma * sigma));
        kernel[k + radius] = w;
        norm += w;
    }
    for (double& w : kernel) w /= norm;

    const long n = static_cast<long>(x.size());
    std::vector<float> out(x.size());
    for (long i = 0; i < n; ++i) {
        double acc = 0.0;
        for (long k = -radius; k <= radius; ++k) {
            acc += kernel[k + radius] * x[reflect_index(i + k, n)];
        }
        out[i] = static_cast<float>(acc);
    }
    return out;
}

/**
 * Centered box filter with zero padding outside the signal, i.e.
 * convolve(x, ones(win) / win, 'same'). The window is clamped to the signal length.
 */
inline std::vector<float> moving_average(const std::vector<float>& x, int win) {
    if (x.empty()) return {};
    const long n = static_cast<long>(x.size());
    const long w = std::max(1L, std::min(static_cast<long>(win), n));
    const long offset = (w - 1) / 2;

    std::vector<double> prefix(n + 1, 0.0);
    for (long i = 0; i < n; ++i) prefix[i + 1] = prefix[i] + x[i];

    std::vector<float> out(x.size());
    for (long i = 0; i < n; ++i) {
        long hi = std::min(n - 1, i + offset);
        long lo = std::max(0L, i + offset - w + 1);
        double sum = hi >= lo ? prefix[hi + 1] - prefix[lo] : 0.0;
        out[i] = static_cast<float>(sum / w);
    }
    return out;
}

/* ============================================================================
 * Identifiers / Time
 * ============================================================================ */

/**
 * Random RFC 4122 version 4 UUID.
 */
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFF),
        static_cast<unsigned>(hi & 0xFFFF),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

inline int64_t current_timestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

/* ============================================================================
 * File Utilities
 * ============================================================================ */

/**
 * Temporary directory removed on scope exit, whatever the outcome.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix) {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) return;
        path_ = base / (prefix + "-" + generate_uuid());
        if (!std::filesystem::create_directories(path_, ec) || ec) {
            path_.clear();
        }
    }

    ~ScopedTempDir() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace utils
} // namespace tracksense

#endif // TRACKSENSE_UTILS_H
