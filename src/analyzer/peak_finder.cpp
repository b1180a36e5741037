/**
 * TrackSense - Peak Finder Implementation
 */

#include "peak_finder.h"
#include <algorithm>
#include <numeric>

namespace tracksense {

namespace {

// Indices of local maxima; flat tops report their (left + right) / 2 midpoint.
std::vector<int> local_maxima(const std::vector<float>& x) {
    std::vector<int> peaks;
    const int n = static_cast<int>(x.size());
    int i = 1;
    while (i < n - 1) {
        if (x[i - 1] < x[i]) {
            int ahead = i + 1;
            while (ahead < n - 1 && x[ahead] == x[i]) {
                ++ahead;
            }
            if (x[ahead] < x[i]) {
                peaks.push_back((i + ahead - 1) / 2);
                i = ahead;
                continue;
            }
        }
        ++i;
    }
    return peaks;
}

std::vector<int> select_by_distance(const std::vector<int>& peaks,
                                    const std::vector<float>& x,
                                    int distance) {
    const size_t n = peaks.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return x[peaks[a]] < x[peaks[b]];
    });

    std::vector<bool> keep(n, true);
    for (size_t r = n; r-- > 0;) {
        size_t j = order[r];
        if (!keep[j]) continue;

        for (size_t k = j; k-- > 0 && peaks[j] - peaks[k] < distance;) {
            keep[k] = false;
        }
        for (size_t k = j + 1; k < n && peaks[k] - peaks[j] < distance; ++k) {
            keep[k] = false;
        }
    }

    std::vector<int> kept;
    for (size_t i = 0; i < n; ++i) {
        if (keep[i]) kept.push_back(peaks[i]);
    }
    return kept;
}

} // namespace

float peak_prominence(const std::vector<float>& x, int peak) {
    const int n = static_cast<int>(x.size());
    const float height = x[peak];

    float left_min = height;
    for (int i = peak; i >= 0 && x[i] <= height; --i) {
        left_min = std::min(left_min, x[i]);
    }

    float right_min = height;
    for (int i = peak; i < n && x[i] <= height; ++i) {
        right_min = std::min(right_min, x[i]);
    }

    return height - std::max(left_min, right_min);
}

std::vector<Peak> find_peaks(const std::vector<float>& x, const PeakCriteria& criteria) {
    std::vector<Peak> result;
    if (x.size() < 3) return result;

    std::vector<int> peaks = local_maxima(x);

    if (criteria.height) {
        float h = *criteria.height;
        peaks.erase(std::remove_if(peaks.begin(), peaks.end(),
            [&](int p) { return x[p] < h; }), peaks.end());
    }

    if (criteria.distance > 1 && peaks.size() > 1) {
        peaks = select_by_distance(peaks, x, criteria.distance);
    }

    result.reserve(peaks.size());
    for (int p : peaks) {
        Peak peak;
        peak.index = p;
        peak.height = x[p];
        peak.prominence = peak_prominence(x, p);
        if (criteria.prominence && peak.prominence < *criteria.prominence) {
            continue;
        }
        result.push_back(peak);
    }

    return result;
}

} // namespace tracksense
