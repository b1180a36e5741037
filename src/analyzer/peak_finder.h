/**
 * TrackSense - Peak Finder
 */

#ifndef TRACKSENSE_PEAK_FINDER_H
#define TRACKSENSE_PEAK_FINDER_H

#include <optional>
#include <vector>

namespace tracksense {

struct Peak {
    int index = 0;
    float height = 0.0f;
    float prominence = 0.0f;
};

struct PeakCriteria {
    std::optional<float> height;        // Minimum sample value at the peak
    int distance = 1;                   // Minimum index spacing between kept peaks
    std::optional<float> prominence;    // Minimum prominence
};

/**
 * Local-maximum search with the same filter order as scipy.signal.find_peaks:
 * plateau-aware maxima, then height, then distance (tallest first), then prominence.
 * Returned peaks are ordered by index.
 */
std::vector<Peak> find_peaks(const std::vector<float>& x, const PeakCriteria& criteria);

/**
 * Prominence of the sample at `peak`: height above the higher of the two lowest
 * points reachable before the signal rises above the peak on either side.
 */
float peak_prominence(const std::vector<float>& x, int peak);

} // namespace tracksense

#endif // TRACKSENSE_PEAK_FINDER_H
