/**
 * TrackSense - Segment Assembler Implementation
 */

#include "segment_assembler.h"
#include "../core/log.h"

namespace tracksense {

std::vector<Segment> SegmentAssembler::assemble(const std::vector<float>& boundaries) const {
    std::vector<Segment> segments;
    if (boundaries.size() < 2) {
        TRACKSENSE_LOG_DEBUG("Segments", "fewer than 2 boundaries, no segmentation");
        return segments;
    }

    segments.reserve(boundaries.size() - 1);
    for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
        Segment seg;
        seg.start_time = boundaries[i];
        seg.end_time = boundaries[i + 1];
        seg.duration = seg.end_time - seg.start_time;
        seg.segment_index = static_cast<int>(i);
        segments.push_back(seg);
    }

    return segments;
}

bool SegmentAssembler::is_contiguous(const std::vector<Segment>& segments) {
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (seg.segment_index != static_cast<int>(i) || seg.end_time < seg.start_time) {
            return false;
        }
        if (i + 1 < segments.size() && seg.end_time != segments[i + 1].start_time) {
            return false;
        }
    }
    return true;
}

} // namespace tracksense
