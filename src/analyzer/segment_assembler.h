/**
 * TrackSense - Segment Assembler
 */

#ifndef TRACKSENSE_SEGMENT_ASSEMBLER_H
#define TRACKSENSE_SEGMENT_ASSEMBLER_H

#include "tracksense/types.h"

namespace tracksense {

/**
 * Turns ordered boundary times into contiguous segments.
 * n boundaries give n - 1 segments; fewer than 2 boundaries give none.
 */
class SegmentAssembler {
public:
    SegmentAssembler() = default;

    std::vector<Segment> assemble(const std::vector<float>& boundaries) const;

    /**
     * True when segments are ordered, contiguous and indexed 0..n-1.
     */
    static bool is_contiguous(const std::vector<Segment>& segments);
};

} // namespace tracksense

#endif // TRACKSENSE_SEGMENT_ASSEMBLER_H
