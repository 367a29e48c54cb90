#include "anchor_extractor.h"

namespace gapwalk {

int64_t boundaryCoordinate(size_t gapStart, AnchorSide side) {
    int64_t p = static_cast<int64_t>(gapStart);
    return side == AnchorSide::Left ? p + LEFT_BOUNDARY_OFFSET : p + RIGHT_BOUNDARY_OFFSET;
}

std::vector<AnchorRead> extractAnchorReads(const std::vector<AlignedRead>& reads,
                                           size_t gapStart,
                                           AnchorSide side,
                                           int64_t window) {
    std::vector<AnchorRead> anchors;
    const int64_t boundary = boundaryCoordinate(gapStart, side);

    for (const auto& r : reads) {
        if (r.sequence.empty()) continue;
        bool keep = false;
        if (side == AnchorSide::Left) {
            int64_t dist = boundary - r.start;
            keep = dist >= 0 && dist <= window
                   && r.start + static_cast<int64_t>(r.readLength()) > boundary;
        } else {
            // any read starting no more than window bases before the boundary
            keep = r.start - boundary >= -window;
        }
        if (keep) {
            AnchorRead a;
            a.id = r.id;
            a.sequence = r.sequence;
            anchors.push_back(a);
        }
    }
    return anchors;
}

} // namespace gapwalk
