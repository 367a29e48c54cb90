#ifndef GAPWALK_ANCHOR_EXTRACTOR_H
#define GAPWALK_ANCHOR_EXTRACTOR_H

#include "gap_constants.h"
#include "gap_types.h"

#include <cstdint>
#include <vector>

namespace gapwalk {

// Boundary coordinate (0-based) of one side of the gap starting at gapStart:
// gapStart-5 on the left, gapStart+15 on the right.
int64_t boundaryCoordinate(size_t gapStart, AnchorSide side);

// Reads usable as extension evidence on one side of the gap.
//   left:  0 <= boundary - start <= window, and the read sequence reaches the boundary
//   right: start - boundary >= -window
// Input order is kept.
std::vector<AnchorRead> extractAnchorReads(const std::vector<AlignedRead>& reads,
                                           size_t gapStart,
                                           AnchorSide side,
                                           int64_t window = ANCHOR_WINDOW);

} // namespace gapwalk

#endif // GAPWALK_ANCHOR_EXTRACTOR_H
