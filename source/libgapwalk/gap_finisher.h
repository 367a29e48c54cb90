#ifndef GAPWALK_GAP_FINISHER_H
#define GAPWALK_GAP_FINISHER_H

#include "sequence_buffer.h"

#include <cstdint>
#include <string>

namespace gapwalk {

enum class JoinOutcome : uint8_t {
    Joined = 0,
    NoGap,           // nothing to join
    MultipleGaps,    // more than one gap run
    FlankOutOfRange, // a side is shorter than FLANK_PATTERN_LENGTH
    NoOverlap        // the flank patterns cannot be placed on the other side
};

const char* joinOutcomeName(JoinOutcome outcome);

struct JoinResult {
    SequenceBuffer sequence;  // joined sequence, or the input when not joined
    JoinOutcome outcome;
    size_t overlapLength;     // bases shared by the two sides, dropped once

    JoinResult() : outcome(JoinOutcome::NoGap), overlapLength(0) {}
    bool joined() const { return outcome == JoinOutcome::Joined; }
};

// Join the two sides of the gap run once their extensions overlap.
// With left = seq[0,p) and right = seq[p+10,end), the overlap is the shortest
// k >= FLANK_PATTERN_LENGTH for which the last k bases of left equal the first
// k bases of right (case-insensitive): the right 20-base flank pattern then
// sits inside left and the left pattern inside right. The joined sequence is
// left[0, |left|-k) + right, so the gap run and the duplicated overlap go.
JoinResult joinAcrossGap(const SequenceBuffer& reference);

// Sequence ready for correction: the input when it has no gap run, the joined
// sequence otherwise. Throws UnresolvableGap when the sides cannot be joined.
SequenceBuffer finishGap(const SequenceBuffer& reference);

} // namespace gapwalk

#endif // GAPWALK_GAP_FINISHER_H
