#ifndef GAPWALK_SPLICE_ENGINE_H
#define GAPWALK_SPLICE_ENGINE_H

#include "gap_types.h"
#include "sequence_buffer.h"

#include <cstdint>
#include <string>

namespace gapwalk {

enum class SpliceOutcome : uint8_t {
    Applied = 0,
    NoGap,                // reference has no gap run
    AnchorOutOfRange,     // flank shorter than ANCHOR_ALL_LENGTH
    AmbiguousAnchor,      // oldAnchorAll not exactly once in the target
    AnchorNotInConsensus, // oldAnchorPart absent from the consensus
    ShortExtension,       // extension shorter than MIN_EXTENSION_LENGTH
    NotAttempted          // side not extended this iteration
};

const char* spliceOutcomeName(SpliceOutcome outcome);

// Fixed-width anchors of one side, sliced from the reference at the gap run.
//   left:  all = [p-35, p)      part = [p-15, p)      keep = [p-35, p-15)
//   right: all = [p+10, p+45)   part = [p+10, p+25)   keep = [p+25, p+45)
// keep is the part of oldAnchorAll that the extension does not cover.
struct SpliceAnchors {
    AnchorSide side;
    std::string oldAnchorAll;
    std::string oldAnchorPart;
    std::string keep;
    bool valid;

    SpliceAnchors() : side(AnchorSide::Left), valid(false) {}
};

struct SpliceResult {
    SequenceBuffer sequence;
    SpliceOutcome outcome;
    std::string extension; // lower-case extension, also filled when a guard fails

    SpliceResult() : outcome(SpliceOutcome::NotAttempted) {}
    bool applied() const { return outcome == SpliceOutcome::Applied; }
};

class SpliceEngine {
public:
    // NoGap / AnchorOutOfRange are reported through outcome when !valid
    static SpliceAnchors computeAnchors(const SequenceBuffer& reference, AnchorSide side,
                                        SpliceOutcome* outcome = nullptr);

    // Part of consensus anchored at oldAnchorPart, lower-cased; empty when absent.
    //   left:  match of part .. consensus end
    //   right: consensus start .. end of the last match of part
    static std::string extensionFromConsensus(const SpliceAnchors& anchors, const std::string& consensus);

    // Apply the extension to target when oldAnchorAll occurs exactly once in it
    // and the extension has at least MIN_EXTENSION_LENGTH bases; otherwise
    // return target unchanged.
    static SpliceResult splice(const SequenceBuffer& target, const SpliceAnchors& anchors,
                               const std::string& consensus);

    // computeAnchors on reference + splice into reference
    static SpliceResult spliceSide(const SequenceBuffer& reference, AnchorSide side,
                                   const std::string& consensus);
};

} // namespace gapwalk

#endif // GAPWALK_SPLICE_ENGINE_H
