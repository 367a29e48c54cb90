#include "splice_engine.h"
#include "gap_constants.h"

namespace gapwalk {

const char* spliceOutcomeName(SpliceOutcome outcome) {
    switch (outcome) {
        case SpliceOutcome::Applied: return "Applied";
        case SpliceOutcome::NoGap: return "NoGap";
        case SpliceOutcome::AnchorOutOfRange: return "AnchorOutOfRange";
        case SpliceOutcome::AmbiguousAnchor: return "AmbiguousAnchor";
        case SpliceOutcome::AnchorNotInConsensus: return "AnchorNotInConsensus";
        case SpliceOutcome::ShortExtension: return "ShortExtension";
        case SpliceOutcome::NotAttempted: return "NotAttempted";
    }
    return "Unknown";
}

SpliceAnchors SpliceEngine::computeAnchors(const SequenceBuffer& reference, AnchorSide side,
                                           SpliceOutcome* outcome) {
    SpliceAnchors anchors;
    anchors.side = side;

    size_t p = 0;
    if (!reference.gapRun(p)) {
        if (outcome) *outcome = SpliceOutcome::NoGap;
        return anchors;
    }

    const size_t keepLength = ANCHOR_ALL_LENGTH - ANCHOR_PART_LENGTH;
    if (side == AnchorSide::Left) {
        if (p < ANCHOR_ALL_LENGTH) {
            if (outcome) *outcome = SpliceOutcome::AnchorOutOfRange;
            return anchors;
        }
        anchors.oldAnchorAll = reference.sequence().substr(p - ANCHOR_ALL_LENGTH, ANCHOR_ALL_LENGTH);
        anchors.oldAnchorPart = reference.sequence().substr(p - ANCHOR_PART_LENGTH, ANCHOR_PART_LENGTH);
        anchors.keep = anchors.oldAnchorAll.substr(0, keepLength);
    } else {
        size_t flankStart = p + GAP_RUN_LENGTH;
        if (flankStart + ANCHOR_ALL_LENGTH > reference.length()) {
            if (outcome) *outcome = SpliceOutcome::AnchorOutOfRange;
            return anchors;
        }
        anchors.oldAnchorAll = reference.sequence().substr(flankStart, ANCHOR_ALL_LENGTH);
        anchors.oldAnchorPart = reference.sequence().substr(flankStart, ANCHOR_PART_LENGTH);
        anchors.keep = anchors.oldAnchorAll.substr(ANCHOR_PART_LENGTH);
    }
    anchors.valid = true;
    if (outcome) *outcome = SpliceOutcome::Applied;
    return anchors;
}

std::string SpliceEngine::extensionFromConsensus(const SpliceAnchors& anchors, const std::string& consensus) {
    if (!anchors.valid) return std::string();
    if (anchors.side == AnchorSide::Left) {
        size_t pos = findNoCase(consensus, anchors.oldAnchorPart);
        if (pos == std::string::npos) return std::string();
        return toLowerCopy(consensus.substr(pos));
    }
    size_t pos = rfindNoCase(consensus, anchors.oldAnchorPart);
    if (pos == std::string::npos) return std::string();
    return toLowerCopy(consensus.substr(0, pos + anchors.oldAnchorPart.size()));
}

SpliceResult SpliceEngine::splice(const SequenceBuffer& target, const SpliceAnchors& anchors,
                                  const std::string& consensus) {
    SpliceResult result;
    result.sequence = target;
    if (!anchors.valid) {
        size_t p = 0;
        result.outcome = target.gapRun(p) ? SpliceOutcome::AnchorOutOfRange : SpliceOutcome::NoGap;
        return result;
    }

    if (target.countOccurrences(anchors.oldAnchorAll) != 1) {
        result.outcome = SpliceOutcome::AmbiguousAnchor;
        return result;
    }

    result.extension = extensionFromConsensus(anchors, consensus);
    if (result.extension.empty()) {
        result.outcome = SpliceOutcome::AnchorNotInConsensus;
        return result;
    }
    if (result.extension.size() < MIN_EXTENSION_LENGTH) {
        result.outcome = SpliceOutcome::ShortExtension;
        return result;
    }

    const std::string replacement = anchors.side == AnchorSide::Left
                                    ? anchors.keep + result.extension
                                    : result.extension + anchors.keep;
    result.sequence = target.replace(anchors.oldAnchorAll, replacement);
    result.outcome = SpliceOutcome::Applied;
    return result;
}

SpliceResult SpliceEngine::spliceSide(const SequenceBuffer& reference, AnchorSide side,
                                      const std::string& consensus) {
    return splice(reference, computeAnchors(reference, side), consensus);
}

} // namespace gapwalk
