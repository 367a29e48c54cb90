#include "gap_finisher.h"
#include "gap_constants.h"
#include "gap_errors.h"

#include <cctype>

namespace gapwalk {

namespace {

bool sameBaseNoCase(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

// Last k bases of left equal the first k bases of right
bool suffixMatchesPrefix(const std::string& left, const std::string& right, size_t k) {
    const size_t offset = left.size() - k;
    for (size_t i = 0; i < k; ++i) {
        if (!sameBaseNoCase(left[offset + i], right[i])) return false;
    }
    return true;
}

} // namespace

const char* joinOutcomeName(JoinOutcome outcome) {
    switch (outcome) {
        case JoinOutcome::Joined: return "Joined";
        case JoinOutcome::NoGap: return "NoGap";
        case JoinOutcome::MultipleGaps: return "MultipleGaps";
        case JoinOutcome::FlankOutOfRange: return "FlankOutOfRange";
        case JoinOutcome::NoOverlap: return "NoOverlap";
    }
    return "Unknown";
}

JoinResult joinAcrossGap(const SequenceBuffer& reference) {
    JoinResult result;
    result.sequence = reference;

    size_t p = 0;
    if (!reference.gapRun(p)) {
        result.outcome = JoinOutcome::NoGap;
        return result;
    }
    if (reference.gapRunCount() > 1) {
        result.outcome = JoinOutcome::MultipleGaps;
        return result;
    }

    const std::string left = reference.slice(0, p);
    const std::string right = reference.slice(static_cast<long long>(p + GAP_RUN_LENGTH), reference.length());
    if (left.size() < FLANK_PATTERN_LENGTH || right.size() < FLANK_PATTERN_LENGTH) {
        result.outcome = JoinOutcome::FlankOutOfRange;
        return result;
    }

    const size_t maxOverlap = left.size() < right.size() ? left.size() : right.size();
    for (size_t k = FLANK_PATTERN_LENGTH; k <= maxOverlap; ++k) {
        if (suffixMatchesPrefix(left, right, k)) {
            result.sequence = SequenceBuffer(reference.id(), left.substr(0, left.size() - k) + right);
            result.outcome = JoinOutcome::Joined;
            result.overlapLength = k;
            return result;
        }
    }
    result.outcome = JoinOutcome::NoOverlap;
    return result;
}

SequenceBuffer finishGap(const SequenceBuffer& reference) {
    JoinResult join = joinAcrossGap(reference);
    switch (join.outcome) {
        case JoinOutcome::Joined:
        case JoinOutcome::NoGap:
            return join.sequence;
        case JoinOutcome::MultipleGaps:
            throw UnresolvableGap("sequence " + reference.id() + " carries " + std::to_string(reference.gapRunCount())
                                  + " gap runs, only one gap can be finished");
        case JoinOutcome::FlankOutOfRange:
            throw UnresolvableGap("gap of " + reference.id() + " has a flank shorter than "
                                  + std::to_string(FLANK_PATTERN_LENGTH) + " bases, the sequence cannot be used");
        case JoinOutcome::NoOverlap:
            break;
    }
    throw UnresolvableGap("the two sides of the gap in " + reference.id()
                          + " do not overlap, they cannot be judged joined");
}

} // namespace gapwalk
