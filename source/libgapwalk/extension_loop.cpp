#include "extension_loop.h"
#include "anchor_extractor.h"
#include "gap_finisher.h"
#include "haplotype_bins.h"

namespace gapwalk {

namespace {

MsaConsensus& checkedMsa(const Collaborators& tools) {
    tools.requireAll();
    return *tools.msa;
}

} // namespace

const char* loopStateName(LoopState state) {
    switch (state) {
        case LoopState::Running: return "Running";
        case LoopState::StoppedNoGrowth: return "StoppedNoGrowth";
        case LoopState::StoppedHighCoverage: return "StoppedHighCoverage";
        case LoopState::StoppedSidesMet: return "StoppedSidesMet";
        case LoopState::StoppedMaxIterations: return "StoppedMaxIterations";
    }
    return "Unknown";
}

ExtensionLoop::ExtensionLoop(const LoopConfig& config, const Collaborators& tools, SnapshotStore& store)
    : config_(config), tools_(tools), store_(store), consensus_(checkedMsa(tools)),
      logMain_(nullptr), logProgress_(nullptr) {}

void ExtensionLoop::setLogs(std::ostream* logMain, std::ostream* logProgress) {
    logMain_ = logMain;
    logProgress_ = logProgress;
}

void ExtensionLoop::writeProgressHeader(std::ostream& out) {
    out << "iteration\tlength_before\tlength_after\tgap_start\tleft_reads\tright_reads"
        << "\tleft_coverage\tright_coverage\tleft_splice\tright_splice\tstate\n" << std::flush;
}

void ExtensionLoop::logProgress(const IterationRecord& rec) {
    if (!logProgress_) return;
    *logProgress_ << rec.iteration << '\t' << rec.lengthBefore << '\t' << rec.lengthAfter
                  << '\t' << rec.gapStart << '\t' << rec.leftReads << '\t' << rec.rightReads
                  << '\t' << rec.leftCoverage << '\t' << rec.rightCoverage
                  << '\t' << spliceOutcomeName(rec.leftOutcome) << '\t' << spliceOutcomeName(rec.rightOutcome)
                  << '\t' << loopStateName(rec.state) << '\n' << std::flush;
}

void ExtensionLoop::logSplice(const std::string& tag, AnchorSide side, const SpliceResult& res) {
    if (!logMain_) return;
    *logMain_ << tag << ": " << anchorSideName(side) << " splice " << spliceOutcomeName(res.outcome)
              << ", extension " << res.extension.size() << " bases\n";
}

LoopResult ExtensionLoop::run(const SequenceBuffer& initial) {
    LoopResult result;
    SequenceBuffer current = initial;

    IterationSnapshot last;
    if (store_.latest(last)) {
        current = last.sequence;
        result.firstIteration = last.iteration + 1;
        if (logMain_) {
            *logMain_ << "Resuming gap extension from iteration " << last.iteration
                      << " snapshot, length=" << current.length() << "\n";
        }
    }

    if (result.firstIteration > config_.iterMax) {
        // budget already spent by the run that produced the snapshots
        result.state = LoopState::StoppedMaxIterations;
        result.finalSequence = current;
        store_.saveFinal(current);
        return result;
    }

    uint32_t budget = config_.iterMax - (result.firstIteration - 1);
    uint32_t iteration = result.firstIteration;
    LoopState state = LoopState::Running;
    SequenceBuffer finalSequence = current;

    while (state == LoopState::Running) {
        IterationRecord rec;
        rec.iteration = iteration;
        state = iterate(iteration, current, finalSequence, rec);

        if (state == LoopState::Running) {
            --budget;
            if (budget == 0) {
                state = LoopState::StoppedMaxIterations;
                finalSequence = current;
            }
        }
        rec.state = state;
        result.history.push_back(rec);
        result.lastIteration = iteration;
        logProgress(rec);
        ++iteration;
    }

    if (logMain_) {
        *logMain_ << "Gap extension finished: " << loopStateName(state) << " after iteration "
                  << result.lastIteration << ", final length=" << finalSequence.length() << "\n" << std::flush;
    }
    result.state = state;
    result.finalSequence = finalSequence;
    store_.saveFinal(finalSequence);
    return result;
}

AlignmentSet ExtensionLoop::drivingAlignments(const SequenceBuffer& reference, const std::string& tag,
                                              CoverageProfile& profile) {
    AlignmentSet aln = tools_.aligner->align(reference, tag);
    if (config_.ploidy == PloidyMode::Homozygous) {
        profile = tools_.depth->coverage(reference, aln);
        return aln;
    }

    aln = tools_.refiner->refine(reference, aln, tag);
    profile = tools_.depth->coverage(reference, aln);
    aln = downsampleToTarget(reference, aln, DOWNSAMPLE_TARGET_COVERAGE, tools_, tag, profile);

    PhasingResult phasing = tools_.phaser->phase(reference, aln, tag);
    const HaplotypeBin* bin = selectDrivingBin(phasing);
    if (bin == nullptr) {
        // phaser produced nothing usable; extend from all alignments
        return aln;
    }
    if (logMain_) {
        *logMain_ << tag << ": extending with haplotype bin " << bin->label << " ("
                  << bin->alignments.size() << " alignments)\n";
    }
    profile = tools_.depth->coverage(reference, bin->alignments);
    return bin->alignments;
}

bool ExtensionLoop::sidesMet(const SequenceBuffer& next) const {
    size_t p = 0;
    if (!next.gapRun(p)) return false;
    if (p < FLANK_PATTERN_LENGTH || p + GAP_RUN_LENGTH + FLANK_PATTERN_LENGTH > next.length()) {
        return false;
    }
    const std::string leftPattern = next.sequence().substr(p - FLANK_PATTERN_LENGTH, FLANK_PATTERN_LENGTH);
    const std::string rightPattern = next.sequence().substr(p + GAP_RUN_LENGTH, FLANK_PATTERN_LENGTH);
    return next.countOccurrences(leftPattern) >= 2 && next.countOccurrences(rightPattern) >= 2;
}

LoopState ExtensionLoop::iterate(uint32_t iteration, SequenceBuffer& current, SequenceBuffer& finalSequence,
                                 IterationRecord& rec) {
    const std::string tag = "iter" + std::to_string(iteration);
    rec.lengthBefore = rec.lengthAfter = current.length();

    CoverageProfile profile;
    AlignmentSet aln = drivingAlignments(current, tag, profile);

    size_t p = 0;
    if (!current.gapRun(p)) {
        if (logMain_) *logMain_ << tag << ": no gap marker left, scaffolds are joined\n";
        store_.save(iteration, current);
        finalSequence = current;
        return LoopState::StoppedSidesMet;
    }
    rec.gapStart = p;

    std::vector<AnchorRead> leftReads = extractAnchorReads(aln.reads, p, AnchorSide::Left);
    std::vector<AnchorRead> rightReads = extractAnchorReads(aln.reads, p, AnchorSide::Right);
    rec.leftReads = leftReads.size();
    rec.rightReads = rightReads.size();
    rec.leftCoverage = profile.depthAt(static_cast<uint64_t>(boundaryCoordinate(p, AnchorSide::Left) + 1));
    rec.rightCoverage = profile.depthAt(static_cast<uint64_t>(boundaryCoordinate(p, AnchorSide::Right) + 1));

    const double ceiling = coverageCeiling();
    if (logMain_) {
        *logMain_ << tag << ": gap at " << p << ", anchor reads left=" << rec.leftReads
                  << " right=" << rec.rightReads << ", boundary coverage left=" << rec.leftCoverage
                  << " right=" << rec.rightCoverage << " (ceiling " << ceiling << ")\n";
    }

    if (rec.leftCoverage > ceiling && rec.rightCoverage > ceiling) {
        store_.save(iteration, current);
        finalSequence = current;
        return LoopState::StoppedHighCoverage;
    }

    // Both anchors come from the reference as it was before this iteration;
    // the right splice is applied to the post-left-splice buffer.
    const SpliceAnchors leftAnchors = SpliceEngine::computeAnchors(current, AnchorSide::Left);
    const SpliceAnchors rightAnchors = SpliceEngine::computeAnchors(current, AnchorSide::Right);

    SequenceBuffer next = current;
    bool coverageSkipped = false;
    if (!leftReads.empty()) {
        if (rec.leftCoverage <= ceiling) {
            std::string cons = consensus_.build(leftReads, tag + ".left");
            SpliceResult res = SpliceEngine::splice(next, leftAnchors, cons);
            rec.leftOutcome = res.outcome;
            logSplice(tag, AnchorSide::Left, res);
            next = res.sequence;
        } else {
            coverageSkipped = true;
        }
    }
    if (!rightReads.empty()) {
        if (rec.rightCoverage <= ceiling) {
            std::string cons = consensus_.build(rightReads, tag + ".right");
            SpliceResult res = SpliceEngine::splice(next, rightAnchors, cons);
            rec.rightOutcome = res.outcome;
            logSplice(tag, AnchorSide::Right, res);
            next = res.sequence;
        } else {
            coverageSkipped = true;
        }
    }
    rec.lengthAfter = next.length();

    if (next.length() <= current.length()) {
        store_.save(iteration, current);
        finalSequence = current;
        return LoopState::StoppedNoGrowth;
    }

    // Convergence is only judged when both sides extended from reads this
    // round, and never when a side was held back by its coverage.
    if (!leftReads.empty() && !rightReads.empty() && !coverageSkipped && sidesMet(next)) {
        JoinResult join = joinAcrossGap(next);
        if (logMain_) {
            *logMain_ << tag << ": sides met, join across the gap " << joinOutcomeName(join.outcome);
            if (join.joined()) *logMain_ << " with " << join.overlapLength << " overlapping bases";
            *logMain_ << "\n";
        }
        if (join.joined()) next = join.sequence;
        rec.lengthAfter = next.length();
        store_.save(iteration, next);
        finalSequence = next;
        return LoopState::StoppedSidesMet;
    }

    current = next;
    store_.save(iteration, current);
    return LoopState::Running;
}

} // namespace gapwalk
