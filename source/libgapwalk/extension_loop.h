#ifndef GAPWALK_EXTENSION_LOOP_H
#define GAPWALK_EXTENSION_LOOP_H

#include "collaborators.h"
#include "consensus_builder.h"
#include "gap_constants.h"
#include "gap_types.h"
#include "sequence_buffer.h"
#include "snapshot_store.h"
#include "splice_engine.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace gapwalk {

enum class LoopState : uint8_t {
    Running = 0,
    StoppedNoGrowth,
    StoppedHighCoverage,
    StoppedSidesMet,
    StoppedMaxIterations
};

const char* loopStateName(LoopState state);

struct LoopConfig {
    PloidyMode ploidy;
    uint32_t iterMax;          // iteration budget L
    double coverageExpected;   // C; extension stops above COVERAGE_CEILING_FACTOR * C

    LoopConfig() : ploidy(PloidyMode::Homozygous), iterMax(100), coverageExpected(1000.0) {}
};

// What one iteration observed and decided
struct IterationRecord {
    uint32_t iteration;
    size_t lengthBefore;
    size_t lengthAfter;
    size_t gapStart;
    size_t leftReads;
    size_t rightReads;
    double leftCoverage;
    double rightCoverage;
    SpliceOutcome leftOutcome;
    SpliceOutcome rightOutcome;
    LoopState state;

    IterationRecord()
        : iteration(0), lengthBefore(0), lengthAfter(0), gapStart(0), leftReads(0), rightReads(0),
          leftCoverage(0.0), rightCoverage(0.0),
          leftOutcome(SpliceOutcome::NotAttempted), rightOutcome(SpliceOutcome::NotAttempted),
          state(LoopState::Running) {}
};

struct LoopResult {
    LoopState state;
    SequenceBuffer finalSequence;
    uint32_t firstIteration;  // > 1 when resumed from a snapshot
    uint32_t lastIteration;   // 0 when no iteration ran
    std::vector<IterationRecord> history;

    LoopResult() : state(LoopState::Running), firstIteration(1), lastIteration(0) {}
};

// Drives align -> select anchor reads -> consensus -> splice cycles until one
// of the terminal states is reached. When the sides meet, the two extensions
// are joined across the gap run (joinAcrossGap) before the result is kept. The only mutable state across iterations
// is the committed reference held by run().
class ExtensionLoop {
public:
    ExtensionLoop(const LoopConfig& config, const Collaborators& tools, SnapshotStore& store);

    // Either stream may be null
    void setLogs(std::ostream* logMain, std::ostream* logProgress);

    // Starts from the latest snapshot in the store when there is one,
    // otherwise from initial. Every iteration's reference is saved to the
    // store; the final reference is saved with saveFinal().
    LoopResult run(const SequenceBuffer& initial);

    double coverageCeiling() const { return COVERAGE_CEILING_FACTOR * config_.coverageExpected; }

    static void writeProgressHeader(std::ostream& out);

private:
    // One iteration; returns Running when current was replaced by the next reference
    LoopState iterate(uint32_t iteration, SequenceBuffer& current, SequenceBuffer& finalSequence,
                      IterationRecord& rec);

    // Alignments and coverage profile that drive extension this iteration
    AlignmentSet drivingAlignments(const SequenceBuffer& reference, const std::string& tag,
                                   CoverageProfile& profile);

    bool sidesMet(const SequenceBuffer& next) const;

    void logProgress(const IterationRecord& rec);
    void logSplice(const std::string& tag, AnchorSide side, const SpliceResult& res);

    LoopConfig config_;
    Collaborators tools_;
    SnapshotStore& store_;
    ConsensusBuilder consensus_;
    std::ostream* logMain_;
    std::ostream* logProgress_;
};

} // namespace gapwalk

#endif // GAPWALK_EXTENSION_LOOP_H
