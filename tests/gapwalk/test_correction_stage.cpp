// CorrectionStage: homozygous correction, phased per-bin output with masking,
// unseparated fallback, joining across the gap and unresolvable gaps

#include <iostream>
#include <string>
#include <vector>

#include "correction_stage.h"
#include "extension_loop.h"
#include "fake_collaborators.h"
#include "gap_errors.h"
#include "snapshot_store.h"

using namespace gapwalk;
using testing::FakeToolSet;
using testing::StaticAligner;
using testing::TableDepth;

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static const std::string S = testing::pseudoRandomBases(40, 21);

static std::string otherBase(char c) {
    return c == 'A' ? "C" : "A";
}

static AlignmentSet readsOfSize(size_t n) {
    AlignmentSet aln;
    for (size_t i = 0; i < n; ++i) {
        aln.reads.push_back(AlignedRead("r" + std::to_string(i), S.substr(0, 20), static_cast<int64_t>(i), 20));
    }
    return aln;
}

// positions 1..30 at depth 100 except position 5; 31..40 not reported
static void fillDepth(TableDepth& depth) {
    for (uint64_t pos1 = 1; pos1 <= 30; ++pos1) depth.table[pos1] = 100;
    depth.table[5] = 10;
}

static CorrectionConfig correctionConfig(PloidyMode ploidy) {
    CorrectionConfig config;
    config.ploidy = ploidy;
    return config;
}

static int testHomozygous() {
    int failed = 0;
    StaticAligner aligner;
    aligner.alignments = readsOfSize(4);
    TableDepth depth;
    fillDepth(depth);
    FakeToolSet fakes;
    fakes.caller.bySize[4].push_back(Variant(10, S.substr(9, 1), otherBase(S[9])));
    fakes.caller.bySize[4].push_back(Variant(12, otherBase(S[11]), "G")); // ref allele does not match

    CorrectionStage stage(correctionConfig(PloidyMode::Homozygous), fakes.bundle(aligner, depth));
    CorrectionResult res = stage.run(SequenceBuffer("ctg", S), "S1");

    std::string expected = S;
    expected.replace(9, 1, otherBase(S[9]));
    failed += check(!res.phased && res.outputs.size() == 1, "homozygous: one output");
    failed += check(res.outputs[0].record.id == "S1" && res.outputs[0].bin == -1, "homozygous: record named after the sample");
    failed += check(res.outputs[0].record.sequence == expected, "homozygous: variant applied");
    failed += check(res.outputs[0].variantsCalled == 2 && res.outputs[0].variantsApplied == 1,
                    "homozygous: variant with mismatching ref allele skipped");
    failed += check(res.outputs[0].maskedBases == 0, "homozygous: no masking");
    failed += check(fakes.refiner.calls == 1, "homozygous: alignments refined");
    failed += check(fakes.phaser.calls == 0, "homozygous: no phasing");
    return failed;
}

static int testPhasedBins() {
    int failed = 0;
    StaticAligner aligner;
    aligner.alignments = readsOfSize(5);
    TableDepth depth;
    fillDepth(depth);
    FakeToolSet fakes;
    fakes.phaser.result.separated = true;
    fakes.phaser.result.bins.push_back(HaplotypeBin(BIN_HAPLOTYPE_0, readsOfSize(2)));
    fakes.phaser.result.bins.push_back(HaplotypeBin(BIN_HAPLOTYPE_1, readsOfSize(3)));
    fakes.caller.bySize[2].push_back(Variant(20, S.substr(19, 1), otherBase(S[19])));
    fakes.caller.bySize[3].push_back(Variant(10, S.substr(9, 1), otherBase(S[9])));

    CorrectionStage stage(correctionConfig(PloidyMode::Heterozygous), fakes.bundle(aligner, depth));
    CorrectionResult res = stage.run(SequenceBuffer("ctg", S), "S1");

    failed += check(res.phased && res.outputs.size() == 2, "separated bins: two outputs");
    if (res.outputs.size() != 2) return failed + 1;

    std::string bin0 = S;
    bin0.replace(19, 1, otherBase(S[19]));
    bin0[4] = 'N';
    std::string bin1 = S;
    bin1.replace(9, 1, otherBase(S[9]));
    bin1[4] = 'N';

    failed += check(res.outputs[0].record.id == "S1.0" && res.outputs[1].record.id == "S1.1", "records named <sample>.<bin>");
    failed += check(res.outputs[0].record.sequence == bin0, "bin 0: own variant applied, low-coverage base masked");
    failed += check(res.outputs[1].record.sequence == bin1, "bin 1: own variant applied, low-coverage base masked");
    failed += check(res.outputs[0].maskedBases == 1 && res.outputs[1].maskedBases == 1, "one masked base per bin");
    failed += check(res.outputs[1].record.sequence.substr(30) == S.substr(30), "positions after the last reported depth kept");
    failed += check(fakes.downsampler.calls == 0, "mean below 100: no downsampling");
    return failed;
}

static int testUnseparated() {
    int failed = 0;
    StaticAligner aligner;
    aligner.alignments = readsOfSize(4);
    TableDepth depth;
    fillDepth(depth);
    FakeToolSet fakes;
    fakes.caller.bySize[4].push_back(Variant(10, S.substr(9, 1), otherBase(S[9])));

    CorrectionStage stage(correctionConfig(PloidyMode::Heterozygous), fakes.bundle(aligner, depth));
    CorrectionResult res = stage.run(SequenceBuffer("ctg", S), "S1");

    failed += check(!res.phased && res.outputs.size() == 1, "unseparated: single output");
    failed += check(res.outputs[0].record.id == "S1", "unseparated: record named after the sample");
    failed += check(res.outputs[0].record.sequence[4] != 'N' && res.outputs[0].maskedBases == 0, "unseparated: no masking");
    failed += check(res.outputs[0].variantsApplied == 1, "unseparated: variants applied");

    // bin 1 empty counts as unseparated
    FakeToolSet oneBin;
    oneBin.phaser.result.separated = true;
    oneBin.phaser.result.bins.push_back(HaplotypeBin(BIN_HAPLOTYPE_0, readsOfSize(2)));
    oneBin.phaser.result.bins.push_back(HaplotypeBin(BIN_HAPLOTYPE_1, AlignmentSet()));
    CorrectionStage stage2(correctionConfig(PloidyMode::Heterozygous), oneBin.bundle(aligner, depth));
    CorrectionResult res2 = stage2.run(SequenceBuffer("ctg", S), "S1");
    failed += check(!res2.phased && res2.outputs.size() == 1 && res2.outputs[0].record.id == "S1",
                    "empty bin 1: single unphased output");
    return failed;
}

static bool runThrowsUnresolvable(CorrectionStage& stage, const SequenceBuffer& ref) {
    try {
        stage.run(ref, "S1");
    } catch (const UnresolvableGap&) {
        return true;
    }
    return false;
}

static int testUnresolvable() {
    int failed = 0;
    const std::string GAP(GAP_RUN);
    const std::string L = testing::pseudoRandomBases(30, 22);
    const std::string R = testing::pseudoRandomBases(30, 23);

    StaticAligner aligner;
    TableDepth depth;
    FakeToolSet fakes;
    CorrectionStage stage(correctionConfig(PloidyMode::Homozygous), fakes.bundle(aligner, depth));

    failed += check(runThrowsUnresolvable(stage, SequenceBuffer("ctg", L + GAP + R)),
                    "sides that do not overlap cannot be joined");
    failed += check(runThrowsUnresolvable(stage, SequenceBuffer("ctg", L + GAP + R + GAP + L)),
                    "two gap runs are unresolvable");
    failed += check(runThrowsUnresolvable(stage, SequenceBuffer("ctg", GAP + R)), "gap without a left flank");
    failed += check(fakes.caller.tags.empty() && fakes.refiner.calls == 0,
                    "unresolvable gap stops before alignment and variant calling");

    CorrectionResult res = stage.run(SequenceBuffer("ctg", L + R), "S1");
    failed += check(!res.joined && res.outputs.size() == 1 && res.outputs[0].record.sequence == L + R,
                    "sequence without a gap run corrected as is");
    return failed;
}

// Extension loop followed by correction on a genome whose middle the two
// sides walk into from both ends
static int testConvergedRun() {
    int failed = 0;
    const std::string L = testing::pseudoRandomBases(100, 1);
    const std::string M = testing::pseudoRandomBases(60, 3);
    const std::string R = testing::pseudoRandomBases(100, 2);
    const SequenceBuffer gapped("ctg", L + std::string(GAP_RUN) + R);

    testing::GenomeAligner aligner(L + M + R);
    testing::UniformDepth depth(50);
    FakeToolSet fakes;
    SnapshotStore store;
    LoopConfig loopConfig;
    loopConfig.iterMax = 10;
    ExtensionLoop loop(loopConfig, fakes.bundle(aligner, depth), store);
    LoopResult loopRes = loop.run(gapped);
    failed += check(loopRes.state == LoopState::StoppedSidesMet, "converged run: sides met");

    CorrectionStage stage(correctionConfig(PloidyMode::Homozygous), fakes.bundle(aligner, depth));
    CorrectionResult res = stage.run(loopRes.finalSequence, "S1");
    failed += check(res.outputs.size() == 1, "converged run: one output");
    if (res.outputs.size() != 1) return failed + 1;
    const std::string& out = res.outputs[0].record.sequence;
    failed += check(out.find(GAP_RUN) == std::string::npos, "converged run: no gap marker in the output");
    failed += check(toUpperCopy(out) == L + M + R, "converged run: output is the true genome");

    // a run that stopped with the sides still apart is not joined
    CorrectionStage apart(correctionConfig(PloidyMode::Homozygous), fakes.bundle(aligner, depth));
    failed += check(runThrowsUnresolvable(apart, gapped), "sides still apart: unresolvable");
    return failed;
}

int main() {
    int failed = 0;

    failed += testHomozygous();
    failed += testPhasedBins();
    failed += testUnseparated();
    failed += testUnresolvable();
    failed += testConvergedRun();
    failed += check(countMaskedDifferences("ACGTN", "ANGNN") == 2, "masked differences count new N only");

    if (failed == 0) {
        std::cout << "PASS: correction stage\n";
        return 0;
    }
    return 1;
}
