#include "correction_stage.h"
#include "coverage_profile.h"
#include "gap_finisher.h"
#include "haplotype_bins.h"

namespace gapwalk {

CorrectionStage::CorrectionStage(const CorrectionConfig& config, const Collaborators& tools)
    : config_(config), tools_(tools), logMain_(nullptr) {
    tools_.requireAll();
}

size_t countMaskedDifferences(const std::string& before, const std::string& after) {
    size_t n = 0;
    size_t len = before.size() < after.size() ? before.size() : after.size();
    for (size_t i = 0; i < len; ++i) {
        if (after[i] == MASK_BASE && before[i] != MASK_BASE) ++n;
    }
    return n;
}

CorrectedSequence CorrectionStage::correctUnphased(const SequenceBuffer& finished, const AlignmentSet& alignments,
                                                   const std::string& sampleId) {
    CorrectedSequence out;
    std::vector<Variant> variants = tools_.variantCaller->call(finished, alignments, "final");
    out.variantsCalled = variants.size();

    VariantApplyStats stats;
    applyVariants(finished.sequence(), variants, &stats);
    out.variantsApplied = stats.applied;
    out.record.id = sampleId;
    out.record.sequence = tools_.variantCaller->apply(finished, variants);
    return out;
}

CorrectedSequence CorrectionStage::correctBin(const SequenceBuffer& finished, const HaplotypeBin& bin,
                                              const std::string& sampleId) {
    CorrectedSequence out;
    const std::string tag = "final.bin" + std::to_string(bin.label);
    out.bin = bin.label;

    std::vector<Variant> variants = tools_.variantCaller->call(finished, bin.alignments, tag);
    out.variantsCalled = variants.size();
    VariantApplyStats stats;
    applyVariants(finished.sequence(), variants, &stats);
    out.variantsApplied = stats.applied;
    std::string corrected = tools_.variantCaller->apply(finished, variants);

    CoverageProfile profile = tools_.depth->coverage(finished, bin.alignments);
    std::string masked = maskLowCoverage(corrected, profile, config_.maskFraction);
    out.maskedBases = countMaskedDifferences(corrected, masked);

    out.record.id = sampleId + "." + std::to_string(bin.label);
    out.record.sequence = masked;
    return out;
}

CorrectionResult CorrectionStage::run(const SequenceBuffer& extended, const std::string& sampleId) {
    const SequenceBuffer finished = finishGap(extended);

    CorrectionResult result;
    size_t gapStart = 0;
    result.joined = extended.gapRun(gapStart);
    if (result.joined && logMain_) {
        *logMain_ << "Correction: joined the sides of the gap, " << extended.length() << " -> "
                  << finished.length() << " bases\n";
    }
    AlignmentSet aln = tools_.aligner->align(finished, "final");
    aln = tools_.refiner->refine(finished, aln, "final");
    if (logMain_) {
        *logMain_ << "Correction: " << aln.size() << " alignments on the finished sequence ("
                  << finished.length() << " bases)\n";
    }

    if (config_.ploidy == PloidyMode::Homozygous) {
        result.outputs.push_back(correctUnphased(finished, aln, sampleId));
        return result;
    }

    CoverageProfile profile = tools_.depth->coverage(finished, aln);
    aln = downsampleToTarget(finished, aln, config_.targetCoverage, tools_, "final", profile);

    PhasingResult phasing = tools_.phaser->phase(finished, aln, "final");
    if (!phasingSeparated(phasing)) {
        if (logMain_) {
            *logMain_ << "Correction: reads did not separate into two haplotypes, writing a single sequence\n";
        }
        const HaplotypeBin* bin = selectDrivingBin(phasing);
        result.outputs.push_back(correctUnphased(finished, bin ? bin->alignments : aln, sampleId));
        return result;
    }

    result.phased = true;
    const int labels[] = {BIN_HAPLOTYPE_0, BIN_HAPLOTYPE_1};
    for (int label : labels) {
        const HaplotypeBin* bin = findBin(phasing, label);
        if (bin == nullptr || bin->alignments.empty()) continue;
        CorrectedSequence cs = correctBin(finished, *bin, sampleId);
        if (logMain_) {
            *logMain_ << "Correction: bin " << label << " alignments=" << bin->alignments.size()
                      << " variants=" << cs.variantsCalled << " applied=" << cs.variantsApplied
                      << " masked=" << cs.maskedBases << "\n";
        }
        result.outputs.push_back(cs);
    }
    return result;
}

} // namespace gapwalk
