#ifndef GAPWALK_CORRECTION_STAGE_H
#define GAPWALK_CORRECTION_STAGE_H

#include "collaborators.h"
#include "gap_constants.h"
#include "gap_types.h"
#include "sequence_buffer.h"

#include <ostream>
#include <string>
#include <vector>

namespace gapwalk {

struct CorrectionConfig {
    PloidyMode ploidy;
    double targetCoverage;   // downsampling target before phasing
    double maskFraction;     // bases at or below this fraction of the mean depth become N

    CorrectionConfig()
        : ploidy(PloidyMode::Homozygous), targetCoverage(DOWNSAMPLE_TARGET_COVERAGE),
          maskFraction(MASK_COVERAGE_FRACTION) {}
};

struct CorrectedSequence {
    int bin;                 // haplotype bin, -1 for the single (unphased) output
    FastaRecord record;
    size_t variantsCalled;
    size_t variantsApplied;
    size_t maskedBases;

    CorrectedSequence() : bin(-1), variantsCalled(0), variantsApplied(0), maskedBases(0) {}
};

struct CorrectionResult {
    std::vector<CorrectedSequence> outputs;
    bool phased;             // true when one output per haplotype bin was produced
    bool joined;             // the gap run was removed before correction

    CorrectionResult() : phased(false), joined(false) {}
};

// Re-maps reads to the finished sequence, calls and applies variants and, for
// heterozygous samples whose reads separate into two bins, masks the bases of
// each bin that lack read support.
class CorrectionStage {
public:
    CorrectionStage(const CorrectionConfig& config, const Collaborators& tools);

    void setLog(std::ostream* logMain) { logMain_ = logMain; }

    // A sequence still carrying its gap run is first joined across it
    // (finishGap); UnresolvableGap is thrown when the sides cannot be joined.
    CorrectionResult run(const SequenceBuffer& extended, const std::string& sampleId);

private:
    CorrectedSequence correctUnphased(const SequenceBuffer& finished, const AlignmentSet& alignments,
                                      const std::string& sampleId);
    CorrectedSequence correctBin(const SequenceBuffer& finished, const HaplotypeBin& bin,
                                 const std::string& sampleId);

    CorrectionConfig config_;
    Collaborators tools_;
    std::ostream* logMain_;
};

size_t countMaskedDifferences(const std::string& before, const std::string& after);

} // namespace gapwalk

#endif // GAPWALK_CORRECTION_STAGE_H
