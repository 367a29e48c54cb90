#include "haplotype_bins.h"
#include "gap_constants.h"

namespace gapwalk {

double downsampleFraction(double meanCoverage, double target) {
    if (meanCoverage <= target || meanCoverage <= 0.0) return 1.0;
    return target / meanCoverage;
}

AlignmentSet downsampleToTarget(const SequenceBuffer& reference, const AlignmentSet& alignments,
                                double target, const Collaborators& tools, const std::string& tag,
                                CoverageProfile& profile) {
    double fraction = downsampleFraction(profile.meanCoverage(), target);
    if (fraction >= 1.0) {
        return alignments;
    }
    AlignmentSet reduced = tools.downsampler->downsample(alignments, fraction, tag);
    profile = tools.depth->coverage(reference, reduced);
    return reduced;
}

const HaplotypeBin* findBin(const PhasingResult& phasing, int label) {
    for (const auto& b : phasing.bins) {
        if (b.label == label) return &b;
    }
    return nullptr;
}

bool phasingSeparated(const PhasingResult& phasing) {
    if (!phasing.separated) return false;
    const HaplotypeBin* bin1 = findBin(phasing, BIN_HAPLOTYPE_1);
    return bin1 != nullptr && !bin1->alignments.empty();
}

const HaplotypeBin* selectDrivingBin(const PhasingResult& phasing) {
    if (!phasingSeparated(phasing)) {
        const HaplotypeBin* unseparated = findBin(phasing, BIN_UNSEPARATED);
        if (unseparated) return unseparated;
        return findBin(phasing, BIN_HAPLOTYPE_0);
    }
    const HaplotypeBin* bin0 = findBin(phasing, BIN_HAPLOTYPE_0);
    const HaplotypeBin* bin1 = findBin(phasing, BIN_HAPLOTYPE_1);
    if (bin0 == nullptr) return bin1;
    return bin1->alignments.size() > bin0->alignments.size() ? bin1 : bin0;
}

} // namespace gapwalk
