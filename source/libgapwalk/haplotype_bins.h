#ifndef GAPWALK_HAPLOTYPE_BINS_H
#define GAPWALK_HAPLOTYPE_BINS_H

#include "collaborators.h"
#include "gap_types.h"

#include <string>

namespace gapwalk {

// Fraction of reads to keep so that meanCoverage drops to target; 1 when no
// downsampling is needed.
double downsampleFraction(double meanCoverage, double target);

// Downsample through the collaborator when the mean coverage of alignments
// exceeds target. profile is updated to describe the returned set.
AlignmentSet downsampleToTarget(const SequenceBuffer& reference, const AlignmentSet& alignments,
                                double target, const Collaborators& tools, const std::string& tag,
                                CoverageProfile& profile);

// Bin that drives extension: the unseparated bin when phasing failed,
// otherwise the bin with more alignments (bin 0 on a tie).
const HaplotypeBin* selectDrivingBin(const PhasingResult& phasing);

// True when reads were split and bin 1 received alignments
bool phasingSeparated(const PhasingResult& phasing);

const HaplotypeBin* findBin(const PhasingResult& phasing, int label);

} // namespace gapwalk

#endif // GAPWALK_HAPLOTYPE_BINS_H
