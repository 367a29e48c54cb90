#ifndef GAPWALK_COLLABORATORS_H
#define GAPWALK_COLLABORATORS_H

// Interfaces to the external tools the gap walker depends on. Each call is
// synchronous and either returns its result or throws CollaboratorFailure.

#include "coverage_profile.h"
#include "gap_types.h"
#include "sequence_buffer.h"

#include <string>
#include <vector>

namespace gapwalk {

class ReadAligner {
public:
    virtual ~ReadAligner() {}
    // Align the configured read pairs to reference. Unmapped records and records
    // with less than MIN_ALIGNED_FRACTION of the read aligned are discarded.
    // tag names the intermediate files of this call.
    virtual AlignmentSet align(const SequenceBuffer& reference, const std::string& tag) = 0;
};

// Duplicate marking followed by local realignment around indels
class AlignmentRefiner {
public:
    virtual ~AlignmentRefiner() {}
    virtual AlignmentSet refine(const SequenceBuffer& reference, const AlignmentSet& alignments,
                                const std::string& tag) = 0;
};

class AlignmentDownsampler {
public:
    virtual ~AlignmentDownsampler() {}
    // Keep approximately fraction (0,1) of the read pairs
    virtual AlignmentSet downsample(const AlignmentSet& alignments, double fraction,
                                    const std::string& tag) = 0;
};

class DepthReporter {
public:
    virtual ~DepthReporter() {}
    virtual CoverageProfile coverage(const SequenceBuffer& reference, const AlignmentSet& alignments) = 0;
};

class ReadPhaser {
public:
    virtual ~ReadPhaser() {}
    // Bins {0,1} when reads separate, a single bin 2 otherwise
    virtual PhasingResult phase(const SequenceBuffer& reference, const AlignmentSet& alignments,
                                const std::string& tag) = 0;
};

class MsaConsensus {
public:
    virtual ~MsaConsensus() {}
    // Plurality consensus of the gapped alignment of sequences; may contain
    // CONSENSUS_AMBIGUITY placeholders.
    virtual std::string alignAndConsensus(const std::vector<std::string>& sequences,
                                          const std::string& tag) = 0;
};

class VariantCaller {
public:
    virtual ~VariantCaller() {}
    virtual std::vector<Variant> call(const SequenceBuffer& reference, const AlignmentSet& alignments,
                                      const std::string& tag) = 0;
    // Sequence with the called alleles substituted
    virtual std::string apply(const SequenceBuffer& reference, const std::vector<Variant>& variants);
};

struct VariantApplyStats {
    size_t applied;
    size_t skipped; // ref allele does not match the sequence, or out of range

    VariantApplyStats() : applied(0), skipped(0) {}
};

// Substitute alleles right-to-left so that earlier positions keep their coordinates
std::string applyVariants(const std::string& sequence, const std::vector<Variant>& variants,
                          VariantApplyStats* stats = nullptr);

// Non-owning bundle handed to the loop and the correction stage
struct Collaborators {
    ReadAligner* aligner;
    AlignmentRefiner* refiner;
    AlignmentDownsampler* downsampler;
    DepthReporter* depth;
    ReadPhaser* phaser;
    MsaConsensus* msa;
    VariantCaller* variantCaller;

    Collaborators()
        : aligner(nullptr), refiner(nullptr), downsampler(nullptr), depth(nullptr),
          phaser(nullptr), msa(nullptr), variantCaller(nullptr) {}

    // Throws ConfigurationError naming the first missing collaborator
    void requireAll() const;
};

} // namespace gapwalk

#endif // GAPWALK_COLLABORATORS_H
