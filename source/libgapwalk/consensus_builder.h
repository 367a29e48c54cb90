#ifndef GAPWALK_CONSENSUS_BUILDER_H
#define GAPWALK_CONSENSUS_BUILDER_H

#include "collaborators.h"
#include "gap_types.h"

#include <string>
#include <vector>

namespace gapwalk {

class ConsensusBuilder {
public:
    explicit ConsensusBuilder(MsaConsensus& msa) : msa_(msa) {}

    // Empty string when anchors is empty; the aligner is not called then.
    std::string build(const std::vector<AnchorRead>& anchors, const std::string& tag);

private:
    MsaConsensus& msa_;
};

// Remove CONSENSUS_AMBIGUITY placeholders
std::string stripAmbiguity(const std::string& consensus);

} // namespace gapwalk

#endif // GAPWALK_CONSENSUS_BUILDER_H
