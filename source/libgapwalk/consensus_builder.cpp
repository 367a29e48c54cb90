#include "consensus_builder.h"
#include "gap_constants.h"

#include <algorithm>

namespace gapwalk {

std::string stripAmbiguity(const std::string& consensus) {
    std::string out(consensus);
    out.erase(std::remove(out.begin(), out.end(), CONSENSUS_AMBIGUITY), out.end());
    return out;
}

std::string ConsensusBuilder::build(const std::vector<AnchorRead>& anchors, const std::string& tag) {
    if (anchors.empty()) {
        return std::string();
    }
    std::vector<std::string> sequences;
    sequences.reserve(anchors.size());
    for (const auto& a : anchors) {
        sequences.push_back(a.sequence);
    }
    return stripAmbiguity(msa_.alignAndConsensus(sequences, tag));
}

} // namespace gapwalk
