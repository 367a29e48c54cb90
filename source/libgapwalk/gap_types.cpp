#include "gap_types.h"

namespace gapwalk {

const char* ploidyModeName(PloidyMode mode) {
    return mode == PloidyMode::Heterozygous ? "Heterozygous" : "Homozygous";
}

const char* anchorSideName(AnchorSide side) {
    return side == AnchorSide::Left ? "left" : "right";
}

} // namespace gapwalk
