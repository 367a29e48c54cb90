#ifndef GAPWALK_GAP_CONSTANTS_H
#define GAPWALK_GAP_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace gapwalk {

// Gap marker: a run of exactly this many N between the two scaffolds
constexpr size_t GAP_RUN_LENGTH = 10;
constexpr char GAP_RUN[] = "NNNNNNNNNN";

// Anchor geometry around the gap run. These widths define which bases a splice
// may touch and which reads count as spanning the gap boundary.
constexpr size_t ANCHOR_PART_LENGTH = 15;    // flank bases located inside the consensus
constexpr size_t FLANK_PATTERN_LENGTH = 20;  // flank bases used by the sides-met test
constexpr size_t ANCHOR_ALL_LENGTH = 35;     // flank bases replaced by a splice
constexpr size_t MIN_EXTENSION_LENGTH = 35;  // shorter consensus extensions are rejected

// Read selection window around each gap boundary
constexpr int64_t ANCHOR_WINDOW = 50;
constexpr int64_t LEFT_BOUNDARY_OFFSET = -5;
constexpr int64_t RIGHT_BOUNDARY_OFFSET = 15;

// Coverage gating
constexpr double COVERAGE_CEILING_FACTOR = 3.0;
constexpr double DOWNSAMPLE_TARGET_COVERAGE = 100.0;
constexpr double MASK_COVERAGE_FRACTION = 0.2;

// Alignment records with less than this fraction of the read aligned are dropped
constexpr double MIN_ALIGNED_FRACTION = 0.5;

// Placeholder emitted by the consensus tool for columns without a plurality
constexpr char CONSENSUS_AMBIGUITY = '?';

constexpr char MASK_BASE = 'N';

// Haplotype bin labels
constexpr int BIN_HAPLOTYPE_0 = 0;
constexpr int BIN_HAPLOTYPE_1 = 1;
constexpr int BIN_UNSEPARATED = 2;

} // namespace gapwalk

#endif // GAPWALK_GAP_CONSTANTS_H
