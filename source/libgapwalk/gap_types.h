#ifndef GAPWALK_GAP_TYPES_H
#define GAPWALK_GAP_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace gapwalk {

enum class AnchorSide : uint8_t {
    Left = 0,
    Right = 1
};

enum class PloidyMode : uint8_t {
    Homozygous = 0,
    Heterozygous = 1
};

// One alignment record read back from the aligner output
struct AlignedRead {
    std::string id;
    std::string sequence;   // reference orientation, soft-clipped bases included
    int64_t start;          // 0-based leftmost aligned reference position
    uint32_t alignedLength; // query bases in M/I/=/X operations

    AlignedRead() : start(0), alignedLength(0) {}
    AlignedRead(const std::string& id_in, const std::string& seq_in, int64_t start_in, uint32_t aligned_in)
        : id(id_in), sequence(seq_in), start(start_in), alignedLength(aligned_in) {}

    uint32_t readLength() const { return static_cast<uint32_t>(sequence.size()); }
};

// Alignments against one reference state; bamPath is empty for in-memory sets
struct AlignmentSet {
    std::string bamPath;
    std::vector<AlignedRead> reads;

    bool empty() const { return reads.empty(); }
    size_t size() const { return reads.size(); }
};

struct AnchorRead {
    std::string id;
    std::string sequence;
};

struct HaplotypeBin {
    int label;
    AlignmentSet alignments;

    HaplotypeBin() : label(0) {}
    HaplotypeBin(int label_in, const AlignmentSet& aln) : label(label_in), alignments(aln) {}
};

struct PhasingResult {
    std::vector<HaplotypeBin> bins; // {0,1} when separated, {2} otherwise
    bool separated;

    PhasingResult() : separated(false) {}
};

// Called variant, VCF coordinates (1-based)
struct Variant {
    uint64_t pos;
    std::string ref;
    std::string alt;

    Variant() : pos(0) {}
    Variant(uint64_t pos_in, const std::string& ref_in, const std::string& alt_in)
        : pos(pos_in), ref(ref_in), alt(alt_in) {}
};

struct FastaRecord {
    std::string id;
    std::string sequence;
};

const char* ploidyModeName(PloidyMode mode);
const char* anchorSideName(AnchorSide side);

} // namespace gapwalk

#endif // GAPWALK_GAP_TYPES_H
