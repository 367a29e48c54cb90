#ifndef HTS_READERS_DEF
#define HTS_READERS_DEF

#include "IncludeDefine.h"
#include "libgapwalk/gap_types.h"

//mapped primary records of a SAM/BAM file whose aligned query bases (M/I/=/X) cover
//at least minAlignedFraction of the read. Throws gapwalk::CollaboratorFailure when unreadable
gapwalk::AlignmentSet bamReadAlignments(const string &bamPath, double minAlignedFraction);

//query bases in M/I/=/X cigar operations
uint32 bamAlignedQueryLength(const uint32 *cigar, uint32 nCigar);

//records of a VCF/BCF file with at least one concrete ALT allele; the first ALT is taken
vector<gapwalk::Variant> vcfReadVariants(const string &vcfPath);

#endif
