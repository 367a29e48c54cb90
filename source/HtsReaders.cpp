#include "HtsReaders.h"
#include "libgapwalk/gap_errors.h"

#include <htslib/sam.h>
#include <htslib/vcf.h>

uint32 bamAlignedQueryLength(const uint32 *cigar, uint32 nCigar) {
    uint32 alignedLength=0;
    for (uint32 ii=0; ii<nCigar; ii++) {
        int op = bam_cigar_op(cigar[ii]);
        switch (op) {
            case BAM_CMATCH:
            case BAM_CINS:
            case BAM_CEQUAL:
            case BAM_CDIFF:
                alignedLength += bam_cigar_oplen(cigar[ii]);
                break;
            default:
                break;
        };
    };
    return alignedLength;
};

gapwalk::AlignmentSet bamReadAlignments(const string &bamPath, double minAlignedFraction) {
    htsFile *bamFile = sam_open(bamPath.c_str(), "r");
    if (bamFile==NULL)
        throw gapwalk::CollaboratorFailure("could not open alignment file " + bamPath);

    bam_hdr_t *header = sam_hdr_read(bamFile);
    if (header==NULL) {
        sam_close(bamFile);
        throw gapwalk::CollaboratorFailure("could not read the header of alignment file " + bamPath);
    };

    gapwalk::AlignmentSet alignments;
    alignments.bamPath = bamPath;

    bam1_t *b = bam_init1();
    int ret;
    while ((ret=sam_read1(bamFile, header, b)) >= 0) {
        if (b->core.flag & (BAM_FUNMAP | BAM_FSECONDARY | BAM_FSUPPLEMENTARY))
            continue;
        int32 lQseq = b->core.l_qseq;
        if (lQseq<=0) //no stored sequence
            continue;

        uint32 alignedLength = bamAlignedQueryLength(bam_get_cigar(b), b->core.n_cigar);
        if (alignedLength < minAlignedFraction*lQseq)
            continue;

        string seq(lQseq, 'N');
        uint8 *s = bam_get_seq(b);
        for (int32 ii=0; ii<lQseq; ii++)
            seq[ii] = seq_nt16_str[bam_seqi(s, ii)];

        alignments.reads.push_back(gapwalk::AlignedRead(bam_get_qname(b), seq, b->core.pos, alignedLength));
    };

    bam_destroy1(b);
    bam_hdr_destroy(header);
    sam_close(bamFile);

    if (ret < -1)
        throw gapwalk::CollaboratorFailure("truncated or corrupted alignment file " + bamPath);

    return alignments;
};

vector<gapwalk::Variant> vcfReadVariants(const string &vcfPath) {
    htsFile *vcfFile = bcf_open(vcfPath.c_str(), "r");
    if (vcfFile==NULL)
        throw gapwalk::CollaboratorFailure("could not open variant file " + vcfPath);

    bcf_hdr_t *header = bcf_hdr_read(vcfFile);
    if (header==NULL) {
        bcf_close(vcfFile);
        throw gapwalk::CollaboratorFailure("could not read the header of variant file " + vcfPath);
    };

    vector<gapwalk::Variant> variants;
    bcf1_t *rec = bcf_init();
    int ret;
    while ((ret=bcf_read(vcfFile, header, rec)) == 0) {
        bcf_unpack(rec, BCF_UN_STR);
        if (rec->n_allele < 2)
            continue;
        string alt = rec->d.allele[1];
        if (alt.empty() || alt[0]=='<' || alt[0]=='*' || alt[0]=='.') //symbolic or missing allele
            continue;
        variants.push_back(gapwalk::Variant((uint64) rec->pos + 1, rec->d.allele[0], alt));
    };

    bcf_destroy(rec);
    bcf_hdr_destroy(header);
    bcf_close(vcfFile);

    if (ret < -1)
        throw gapwalk::CollaboratorFailure("truncated or corrupted variant file " + vcfPath);

    return variants;
};
