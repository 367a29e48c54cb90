// htslib readers: alignment filters on a SAM file and variant records from a VCF file

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

#include <htslib/sam.h>

#include "HtsReaders.h"
#include "libgapwalk/gap_constants.h"
#include "libgapwalk/gap_errors.h"

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static const gapwalk::AlignedRead* findRead(const gapwalk::AlignmentSet& aln, const std::string& id) {
    for (size_t i = 0; i < aln.reads.size(); ++i) {
        if (aln.reads[i].id == id) return &aln.reads[i];
    }
    return nullptr;
}

static std::string samLine(const std::string& name, int flag, int pos, const std::string& cigar, const std::string& seq) {
    std::string rname = (flag & 4) ? "*" : "ctg";
    std::string qual = seq == "*" ? "*" : std::string(seq.size(), 'I');
    return name + "\t" + std::to_string(flag) + "\t" + rname + "\t" + std::to_string(pos) + "\t60\t" + cigar
           + "\t*\t0\t0\t" + seq + "\t" + qual + "\n";
}

static int testCigar() {
    int failed = 0;
    uint32_t cigar[4];
    cigar[0] = (2u << BAM_CIGAR_SHIFT) | BAM_CSOFT_CLIP;
    cigar[1] = (6u << BAM_CIGAR_SHIFT) | BAM_CMATCH;
    cigar[2] = (3u << BAM_CIGAR_SHIFT) | BAM_CDEL;
    cigar[3] = (2u << BAM_CIGAR_SHIFT) | BAM_CINS;
    failed += check(bamAlignedQueryLength(cigar, 4) == 8, "M and I counted, S and D not");

    cigar[0] = (4u << BAM_CIGAR_SHIFT) | BAM_CEQUAL;
    cigar[1] = (1u << BAM_CIGAR_SHIFT) | BAM_CDIFF;
    failed += check(bamAlignedQueryLength(cigar, 2) == 5, "= and X counted");
    return failed;
}

static int testSam(const std::string& dir) {
    int failed = 0;
    const std::string path = dir + "/aln.sam";
    const std::string seq10 = "ACGTACGTAC";
    {
        std::ofstream out(path.c_str());
        out << "@HD\tVN:1.6\tSO:coordinate\n";
        out << "@SQ\tSN:ctg\tLN:200\n";
        out << samLine("mapped", 0, 11, "10M", seq10);
        out << "unmapped\t4\t*\t0\t0\t*\t*\t0\t0\t" << seq10 << "\tIIIIIIIIII\n";
        out << samLine("secondary", 256, 20, "10M", seq10);
        out << samLine("supplementary", 2048, 20, "10M", seq10);
        out << samLine("mostly_clipped", 0, 30, "3M7S", seq10);
        out << samLine("half_aligned", 16, 40, "5M5S", seq10);
        out << samLine("with_indels", 0, 50, "2S6M2I", seq10);
        out << samLine("with_deletion", 0, 60, "4M2D6M", seq10);
        out << samLine("no_sequence", 0, 70, "10M", "*");
    }

    gapwalk::AlignmentSet aln = bamReadAlignments(path, gapwalk::MIN_ALIGNED_FRACTION);
    failed += check(aln.bamPath == path, "alignment set keeps its file");
    failed += check(aln.size() == 4, "four records pass the filters");

    const gapwalk::AlignedRead* mapped = findRead(aln, "mapped");
    failed += check(mapped != nullptr && mapped->start == 10 && mapped->sequence == seq10 && mapped->alignedLength == 10,
                    "mapped record: 0-based start, sequence, aligned length");
    failed += check(findRead(aln, "unmapped") == nullptr, "unmapped dropped");
    failed += check(findRead(aln, "secondary") == nullptr, "secondary dropped");
    failed += check(findRead(aln, "supplementary") == nullptr, "supplementary dropped");
    failed += check(findRead(aln, "mostly_clipped") == nullptr, "aligned fraction 0.3 dropped");
    failed += check(findRead(aln, "half_aligned") != nullptr, "aligned fraction 0.5 kept");
    const gapwalk::AlignedRead* indels = findRead(aln, "with_indels");
    failed += check(indels != nullptr && indels->alignedLength == 8 && indels->readLength() == 10, "soft clip not aligned");
    const gapwalk::AlignedRead* del = findRead(aln, "with_deletion");
    failed += check(del != nullptr && del->alignedLength == 10, "deletion does not consume query");
    failed += check(findRead(aln, "no_sequence") == nullptr, "record without sequence dropped");

    bool thrown = false;
    try {
        bamReadAlignments(dir + "/missing.bam", gapwalk::MIN_ALIGNED_FRACTION);
    } catch (const gapwalk::CollaboratorFailure&) {
        thrown = true;
    }
    failed += check(thrown, "missing alignment file reported as tool failure");

    std::remove(path.c_str());
    return failed;
}

static int testVcf(const std::string& dir) {
    int failed = 0;
    const std::string path = dir + "/calls.vcf";
    {
        std::ofstream out(path.c_str());
        out << "##fileformat=VCFv4.2\n";
        out << "##contig=<ID=ctg,length=200>\n";
        out << "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\n";
        out << "ctg\t5\t.\tA\tG\t50\tPASS\t.\n";
        out << "ctg\t9\t.\tC\t<*>\t50\tPASS\t.\n";
        out << "ctg\t12\t.\tAT\tA\t50\tPASS\t.\n";
        out << "ctg\t20\t.\tG\t.\t50\tPASS\t.\n";
        out << "ctg\t30\t.\tC\tCTT,CT\t50\tPASS\t.\n";
    }

    vector<gapwalk::Variant> vars = vcfReadVariants(path);
    failed += check(vars.size() == 3, "symbolic and reference-only records skipped");
    if (vars.size() == 3) {
        failed += check(vars[0].pos == 5 && vars[0].ref == "A" && vars[0].alt == "G", "SNP record");
        failed += check(vars[1].pos == 12 && vars[1].ref == "AT" && vars[1].alt == "A", "deletion record");
        failed += check(vars[2].pos == 30 && vars[2].alt == "CTT", "first ALT of a multi-allelic record");
    }

    bool thrown = false;
    try {
        vcfReadVariants(dir + "/missing.vcf");
    } catch (const gapwalk::CollaboratorFailure&) {
        thrown = true;
    }
    failed += check(thrown, "missing variant file reported as tool failure");

    std::remove(path.c_str());
    return failed;
}

int main() {
    int failed = 0;
    char dirTemplate[] = "/tmp/gapwalk_hts_XXXXXX";
    char* dir = mkdtemp(dirTemplate);
    if (dir == nullptr) {
        std::cerr << "FAIL: temporary directory\n";
        return 1;
    }

    failed += testCigar();
    failed += testSam(dir);
    failed += testVcf(dir);
    rmdir(dir);

    if (failed == 0) {
        std::cout << "PASS: htslib readers\n";
        return 0;
    }
    return 1;
}
