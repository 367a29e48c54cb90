// FASTA/FASTQ input checks through zlib, plain and gzip-compressed

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include <zlib.h>

#include "fasta_io.h"
#include "gap_errors.h"

using namespace gapwalk;

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static void writePlain(const std::string& path, const std::string& text) {
    FILE* fp = std::fopen(path.c_str(), "w");
    if (fp == nullptr) return;
    std::fputs(text.c_str(), fp);
    std::fclose(fp);
}

static void writeGzip(const std::string& path, const std::string& text) {
    gzFile fp = gzopen(path.c_str(), "wb");
    if (fp == nullptr) return;
    gzputs(fp, text.c_str());
    gzclose(fp);
}

static bool referenceRejected(const std::string& path) {
    try {
        readReferenceFasta(path);
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

int main() {
    int failed = 0;
    char dirTemplate[] = "/tmp/gapwalk_fasta_XXXXXX";
    char* dirC = mkdtemp(dirTemplate);
    if (dirC == nullptr) {
        std::cerr << "FAIL: temporary directory\n";
        return 1;
    }
    const std::string dir(dirC);

    failed += check(isValidSequenceId("contig_1") == false, "underscore not allowed in id");
    failed += check(isValidSequenceId("NC.0001"), "letters, digits and periods allowed");
    failed += check(isValidNucleotideString("ACGTNacgtn"), "ACGTN in any case");
    failed += check(!isValidNucleotideString("ACGU"), "U rejected");

    writePlain(dir + "/ref.fa", ">ctg1\nACGTNNNNNNNNNNacgt\n");
    FastaRecord ref = readReferenceFasta(dir + "/ref.fa");
    failed += check(ref.id == "ctg1" && ref.sequence == "ACGTNNNNNNNNNNacgt", "plain reference read");

    writeGzip(dir + "/ref.fa.gz", ">ctg2\nACGTNNNNNNNNNNACGT\n");
    FastaRecord gz = readReferenceFasta(dir + "/ref.fa.gz");
    failed += check(gz.id == "ctg2" && gz.sequence.size() == 18, "gzip reference read");

    writePlain(dir + "/multi.fa", ">ctg1\nACGT\nACGT\n");
    failed += check(referenceRejected(dir + "/multi.fa"), "wrapped reference rejected");
    writePlain(dir + "/badid.fa", ">ctg 1\nACGT\n");
    failed += check(referenceRejected(dir + "/badid.fa"), "header with space rejected");
    writePlain(dir + "/badseq.fa", ">ctg1\nACGTX\n");
    failed += check(referenceRejected(dir + "/badseq.fa"), "invalid base rejected");
    writePlain(dir + "/nohdr.fa", "ACGT\nACGT\n");
    failed += check(referenceRejected(dir + "/nohdr.fa"), "missing header rejected");
    failed += check(referenceRejected(dir + "/missing.fa"), "missing file rejected");

    std::vector<FastaRecord> recs = readFastaRecords(dir + "/multi.fa");
    failed += check(recs.size() == 1 && recs[0].sequence == "ACGTACGT", "multi-line records joined");

    std::vector<FastaRecord> out(2);
    out[0].id = "s.0";
    out[0].sequence = "ACGT";
    out[1].id = "s.1";
    out[1].sequence = "ACNT";
    writeFasta(dir + "/out.fa", out);
    std::vector<FastaRecord> back = readFastaRecords(dir + "/out.fa");
    failed += check(back.size() == 2 && back[1].id == "s.1" && back[1].sequence == "ACNT", "written records read back");

    writePlain(dir + "/r1.fq", "@read1/1\nACGT\n+\nIIII\n");
    writeGzip(dir + "/r2.fq.gz", "@read1/2\nACGT\n+\nIIII\n");
    failed += check(looksLikeFastq(dir + "/r1.fq"), "plain FASTQ recognised");
    failed += check(looksLikeFastq(dir + "/r2.fq.gz"), "gzip FASTQ recognised");
    failed += check(!looksLikeFastq(dir + "/ref.fa"), "FASTA is not FASTQ");
    failed += check(!looksLikeFastq(dir + "/none.fq"), "missing FASTQ");

    const char* files[] = {"ref.fa", "ref.fa.gz", "multi.fa", "badid.fa", "badseq.fa", "nohdr.fa", "out.fa", "r1.fq", "r2.fq.gz"};
    for (const char* f : files) std::remove((dir + "/" + f).c_str());
    rmdir(dir.c_str());

    if (failed == 0) {
        std::cout << "PASS: FASTA and FASTQ input\n";
        return 0;
    }
    return 1;
}
