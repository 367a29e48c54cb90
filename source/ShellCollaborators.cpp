#include "ShellCollaborators.h"
#include "HtsReaders.h"

#include "libgapwalk/fasta_io.h"
#include "libgapwalk/gap_constants.h"
#include "libgapwalk/gap_errors.h"

#include <map>
#include <sys/stat.h>

static bool fileExists(const string &path) {
    struct stat st;
    return stat(path.c_str(), &st)==0;
};

ShellCollaborators::ShellCollaborators(Parameters &Pin, ToolRunner &runnerIn) : P(Pin), runner(runnerIn), nDepthCalls(0) {
};

gapwalk::Collaborators ShellCollaborators::bundle() {
    gapwalk::Collaborators tools;
    tools.aligner=this;
    tools.refiner=this;
    tools.downsampler=this;
    tools.depth=this;
    tools.phaser=this;
    tools.msa=this;
    tools.variantCaller=this;
    return tools;
};

void ShellCollaborators::checkTools() {
    vector<string> required;
    required.push_back(P.tool.samtools);
    required.push_back(P.tool.bwa);
    if (P.runMode.correct)
        required.push_back(P.tool.bcftools);
    if (P.runMode.extend)
        required.push_back(P.tool.muscle);
    if (P.tool.gatk3!="-")
        required.push_back(P.tool.gatk3);

    string missing="";
    for (uint ii=0; ii<required.size(); ii++) {
        if (!runner.available(required[ii]))
            missing += " " + required[ii];
    };
    if (missing!="") {
        throw gapwalk::CollaboratorUnavailable("EXITING because of FATAL ERROR: required external tools were not found:" + missing
                                               + "\nSOLUTION: install the tools or point --toolBwa/--toolSamtools/--toolBcftools/--toolMuscle/--toolGatk3 to them\n");
    };
};

string ShellCollaborators::tmpPath(const string &tag, const string &suffix) const {
    return P.outFileTmp + tag + suffix;
};

string ShellCollaborators::requireBam(const gapwalk::AlignmentSet &alignments, const string &step) const {
    if (alignments.bamPath=="")
        throw gapwalk::CollaboratorFailure("step " + step + " needs alignments backed by a BAM file");
    return alignments.bamPath;
};

string ShellCollaborators::prepareReference(const gapwalk::SequenceBuffer &reference, const string &tag, bool needDict) {
    string refPath;
    if (reference.sequence()==refSequenceIndexed) {
        refPath=refPathIndexed;
    } else {
        refPath=tmpPath(tag, ".ref.fa");
        gapwalk::FastaRecord rec;
        rec.id=reference.id();
        rec.sequence=reference.sequence();
        gapwalk::writeFasta(refPath, rec);
        runner.run(P.tool.bwa + " index " + ToolRunner::quoteArg(refPath), "bwa index");
        runner.run(P.tool.samtools + " faidx " + ToolRunner::quoteArg(refPath), "samtools faidx");
        refSequenceIndexed=reference.sequence();
        refPathIndexed=refPath;
    };

    if (needDict) {//GATK3 looks for <ref>.dict next to <ref>.fa
        string dictPath=refPath.substr(0, refPath.size()-3) + ".dict";
        if (!fileExists(dictPath))
            runner.run(P.tool.samtools + " dict -o " + ToolRunner::quoteArg(dictPath) + " " + ToolRunner::quoteArg(refPath), "samtools dict");
    };
    return refPath;
};

gapwalk::AlignmentSet ShellCollaborators::sortIndexRead(const string &inPath, const string &tag, const string &suffix) {
    string bamPath=tmpPath(tag, suffix);
    runner.run(P.tool.samtools + " sort -@ " + to_string(P.runThreadN) + " -o " + ToolRunner::quoteArg(bamPath) + " " + ToolRunner::quoteArg(inPath), "samtools sort");
    runner.run(P.tool.samtools + " index " + ToolRunner::quoteArg(bamPath), "samtools index");
    return bamReadAlignments(bamPath, gapwalk::MIN_ALIGNED_FRACTION);
};

gapwalk::AlignmentSet ShellCollaborators::align(const gapwalk::SequenceBuffer &reference, const string &tag) {
    string refPath=prepareReference(reference, tag, false);
    string samPath=tmpPath(tag, ".aln.sam");
    string readGroup="@RG\\tID:" + P.sampleId + "\\tSM:" + P.sampleId;

    runner.run(P.tool.bwa + " mem -t " + to_string(P.runThreadN) + " -R " + ToolRunner::quoteArg(readGroup) + " "
               + ToolRunner::quoteArg(refPath) + " " + ToolRunner::quoteArg(P.readFilesIn[0]) + " " + ToolRunner::quoteArg(P.readFilesIn[1])
               + " > " + ToolRunner::quoteArg(samPath), "bwa mem");

    return sortIndexRead(samPath, tag, ".aln.bam");
};

gapwalk::AlignmentSet ShellCollaborators::refine(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag) {
    string inBam=requireBam(alignments, "refine");
    string threads=" -@ " + to_string(P.runThreadN);

    string nameSorted=tmpPath(tag, ".nsort.bam");
    string fixmate=tmpPath(tag, ".fixmate.bam");
    string coordSorted=tmpPath(tag, ".fixsort.bam");
    string markdup=tmpPath(tag, ".markdup.bam");

    runner.run(P.tool.samtools + " sort -n" + threads + " -o " + ToolRunner::quoteArg(nameSorted) + " " + ToolRunner::quoteArg(inBam), "samtools sort -n");
    runner.run(P.tool.samtools + " fixmate -m " + ToolRunner::quoteArg(nameSorted) + " " + ToolRunner::quoteArg(fixmate), "samtools fixmate");
    runner.run(P.tool.samtools + " sort" + threads + " -o " + ToolRunner::quoteArg(coordSorted) + " " + ToolRunner::quoteArg(fixmate), "samtools sort");
    runner.run(P.tool.samtools + " markdup" + threads + " " + ToolRunner::quoteArg(coordSorted) + " " + ToolRunner::quoteArg(markdup), "samtools markdup");
    runner.run(P.tool.samtools + " index " + ToolRunner::quoteArg(markdup), "samtools index");

    if (P.tool.gatk3=="-")
        return bamReadAlignments(markdup, gapwalk::MIN_ALIGNED_FRACTION);

    string refPath=prepareReference(reference, tag, true);
    string intervals=tmpPath(tag, ".realign.intervals");
    string realigned=tmpPath(tag, ".realign.bam");
    runner.run(P.tool.gatk3 + " -T RealignerTargetCreator -R " + ToolRunner::quoteArg(refPath) + " -I " + ToolRunner::quoteArg(markdup)
               + " -o " + ToolRunner::quoteArg(intervals), "GATK3 RealignerTargetCreator");
    runner.run(P.tool.gatk3 + " -T IndelRealigner -R " + ToolRunner::quoteArg(refPath) + " -I " + ToolRunner::quoteArg(markdup)
               + " -targetIntervals " + ToolRunner::quoteArg(intervals) + " -o " + ToolRunner::quoteArg(realigned), "GATK3 IndelRealigner");
    runner.run(P.tool.samtools + " index " + ToolRunner::quoteArg(realigned), "samtools index");
    return bamReadAlignments(realigned, gapwalk::MIN_ALIGNED_FRACTION);
};

gapwalk::AlignmentSet ShellCollaborators::downsample(const gapwalk::AlignmentSet &alignments, double fraction, const string &tag) {
    string inBam=requireBam(alignments, "downsample");
    if (!(fraction>0.0 && fraction<1.0))
        return alignments;

    //samtools view -s SEED.FRACTION
    ostringstream subsample;
    subsample << fixed << setprecision(6) << fraction;
    string frac=subsample.str();
    frac=frac.substr(frac.find('.'));

    string outBam=tmpPath(tag, ".downsample.bam");
    runner.run(P.tool.samtools + " view -b -s 11" + frac + " -o " + ToolRunner::quoteArg(outBam) + " " + ToolRunner::quoteArg(inBam), "samtools view -s");
    runner.run(P.tool.samtools + " index " + ToolRunner::quoteArg(outBam), "samtools index");
    return bamReadAlignments(outBam, gapwalk::MIN_ALIGNED_FRACTION);
};

gapwalk::CoverageProfile ShellCollaborators::coverage(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments) {
    (void) reference;
    if (alignments.bamPath=="") //nothing aligned
        return gapwalk::CoverageProfile();

    string depthPath=alignments.bamPath + ".depth" + to_string(++nDepthCalls) + ".txt";
    runner.run(P.tool.samtools + " depth " + ToolRunner::quoteArg(alignments.bamPath) + " > " + ToolRunner::quoteArg(depthPath), "samtools depth");
    return gapwalk::CoverageProfile::fromDepthFile(depthPath);
};

gapwalk::PhasingResult ShellCollaborators::phase(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag) {
    (void) reference;
    string inBam=requireBam(alignments, "phase");
    string prefix=tmpPath(tag, ".phase");
    runner.run(P.tool.samtools + " phase -b " + ToolRunner::quoteArg(prefix) + " " + ToolRunner::quoteArg(inBam)
               + " > " + ToolRunner::quoteArg(prefix + ".txt"), "samtools phase");

    gapwalk::PhasingResult phasing;
    string bin0Path=prefix + ".0.bam", bin1Path=prefix + ".1.bam";
    if (fileExists(bin0Path) && fileExists(bin1Path)) {
        gapwalk::AlignmentSet bin0=bamReadAlignments(bin0Path, gapwalk::MIN_ALIGNED_FRACTION);
        gapwalk::AlignmentSet bin1=bamReadAlignments(bin1Path, gapwalk::MIN_ALIGNED_FRACTION);
        if (!bin0.empty() && !bin1.empty()) {
            phasing.separated=true;
            phasing.bins.push_back(gapwalk::HaplotypeBin(gapwalk::BIN_HAPLOTYPE_0, bin0));
            phasing.bins.push_back(gapwalk::HaplotypeBin(gapwalk::BIN_HAPLOTYPE_1, bin1));
            return phasing;
        };
    };

    phasing.separated=false;
    phasing.bins.push_back(gapwalk::HaplotypeBin(gapwalk::BIN_UNSEPARATED, alignments));
    return phasing;
};

string msaPluralityConsensus(const vector<string> &alignedRows) {
    string consensus="";
    if (alignedRows.empty())
        return consensus;

    size_t nCols=0;
    for (uint ii=0; ii<alignedRows.size(); ii++)
        nCols=max(nCols, alignedRows[ii].size());

    for (size_t icol=0; icol<nCols; icol++) {
        map<char,uint> counts;
        for (uint ii=0; ii<alignedRows.size(); ii++) {
            char c = icol<alignedRows[ii].size() ? alignedRows[ii][icol] : '-';
            ++counts[(char) toupper(c)];
        };

        char best='-';
        uint bestCount=0, secondCount=0;
        for (map<char,uint>::const_iterator it=counts.begin(); it!=counts.end(); ++it) {
            if (it->second>bestCount) {
                secondCount=bestCount;
                bestCount=it->second;
                best=it->first;
            } else if (it->second>secondCount) {
                secondCount=it->second;
            };
        };

        if (bestCount==secondCount) {
            consensus+=gapwalk::CONSENSUS_AMBIGUITY;
        } else if (best!='-') {
            consensus+=best;
        };
    };
    return consensus;
};

string ShellCollaborators::alignAndConsensus(const vector<string> &sequences, const string &tag) {
    if (sequences.empty())
        return "";
    if (sequences.size()==1) //nothing to align
        return sequences[0];

    vector<gapwalk::FastaRecord> records(sequences.size());
    for (uint ii=0; ii<sequences.size(); ii++) {
        records[ii].id="read" + to_string(ii);
        records[ii].sequence=sequences[ii];
    };
    string inPath=tmpPath(tag, ".msa.in.fa");
    string outPath=tmpPath(tag, ".msa.out.fa");
    gapwalk::writeFasta(inPath, records);

    runner.run(P.tool.muscle + " -quiet -in " + ToolRunner::quoteArg(inPath) + " -out " + ToolRunner::quoteArg(outPath), "muscle");

    vector<gapwalk::FastaRecord> aligned;
    try {
        aligned=gapwalk::readFastaRecords(outPath);
    } catch (const std::runtime_error &e) {
        throw gapwalk::CollaboratorFailure(string("could not read the multiple alignment: ") + e.what());
    };

    vector<string> rows;
    for (uint ii=0; ii<aligned.size(); ii++)
        rows.push_back(aligned[ii].sequence);
    return msaPluralityConsensus(rows);
};

vector<gapwalk::Variant> ShellCollaborators::call(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag) {
    if (alignments.empty())
        return vector<gapwalk::Variant>();
    string inBam=requireBam(alignments, "variant calling");
    string refPath=prepareReference(reference, tag, false);
    string pileupPath=tmpPath(tag, ".pileup.bcf");
    string vcfPath=tmpPath(tag, ".calls.vcf");

    runner.run(P.tool.bcftools + " mpileup -Ob -f " + ToolRunner::quoteArg(refPath) + " -o " + ToolRunner::quoteArg(pileupPath)
               + " " + ToolRunner::quoteArg(inBam), "bcftools mpileup");
    runner.run(P.tool.bcftools + " call -mv --ploidy 1 -Ov -o " + ToolRunner::quoteArg(vcfPath) + " " + ToolRunner::quoteArg(pileupPath), "bcftools call");

    return vcfReadVariants(vcfPath);
};
