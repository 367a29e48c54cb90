#ifndef SHELL_COLLABORATORS_DEF
#define SHELL_COLLABORATORS_DEF

#include "IncludeDefine.h"
#include "Parameters.h"
#include "ToolRunner.h"

#include "libgapwalk/collaborators.h"

//external tools behind the collaborator interfaces:
//bwa mem + samtools (align), samtools markdup + GATK3 (refine), samtools view -s (downsample),
//samtools depth (coverage), samtools phase (phase), muscle (MSA), bcftools (variants)
class ShellCollaborators : public gapwalk::ReadAligner,
                           public gapwalk::AlignmentRefiner,
                           public gapwalk::AlignmentDownsampler,
                           public gapwalk::DepthReporter,
                           public gapwalk::ReadPhaser,
                           public gapwalk::MsaConsensus,
                           public gapwalk::VariantCaller {
    public:
        ShellCollaborators(Parameters &Pin, ToolRunner &runnerIn);

        //throws gapwalk::CollaboratorUnavailable naming the missing tools
        void checkTools();

        gapwalk::Collaborators bundle();

        gapwalk::AlignmentSet align(const gapwalk::SequenceBuffer &reference, const string &tag);
        gapwalk::AlignmentSet refine(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag);
        gapwalk::AlignmentSet downsample(const gapwalk::AlignmentSet &alignments, double fraction, const string &tag);
        gapwalk::CoverageProfile coverage(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments);
        gapwalk::PhasingResult phase(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag);
        string alignAndConsensus(const vector<string> &sequences, const string &tag);
        vector<gapwalk::Variant> call(const gapwalk::SequenceBuffer &reference, const gapwalk::AlignmentSet &alignments, const string &tag);

    private:
        Parameters &P;
        ToolRunner &runner;

        string refSequenceIndexed, refPathIndexed; //last reference written and indexed
        uint64 nDepthCalls;

        string tmpPath(const string &tag, const string &suffix) const;
        string prepareReference(const gapwalk::SequenceBuffer &reference, const string &tag, bool needDict);
        gapwalk::AlignmentSet sortIndexRead(const string &inPath, const string &tag, const string &suffix);
        string requireBam(const gapwalk::AlignmentSet &alignments, const string &step) const;
};

//column plurality of a gapped alignment: the most frequent symbol of each column,
//CONSENSUS_AMBIGUITY on a tie, columns won by the gap symbol '-' are dropped
string msaPluralityConsensus(const vector<string> &alignedRows);

#endif
