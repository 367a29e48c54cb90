#ifndef PARAMETERS_DEF
#define PARAMETERS_DEF

#include "IncludeDefine.h"
#include "InOutStreams.h"
#include "ParameterInfo.h"

#include "libgapwalk/gap_types.h"
#include "libgapwalk/sequence_buffer.h"

#define PAR_NAME_PRINT_WIDTH 30

class Parameters {

    public:
        vector <ParameterInfoBase*> parArray;
        vector <string> parameterInputName;

        string commandLine, commandLineFull;

        string versionGapWalk;

        //system parameters
        vector <string> parametersFiles;
        string sysShell; //shell for executing system commands

        //run parameters
        string runModeIn;
        struct {
            bool extend;  //run the extension loop
            bool correct; //run the correction stage
        } runMode;
        int runThreadN;
        struct {
            string in;
            bool fromSnapshot;
        } runRestart;

        //input
        string refFasta;
        vector <string> readFilesIn;
        string sampleIdIn, sampleId;
        string ploidyIn;
        gapwalk::PloidyMode ploidy;
        uint32 iterMax;
        double coverageExpected;

        //output
        string outFileNamePrefix, outLogFileName;
        string outTmpDir, outFileTmp;
        string outTmpKeep;

        //external tools
        struct {
            string bwa, samtools, bcftools, muscle, gatk3;
        } tool;

        //reference loaded and checked in inputParameters
        gapwalk::SequenceBuffer reference;

        InOutStreams *inOut; //main input output streams

        Parameters();
        ~Parameters();
        void inputParameters (int argInN, char* argIn[]); //input parameters: default, from files, from command line
        void removeTmpDir();

    private:
        void scanAllLines (istream &streamIn, int inputLevel);
        //initialOnly: read only the parameters restricted to the command line (parametersFiles, outFileNamePrefix)
        void scanOneLine (const string &lineIn, int inputLevel, bool initialOnly);
        ParameterInfoBase* findParameter(const string &name);
        void parameterError(const string &message, const string &solution);
        void checkParameters();
        void loadReference();
        void checkReadFiles();
};

#endif
