#include "IncludeDefine.h"
#include "Parameters.h"
#include "ErrorWarning.h"

#include "libgapwalk/fasta_io.h"
#include "libgapwalk/gap_constants.h"
#include "libgapwalk/gap_errors.h"

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

static int removeOneEntry(const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf) {
    (void) sb; (void) typeflag; (void) ftwbuf;
    return remove(fpath);
};

static bool sysRemoveDir(const string &dirName) {//remove directory and all its contents
    struct stat st;
    if (stat(dirName.c_str(), &st)!=0)
        return true;
    return nftw(dirName.c_str(), removeOneEntry, 64, FTW_DEPTH | FTW_PHYS)==0;
};

//one "name value..." line per --name on the command line; --name=value is split.
//Values with white space are quoted for the parameter readers.
static vector<string> commandLineToLines(int argInN, char* argIn[], string &commandLine) {
    vector<string> lines;
    commandLine=string(argIn[0]);
    for (int iarg=1; iarg<argInN; iarg++) {
        string oneArg=string(argIn[iarg]);
        if (oneArg=="--version") {
            std::cout << GAPWALK_VERSION << std::endl;
            exit(0);
        };
        commandLine += ' ' + oneArg;

        if (oneArg.substr(0,2)=="--") {
            size_t eq=oneArg.find('=');
            lines.push_back(oneArg.substr(2, eq==string::npos ? string::npos : eq-2));
            if (eq==string::npos)
                continue;
            oneArg=oneArg.substr(eq+1);
        } else if (lines.empty()) {
            lines.push_back(""); //value without a name, reported as unrecognized parameter
        };
        if (oneArg.find_first_of(" \t")!=string::npos)
            oneArg='\"' + oneArg + '\"';
        lines.back() += ' ' + oneArg;
    };
    return lines;
};

Parameters::Parameters() {//initalize parameters info

    inOut = new InOutStreams;

    //versions
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "versionGapWalk", &versionGapWalk));

    //parameters
    parArray.push_back(new ParameterInfoVector <string> (-1, 2, "parametersFiles", &parametersFiles));

    //system
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "sysShell", &sysShell));

    //run
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "runMode", &runModeIn));
    parArray.push_back(new ParameterInfoScalar <int> (-1, -1, "runThreadN", &runThreadN));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "runRestart", &runRestart.in));

    //input
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "refFasta", &refFasta));
    parArray.push_back(new ParameterInfoVector <string> (-1, -1, "readFilesIn", &readFilesIn));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "sampleId", &sampleIdIn));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "ploidy", &ploidyIn));
    parArray.push_back(new ParameterInfoScalar <uint32> (-1, -1, "iterMax", &iterMax));
    parArray.push_back(new ParameterInfoScalar <double> (-1, -1, "coverageExpected", &coverageExpected));

    //output
    parArray.push_back(new ParameterInfoScalar <string> (-1, 2, "outFileNamePrefix", &outFileNamePrefix));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "outTmpDir", &outTmpDir));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "outTmpKeep", &outTmpKeep));

    //tools
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "toolBwa", &tool.bwa));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "toolSamtools", &tool.samtools));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "toolBcftools", &tool.bcftools));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "toolMuscle", &tool.muscle));
    parArray.push_back(new ParameterInfoScalar <string> (-1, -1, "toolGatk3", &tool.gatk3));

    parameterInputName.push_back("Default");
    parameterInputName.push_back("Command-Line-Initial");
    parameterInputName.push_back("Command-Line");

    runMode.extend=true;
    runMode.correct=true;
    runRestart.fromSnapshot=false;
    ploidy=gapwalk::PloidyMode::Homozygous;
    outFileTmp="";
};

Parameters::~Parameters() {
    for (uint ii=0; ii<parArray.size(); ii++)
        delete parArray[ii];
    delete inOut;
};

void Parameters::inputParameters (int argInN, char* argIn[]) {//input parameters: default, from files, from command line

///////// Default parameters

    #include "parametersDefault.xxd"
    string parString( (const char*) parametersDefault,parametersDefault_len);
    stringstream parStream (parString);

    scanAllLines(parStream, 0);
    for (uint ii=0; ii<parArray.size(); ii++) {
        if (parArray[ii]->inputLevel<0) {
            ostringstream errOut;
            errOut <<"BUG: DEFAULT parameter value not defined: "<<parArray[ii]->nameString;
            exitWithError(errOut.str(), std::cerr, inOut->logMain, EXIT_CODE_BUG, *this);
        };
    };

///////// Initial parameters from Command Line: only those that locate the outputs and parameter files

    vector<string> commandLineLines=commandLineToLines(argInN, argIn, commandLine);
    for (uint ii=0; ii<commandLineLines.size(); ii++)
        scanOneLine(commandLineLines[ii], 1, true);

    outLogFileName=outFileNamePrefix + "Log.out";
    inOut->logMain.open(outLogFileName.c_str());
    if (inOut->logMain.fail()) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL ERROR: could not create output file: "<<outFileNamePrefix + "Log.out"<<"\n";
        errOut <<"SOLUTION: check if the path " << outFileNamePrefix << " exists and you have permissions to write there\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    inOut->logMain << "GapWalk version=" << GAPWALK_VERSION << "\n";
    inOut->logMain << "GapWalk compilation time,server,dir=" << COMPILATION_TIME_PLACE << "\n";

    inOut->logMain <<"##### Command Line:\n"<<commandLine <<endl ;

    inOut->logMain << "##### Initial USER parameters from Command Line:\n";
    for (uint ii=0; ii<parArray.size(); ii++) {
        if (parArray[ii]->inputLevel==1) {
            inOut->logMain << setw(PAR_NAME_PRINT_WIDTH) << parArray[ii]->nameString <<"    "<< *(parArray[ii]) << endl;
        };
    };

///////// Parameters files

    if (parametersFiles.at(0) != "-") {//read parameters from a user-defined file
        for (uint ii=0; ii<parametersFiles.size(); ii++) {
            parameterInputName.push_back(parametersFiles.at(ii));
            ifstream parFile(parametersFiles.at(ii).c_str());
            if (parFile.good()) {
                inOut->logMain << "##### USER parameters from user-defined parameters file " <<parametersFiles.at(ii)<< ":\n" <<flush;
                scanAllLines(parFile, parameterInputName.size()-1);
                parFile.close();
            } else {
                ostringstream errOut;
                errOut <<"EXITING because of fatal input ERROR: could not open user-defined parameters file " <<parametersFiles.at(ii)<< "\n" <<flush;
                exitWithError(errOut.str(), std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
            };
        };
    };

///////// Command Line Final: overrides defaults and parameter files

    if (!commandLineLines.empty()) {
        inOut->logMain << "###### All USER parameters from Command Line:\n" <<flush;
        for (uint ii=0; ii<commandLineLines.size(); ii++)
            scanOneLine(commandLineLines[ii], 2, false);
    };

    inOut->logMain << "##### Finished reading parameters from all sources\n\n" << flush;

    inOut->logMain << "##### Final user re-defined parameters-----------------:\n" << flush;

    ostringstream clFull;
    clFull << argIn[0];
    for (uint ii=0; ii<parArray.size(); ii++) {
        if (parArray[ii]->inputLevel>0) {
            inOut->logMain << setw(PAR_NAME_PRINT_WIDTH) << parArray[ii]->nameString <<"    "<< *(parArray[ii]) << endl;
            if (parArray[ii]->nameString != "parametersFiles" ) {
                clFull << "   --" << parArray[ii]->nameString << " " << *(parArray[ii]);
            };
        };
    };
    commandLineFull=clFull.str();
    inOut->logMain << "\n-------------------------------\n##### Final effective command line:\n" <<  clFull.str() << "\n";
    inOut->logMain << "----------------------------------------\n\n" << flush;

    inOut->logProgress.open((outFileNamePrefix + "Log.progress.out").c_str());
    inOut->logFinal.open((outFileNamePrefix + "Log.final.out").c_str());
    if (inOut->logProgress.fail() || inOut->logFinal.fail()) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL ERROR: could not create output files: "<<outFileNamePrefix <<"Log.progress.out, Log.final.out\n";
        errOut <<"SOLUTION: check if the path " << outFileNamePrefix << " exists and you have permissions to write there\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_FILE_OPEN, *this);
    };

////////////////////////////////////////////////////// Calculate and check parameters
    checkParameters();

    if (outTmpDir=="-") {
        outFileTmp=outFileNamePrefix +"_GWtmp/";
        if (!runRestart.fromSnapshot)
            sysRemoveDir(outFileTmp);
    } else {
        outFileTmp=outTmpDir + "/";
    };

    if (mkdir (outFileTmp.c_str(), S_IRWXU)!=0 && !runRestart.fromSnapshot) {
        ostringstream errOut;
        errOut <<"EXITING because of fatal ERROR: could not make temporary directory: "<< outFileTmp<<"\n";
        errOut <<"SOLUTION: (i) please check the path and writing permissions \n (ii) if you specified --outTmpDir, and this directory exists - please remove it before running GapWalk\n"<<flush;
        outFileTmp="";//do not remove a directory we did not create
        exitWithError(errOut.str(), std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    loadReference();
    checkReadFiles();

    ////////////////////////////////////////////////
    inOut->logMain << "Finished loading and checking parameters\n" <<flush;
};

void Parameters::checkParameters() {

    if (runModeIn=="gapFill") {
        runMode.extend=true;
        runMode.correct=true;
    } else if (runModeIn=="extendOnly") {
        runMode.extend=true;
        runMode.correct=false;
    } else if (runModeIn=="correctOnly") {
        runMode.extend=false;
        runMode.correct=true;
    } else {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: runMode="<<runModeIn <<" is not a valid value of the parameter\n";
        errOut <<"SOLUTION: provide a valid value for runMode: gapFill / extendOnly / correctOnly\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (runRestart.in=="None") {
        runRestart.fromSnapshot=false;
    } else if (runRestart.in=="LastSnapshot") {
        runRestart.fromSnapshot=true;
        if (!runMode.extend) {
            ostringstream errOut;
            errOut <<"EXITING because of FATAL PARAMETER error: --runRestart LastSnapshot requires the extension loop, but --runMode "<<runModeIn<<"\n";
            errOut <<"SOLUTION: use --runMode gapFill or extendOnly, or --runRestart None\n";
            exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
        };
    } else {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: runRestart="<<runRestart.in <<" is not a valid value of the parameter\n";
        errOut <<"SOLUTION: provide a valid value for runRestart: None / LastSnapshot\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (ploidyIn=="Homozygous") {
        ploidy=gapwalk::PloidyMode::Homozygous;
    } else if (ploidyIn=="Heterozygous") {
        ploidy=gapwalk::PloidyMode::Heterozygous;
    } else {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: ploidy="<<ploidyIn <<" is not a valid value of the parameter\n";
        errOut <<"SOLUTION: provide a valid value for ploidy: Homozygous / Heterozygous\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (iterMax<1) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: --iterMax "<<iterMax <<" has to be >0\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (!(coverageExpected>0)) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: --coverageExpected "<<coverageExpected <<" has to be >0\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (runThreadN<1) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: --runThreadN "<<runThreadN <<" has to be >0\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (outTmpKeep!="None" && outTmpKeep!="All") {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: outTmpKeep="<<outTmpKeep <<" is not a valid value of the parameter\n";
        errOut <<"SOLUTION: provide a valid value for outTmpKeep: None / All\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (refFasta=="-") {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: --refFasta is required\n";
        errOut <<"SOLUTION: specify the reference FASTA with one gap run of "<<gapwalk::GAP_RUN_LENGTH<<" N\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };

    if (readFilesIn.size()!=MAX_N_MATES) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL PARAMETER error: --readFilesIn requires "<<MAX_N_MATES<<" files, found "<<readFilesIn.size()<<"\n";
        errOut <<"SOLUTION: specify the two FASTQ files with paired-end reads\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };
};

void Parameters::loadReference() {
    gapwalk::FastaRecord rec;
    try {
        rec=gapwalk::readReferenceFasta(refFasta);
    } catch (const gapwalk::ConfigurationError &e) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL INPUT FILE error: invalid --refFasta "<<refFasta<<"\n"<<e.what()<<"\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_INPUT_FILES, *this);
    } catch (const std::runtime_error &e) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL INPUT FILE error: could not read --refFasta "<<refFasta<<"\n"<<e.what()<<"\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_INPUT_FILES, *this);
    };

    reference=gapwalk::SequenceBuffer(rec.id, rec.sequence);
    sampleId = (sampleIdIn=="-" ? rec.id : sampleIdIn);

    size_t nGaps=reference.gapRunCount();
    if (runMode.extend && nGaps!=1) {
        ostringstream errOut;
        errOut <<"EXITING because of FATAL INPUT FILE error: --refFasta "<<refFasta<<" contains "<<nGaps<<" gap runs of "<<gapwalk::GAP_RUN_LENGTH<<" N\n";
        errOut <<"SOLUTION: the reference sequence has to contain exactly one gap run\n";
        exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_INPUT_FILES, *this);
    };

    inOut->logMain << "Reference " << reference.id() << " length=" << reference.length() << " gapRuns=" << nGaps << " sampleId=" << sampleId << "\n" <<flush;
};

void Parameters::checkReadFiles() {
    for (uint imate=0; imate<readFilesIn.size(); imate++) {
        if (!gapwalk::looksLikeFastq(readFilesIn[imate])) {
            ostringstream errOut;
            errOut <<"EXITING because of FATAL INPUT FILE error: could not read FASTQ records from --readFilesIn "<<readFilesIn[imate]<<"\n";
            errOut <<"SOLUTION: check the path and the format of the read files (plain or gzipped FASTQ)\n";
            exitWithError(errOut.str(),std::cerr, inOut->logMain, EXIT_CODE_INPUT_FILES, *this);
        };
    };
};

void Parameters::removeTmpDir() {
    if (outFileTmp=="" || outTmpKeep=="All")
        return;
    if (!sysRemoveDir(outFileTmp) && inOut->logMain.good())
        inOut->logMain << "WARNING: could not remove temporary directory " << outFileTmp << "\n";
};

/////////////////////////////////////////////////////////////////////////////////////////////////////////////////
void Parameters::scanAllLines (istream &streamIn, int inputLevel) {
    string lineIn;
    while (getline(streamIn,lineIn))
        scanOneLine(lineIn, inputLevel, false);
};

ParameterInfoBase* Parameters::findParameter(const string &name) {
    for (uint ii=0; ii<parArray.size(); ii++) {
        if (parArray[ii]->nameString==name)
            return parArray[ii];
    };
    return NULL;
};

void Parameters::parameterError(const string &message, const string &solution) {
    ostringstream errOut;
    errOut << "EXITING: FATAL INPUT ERROR: " << message << "\n";
    errOut << "SOLUTION: " << solution << "\n" << flush;
    exitWithError(errOut.str(), std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
};

void Parameters::scanOneLine (const string &lineIn, int inputLevel, bool initialOnly) {
    //defaults: indented lines are descriptions
    if (lineIn=="" || (inputLevel==0 && (lineIn[0]==' ' || lineIn[0]=='\t')))
        return;

    istringstream lineInStream (lineIn);
    string parIn("");
    lineInStream >> parIn;
    if (parIn=="" || parIn.substr(0,2)=="//" || parIn[0]=='#') //comment
        return;

    ParameterInfoBase *par=findParameter(parIn);
    const string inputName=parameterInputName.at(inputLevel);
    if (initialOnly && (par==NULL || par->inputLevelAllowed!=2))
        return; //read in the final command line pass

    if (par==NULL)
        parameterError("unrecognized parameter name \"" + parIn + "\" in input \"" + inputName + "\"",
                       "use correct parameter name (check GapWalk --help)");

    string parV("");
    lineInStream >> parV;
    if (parV=="")
        parameterError("empty value for parameter \"" + parIn + "\" in input \"" + inputName + "\"",
                       "use non-empty value for this parameter");

    if (par->inputLevelAllowed>0 && par->inputLevelAllowed<inputLevel)
        parameterError("parameter \"" + parIn + "\" cannot be defined in \"" + inputName + "\"",
                       "define parameter \"" + parIn + "\" on the command line");
    if (par->inputLevel==inputLevel)
        parameterError("duplicate parameter \"" + parIn + "\" in input \"" + inputName + "\"",
                       "keep only one definition of each parameter in each input source");

    lineInStream.str(lineIn);
    lineInStream.clear();
    lineInStream >> parIn; //values start after the name
    try {
        par->inputValues(lineInStream);
    } catch (const std::runtime_error &e) {
        exitWithError(e.what(), std::cerr, inOut->logMain, EXIT_CODE_PARAMETER, *this);
    };
    par->inputLevel=inputLevel;

    if (inOut->logMain.is_open() && inOut->logMain.good()) {
        inOut->logMain << setiosflags(ios::left) << setw(PAR_NAME_PRINT_WIDTH) << par->nameString << *par;
        if (inputLevel>0) inOut->logMain << "     ~RE-DEFINED";
        inOut->logMain << endl;
    };
};
