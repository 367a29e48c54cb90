#include "IncludeDefine.h"
#include "Parameters.h"
#include "ErrorWarning.h"
#include "TimeFunctions.h"
#include "ToolRunner.h"
#include "ShellCollaborators.h"

#include "libgapwalk/correction_stage.h"
#include "libgapwalk/extension_loop.h"
#include "libgapwalk/fasta_io.h"
#include "libgapwalk/gap_errors.h"
#include "libgapwalk/snapshot_store.h"

#include "parametersDefault.xxd"

void usage(int usageType) {
    cout << "Usage: GapWalk  [options]... --refFasta contig.fa --readFilesIn R1.fq R2.fq\n";
    cout << "Iterative gap closing of a scaffolded contig with paired-end reads\n\n";
    cout << "GapWalk version=" << GAPWALK_VERSION << "\n";
    cout << "GapWalk compilation time,server,dir=" << COMPILATION_TIME_PLACE << "\n";

    if (usageType==0) {//brief
        cout << "\nTo list all parameters, run GapWalk --help\n";
    } else if (usageType==1) {//full
        cout.write(reinterpret_cast<char *> (parametersDefault), parametersDefault_len);
    };
    exit(0);
};

static void writeOutputFasta(const string &path, const gapwalk::FastaRecord &rec, Parameters &P) {
    try {
        gapwalk::writeFasta(path, rec);
    } catch (const std::runtime_error &e) {
        ostringstream errOut;
        errOut << "EXITING because of FATAL ERROR: could not write output file " << path << "\n" << e.what() << "\n";
        errOut << "SOLUTION: check that you have permissions to write to " << P.outFileNamePrefix << "\n";
        exitWithError(errOut.str(), std::cerr, P.inOut->logMain, EXIT_CODE_FILE_OPEN, P);
    };
    P.inOut->logMain << "Written " << path << " (" << rec.sequence.size() << " bases)\n";
};

static void reportFinal(ostream &out, Parameters &P, time_t timeStart, const gapwalk::LoopResult *loop,
                        const gapwalk::CorrectionResult *correction, const vector<string> &outputFiles, uint64 nCommands) {
    time_t timeFinish;
    time(&timeFinish);

    out << setiosflags(ios::left);
    out << setw(50) << "                                 Started job on |\t" << timeMonthDayTime(timeStart) << "\n";
    out << setw(50) << "                                Finished on |\t" << timeMonthDayTime(timeFinish) << "\n";
    out << setw(50) << "                                  Sample |\t" << P.sampleId << "\n";
    out << setw(50) << "                                  Ploidy |\t" << gapwalk::ploidyModeName(P.ploidy) << "\n";
    out << setw(50) << "                        Reference length |\t" << P.reference.length() << "\n";
    out << setw(50) << "                  External tool commands |\t" << nCommands << "\n";

    if (loop!=NULL) {
        out << "GAP EXTENSION:\n";
        out << setw(50) << "                         First iteration |\t" << loop->firstIteration << "\n";
        out << setw(50) << "                          Last iteration |\t" << loop->lastIteration << "\n";
        out << setw(50) << "                          Terminal state |\t" << gapwalk::loopStateName(loop->state) << "\n";
        out << setw(50) << "                         Extended length |\t" << loop->finalSequence.length() << "\n";
        size_t gapStart=0;
        out << setw(50) << "                       Gap marker remains |\t" << (loop->finalSequence.gapRun(gapStart) ? "yes" : "no") << "\n";
    };

    if (correction!=NULL) {
        out << "CORRECTION:\n";
        out << setw(50) << "                   Joined across the gap |\t" << (correction->joined ? "yes" : "no") << "\n";
        out << setw(50) << "                                  Phased |\t" << (correction->phased ? "yes" : "no") << "\n";
        for (uint ii=0; ii<correction->outputs.size(); ii++) {
            const gapwalk::CorrectedSequence &cs = correction->outputs[ii];
            out << "  " << cs.record.id << ":\n";
            out << setw(50) << "                         Variants called |\t" << cs.variantsCalled << "\n";
            out << setw(50) << "                        Variants applied |\t" << cs.variantsApplied << "\n";
            out << setw(50) << "                            Masked bases |\t" << cs.maskedBases << "\n";
            out << setw(50) << "                         Sequence length |\t" << cs.record.sequence.size() << "\n";
        };
    };

    out << "OUTPUT FILES:\n";
    for (uint ii=0; ii<outputFiles.size(); ii++)
        out << "  " << outputFiles[ii] << "\n";
    out << flush;
};

int main(int argInN, char *argIn[]) {
    if (argInN==1) {
        usage(0);
    } else if (argInN==2 && (strcmp("-h",argIn[1])==0 || strcmp("--help",argIn[1])==0)) {
        usage(1);
    };

    time_t timeStart;
    time(&timeStart);

    Parameters P;
    P.inputParameters(argInN, argIn);

    *(P.inOut->logStdOut) << "\t" << P.commandLine << '\n';
    *(P.inOut->logStdOut) << "\tGapWalk version: " << GAPWALK_VERSION << "   compiled: " << COMPILATION_TIME_PLACE << '\n';
    *(P.inOut->logStdOut) << timeMonthDayTime(timeStart) << " ..... started GapWalk run\n" << flush;
    P.inOut->logMain << timeMonthDayTime(timeStart) << " ..... started GapWalk run\n" << flush;

    ToolRunner runner(P.sysShell, P.outFileNamePrefix + "Log.tools.out", &P.inOut->logMain);
    ShellCollaborators shellTools(P, runner);

    gapwalk::LoopResult loopResult;
    gapwalk::CorrectionResult correctionResult;
    vector<string> outputFiles;

    try {
        shellTools.checkTools();
        gapwalk::Collaborators tools = shellTools.bundle();

        gapwalk::SequenceBuffer finished = P.reference;

        if (P.runMode.extend) {
            gapwalk::SnapshotStore store(P.outFileNamePrefix, P.sampleId);
            if (P.runRestart.fromSnapshot) {
                size_t nLoaded = store.loadExisting();
                P.inOut->logMain << "Loaded " << nLoaded << " snapshots from " << P.outFileNamePrefix << "\n";
                if (nLoaded==0)
                    warningMessage("--runRestart LastSnapshot: no snapshots found, starting from --refFasta", P.inOut->logMain, std::cerr);
            };

            gapwalk::LoopConfig loopConfig;
            loopConfig.ploidy = P.ploidy;
            loopConfig.iterMax = P.iterMax;
            loopConfig.coverageExpected = P.coverageExpected;

            gapwalk::ExtensionLoop loop(loopConfig, tools, store);
            loop.setLogs(&P.inOut->logMain, &P.inOut->logProgress);
            gapwalk::ExtensionLoop::writeProgressHeader(P.inOut->logProgress);

            *(P.inOut->logStdOut) << timeMonthDayTime() << " ..... started gap extension\n" << flush;
            loopResult = loop.run(P.reference);
            *(P.inOut->logStdOut) << timeMonthDayTime() << " ..... finished gap extension: " << gapwalk::loopStateName(loopResult.state) << "\n" << flush;

            finished = loopResult.finalSequence;
            outputFiles.push_back(store.finalPath());
        };

        if (P.runMode.correct) {
            gapwalk::CorrectionConfig correctionConfig;
            correctionConfig.ploidy = P.ploidy;

            gapwalk::CorrectionStage correction(correctionConfig, tools);
            correction.setLog(&P.inOut->logMain);

            *(P.inOut->logStdOut) << timeMonthDayTime() << " ..... started variant correction\n" << flush;
            correctionResult = correction.run(finished, P.sampleId);

            for (uint ii=0; ii<correctionResult.outputs.size(); ii++) {
                const gapwalk::CorrectedSequence &cs = correctionResult.outputs[ii];
                string path = P.outFileNamePrefix + P.sampleId + (cs.bin<0 ? ".final" : "." + to_string(cs.bin)) + ".fa";
                writeOutputFasta(path, cs.record, P);
                outputFiles.push_back(path);
            };
            *(P.inOut->logStdOut) << timeMonthDayTime() << " ..... finished variant correction\n" << flush;
        };

    } catch (const gapwalk::UnresolvableGap &e) {
        exitWithError(string("EXITING: the gap cannot be finished\n") + e.what(), std::cerr, P.inOut->logMain, EXIT_CODE_UNRESOLVABLE_GAP, P);
    } catch (const gapwalk::CollaboratorUnavailable &e) {
        exitWithError(e.what(), std::cerr, P.inOut->logMain, EXIT_CODE_TOOLS, P);
    } catch (const gapwalk::CollaboratorFailure &e) {
        exitWithError(e.what(), std::cerr, P.inOut->logMain, EXIT_CODE_COLLABORATOR, P);
    } catch (const gapwalk::ConfigurationError &e) {
        exitWithError(string("EXITING because of FATAL CONFIGURATION ERROR: ") + e.what(), std::cerr, P.inOut->logMain, EXIT_CODE_PARAMETER, P);
    } catch (const std::exception &e) {
        exitWithError(string("EXITING because of FATAL RUNTIME ERROR: ") + e.what(), std::cerr, P.inOut->logMain, EXIT_CODE_RUNTIME, P);
    };

    reportFinal(P.inOut->logFinal, P, timeStart,
                P.runMode.extend ? &loopResult : NULL,
                P.runMode.correct ? &correctionResult : NULL,
                outputFiles, runner.nCommands());

    P.removeTmpDir();

    time_t timeFinish;
    time(&timeFinish);
    *(P.inOut->logStdOut) << timeMonthDayTime(timeFinish) << " ..... finished successfully\n" << flush;
    P.inOut->logMain << "ALL DONE!\n" << flush;
    return 0;
};
