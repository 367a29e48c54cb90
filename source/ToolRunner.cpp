#include "ToolRunner.h"
#include "TimeFunctions.h"
#include "libgapwalk/gap_errors.h"

#include <sys/wait.h>

ToolRunner::ToolRunner(const string &sysShellIn, const string &toolLogIn, ostream *logMainIn)
    : sysShell(sysShellIn), toolLog(toolLogIn), logMain(logMainIn), nCommands_(0) {
};

string ToolRunner::quoteArg(const string &arg) {
    string out="'";
    for (char c : arg) {
        if (c=='\'') {
            out+="'\\''";
        } else {
            out+=c;
        };
    };
    return out+"'";
};

int ToolRunner::execute(const string &command) {
    string fullCommand = command;
    if (sysShell!="-") {
        fullCommand = sysShell + " -c " + quoteArg(command);
    };
    int status = system(fullCommand.c_str());
    if (status==-1)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
};

void ToolRunner::run(const string &command, const string &stepName) {
    string logged = command;
    if (toolLog!="")
        logged = "( " + command + " ) 2>> " + quoteArg(toolLog);

    if (logMain!=NULL)
        *logMain << timeMonthDayTime() << " ..... " << stepName << ": " << logged << "\n" << flush;

    ++nCommands_;
    int exitCode = execute(logged);
    if (exitCode!=0) {
        ostringstream errOut;
        errOut << "EXITING because of FATAL ERROR in external tool, step " << stepName << ", exit code " << exitCode << "\n";
        errOut << "Command: " << command << "\n";
        if (toolLog!="")
            errOut << "SOLUTION: check the tool messages in " << toolLog << "\n";
        throw gapwalk::CollaboratorFailure(errOut.str());
    };
};

bool ToolRunner::available(const string &executable) {
    string firstWord = executable.substr(0, executable.find_first_of(" \t"));
    int exitCode = execute("command -v " + quoteArg(firstWord) + " > /dev/null 2>&1");
    if (logMain!=NULL)
        *logMain << "Checking tool " << firstWord << " ... " << (exitCode==0 ? "found" : "NOT FOUND") << "\n";
    return exitCode==0;
};
