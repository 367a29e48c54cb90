#ifndef TOOL_RUNNER_DEF
#define TOOL_RUNNER_DEF

#include "IncludeDefine.h"

//runs external tool commands through the configured shell, one command at a time
class ToolRunner {
    public:
        ToolRunner(const string &sysShellIn, const string &toolLogIn, ostream *logMainIn);

        //throws gapwalk::CollaboratorFailure on non-zero exit status
        void run(const string &command, const string &stepName);
        //executable is found by the shell
        bool available(const string &executable);

        static string quoteArg(const string &arg);
        uint64 nCommands() const {return nCommands_;};

    private:
        string sysShell; //"-": default shell of system()
        string toolLog;  //stderr of the tools is appended here
        ostream *logMain;
        uint64 nCommands_;

        int execute(const string &command);
};

#endif
