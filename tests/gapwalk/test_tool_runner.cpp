// ToolRunner shell execution and the column-plurality consensus of a multiple alignment

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ShellCollaborators.h"
#include "ToolRunner.h"
#include "libgapwalk/gap_errors.h"

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static int testRunner() {
    int failed = 0;
    std::ostringstream log;
    ToolRunner runner("-", "", &log);

    bool thrown = false;
    try {
        runner.run("true", "no-op");
    } catch (const gapwalk::CollaboratorFailure&) {
        thrown = true;
    }
    failed += check(!thrown, "successful command");
    failed += check(log.str().find("no-op: true") != std::string::npos, "command line logged");

    thrown = false;
    try {
        runner.run("exit 3", "failing step");
    } catch (const gapwalk::CollaboratorFailure& e) {
        thrown = std::string(e.what()).find("exit code 3") != std::string::npos;
    }
    failed += check(thrown, "non-zero exit status raised with its code");
    failed += check(runner.nCommands() == 2, "commands counted");

    failed += check(runner.available("sh"), "shell found");
    failed += check(!runner.available("gapwalk-no-such-tool-xyz --version"), "missing tool detected");

    ToolRunner bash("/bin/sh", "", nullptr);
    thrown = false;
    try {
        bash.run("test 'a b' = \"a b\"", "quoted");
    } catch (const gapwalk::CollaboratorFailure&) {
        thrown = true;
    }
    failed += check(!thrown, "command passed through the configured shell");

    failed += check(ToolRunner::quoteArg("a'b") == "'a'\\''b'", "single quote escaped");
    return failed;
}

static int testPlurality() {
    int failed = 0;
    std::vector<std::string> rows;
    rows.push_back("AC-T");
    rows.push_back("AC-T");
    rows.push_back("AGGT");
    failed += check(msaPluralityConsensus(rows) == "ACT", "gap-won column dropped");

    std::vector<std::string> tie;
    tie.push_back("AC");
    tie.push_back("AG");
    failed += check(msaPluralityConsensus(tie) == "A?", "tie gives the ambiguity placeholder");

    std::vector<std::string> ragged;
    ragged.push_back("acgt");
    ragged.push_back("ACG");
    ragged.push_back("ACGA");
    failed += check(msaPluralityConsensus(ragged) == "ACG?", "case folded and short rows padded with gaps");

    failed += check(msaPluralityConsensus(std::vector<std::string>()).empty(), "no rows, empty consensus");
    return failed;
}

int main() {
    int failed = 0;

    failed += testRunner();
    failed += testPlurality();

    if (failed == 0) {
        std::cout << "PASS: tool runner and plurality consensus\n";
        return 0;
    }
    return 1;
}
