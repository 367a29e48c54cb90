// SequenceBuffer: gap-run detection, case-insensitive search and replacement

#include <iostream>
#include <string>

#include "gap_errors.h"
#include "sequence_buffer.h"

using namespace gapwalk;

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

static int testGapRun() {
    int failed = 0;
    size_t p = 99;

    SequenceBuffer one("ctg1", "ACGTACGTNNNNNNNNNNACGTACGT");
    failed += check(one.gapRun(p) && p == 8, "gap run found at 8");
    failed += check(one.gapRunCount() == 1, "one gap run");

    SequenceBuffer lower("ctg1", "ACGTnnnnnNNNNNACGT");
    failed += check(lower.gapRun(p) && p == 4, "mixed-case gap run");

    SequenceBuffer longer("ctg1", "ACGTNNNNNNNNNNNACGT");
    failed += check(!longer.gapRun(p), "run of 11 N is not a gap marker");
    failed += check(longer.gapRunCount() == 0, "no gap run counted in run of 11");

    SequenceBuffer shorter("ctg1", "ACGTNNNNNACGT");
    failed += check(!shorter.gapRun(p), "run of 5 N is not a gap marker");

    SequenceBuffer two("ctg1", "NNNNNNNNNNACGTNNNACGTNNNNNNNNNN");
    failed += check(two.gapRun(p) && p == 0, "first of two runs at 0");
    failed += check(two.gapRunCount() == 2, "two gap runs");
    return failed;
}

static int testCountAndReplace() {
    int failed = 0;
    SequenceBuffer s("ctg2", "acgtACGTacgtTTTT");
    failed += check(s.countOccurrences("ACGT") == 3, "case-insensitive occurrences");
    failed += check(s.countOccurrences("AAAA") == 0, "absent pattern");
    failed += check(s.countOccurrences("") == 0, "empty pattern");

    SequenceBuffer overlap("ctg2", "AAAAA");
    failed += check(overlap.countOccurrences("AA") == 2, "non-overlapping count");

    SequenceBuffer r = s.replace("ACGTACGT", "gg");
    failed += check(r.sequence() == "ggacgtTTTT", "first occurrence replaced");
    failed += check(r.id() == "ctg2", "id kept on replace");
    failed += check(s.sequence() == "acgtACGTacgtTTTT", "source buffer unchanged");

    bool thrown = false;
    try {
        s.replace("CCCC", "A");
    } catch (const SequenceNotFound&) {
        thrown = true;
    }
    failed += check(thrown, "replace of absent substring throws");
    return failed;
}

static int testSlice() {
    int failed = 0;
    SequenceBuffer s("ctg3", "ACGTACGTAC");
    failed += check(s.slice(2, 3) == "GTA", "inner slice");
    failed += check(s.slice(-2, 4) == "AC", "slice clipped at start");
    failed += check(s.slice(8, 10) == "AC", "slice clipped at end");
    failed += check(s.slice(20, 5).empty(), "slice beyond end");
    failed += check(SequenceBuffer("a", "AC") != SequenceBuffer("b", "AC"), "ids distinguish buffers");
    return failed;
}

int main() {
    int failed = 0;

    failed += testGapRun();
    failed += testCountAndReplace();
    failed += testSlice();

    if (failed == 0) {
        std::cout << "PASS: sequence buffer\n";
        return 0;
    }
    return 1;
}
