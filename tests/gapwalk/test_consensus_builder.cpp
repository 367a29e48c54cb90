// ConsensusBuilder: empty evidence and ambiguity stripping

#include <iostream>
#include <string>
#include <vector>

#include "consensus_builder.h"
#include "fake_collaborators.h"

using namespace gapwalk;

static int check(bool ok, const std::string& label) {
    if (!ok) {
        std::cerr << "FAIL: " << label << "\n";
        return 1;
    }
    return 0;
}

int main() {
    int failed = 0;
    testing::FirstSequenceMsa msa;
    ConsensusBuilder builder(msa);

    std::vector<AnchorRead> none;
    failed += check(builder.build(none, "iter1.left").empty(), "empty anchor set gives empty consensus");
    failed += check(msa.calls == 0, "aligner not called without reads");

    std::vector<AnchorRead> anchors(2);
    anchors[0].id = "r1";
    anchors[0].sequence = "ACGTACGT";
    anchors[1].id = "r2";
    anchors[1].sequence = "ACGTTCGT";

    msa.fixed = "ACGT?CGT??";
    std::string cons = builder.build(anchors, "iter3.right");
    failed += check(cons == "ACGTCGT", "ambiguity placeholders removed");
    failed += check(msa.lastTag == "iter3.right", "tag handed to the aligner");
    failed += check(msa.lastInput.size() == 2 && msa.lastInput[1] == "ACGTTCGT", "read sequences handed to the aligner");

    msa.fixed = "???";
    failed += check(builder.build(anchors, "iter4.left").empty(), "all-ambiguous consensus is empty");

    failed += check(stripAmbiguity("A?c?G") == "AcG", "stripAmbiguity keeps case");

    if (failed == 0) {
        std::cout << "PASS: consensus builder\n";
        return 0;
    }
    return 1;
}
