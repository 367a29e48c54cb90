// SnapshotStore: in-memory snapshots, FASTA files per iteration and reload

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

#include "fasta_io.h"
#include "snapshot_store.h"

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

    SnapshotStore memory;
    IterationSnapshot snap;
    failed += check(!memory.latest(snap), "empty store has no latest snapshot");
    memory.save(1, SequenceBuffer("ctg", "AAAA"));
    memory.save(2, SequenceBuffer("ctg", "AAAAC"));
    memory.save(1, SequenceBuffer("ctg", "AAAAT"));
    failed += check(memory.snapshots().size() == 2, "saving an iteration again replaces it");
    failed += check(memory.latest(snap) && snap.iteration == 2 && snap.sequence.sequence() == "AAAAC", "latest is the highest iteration");
    failed += check(!memory.persistent() && memory.loadExisting() == 0, "in-memory store loads nothing");

    char dirTemplate[] = "/tmp/gapwalk_snap_XXXXXX";
    char* dirC = mkdtemp(dirTemplate);
    if (dirC == nullptr) {
        std::cerr << "FAIL: temporary directory\n";
        return 1;
    }
    const std::string prefix = std::string(dirC) + "/run_";

    {
        SnapshotStore store(prefix, "S1");
        failed += check(store.snapshotPath(3) == prefix + "S1.iter3.fa", "snapshot file name");
        failed += check(store.finalPath() == prefix + "S1.loop.fa", "loop result file name");
        store.save(1, SequenceBuffer("ctg", "ACGTNNNNNNNNNNACGT"));
        store.save(2, SequenceBuffer("ctg", "ACGTacgtaNNNNNNNNNNACGT"));
        store.saveFinal(SequenceBuffer("ctg", "ACGTacgtaNNNNNNNNNNACGT"));
        failed += check(store.hasFinal(), "final recorded");

        std::vector<FastaRecord> recs = readFastaRecords(store.snapshotPath(2));
        failed += check(recs.size() == 1 && recs[0].id == "ctg" && recs[0].sequence == "ACGTacgtaNNNNNNNNNNACGT",
                        "snapshot written as single-record FASTA");
    }

    {
        SnapshotStore reloaded(prefix, "S1");
        failed += check(reloaded.loadExisting() == 2, "two snapshots reloaded");
        failed += check(reloaded.latest(snap) && snap.iteration == 2 && snap.sequence.length() == 23, "reloaded latest snapshot");
        failed += check(!reloaded.hasFinal(), "loop result is not a snapshot");
    }

    {
        SnapshotStore other(prefix, "S2");
        failed += check(other.loadExisting() == 0, "snapshots of another sample are not loaded");
    }

    std::remove((prefix + "S1.iter1.fa").c_str());
    std::remove((prefix + "S1.iter2.fa").c_str());
    std::remove((prefix + "S1.loop.fa").c_str());
    rmdir(dirC);

    if (failed == 0) {
        std::cout << "PASS: snapshot store\n";
        return 0;
    }
    return 1;
}
