#ifndef GAPWALK_SNAPSHOT_STORE_H
#define GAPWALK_SNAPSHOT_STORE_H

#include "sequence_buffer.h"

#include <cstdint>
#include <string>
#include <vector>

namespace gapwalk {

struct IterationSnapshot {
    uint32_t iteration;
    SequenceBuffer sequence;

    IterationSnapshot() : iteration(0) {}
    IterationSnapshot(uint32_t it, const SequenceBuffer& seq) : iteration(it), sequence(seq) {}
};

// Reference state of every extension iteration. With a file prefix the
// snapshots are also written as <prefix><sample>.iter<N>.fa and the loop
// result as <prefix><sample>.loop.fa; loadExisting() reads them back so that a
// run can resume from the last committed iteration.
class SnapshotStore {
public:
    SnapshotStore() : hasFinal_(false) {}
    SnapshotStore(const std::string& filePrefix, const std::string& sampleId);

    void save(uint32_t iteration, const SequenceBuffer& sequence);
    void saveFinal(const SequenceBuffer& sequence);

    // Highest-numbered snapshot; false when none
    bool latest(IterationSnapshot& out) const;

    const std::vector<IterationSnapshot>& snapshots() const { return snapshots_; }
    bool hasFinal() const { return hasFinal_; }
    const SequenceBuffer& finalSequence() const { return final_; }

    // Read iter1, iter2, ... from disk until the first missing file.
    // Returns the number of snapshots loaded.
    size_t loadExisting();

    std::string snapshotPath(uint32_t iteration) const;
    std::string finalPath() const;
    bool persistent() const { return !filePrefix_.empty(); }

private:
    std::string filePrefix_;
    std::string sampleId_;
    std::vector<IterationSnapshot> snapshots_;
    SequenceBuffer final_;
    bool hasFinal_;
};

} // namespace gapwalk

#endif // GAPWALK_SNAPSHOT_STORE_H
