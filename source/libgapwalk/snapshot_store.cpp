#include "snapshot_store.h"
#include "fasta_io.h"

#include <sys/stat.h>

namespace gapwalk {

SnapshotStore::SnapshotStore(const std::string& filePrefix, const std::string& sampleId)
    : filePrefix_(filePrefix), sampleId_(sampleId), hasFinal_(false) {}

std::string SnapshotStore::snapshotPath(uint32_t iteration) const {
    return filePrefix_ + sampleId_ + ".iter" + std::to_string(iteration) + ".fa";
}

std::string SnapshotStore::finalPath() const {
    return filePrefix_ + sampleId_ + ".loop.fa";
}

void SnapshotStore::save(uint32_t iteration, const SequenceBuffer& sequence) {
    bool replaced = false;
    for (auto& s : snapshots_) {
        if (s.iteration == iteration) {
            s.sequence = sequence;
            replaced = true;
        }
    }
    if (!replaced) {
        snapshots_.push_back(IterationSnapshot(iteration, sequence));
    }
    if (persistent()) {
        FastaRecord rec;
        rec.id = sequence.id();
        rec.sequence = sequence.sequence();
        writeFasta(snapshotPath(iteration), rec);
    }
}

void SnapshotStore::saveFinal(const SequenceBuffer& sequence) {
    final_ = sequence;
    hasFinal_ = true;
    if (persistent()) {
        FastaRecord rec;
        rec.id = sequence.id();
        rec.sequence = sequence.sequence();
        writeFasta(finalPath(), rec);
    }
}

bool SnapshotStore::latest(IterationSnapshot& out) const {
    if (snapshots_.empty()) return false;
    const IterationSnapshot* best = &snapshots_.front();
    for (const auto& s : snapshots_) {
        if (s.iteration > best->iteration) best = &s;
    }
    out = *best;
    return true;
}

size_t SnapshotStore::loadExisting() {
    if (!persistent()) return 0;
    size_t loaded = 0;
    for (uint32_t it = 1;; ++it) {
        std::string path = snapshotPath(it);
        struct stat st;
        if (stat(path.c_str(), &st) != 0) break;
        std::vector<FastaRecord> recs = readFastaRecords(path);
        if (recs.size() != 1) break;
        IterationSnapshot snap(it, SequenceBuffer(recs[0].id, recs[0].sequence));
        bool replaced = false;
        for (auto& s : snapshots_) {
            if (s.iteration == it) {
                s = snap;
                replaced = true;
            }
        }
        if (!replaced) snapshots_.push_back(snap);
        ++loaded;
    }
    return loaded;
}

} // namespace gapwalk
