#ifndef GAPWALK_COVERAGE_PROFILE_H
#define GAPWALK_COVERAGE_PROFILE_H

#include <cstdint>
#include <map>
#include <string>

namespace gapwalk {

// Per-position read depth keyed by 1-based reference position.
// Positions with zero depth are not stored.
class CoverageProfile {
public:
    CoverageProfile() : total_(0.0) {}

    void add(uint64_t pos1, double depth);

    double depthAt(uint64_t pos1) const; // 0 when not reported
    bool has(uint64_t pos1) const { return depth_.count(pos1) > 0; }

    // total depth / number of reported positions; 0 for an empty profile
    double meanCoverage() const;
    uint64_t lastPosition() const;
    size_t size() const { return depth_.size(); }
    bool empty() const { return depth_.empty(); }

    // samtools depth output: <contig> <pos> <depth> per line
    static CoverageProfile fromDepthFile(const std::string& path);

private:
    std::map<uint64_t, double> depth_;
    double total_;
};

// Overwrite with N every position in 1..lastPosition() (capped at the sequence
// length) whose depth is absent or <= fraction * mean. Positions beyond the last
// reported one keep their base.
std::string maskLowCoverage(const std::string& sequence, const CoverageProfile& profile, double fraction);

} // namespace gapwalk

#endif // GAPWALK_COVERAGE_PROFILE_H
